/**
 * @file component_registry.hpp
 * @brief Authoritative map of component identity to health and dependency metadata.
 *
 * The registry is a plain value: the coordinator copies it, mutates the copy
 * and publishes the copy inside a new SystemState snapshot. Readers holding an
 * older snapshot keep a consistent view for as long as they need it.
 *
 * Iteration order is registration order; replacing an entry keeps its slot.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordination_core {

/**
 * @brief Outcome of a start-readiness check for one component.
 */
struct StartCheck {
    bool can_start = true;
    std::string reason;
    std::vector<ComponentId> blocked_by;
};

class ComponentRegistry {
public:
    // ── Mutation ──────────────────────────────

    /// Insert or replace by id. Returns true when the id was new.
    bool register_component(ComponentStatus status);

    /// Remove by id. No-op (returns false) if absent.
    bool unregister_component(const ComponentId& id);

    /// Returns false if the id is not registered.
    bool update_status(const ComponentId& id, HealthStatus status);

    void clear();

    // ── Queries ───────────────────────────────
    [[nodiscard]] const ComponentStatus* find(const ComponentId& id) const;
    [[nodiscard]] std::optional<ComponentStatus> get(const ComponentId& id) const;
    [[nodiscard]] bool contains(const ComponentId& id) const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::vector<ComponentStatus>& entries() const noexcept { return entries_; }

    [[nodiscard]] std::vector<ComponentId> healthy_components() const;
    [[nodiscard]] size_t count(HealthStatus status) const;
    [[nodiscard]] bool is_healthy(const ComponentId& id) const;

    /// Components whose dependency list names @p id.
    [[nodiscard]] std::vector<ComponentId> dependents_of(const ComponentId& id) const;

    // ── Dependency rules ──────────────────────

    /// A dependency is satisfied only if it is registered and healthy.
    [[nodiscard]] bool dependencies_satisfied(const ComponentStatus& component) const;
    [[nodiscard]] std::vector<ComponentId> failed_dependencies(const ComponentStatus& component) const;
    [[nodiscard]] StartCheck can_start(const ComponentStatus& component) const;

    /**
     * @brief Dependency-first start order over registered components.
     *
     * Dependencies on unregistered ids do not constrain the order. A cycle is
     * broken by emitting the earliest-registered remaining component.
     */
    [[nodiscard]] std::vector<ComponentId> startup_order() const;

private:
    void rebuild_index();

    std::vector<ComponentStatus> entries_;
    std::unordered_map<ComponentId, size_t> index_;
};

}  // namespace coordination_core
