/**
 * @file component_registry.cpp
 * @brief ComponentRegistry implementation and dependency rules.
 */

#include "registry/component_registry.hpp"

#include <algorithm>
#include <unordered_set>

namespace coordination_core {

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

bool ComponentRegistry::register_component(ComponentStatus status) {
    if (auto it = index_.find(status.id); it != index_.end()) {
        entries_[it->second] = std::move(status);
        return false;
    }
    index_.emplace(status.id, entries_.size());
    entries_.push_back(std::move(status));
    return true;
}

bool ComponentRegistry::unregister_component(const ComponentId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}

bool ComponentRegistry::update_status(const ComponentId& id, HealthStatus status) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    entries_[it->second].status = status;
    return true;
}

void ComponentRegistry::clear() {
    entries_.clear();
    index_.clear();
}

void ComponentRegistry::rebuild_index() {
    index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].id, i);
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

const ComponentStatus* ComponentRegistry::find(const ComponentId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

std::optional<ComponentStatus> ComponentRegistry::get(const ComponentId& id) const {
    if (const auto* entry = find(id)) return *entry;
    return std::nullopt;
}

bool ComponentRegistry::contains(const ComponentId& id) const {
    return index_.count(id) > 0;
}

std::vector<ComponentId> ComponentRegistry::healthy_components() const {
    std::vector<ComponentId> result;
    for (const auto& entry : entries_) {
        if (entry.is_healthy()) result.push_back(entry.id);
    }
    return result;
}

size_t ComponentRegistry::count(HealthStatus status) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [status](const ComponentStatus& c) { return c.status == status; }));
}

bool ComponentRegistry::is_healthy(const ComponentId& id) const {
    const auto* entry = find(id);
    return entry != nullptr && entry->is_healthy();
}

std::vector<ComponentId> ComponentRegistry::dependents_of(const ComponentId& id) const {
    std::vector<ComponentId> result;
    for (const auto& entry : entries_) {
        if (std::find(entry.dependencies.begin(), entry.dependencies.end(), id)
            != entry.dependencies.end()) {
            result.push_back(entry.id);
        }
    }
    return result;
}

// ─────────────────────────────────────────────
// Dependency rules
// ─────────────────────────────────────────────

bool ComponentRegistry::dependencies_satisfied(const ComponentStatus& component) const {
    return std::all_of(component.dependencies.begin(), component.dependencies.end(),
        [this](const ComponentId& dep) { return is_healthy(dep); });
}

std::vector<ComponentId> ComponentRegistry::failed_dependencies(const ComponentStatus& component) const {
    std::vector<ComponentId> failed;
    for (const auto& dep : component.dependencies) {
        if (!is_healthy(dep)) failed.push_back(dep);
    }
    return failed;
}

StartCheck ComponentRegistry::can_start(const ComponentStatus& component) const {
    auto failed = failed_dependencies(component);
    if (failed.empty()) {
        return StartCheck{.can_start = true, .reason = "All dependencies satisfied", .blocked_by = {}};
    }
    auto reason = "Blocked by " + std::to_string(failed.size()) + " failed dependencies";
    return StartCheck{.can_start = false, .reason = std::move(reason), .blocked_by = std::move(failed)};
}

std::vector<ComponentId> ComponentRegistry::startup_order() const {
    std::vector<ComponentId> order;
    order.reserve(entries_.size());

    std::unordered_set<ComponentId> remaining;
    for (const auto& entry : entries_) remaining.insert(entry.id);

    while (!remaining.empty()) {
        bool added_any = false;

        for (const auto& entry : entries_) {
            if (!remaining.count(entry.id)) continue;

            bool blocked = std::any_of(entry.dependencies.begin(), entry.dependencies.end(),
                [&](const ComponentId& dep) { return dep != entry.id && remaining.count(dep) > 0; });
            if (!blocked) {
                order.push_back(entry.id);
                remaining.erase(entry.id);
                added_any = true;
            }
        }

        // Cycle: release the earliest-registered remaining component
        if (!added_any) {
            for (const auto& entry : entries_) {
                if (remaining.count(entry.id)) {
                    order.push_back(entry.id);
                    remaining.erase(entry.id);
                    break;
                }
            }
        }
    }

    return order;
}

}  // namespace coordination_core
