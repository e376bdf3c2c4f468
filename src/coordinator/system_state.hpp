/**
 * @file system_state.hpp
 * @brief Immutable snapshot of the coordination state.
 *
 * SystemCoordinator is the only writer. Every mutation builds a new
 * SystemState from the current one and publishes it with an atomic
 * shared_ptr swap; deciders receive `const SystemState&` and return values.
 */

#pragma once

#include "core/types.hpp"
#include "registry/component_registry.hpp"

#include <cstdint>
#include <map>
#include <memory>

namespace coordination_core {

struct SystemMetrics {
    double operations_per_hour = 0.0;       ///< Completions in the trailing hour
    double average_operation_time_ms = 0.0;
    double error_rate = 0.0;                ///< failed / finished, in [0, 1]
    uint64_t completed_operations = 0;
    uint64_t failed_operations = 0;
    size_t listener_count = 0;
};

struct SystemState {
    double health = 100.0;                  ///< 0–100, only set by HealthEvaluator
    ComponentRegistry components;
    std::map<OperationId, Operation> active_operations;
    SystemMetrics metrics;
    Timestamp last_health_check{};

    /// Number of active operations @p id participates in.
    [[nodiscard]] size_t component_load(const ComponentId& id) const {
        size_t load = 0;
        for (const auto& [op_id, op] : active_operations) {
            for (const auto& participant : op.participants) {
                if (participant == id) {
                    ++load;
                    break;
                }
            }
        }
        return load;
    }
};

using StateSnapshot = std::shared_ptr<const SystemState>;

/// Summary exposed by SystemCoordinator::get_system_status().
struct SystemStatusSummary {
    double health = 100.0;
    size_t components_healthy = 0;
    size_t components_total = 0;
    size_t active_operations = 0;
    size_t queued_messages = 0;
    size_t direct_queue = 0;
    size_t hub_queue = 0;
    size_t fallback_queue = 0;
    size_t pending_tasks = 0;       ///< FairnessScheduler queue length
    size_t active_tasks = 0;
};

}  // namespace coordination_core
