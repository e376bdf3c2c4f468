/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "routing/routing_decider.hpp"
#include "scheduler/fairness_scheduler.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace coordination_core {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_routing_decision(const UnifiedMessage& message,
                                 const RoutingDecision& decision,
                                 double latency_ms);
    void record_operation_event(const OperationId& id, std::string_view event,
                                std::optional<ExecutionStrategy> strategy,
                                Millis duration = Millis{0});
    void record_health_update(double health, size_t healthy, size_t total);
    void record_scheduler_stats(const SchedulerStats& stats);
    void record_metrics_snapshot(const MetricsSnapshot& snapshot);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace coordination_core
