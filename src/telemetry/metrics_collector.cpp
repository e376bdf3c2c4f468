/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace coordination_core {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_routing_decision(const UnifiedMessage& message,
                                               const RoutingDecision& decision,
                                               double latency_ms) {
    std::ostringstream oss;
    oss << R"({"event":"routing_decision")"
        << R"(,"source":")" << json_escape(message.source) << "\""
        << R"(,"target":")" << json_escape(message.target) << "\""
        << R"(,"mode":")" << to_string(decision.mode) << "\""
        << R"(,"max_retries":)" << decision.max_retries
        << R"(,"latency_ms":)" << latency_ms
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_operation_event(const OperationId& id, std::string_view event,
                                              std::optional<ExecutionStrategy> strategy,
                                              Millis duration) {
    std::ostringstream oss;
    oss << R"({"event":"operation_event")"
        << R"(,"operation":")" << json_escape(id) << "\""
        << R"(,"state":")" << json_escape(event) << "\"";
    if (strategy) {
        oss << R"(,"strategy":")" << to_string(*strategy) << "\"";
    }
    oss << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_health_update(double health, size_t healthy, size_t total) {
    std::ostringstream oss;
    oss << R"({"event":"health_update")"
        << R"(,"health":)" << health
        << R"(,"healthy":)" << healthy
        << R"(,"total":)" << total
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_scheduler_stats(const SchedulerStats& stats) {
    std::ostringstream oss;
    oss << R"({"event":"scheduler_stats")"
        << R"(,"submitted":)" << stats.total_submitted
        << R"(,"completed":)" << stats.total_completed
        << R"(,"failed":)" << stats.total_failed
        << R"(,"rejected":)" << stats.total_rejected
        << R"(,"queue":)" << stats.queue_length
        << R"(,"active":)" << stats.active_count
        << R"(,"avg_wait_ms":)" << stats.avg_wait_ms
        << R"(,"avg_duration_ms":)" << stats.avg_duration_ms
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_metrics_snapshot(const MetricsSnapshot& snapshot) {
    auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        snapshot.exported_at.time_since_epoch()).count();
    const auto& s = snapshot.status;
    const auto& r = snapshot.routing;

    std::ostringstream oss;
    oss << R"({"event":"metrics_snapshot")"
        << R"(,"ts_ms":)" << ts
        << R"(,"health":)" << s.health
        << R"(,"components_healthy":)" << s.components_healthy
        << R"(,"components_total":)" << s.components_total
        << R"(,"active_operations":)" << s.active_operations
        << R"(,"queues":{"direct":)" << s.direct_queue
        << R"(,"hub":)" << s.hub_queue
        << R"(,"fallback":)" << s.fallback_queue << "}"
        << R"(,"pending_tasks":)" << s.pending_tasks
        << R"(,"routing":{"total":)" << r.metrics.total_messages
        << R"(,"current_mode":")" << to_string(r.current_mode) << "\""
        << R"(,"recommended_mode":")" << to_string(r.recommended_mode) << "\""
        << R"(,"direct_pct":)" << r.direct_percentage
        << R"(,"latency_reduction_pct":)" << r.latency_reduction_pct << "}"
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace coordination_core
