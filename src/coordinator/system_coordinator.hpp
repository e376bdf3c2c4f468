/**
 * @file system_coordinator.hpp
 * @brief Top-level SystemCoordinator facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Registering components and tracking their health
 *   2. Routing messages into per-mode queues
 *   3. Planning, dispatching and completing operations
 *   4. Periodic health checks and metrics export
 *
 * The coordinator is the only writer of SystemState. Readers take a snapshot
 * through state() and never block writers.
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "health/health_evaluator.hpp"
#include "health/system_validator.hpp"
#include "risk/risk_assessor.hpp"
#include "routing/routing_decider.hpp"
#include "scheduler/fairness_scheduler.hpp"
#include "strategy/execution_strategy.hpp"
#include "strategy/operation_planner.hpp"
#include "telemetry/metrics_collector.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace coordination_core {

struct StartOperationOptions {
    bool force_execution = false;
    bool override_risk = false;
};

/**
 * @brief The top-level coordinator that wires all modules together.
 */
class SystemCoordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;         ///< NullSink when empty
        std::shared_ptr<FairnessScheduler> scheduler;   ///< Built from config when empty
        SchedulerClock clock;                           ///< steady_clock when empty
        bool start_background = true;
    };

    explicit SystemCoordinator(Options opts);
    ~SystemCoordinator();

    // Non-copyable, non-movable
    SystemCoordinator(const SystemCoordinator&) = delete;
    SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    // ── Lifecycle ────────────────────────────
    /// Start the health and metrics loops. Idempotent.
    void start();
    /// Stop both loops and the scheduler. Idempotent.
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Components ───────────────────────────
    void register_component(ComponentStatus component);
    bool unregister_component(const ComponentId& id);
    void register_health_probe(const ComponentId& id, HealthProbe probe);

    // ── Messages ─────────────────────────────
    /**
     * @brief Route @p message and append it to its mode queue.
     *
     * Fails with QueueFull when that queue is at capacity.
     */
    Result<RouteResponse> send_message(UnifiedMessage message);

    /// Consumer side of the per-mode queues, oldest first.
    std::vector<UnifiedMessage> drain_messages(RoutingMode mode, size_t max);

    // ── Operations ───────────────────────────
    /**
     * @brief Plan @p operation, record it as active and dispatch it.
     *
     * Expected refusals (no participants, risk gate, quota, duplicate id)
     * come back as errors. Anything else is logged and rethrown.
     */
    Result<OperationId> start_operation(Operation operation,
                                        const StartOperationOptions& options = {});

    /// Pull up to @p max tasks from the scheduler and dispatch them.
    size_t dispatch_queued(size_t max);

    Result<void> complete_operation(const OperationId& id, bool success,
                                    Millis duration, std::string error = {});

    /// Fail every active operation whose deadline is at or before @p now.
    size_t evict_expired_operations(SteadyTime now);

    // ── Health & validation ──────────────────
    HealthEvaluation check_health(const std::vector<HealthCheckResult>& checks = {});
    [[nodiscard]] ValidationReport validate_system(const ValidateSystemRequest& request = {}) const;
    [[nodiscard]] OperationValidation validate_operation(const Operation& operation) const;

    // ── Status ───────────────────────────────
    [[nodiscard]] StateSnapshot state() const;
    [[nodiscard]] SystemStatusSummary get_system_status() const;
    [[nodiscard]] RoutingMetrics routing_metrics() const;
    [[nodiscard]] RoutingStatus routing_status() const;

    /// One metrics:exported tick.
    MetricsSnapshot export_metrics();

    // ── Accessors (for testing) ─────────────
    EventBus& events() { return events_; }
    FairnessScheduler& scheduler() { return *scheduler_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    /// Copy the current state, apply @p fn, publish if it returns true.
    template <typename F>
    bool mutate(F&& fn);

    void dispatch(const Operation& operation, const ExecuteOperationResponse& planned);
    void finish_locked(SystemState& state, const Operation& operation, bool success,
                       Millis duration, SteadyTime now);
    void health_loop(std::stop_token stop);
    void metrics_loop(std::stop_token stop);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    EventBus events_;
    SchedulerClock clock_;
    std::shared_ptr<FairnessScheduler> scheduler_;

    RiskAssessor risk_;
    ExecutionStrategySelector selector_;
    OperationPlanner planner_;
    SystemValidator validator_;
    HealthEvaluator health_evaluator_;
    RoutingDecider router_;

    // State (copy-on-write, single writer)
    std::atomic<StateSnapshot> state_;
    std::mutex write_mutex_;
    std::deque<SteadyTime> completions_;     ///< Guarded by write_mutex_
    double total_operation_ms_ = 0.0;        ///< Guarded by write_mutex_

    // Message queues, indexed by RoutingMode
    mutable std::mutex queue_mutex_;
    std::array<std::deque<UnifiedMessage>, RoutingMetrics::kModeCount> queues_;

    mutable std::mutex probe_mutex_;
    HealthProbeMap probes_;

    // Background loops
    std::mutex lifecycle_mutex_;
    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread health_thread_;
    std::jthread metrics_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace coordination_core
