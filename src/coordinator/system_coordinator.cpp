/**
 * @file system_coordinator.cpp
 * @brief SystemCoordinator implementation.
 */

#include "coordinator/system_coordinator.hpp"

#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace coordination_core {

namespace {

constexpr auto kTrailingWindow = std::chrono::hours(1);
constexpr std::string_view kSystemAgent = "system";

/// P0 maps to the scheduler's highest priority, P3 to 4.
double scheduler_priority(Priority priority) noexcept {
    return ScheduledTask::kHighestPriority + static_cast<double>(static_cast<uint8_t>(priority));
}

size_t mode_index(RoutingMode mode) noexcept {
    return static_cast<size_t>(mode);
}

/// Healthy participants, else every registered participant that has not failed.
std::vector<ComponentId> dispatch_targets(const SystemState& state, const Operation& operation) {
    std::vector<ComponentId> targets;
    for (const auto& participant : operation.participants) {
        if (state.components.is_healthy(participant)) targets.push_back(participant);
    }
    if (!targets.empty()) return targets;

    for (const auto& participant : operation.participants) {
        auto component = state.components.get(participant);
        if (component && component->status != HealthStatus::Failed) targets.push_back(participant);
    }
    return targets;
}

}  // anonymous namespace

SystemCoordinator::SystemCoordinator(Options opts)
    : config_(std::move(opts.config))
    , logger_(opts.log_sink ? std::move(opts.log_sink)
                            : std::unique_ptr<ILogSink>(std::make_unique<StdoutSink>()),
              opts.log_level)
    , metrics_(opts.metrics_sink ? std::move(opts.metrics_sink)
                                 : std::unique_ptr<ILogSink>(std::make_unique<NullSink>()))
    , events_(config_.events, &logger_)
    , clock_(opts.clock ? std::move(opts.clock) : SchedulerClock{[] { return std::chrono::steady_clock::now(); }})
    , scheduler_(opts.scheduler
                 ? std::move(opts.scheduler)
                 : std::make_shared<FairnessScheduler>(config_.scheduler, clock_,
                                                       opts.start_background, &logger_))
    , selector_(config_.strategy)
    , planner_(risk_, selector_, &logger_)
    , validator_(risk_, selector_, &logger_)
    , health_evaluator_(&logger_)
    , router_(config_.routing, &logger_)
    , state_(std::make_shared<const SystemState>()) {
    if (opts.start_background) {
        start();
    }
}

SystemCoordinator::~SystemCoordinator() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void SystemCoordinator::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (running_.exchange(true)) return;

    health_thread_ = std::jthread([this](std::stop_token stop) { health_loop(stop); });
    metrics_thread_ = std::jthread([this](std::stop_token stop) { metrics_loop(stop); });

    logger_.info("SystemCoordinator started",
                 {{"health_interval_ms", std::to_string(config_.coordinator.health_check_interval_ms)},
                  {"metrics_interval_ms", std::to_string(config_.coordinator.metrics_export_interval_ms)}});
}

void SystemCoordinator::shutdown() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    bool was_running = running_.exchange(false);

    if (health_thread_.joinable()) {
        health_thread_.request_stop();
        health_thread_.join();
    }
    if (metrics_thread_.joinable()) {
        metrics_thread_.request_stop();
        metrics_thread_.join();
    }
    scheduler_->shutdown();

    if (was_running) {
        logger_.info("SystemCoordinator stopped");
    }
    metrics_.flush();
    logger_.flush();
}

void SystemCoordinator::health_loop(std::stop_token stop) {
    const auto interval = Millis{config_.coordinator.health_check_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(loop_mutex_);
            if (loop_cv_.wait_for(lock, stop, interval, [] { return false; })) break;
        }
        if (stop.stop_requested()) break;

        try {
            check_health();
            evict_expired_operations(clock_());
        } catch (const std::exception& e) {
            // The tick is retried next interval
            logger_.error("Periodic health check failed", {{"error", e.what()}});
        }
    }
}

void SystemCoordinator::metrics_loop(std::stop_token stop) {
    const auto interval = Millis{config_.coordinator.metrics_export_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(loop_mutex_);
            if (loop_cv_.wait_for(lock, stop, interval, [] { return false; })) break;
        }
        if (stop.stop_requested()) break;

        try {
            export_metrics();
        } catch (const std::exception& e) {
            logger_.error("Metrics export failed", {{"error", e.what()}});
        }
    }
}

// ─────────────────────────────────────────────
// State
// ─────────────────────────────────────────────

template <typename F>
bool SystemCoordinator::mutate(F&& fn) {
    std::lock_guard lock(write_mutex_);
    auto next = std::make_shared<SystemState>(*state_.load());
    if (!fn(*next)) return false;
    state_.store(StateSnapshot{std::move(next)});
    return true;
}

StateSnapshot SystemCoordinator::state() const {
    return state_.load();
}

// ─────────────────────────────────────────────
// Components
// ─────────────────────────────────────────────

void SystemCoordinator::register_component(ComponentStatus component) {
    if (component.last_heartbeat == Timestamp{}) {
        component.last_heartbeat = std::chrono::system_clock::now();
    }

    bool added = false;
    mutate([&](SystemState& s) {
        added = s.components.register_component(component);
        return true;
    });

    logger_.info(added ? "Component registered" : "Component re-registered",
                 {{"component", component.id},
                  {"status", std::string{to_string(component.status)}},
                  {"dependencies", std::to_string(component.dependencies.size())}});
    events_.publish(std::string{topics::kComponentRegistered}, component);
}

bool SystemCoordinator::unregister_component(const ComponentId& id) {
    bool removed = mutate([&](SystemState& s) { return s.components.unregister_component(id); });
    if (!removed) return false;

    {
        std::lock_guard lock(probe_mutex_);
        probes_.erase(id);
    }
    logger_.info("Component unregistered", {{"component", id}});
    events_.publish(std::string{topics::kComponentUnregistered}, ComponentUnregistered{id});
    return true;
}

void SystemCoordinator::register_health_probe(const ComponentId& id, HealthProbe probe) {
    std::lock_guard lock(probe_mutex_);
    if (probe) {
        probes_[id] = std::move(probe);
    } else {
        probes_.erase(id);
    }
}

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

Result<RouteResponse> SystemCoordinator::send_message(UnifiedMessage message) {
    if (message.timestamp == Timestamp{}) {
        message.timestamp = std::chrono::system_clock::now();
    }

    auto snapshot = state();
    RouteRequest request;
    request.hub_healthy = snapshot->health > config_.coordinator.hub_health_threshold;
    {
        std::lock_guard lock(queue_mutex_);
        request.direct_available =
            queues_[mode_index(RoutingMode::Direct)].size() < config_.coordinator.direct_queue_limit;
    }
    request.message = message;

    auto response = router_.route(*snapshot, request);
    if (!response.success) {
        logger_.error("Message routing failed", {{"source", message.source},
                                                 {"target", message.target},
                                                 {"error", response.error}});
        return Error{ErrorCode::Internal, "Routing failed: " + response.error};
    }

    auto mode = response.decision.mode;
    {
        std::lock_guard lock(queue_mutex_);
        auto& queue = queues_[mode_index(mode)];
        if (queue.size() >= config_.coordinator.message_queue_capacity) {
            logger_.warn("Message queue full", {{"mode", std::string{to_string(mode)}},
                                                {"target", message.target}});
            return Error{ErrorCode::QueueFull,
                         "Message queue full for mode " + std::string{to_string(mode)}};
        }
        queue.push_back(message);
        logger_.debug("Message queued", {{"source", message.source},
                                         {"target", message.target},
                                         {"mode", std::string{to_string(mode)}},
                                         {"depth", std::to_string(queue.size())}});
    }

    events_.publish(topics::message_topic(message.target), message);
    events_.publish(std::string{topics::kMessageRouted},
                    MessageRouted{message, mode, response.latency_ms});
    metrics_.record_routing_decision(message, response.decision, response.latency_ms);
    return response;
}

std::vector<UnifiedMessage> SystemCoordinator::drain_messages(RoutingMode mode, size_t max) {
    std::lock_guard lock(queue_mutex_);
    auto& queue = queues_[mode_index(mode)];
    size_t n = std::min(max, queue.size());

    std::vector<UnifiedMessage> drained;
    drained.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        drained.push_back(std::move(queue.front()));
        queue.pop_front();
    }
    return drained;
}

// ─────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────

Result<OperationId> SystemCoordinator::start_operation(Operation operation,
                                                       const StartOperationOptions& options) {
    const OperationId id = operation.id;
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Operation id is empty"};
    }

    try {
        auto snapshot = state();
        if (snapshot->active_operations.contains(id)) {
            return Error{ErrorCode::InvalidArgument, "Operation already active: " + id};
        }

        ExecuteOperationRequest request;
        request.operation = std::move(operation);
        request.force_execution = options.force_execution;
        request.override_risk = options.override_risk;

        auto planned = planner_.plan(*snapshot, request);
        if (!planned.success) {
            auto error = planned.error.value_or(Error{ErrorCode::Internal, "Planning failed"});
            metrics_.record_operation_event(id, "rejected", planned.strategy_decision.strategy);
            return error;
        }

        Operation active = planned.operation;
        auto now = clock_();
        active.started_at = now;
        active.deadline = now + Millis{config_.coordinator.operation_timeout_ms};

        bool inserted = mutate([&](SystemState& s) {
            return s.active_operations.emplace(active.id, active).second;
        });
        if (!inserted) {
            return Error{ErrorCode::InvalidArgument, "Operation already active: " + id};
        }

        if (active.strategy == ExecutionStrategy::Queued) {
            ScheduledTask task;
            task.task_id = active.id;
            task.agent_id = active.initiator.empty() ? AgentId{kSystemAgent} : active.initiator;
            task.priority = scheduler_priority(active.priority);
            task.estimated_duration = planned.plan.estimated_duration;
            task.type = active.type;
            task.description = active.reasoning;

            auto outcome = scheduler_->try_submit(std::move(task));
            if (outcome != SubmitOutcome::Accepted) {
                mutate([&](SystemState& s) { return s.active_operations.erase(id) > 0; });
                logger_.warn("Scheduler refused operation",
                             {{"operation", id}, {"outcome", std::string{to_string(outcome)}}});
                metrics_.record_operation_event(id, "rejected", active.strategy);
                auto code = outcome == SubmitOutcome::Duplicate ? ErrorCode::InvalidArgument
                                                                : ErrorCode::QuotaExceeded;
                return Error{code, "Scheduler refused operation " + id + ": "
                                   + std::string{to_string(outcome)}};
            }
        }

        logger_.info("Operation started",
                     {{"operation", id},
                      {"type", active.type},
                      {"strategy", std::string{to_string(planned.plan.strategy)}},
                      {"risk", std::string{to_string(planned.risk.level)}},
                      {"participants", std::to_string(active.participants.size())}});

        events_.publish(std::string{topics::kOperationStarted}, active);
        dispatch(active, planned);
        metrics_.record_operation_event(id, "started", active.strategy,
                                        planned.plan.estimated_duration);
        return id;
    } catch (const std::exception& e) {
        logger_.error("Operation start failed", {{"operation", id}, {"error", e.what()}});
        throw;
    }
}

void SystemCoordinator::dispatch(const Operation& operation,
                                 const ExecuteOperationResponse& planned) {
    switch (planned.plan.strategy) {
        case ExecutionStrategy::Immediate:
            for (const auto& participant : planned.plan.participants) {
                events_.publish(topics::execute_topic(participant),
                                OperationDispatch{operation, std::nullopt});
            }
            break;

        case ExecutionStrategy::Distributed:
            for (const auto& assignment : planned.plan.workload_distribution) {
                Operation shard = operation;
                shard.shard = assignment.shard;
                shard.payload = assignment.payload;
                events_.publish(topics::execute_topic(assignment.component_id),
                                OperationDispatch{std::move(shard), assignment.shard});
            }
            break;

        case ExecutionStrategy::Delegated:
            if (planned.plan.delegated_to) {
                events_.publish(topics::execute_topic(*planned.plan.delegated_to),
                                OperationDispatch{operation, std::nullopt});
            } else {
                logger_.warn("Delegated operation has no delegate", {{"operation", operation.id}});
            }
            break;

        case ExecutionStrategy::Queued:
            events_.publish(std::string{topics::kOperationQueued}, operation);
            break;
    }
}

size_t SystemCoordinator::dispatch_queued(size_t max) {
    // Tasks whose operation finished or expired while pending. The snapshot is
    // taken after pending() since operations are published before submission.
    auto pending = scheduler_->pending();
    auto snapshot = state();
    for (const auto& task : pending) {
        if (!snapshot->active_operations.contains(task.task_id) && scheduler_->cancel(task.task_id)) {
            logger_.debug("Dropped stale scheduler task", {{"task", task.task_id}});
        }
    }

    size_t dispatched = 0;
    while (dispatched < max) {
        snapshot = state();
        // Work stays pending until some participant can take it
        auto task = scheduler_->next_if([&snapshot](const ScheduledTask& t) {
            auto it = snapshot->active_operations.find(t.task_id);
            return it != snapshot->active_operations.end()
                && !dispatch_targets(*snapshot, it->second).empty();
        });
        if (!task) break;

        const auto& operation = snapshot->active_operations.at(task->task_id);
        auto targets = dispatch_targets(*snapshot, operation);
        bool degraded = std::none_of(targets.begin(), targets.end(), [&](const ComponentId& id) {
            return snapshot->components.is_healthy(id);
        });

        for (const auto& target : targets) {
            events_.publish(topics::execute_topic(target), OperationDispatch{operation, std::nullopt});
        }
        LogFields fields{{"operation", operation.id},
                         {"agent", task->agent_id},
                         {"targets", std::to_string(targets.size())}};
        if (degraded) {
            logger_.warn("Queued operation dispatched without a healthy participant", fields);
        } else {
            logger_.info("Queued operation dispatched", fields);
        }
        ++dispatched;
    }

    if (dispatched < max && scheduler_->queue_length() > 0) {
        logger_.debug("Queued operations waiting for a live participant",
                      {{"pending", std::to_string(scheduler_->queue_length())}});
    }
    return dispatched;
}

void SystemCoordinator::finish_locked(SystemState& state, const Operation& operation,
                                      bool success, Millis duration, SteadyTime now) {
    state.active_operations.erase(operation.id);

    auto& m = state.metrics;
    if (success) {
        ++m.completed_operations;
    } else {
        ++m.failed_operations;
    }
    uint64_t finished = m.completed_operations + m.failed_operations;
    total_operation_ms_ += static_cast<double>(duration.count());
    m.average_operation_time_ms = total_operation_ms_ / static_cast<double>(finished);
    m.error_rate = static_cast<double>(m.failed_operations) / static_cast<double>(finished);

    completions_.push_back(now);
    while (!completions_.empty() && completions_.front() + kTrailingWindow <= now) {
        completions_.pop_front();
    }
    m.operations_per_hour = static_cast<double>(completions_.size());
}

Result<void> SystemCoordinator::complete_operation(const OperationId& id, bool success,
                                                   Millis duration, std::string error) {
    auto now = clock_();
    std::optional<Operation> finished;
    mutate([&](SystemState& s) {
        auto it = s.active_operations.find(id);
        if (it == s.active_operations.end()) return false;
        finished = it->second;
        finish_locked(s, it->second, success, duration, now);
        return true;
    });

    if (!finished) {
        return Error{ErrorCode::NotFound, "Operation not active: " + id};
    }

    if (finished->strategy == ExecutionStrategy::Queued) {
        auto agent = finished->initiator.empty() ? AgentId{kSystemAgent} : finished->initiator;
        if (!scheduler_->complete(TaskResult{id, agent, success, duration, error})
            && scheduler_->cancel(id)) {
            logger_.debug("Operation finished before dispatch", {{"operation", id}});
        }
    }

    if (success) {
        logger_.info("Operation completed",
                     {{"operation", id}, {"duration_ms", std::to_string(duration.count())}});
    } else {
        logger_.warn("Operation failed", {{"operation", id}, {"error", error}});
    }

    events_.publish(std::string{success ? topics::kOperationCompleted : topics::kOperationFailed},
                    OperationFinished{id, success, duration, error});
    metrics_.record_operation_event(id, success ? "completed" : "failed",
                                    finished->strategy, duration);
    return {};
}

size_t SystemCoordinator::evict_expired_operations(SteadyTime now) {
    std::vector<Operation> expired;
    mutate([&](SystemState& s) {
        for (const auto& [id, op] : s.active_operations) {
            if (op.deadline != SteadyTime{} && op.deadline <= now) expired.push_back(op);
        }
        for (const auto& op : expired) {
            auto elapsed = std::chrono::duration_cast<Millis>(now - op.started_at);
            finish_locked(s, op, false, elapsed, now);
        }
        return !expired.empty();
    });

    for (const auto& op : expired) {
        auto elapsed = std::chrono::duration_cast<Millis>(now - op.started_at);
        if (op.strategy == ExecutionStrategy::Queued) {
            auto agent = op.initiator.empty() ? AgentId{kSystemAgent} : op.initiator;
            if (!scheduler_->complete(TaskResult{op.id, agent, false, elapsed, "timeout"})
                && scheduler_->cancel(op.id)) {
                logger_.debug("Expired operation never dispatched", {{"operation", op.id}});
            }
        }
        logger_.warn("Operation timed out", {{"operation", op.id},
                                             {"elapsed_ms", std::to_string(elapsed.count())}});
        events_.publish(std::string{topics::kOperationTimeout},
                        OperationFinished{op.id, false, elapsed, "timeout"});
        metrics_.record_operation_event(op.id, "timeout", op.strategy, elapsed);
    }
    return expired.size();
}

// ─────────────────────────────────────────────
// Health & validation
// ─────────────────────────────────────────────

HealthEvaluation SystemCoordinator::check_health(const std::vector<HealthCheckResult>& checks) {
    HealthProbeMap probes;
    {
        std::lock_guard lock(probe_mutex_);
        probes = probes_;
    }

    HealthEvaluation evaluation;
    size_t healthy = 0;
    size_t total = 0;
    try {
        // Probes run against a snapshot, outside the writer lock
        evaluation = health_evaluator_.evaluate(*state(), checks, probes);

        mutate([&](SystemState& s) {
            for (const auto& transition : evaluation.transitions) {
                s.components.update_status(transition.component_id, transition.to);
            }
            s.health = HealthEvaluator::compute_health(s.components, s.metrics.error_rate);
            s.metrics.listener_count = events_.listener_count();
            s.last_health_check = std::chrono::system_clock::now();

            evaluation.components = s.components;
            evaluation.health = s.health;
            healthy = s.components.count(HealthStatus::Healthy);
            total = s.components.size();
            return true;
        });
    } catch (const std::exception& e) {
        logger_.error("Health check failed", {{"checks", std::to_string(checks.size())},
                                              {"error", e.what()}});
        throw;
    }

    for (const auto& transition : evaluation.transitions) {
        auto level = transition.to == HealthStatus::Failed ? LogLevel::Warn : LogLevel::Info;
        logger_.log(level, "Component status changed",
                    {{"component", transition.component_id},
                     {"from", std::string{to_string(transition.from)}},
                     {"to", std::string{to_string(transition.to)}}});
    }
    logger_.debug("Health updated", {{"health", std::to_string(evaluation.health)},
                                     {"healthy", std::to_string(healthy)},
                                     {"total", std::to_string(total)}});
    events_.publish(std::string{topics::kHealthUpdated}, HealthUpdate{evaluation.health});
    metrics_.record_health_update(evaluation.health, healthy, total);
    return evaluation;
}

ValidationReport SystemCoordinator::validate_system(const ValidateSystemRequest& request) const {
    return validator_.validate(*state(), request);
}

OperationValidation SystemCoordinator::validate_operation(const Operation& operation) const {
    return validator_.validate_operation(operation, *state());
}

// ─────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────

SystemStatusSummary SystemCoordinator::get_system_status() const {
    auto snapshot = state();

    SystemStatusSummary summary;
    summary.health = snapshot->health;
    summary.components_healthy = snapshot->components.count(HealthStatus::Healthy);
    summary.components_total = snapshot->components.size();
    summary.active_operations = snapshot->active_operations.size();
    {
        std::lock_guard lock(queue_mutex_);
        summary.direct_queue = queues_[mode_index(RoutingMode::Direct)].size();
        summary.hub_queue = queues_[mode_index(RoutingMode::Hub)].size();
        summary.fallback_queue = queues_[mode_index(RoutingMode::Fallback)].size();
    }
    summary.queued_messages = summary.direct_queue + summary.hub_queue + summary.fallback_queue;
    summary.pending_tasks = scheduler_->queue_length();
    summary.active_tasks = scheduler_->active_count();
    return summary;
}

RoutingMetrics SystemCoordinator::routing_metrics() const {
    return router_.metrics();
}

RoutingStatus SystemCoordinator::routing_status() const {
    return router_.routing_status();
}

MetricsSnapshot SystemCoordinator::export_metrics() {
    MetricsSnapshot snapshot{std::chrono::system_clock::now(), get_system_status(), routing_status()};

    events_.publish(std::string{topics::kMetricsExported}, snapshot);
    metrics_.record_metrics_snapshot(snapshot);
    metrics_.record_scheduler_stats(scheduler_->stats());
    metrics_.flush();

    logger_.debug("Metrics exported",
                  {{"health", std::to_string(snapshot.status.health)},
                   {"active_operations", std::to_string(snapshot.status.active_operations)},
                   {"messages", std::to_string(snapshot.routing.metrics.total_messages)}});
    return snapshot;
}

}  // namespace coordination_core
