/**
 * @file fairness_scheduler.cpp
 * @brief FairnessScheduler implementation.
 */

#include "scheduler/fairness_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace coordination_core {

namespace {

constexpr auto kMinuteWindow = std::chrono::seconds(60);
constexpr auto kHourWindow = std::chrono::seconds(3600);

double elapsed_ms(SteadyTime from, SteadyTime to) {
    if (to <= from) return 0.0;
    return std::chrono::duration<double, std::milli>(to - from).count();
}

}  // anonymous namespace

FairnessScheduler::FairnessScheduler(SchedulerConfig config, SchedulerClock clock,
                                     bool start_aging, Logger* logger)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : SchedulerClock{[] { return std::chrono::steady_clock::now(); }})
    , logger_(logger) {

    for (const auto& q : config_.quotas) {
        quotas_[q.agent] = AgentQuota{q.agent, q.max_concurrent, q.max_per_minute, q.max_per_hour};
    }

    if (start_aging && config_.fairness_enabled && config_.aging_interval_ms > 0) {
        aging_thread_ = std::jthread([this](std::stop_token stop) {
            aging_loop(stop);
        });
    }
}

FairnessScheduler::~FairnessScheduler() {
    shutdown();
}

// ─────────────────────────────────────────────
// Submission / Dispatch
// ─────────────────────────────────────────────

bool FairnessScheduler::submit(ScheduledTask task) {
    return try_submit(std::move(task)) == SubmitOutcome::Accepted;
}

SubmitOutcome FairnessScheduler::try_submit(ScheduledTask task) {
    std::lock_guard lock(mutex_);
    auto now = clock_();

    bool duplicate = active_.count(task.task_id) > 0
        || std::any_of(queue_.begin(), queue_.end(),
                       [&](const PendingEntry& e) { return e.task.task_id == task.task_id; });
    auto outcome = duplicate ? SubmitOutcome::Duplicate : check_quota_locked(task.agent_id, now);

    if (outcome != SubmitOutcome::Accepted) {
        ++total_rejected_;
        ++counters_[task.agent_id].rejected;
        if (logger_) {
            logger_->debug("Task rejected", {{"task", task.task_id},
                                             {"agent", task.agent_id},
                                             {"reason", std::string{to_string(outcome)}}});
        }
        return outcome;
    }

    if (!std::isfinite(task.priority)) task.priority = ScheduledTask::kLowestPriority;
    task.priority = std::clamp(task.priority, ScheduledTask::kHighestPriority,
                               ScheduledTask::kLowestPriority);
    if (task.submitted_at == SteadyTime{}) task.submitted_at = now;

    double base = task.priority;
    ++counters_[task.agent_id].submitted;
    queue_.push_back(PendingEntry{std::move(task), base});
    ++total_submitted_;

    sort_locked();
    return SubmitOutcome::Accepted;
}

std::optional<ScheduledTask> FairnessScheduler::next() {
    return next_if({});
}

std::optional<ScheduledTask> FairnessScheduler::next_if(
        const std::function<bool(const ScheduledTask&)>& ready) {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const PendingEntry& e) {
        return under_concurrency_limit_locked(e.task.agent_id) && (!ready || ready(e.task));
    });
    if (it == queue_.end()) return std::nullopt;

    ScheduledTask task = std::move(it->task);
    queue_.erase(it);

    auto now = clock_();
    active_.emplace(task.task_id, task);
    ++active_per_agent_[task.agent_id];
    usage_[task.agent_id].push_back(now);

    auto& counters = counters_[task.agent_id];
    counters.wait_sum_ms += elapsed_ms(task.submitted_at, now);
    ++counters.wait_samples;

    compact_locked(now);
    sort_locked();
    return task;
}

bool FairnessScheduler::complete(const TaskResult& result) {
    std::lock_guard lock(mutex_);

    auto it = active_.find(result.task_id);
    if (it == active_.end()) return false;

    // The agent recorded at submission is authoritative
    AgentId agent = it->second.agent_id;
    active_.erase(it);
    if (auto a = active_per_agent_.find(agent); a != active_per_agent_.end()) {
        if (--a->second == 0) active_per_agent_.erase(a);
    }

    auto& counters = counters_[agent];
    if (result.success) {
        ++total_completed_;
        ++counters.completed;
    } else {
        ++total_failed_;
        ++counters.failed;
    }
    duration_sum_ms_ += static_cast<double>(result.duration.count());
    ++duration_samples_;

    sort_locked();
    return true;
}

bool FairnessScheduler::cancel(const TaskId& task) {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const PendingEntry& e) { return e.task.task_id == task; });
    if (it == queue_.end()) return false;

    if (logger_) {
        logger_->debug("Task cancelled", {{"task", task}, {"agent", it->task.agent_id}});
    }
    queue_.erase(it);
    return true;
}

// ─────────────────────────────────────────────
// Quotas
// ─────────────────────────────────────────────

void FairnessScheduler::set_agent_quota(const AgentId& agent, AgentQuota quota) {
    std::lock_guard lock(mutex_);
    quota.agent_id = agent;
    quotas_[agent] = std::move(quota);
}

void FairnessScheduler::clear_agent_quota(const AgentId& agent) {
    std::lock_guard lock(mutex_);
    quotas_.erase(agent);
}

std::optional<AgentQuota> FairnessScheduler::agent_quota(const AgentId& agent) const {
    std::lock_guard lock(mutex_);
    auto it = quotas_.find(agent);
    if (it == quotas_.end()) return std::nullopt;
    return it->second;
}

SubmitOutcome FairnessScheduler::check_quota_locked(const AgentId& agent, SteadyTime now) const {
    if (!config_.quota_enabled) return SubmitOutcome::Accepted;

    auto q = quotas_.find(agent);
    if (q == quotas_.end()) return SubmitOutcome::Accepted;
    const auto& quota = q->second;

    if (!under_concurrency_limit_locked(agent)) return SubmitOutcome::ConcurrentLimit;

    auto u = usage_.find(agent);
    if (u == usage_.end()) return SubmitOutcome::Accepted;

    size_t last_minute = 0;
    size_t last_hour = 0;
    for (auto t = u->second.rbegin(); t != u->second.rend(); ++t) {
        if (*t <= now - kHourWindow) break;
        ++last_hour;
        if (*t > now - kMinuteWindow) ++last_minute;
    }

    if (quota.max_per_minute > 0 && last_minute >= quota.max_per_minute) {
        return SubmitOutcome::MinuteLimit;
    }
    if (quota.max_per_hour > 0 && last_hour >= quota.max_per_hour) {
        return SubmitOutcome::HourLimit;
    }
    return SubmitOutcome::Accepted;
}

bool FairnessScheduler::under_concurrency_limit_locked(const AgentId& agent) const {
    if (!config_.quota_enabled) return true;
    auto q = quotas_.find(agent);
    if (q == quotas_.end() || q->second.max_concurrent == 0) return true;

    auto a = active_per_agent_.find(agent);
    size_t active = a == active_per_agent_.end() ? 0 : a->second;
    return active < q->second.max_concurrent;
}

// ─────────────────────────────────────────────
// Aging and Ordering
// ─────────────────────────────────────────────

void FairnessScheduler::run_aging_pass() {
    std::lock_guard lock(mutex_);
    auto now = clock_();
    age_locked(now);
    sort_locked();
    compact_locked(now);
}

void FairnessScheduler::age_locked(SteadyTime now) {
    auto interval = static_cast<double>(config_.aging_interval_ms);
    if (interval <= 0.0) return;

    for (auto& entry : queue_) {
        double increments = std::floor(elapsed_ms(entry.task.submitted_at, now) / interval);
        if (increments > 0.0 && entry.base_priority > ScheduledTask::kHighestPriority) {
            entry.task.priority = std::max(ScheduledTask::kHighestPriority,
                                           entry.base_priority - increments * config_.aging_factor);
        } else {
            entry.task.priority = entry.base_priority;
        }
    }
}

void FairnessScheduler::sort_locked() {
    auto active_for = [this](const AgentId& agent) -> size_t {
        auto it = active_per_agent_.find(agent);
        return it == active_per_agent_.end() ? 0 : it->second;
    };

    std::stable_sort(queue_.begin(), queue_.end(),
        [&](const PendingEntry& lhs, const PendingEntry& rhs) {
            const auto& a = lhs.task;
            const auto& b = rhs.task;
            if (a.priority != b.priority) return a.priority < b.priority;
            if (config_.fairness_enabled) {
                auto a_active = active_for(a.agent_id);
                auto b_active = active_for(b.agent_id);
                if (a_active != b_active) return a_active < b_active;
            }
            if (a.submitted_at != b.submitted_at) return a.submitted_at < b.submitted_at;
            return a.task_id < b.task_id;
        });
}

void FairnessScheduler::compact_usage() {
    std::lock_guard lock(mutex_);
    compact_locked(clock_());
}

void FairnessScheduler::compact_locked(SteadyTime now) {
    for (auto it = usage_.begin(); it != usage_.end(); ) {
        auto& stamps = it->second;
        while (!stamps.empty() && stamps.front() <= now - kHourWindow) {
            stamps.pop_front();
        }
        it = stamps.empty() ? usage_.erase(it) : std::next(it);
    }
}

void FairnessScheduler::aging_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    auto interval = Millis{config_.aging_interval_ms};
    while (!stop.stop_requested()) {
        aging_cv_.wait_for(lock, stop, interval, [] { return false; });
        if (stop.stop_requested()) break;

        auto now = clock_();
        age_locked(now);
        sort_locked();
        compact_locked(now);
    }
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

size_t FairnessScheduler::clear_queue() {
    std::lock_guard lock(mutex_);
    size_t dropped = queue_.size();
    queue_.clear();
    if (logger_ && dropped > 0) {
        logger_->warn("Scheduler queue cleared", {{"dropped", std::to_string(dropped)}});
    }
    return dropped;
}

void FairnessScheduler::shutdown() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (aging_thread_.joinable()) {
        aging_thread_.request_stop();
        aging_thread_.join();
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

size_t FairnessScheduler::queue_length() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

size_t FairnessScheduler::active_count() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

size_t FairnessScheduler::active_count_for(const AgentId& agent) const {
    std::lock_guard lock(mutex_);
    auto it = active_per_agent_.find(agent);
    return it == active_per_agent_.end() ? 0 : it->second;
}

bool FairnessScheduler::is_active(const TaskId& task) const {
    std::lock_guard lock(mutex_);
    return active_.count(task) > 0;
}

std::vector<ScheduledTask> FairnessScheduler::pending() const {
    std::lock_guard lock(mutex_);
    std::vector<ScheduledTask> tasks;
    tasks.reserve(queue_.size());
    for (const auto& entry : queue_) tasks.push_back(entry.task);
    return tasks;
}

size_t FairnessScheduler::usage_entries(const AgentId& agent) const {
    std::lock_guard lock(mutex_);
    auto it = usage_.find(agent);
    return it == usage_.end() ? 0 : it->second.size();
}

SchedulerStats FairnessScheduler::stats() const {
    std::lock_guard lock(mutex_);

    SchedulerStats s;
    s.total_submitted = total_submitted_;
    s.total_completed = total_completed_;
    s.total_failed = total_failed_;
    s.total_rejected = total_rejected_;
    s.queue_length = queue_.size();
    s.active_count = active_.size();
    s.avg_duration_ms = duration_samples_ == 0 ? 0.0
        : duration_sum_ms_ / static_cast<double>(duration_samples_);

    double wait_sum = 0.0;
    uint64_t wait_samples = 0;
    for (const auto& [agent, c] : counters_) {
        s.agents[agent] = AgentStats{
            .submitted = c.submitted,
            .completed = c.completed,
            .failed = c.failed,
            .rejected = c.rejected,
            .avg_wait_ms = c.wait_samples == 0 ? 0.0
                : c.wait_sum_ms / static_cast<double>(c.wait_samples),
        };
        wait_sum += c.wait_sum_ms;
        wait_samples += c.wait_samples;
    }
    s.avg_wait_ms = wait_samples == 0 ? 0.0 : wait_sum / static_cast<double>(wait_samples);
    return s;
}

}  // namespace coordination_core
