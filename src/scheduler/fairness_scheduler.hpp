/**
 * @file fairness_scheduler.hpp
 * @brief Priority queue with starvation-free aging and per-agent quotas.
 *
 * Priorities are numeric, 1 (highest) to 5 (lowest). Pending tasks age
 * toward 1 from the priority they were submitted with:
 *
 *   effective = max(1, base - floor(wait / aging_interval) * aging_factor)
 *
 * so a task reaches priority 1 after at most
 * (base - 1) / aging_factor * aging_interval of waiting.
 *
 * Queue order is (priority asc, agent's active tasks asc if fairness is
 * enabled, submission time asc, task id). Quota checks and insertion happen
 * under one mutex, so concurrent submits for the same agent cannot both
 * slip past a concurrency limit.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace coordination_core {

using SchedulerClock = std::function<SteadyTime()>;

struct ScheduledTask {
    static constexpr double kHighestPriority = 1.0;
    static constexpr double kLowestPriority = 5.0;

    TaskId task_id;
    AgentId agent_id;
    double priority = 3.0;              ///< Effective priority; aged while pending
    SteadyTime submitted_at{};          ///< Stamped by submit() when left default
    Millis estimated_duration{0};
    std::string type;
    std::string description;
};

struct TaskResult {
    TaskId task_id;
    AgentId agent_id;
    bool success = true;
    Millis duration{0};
    std::string error;
};

/// A zero limit leaves that dimension unbounded.
struct AgentQuota {
    AgentId agent_id;
    uint32_t max_concurrent = 0;
    uint32_t max_per_minute = 0;
    uint32_t max_per_hour = 0;
};

enum class SubmitOutcome : uint8_t {
    Accepted,
    ConcurrentLimit,
    MinuteLimit,
    HourLimit,
    Duplicate
};

[[nodiscard]] constexpr std::string_view to_string(SubmitOutcome outcome) noexcept {
    switch (outcome) {
        case SubmitOutcome::Accepted:        return "accepted";
        case SubmitOutcome::ConcurrentLimit: return "concurrent_limit";
        case SubmitOutcome::MinuteLimit:     return "minute_limit";
        case SubmitOutcome::HourLimit:       return "hour_limit";
        case SubmitOutcome::Duplicate:       return "duplicate";
    }
    return "unknown";
}

struct AgentStats {
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t rejected = 0;
    double avg_wait_ms = 0.0;
};

struct SchedulerStats {
    uint64_t total_submitted = 0;
    uint64_t total_completed = 0;
    uint64_t total_failed = 0;
    uint64_t total_rejected = 0;
    double avg_wait_ms = 0.0;
    double avg_duration_ms = 0.0;
    size_t queue_length = 0;
    size_t active_count = 0;
    std::map<AgentId, AgentStats> agents;
};

class FairnessScheduler {
public:
    /**
     * @param clock        Time source; steady_clock::now when empty.
     * @param start_aging  Launch the background aging thread. Tests pass
     *                     false and drive run_aging_pass() directly.
     */
    explicit FairnessScheduler(SchedulerConfig config = {},
                               SchedulerClock clock = {},
                               bool start_aging = true,
                               Logger* logger = nullptr);
    ~FairnessScheduler();

    FairnessScheduler(const FairnessScheduler&) = delete;
    FairnessScheduler& operator=(const FairnessScheduler&) = delete;

    // ── Submission / dispatch ─────────────────

    /// False when a quota refuses the task or its id is already known.
    bool submit(ScheduledTask task);

    /// Same as submit() with the refusal reason.
    SubmitOutcome try_submit(ScheduledTask task);

    /**
     * @brief Pop the first task whose agent is under its concurrency limit.
     *
     * The task moves to the active set and its agent's rate window records
     * the dequeue.
     */
    std::optional<ScheduledTask> next();

    /// As next(), restricted to tasks for which @p ready returns true.
    /// @p ready runs under the scheduler lock and must not call back into it.
    std::optional<ScheduledTask> next_if(const std::function<bool(const ScheduledTask&)>& ready);

    /// Returns false for a task that is not active.
    bool complete(const TaskResult& result);

    /// Drop a pending task. No usage or outcome is recorded for it.
    /// Returns false when the task is not pending.
    bool cancel(const TaskId& task);

    // ── Quotas ────────────────────────────────
    void set_agent_quota(const AgentId& agent, AgentQuota quota);
    void clear_agent_quota(const AgentId& agent);
    [[nodiscard]] std::optional<AgentQuota> agent_quota(const AgentId& agent) const;

    // ── Maintenance ───────────────────────────

    /// One aging tick: re-age every pending task, re-sort, compact usage.
    void run_aging_pass();

    /// Drop rate-limit timestamps older than one hour.
    void compact_usage();

    /// Drop pending tasks without completing them. Returns the count dropped.
    size_t clear_queue();

    /// Stop the aging thread. Idempotent.
    void shutdown();

    // ── Queries ───────────────────────────────
    [[nodiscard]] size_t queue_length() const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t active_count_for(const AgentId& agent) const;
    [[nodiscard]] bool is_active(const TaskId& task) const;
    [[nodiscard]] std::vector<ScheduledTask> pending() const;
    [[nodiscard]] size_t usage_entries(const AgentId& agent) const;
    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    struct PendingEntry {
        ScheduledTask task;
        double base_priority;
    };

    struct AgentCounters {
        uint64_t submitted = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t rejected = 0;
        double wait_sum_ms = 0.0;
        uint64_t wait_samples = 0;
    };

    SubmitOutcome check_quota_locked(const AgentId& agent, SteadyTime now) const;
    bool under_concurrency_limit_locked(const AgentId& agent) const;
    void age_locked(SteadyTime now);
    void sort_locked();
    void compact_locked(SteadyTime now);
    void aging_loop(std::stop_token stop);

    SchedulerConfig config_;
    SchedulerClock clock_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any aging_cv_;

    std::vector<PendingEntry> queue_;
    std::unordered_map<TaskId, ScheduledTask> active_;
    std::unordered_map<AgentId, size_t> active_per_agent_;
    std::unordered_map<AgentId, AgentQuota> quotas_;
    std::unordered_map<AgentId, std::deque<SteadyTime>> usage_;   ///< Dequeue times, oldest first
    std::map<AgentId, AgentCounters> counters_;

    uint64_t total_submitted_ = 0;
    uint64_t total_completed_ = 0;
    uint64_t total_failed_ = 0;
    uint64_t total_rejected_ = 0;
    double duration_sum_ms_ = 0.0;
    uint64_t duration_samples_ = 0;

    std::mutex lifecycle_mutex_;
    std::jthread aging_thread_;
};

}  // namespace coordination_core
