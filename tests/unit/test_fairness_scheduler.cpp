/**
 * @file test_fairness_scheduler.cpp
 * @brief Unit tests for the FairnessScheduler (ordering, quotas, aging).
 */

#include "scheduler/fairness_scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace coordination_core;
using namespace std::chrono_literals;

namespace {

class FairnessSchedulerTest : public ::testing::Test {
protected:
    SteadyTime now_ = SteadyTime{} + std::chrono::hours(10);

    std::unique_ptr<FairnessScheduler> make(SchedulerConfig config = {}) {
        return std::make_unique<FairnessScheduler>(
            std::move(config), [this] { return now_; }, /*start_aging=*/false);
    }

    static ScheduledTask task(const TaskId& id, const AgentId& agent, double priority = 3.0) {
        ScheduledTask t;
        t.task_id = id;
        t.agent_id = agent;
        t.priority = priority;
        return t;
    }

    static void run_to_completion(FairnessScheduler& s, const TaskId& id) {
        auto t = s.next();
        ASSERT_TRUE(t.has_value());
        EXPECT_EQ(t->task_id, id);
        EXPECT_TRUE(s.complete({id, t->agent_id, true, 10ms, {}}));
    }
};

}  // namespace

// ─────────────────────────────────────────────
// Ordering
// ─────────────────────────────────────────────

TEST_F(FairnessSchedulerTest, DequeuesByPriority) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("low", "a", 3.0)));
    ASSERT_TRUE(s->submit(task("high", "a", 1.0)));
    ASSERT_TRUE(s->submit(task("mid", "a", 2.0)));

    EXPECT_EQ(s->next()->task_id, "high");
    EXPECT_EQ(s->next()->task_id, "mid");
    EXPECT_EQ(s->next()->task_id, "low");
    EXPECT_FALSE(s->next().has_value());
}

TEST_F(FairnessSchedulerTest, EqualPriorityIsFirstInFirstOut) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("first", "a")));
    now_ += 1ms;
    ASSERT_TRUE(s->submit(task("second", "b")));

    EXPECT_EQ(s->next()->task_id, "first");
    EXPECT_EQ(s->next()->task_id, "second");
}

TEST_F(FairnessSchedulerTest, OutOfRangePriorityIsClamped) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a", 0.0)));
    ASSERT_TRUE(s->submit(task("t2", "a", 42.0)));

    auto pending = s->pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_DOUBLE_EQ(pending[0].priority, ScheduledTask::kHighestPriority);
    EXPECT_DOUBLE_EQ(pending[1].priority, ScheduledTask::kLowestPriority);
}

TEST_F(FairnessSchedulerTest, FairnessPrefersLessBusyAgent) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("busy-1", "busy")));
    ASSERT_EQ(s->next()->task_id, "busy-1");

    // Same priority, the busy agent submitted first
    ASSERT_TRUE(s->submit(task("busy-2", "busy")));
    now_ += 1ms;
    ASSERT_TRUE(s->submit(task("idle-1", "idle")));

    EXPECT_EQ(s->next()->task_id, "idle-1");
    EXPECT_EQ(s->next()->task_id, "busy-2");
}

TEST_F(FairnessSchedulerTest, FairnessDisabledKeepsSubmissionOrder) {
    SchedulerConfig config;
    config.fairness_enabled = false;
    auto s = make(config);

    ASSERT_TRUE(s->submit(task("busy-1", "busy")));
    ASSERT_TRUE(s->next().has_value());
    ASSERT_TRUE(s->submit(task("busy-2", "busy")));
    now_ += 1ms;
    ASSERT_TRUE(s->submit(task("idle-1", "idle")));

    EXPECT_EQ(s->next()->task_id, "busy-2");
}

// ─────────────────────────────────────────────
// Quotas
// ─────────────────────────────────────────────

TEST_F(FairnessSchedulerTest, RejectsDuplicateTaskId) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a")));
    EXPECT_EQ(s->try_submit(task("t1", "a")), SubmitOutcome::Duplicate);

    // Still a duplicate while active
    ASSERT_TRUE(s->next().has_value());
    EXPECT_EQ(s->try_submit(task("t1", "b")), SubmitOutcome::Duplicate);
    EXPECT_EQ(s->stats().total_rejected, 2u);
}

TEST_F(FairnessSchedulerTest, ConcurrentLimitRefusesSubmission) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 1, 0, 0});

    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->next().has_value());
    EXPECT_EQ(s->try_submit(task("t2", "a")), SubmitOutcome::ConcurrentLimit);

    // Other agents are unaffected
    EXPECT_EQ(s->try_submit(task("t3", "b")), SubmitOutcome::Accepted);

    ASSERT_TRUE(s->complete({"t1", "a", true, 5ms, {}}));
    EXPECT_EQ(s->try_submit(task("t2", "a")), SubmitOutcome::Accepted);
}

TEST_F(FairnessSchedulerTest, NextSkipsAgentsAtConcurrencyLimit) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 1, 0, 0});

    ASSERT_TRUE(s->submit(task("a-1", "a", 1.0)));
    ASSERT_TRUE(s->submit(task("a-2", "a", 1.0)));
    ASSERT_TRUE(s->submit(task("b-1", "b", 4.0)));

    EXPECT_EQ(s->next()->task_id, "a-1");
    EXPECT_EQ(s->next()->task_id, "b-1");
    EXPECT_FALSE(s->next().has_value());

    ASSERT_TRUE(s->complete({"a-1", "a", true, 5ms, {}}));
    EXPECT_EQ(s->next()->task_id, "a-2");
}

TEST_F(FairnessSchedulerTest, ConcurrentLimitHoldsUnderContention) {
    constexpr size_t kLimit = 3;
    constexpr int kWorkers = 8;
    constexpr int kTasksPerWorker = 250;

    auto s = make();
    s->set_agent_quota("shared", AgentQuota{"shared", kLimit, 0, 0});

    std::atomic<size_t> peak{0};
    std::atomic<int> finished{0};
    {
        std::vector<std::jthread> workers;
        for (int w = 0; w < kWorkers; ++w) {
            workers.emplace_back([&, w] {
                for (int i = 0; i < kTasksPerWorker; ++i) {
                    (void)s->submit(task("t-" + std::to_string(w) + "-" + std::to_string(i), "shared"));
                    auto t = s->next();
                    if (!t) continue;

                    size_t active = s->active_count_for("shared");
                    EXPECT_LE(active, kLimit);
                    size_t seen = peak.load();
                    while (active > seen && !peak.compare_exchange_weak(seen, active)) {}

                    EXPECT_TRUE(s->complete({t->task_id, t->agent_id, true, 1ms, {}}));
                    finished.fetch_add(1);
                }
            });
        }
    }

    EXPECT_LE(peak.load(), kLimit);
    EXPECT_GE(peak.load(), 1u);
    EXPECT_EQ(s->active_count_for("shared"), 0u);

    auto stats = s->stats();
    EXPECT_EQ(stats.total_submitted + stats.total_rejected,
              static_cast<uint64_t>(kWorkers * kTasksPerWorker));
    EXPECT_EQ(stats.total_completed, static_cast<uint64_t>(finished.load()));
    EXPECT_EQ(stats.total_submitted - stats.total_completed, s->queue_length());
}

TEST_F(FairnessSchedulerTest, MinuteLimitResetsAfterWindow) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 0, 2, 0});

    ASSERT_TRUE(s->submit(task("t1", "a")));
    run_to_completion(*s, "t1");
    ASSERT_TRUE(s->submit(task("t2", "a")));
    run_to_completion(*s, "t2");

    EXPECT_EQ(s->try_submit(task("t3", "a")), SubmitOutcome::MinuteLimit);

    now_ += 61s;
    EXPECT_EQ(s->try_submit(task("t3", "a")), SubmitOutcome::Accepted);
}

TEST_F(FairnessSchedulerTest, HourLimitOutlastsMinuteWindow) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 0, 0, 2});

    ASSERT_TRUE(s->submit(task("t1", "a")));
    run_to_completion(*s, "t1");
    ASSERT_TRUE(s->submit(task("t2", "a")));
    run_to_completion(*s, "t2");

    now_ += 61s;
    EXPECT_EQ(s->try_submit(task("t3", "a")), SubmitOutcome::HourLimit);

    now_ += 3600s;
    EXPECT_EQ(s->try_submit(task("t3", "a")), SubmitOutcome::Accepted);
}

TEST_F(FairnessSchedulerTest, ZeroQuotaIsUnbounded) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 0, 0, 0});

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(s->submit(task("t" + std::to_string(i), "a")));
        ASSERT_TRUE(s->next().has_value());
    }
    EXPECT_EQ(s->active_count_for("a"), 50u);
}

TEST_F(FairnessSchedulerTest, QuotaDisabledIgnoresLimits) {
    SchedulerConfig config;
    config.quota_enabled = false;
    auto s = make(config);
    s->set_agent_quota("a", AgentQuota{"a", 1, 1, 1});

    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->next().has_value());
    EXPECT_TRUE(s->submit(task("t2", "a")));
    EXPECT_TRUE(s->next().has_value());
}

TEST_F(FairnessSchedulerTest, QuotasFromConfigAreLoaded) {
    SchedulerConfig config;
    config.quotas.push_back(QuotaConfig{"qa-generator", 2, 10, 100});
    auto s = make(config);

    auto quota = s->agent_quota("qa-generator");
    ASSERT_TRUE(quota.has_value());
    EXPECT_EQ(quota->max_concurrent, 2u);
    EXPECT_EQ(quota->max_per_minute, 10u);

    s->clear_agent_quota("qa-generator");
    EXPECT_FALSE(s->agent_quota("qa-generator").has_value());
}

TEST_F(FairnessSchedulerTest, UsageWindowIsCompacted) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a")));
    run_to_completion(*s, "t1");
    EXPECT_EQ(s->usage_entries("a"), 1u);

    now_ += 3601s;
    s->compact_usage();
    EXPECT_EQ(s->usage_entries("a"), 0u);
}

// ─────────────────────────────────────────────
// Aging
// ─────────────────────────────────────────────

TEST_F(FairnessSchedulerTest, AgingRaisesPriorityToHighest) {
    SchedulerConfig config;
    config.aging_factor = 1.0;
    config.aging_interval_ms = 1000;
    auto s = make(config);

    ASSERT_TRUE(s->submit(task("old", "a", 5.0)));

    now_ += 2500ms;
    s->run_aging_pass();
    EXPECT_DOUBLE_EQ(s->pending().front().priority, 3.0);

    now_ += 10s;
    s->run_aging_pass();
    EXPECT_DOUBLE_EQ(s->pending().front().priority, 1.0);
}

TEST_F(FairnessSchedulerTest, AgingDoesNotCompound) {
    SchedulerConfig config;
    config.aging_factor = 0.5;
    config.aging_interval_ms = 1000;
    auto s = make(config);

    ASSERT_TRUE(s->submit(task("t", "a", 4.0)));
    now_ += 1000ms;
    for (int i = 0; i < 5; ++i) s->run_aging_pass();

    EXPECT_DOUBLE_EQ(s->pending().front().priority, 3.5);
}

TEST_F(FairnessSchedulerTest, OldLowPriorityTaskOvertakesNewHighPriority) {
    SchedulerConfig config;
    config.aging_factor = 1.0;
    config.aging_interval_ms = 1000;
    auto s = make(config);

    ASSERT_TRUE(s->submit(task("starving", "a", 5.0)));
    now_ += 10s;
    s->run_aging_pass();
    ASSERT_TRUE(s->submit(task("fresh", "b", 1.0)));

    // Both at priority 1; the older submission wins
    EXPECT_EQ(s->next()->task_id, "starving");
    EXPECT_EQ(s->next()->task_id, "fresh");
}

// ─────────────────────────────────────────────
// Completion, stats and lifecycle
// ─────────────────────────────────────────────

TEST_F(FairnessSchedulerTest, CompleteUnknownTaskReturnsFalse) {
    auto s = make();
    EXPECT_FALSE(s->complete({"ghost", "a", true, 1ms, {}}));
}

TEST_F(FairnessSchedulerTest, CompleteUsesSubmittingAgent) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->next().has_value());
    ASSERT_TRUE(s->complete({"t1", "someone-else", false, 20ms, "boom"}));

    auto stats = s->stats();
    EXPECT_EQ(stats.agents.at("a").failed, 1u);
    EXPECT_EQ(stats.agents.count("someone-else"), 0u);
    EXPECT_EQ(s->active_count_for("a"), 0u);
}

TEST_F(FairnessSchedulerTest, StatsTrackWaitAndDuration) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->submit(task("t2", "a")));

    now_ += 100ms;
    ASSERT_TRUE(s->next().has_value());
    ASSERT_TRUE(s->complete({"t1", "a", true, 40ms, {}}));
    now_ += 200ms;
    ASSERT_TRUE(s->next().has_value());
    ASSERT_TRUE(s->complete({"t2", "a", false, 80ms, {}}));

    auto stats = s->stats();
    EXPECT_EQ(stats.total_submitted, 2u);
    EXPECT_EQ(stats.total_completed, 1u);
    EXPECT_EQ(stats.total_failed, 1u);
    EXPECT_EQ(stats.queue_length, 0u);
    EXPECT_EQ(stats.active_count, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_wait_ms, 200.0);
    EXPECT_DOUBLE_EQ(stats.avg_duration_ms, 60.0);
    EXPECT_DOUBLE_EQ(stats.agents.at("a").avg_wait_ms, 200.0);
}

TEST_F(FairnessSchedulerTest, CancelDropsPendingTaskWithoutUsage) {
    auto s = make();
    s->set_agent_quota("a", AgentQuota{"a", 0, 1, 0});
    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->submit(task("t2", "a")));

    EXPECT_TRUE(s->cancel("t1"));
    EXPECT_FALSE(s->cancel("t1"));
    EXPECT_EQ(s->queue_length(), 1u);
    EXPECT_EQ(s->usage_entries("a"), 0u);

    auto stats = s->stats();
    EXPECT_EQ(stats.total_completed, 0u);
    EXPECT_EQ(stats.total_failed, 0u);

    // The per-minute slot is still free for real work
    EXPECT_EQ(s->next()->task_id, "t2");
    EXPECT_FALSE(s->cancel("t2"));
    EXPECT_TRUE(s->is_active("t2"));
}

TEST_F(FairnessSchedulerTest, NextIfSkipsTasksThatAreNotReady) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("blocked", "a", 1.0)));
    ASSERT_TRUE(s->submit(task("ready", "b", 3.0)));

    auto t = s->next_if([](const ScheduledTask& c) { return c.task_id != "blocked"; });
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->task_id, "ready");
    EXPECT_FALSE(s->next_if([](const ScheduledTask&) { return false; }).has_value());
    EXPECT_EQ(s->queue_length(), 1u);
}

TEST_F(FairnessSchedulerTest, ClearQueueDropsPendingOnly) {
    auto s = make();
    ASSERT_TRUE(s->submit(task("t1", "a")));
    ASSERT_TRUE(s->submit(task("t2", "a")));
    ASSERT_TRUE(s->submit(task("t3", "a")));
    ASSERT_TRUE(s->next().has_value());

    EXPECT_EQ(s->clear_queue(), 2u);
    EXPECT_EQ(s->queue_length(), 0u);
    EXPECT_TRUE(s->is_active("t1"));
}

TEST_F(FairnessSchedulerTest, ShutdownIsIdempotent) {
    SchedulerConfig config;
    config.aging_interval_ms = 10;
    FairnessScheduler s(config, [this] { return now_; }, /*start_aging=*/true);

    ASSERT_TRUE(s.submit(task("t1", "a")));
    s.shutdown();
    s.shutdown();
    EXPECT_EQ(s.queue_length(), 1u);
}
