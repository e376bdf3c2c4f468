/**
 * @file test_metrics_collector.cpp
 * @brief Unit tests for MetricsCollector NDJSON records.
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace coordination_core;

class MetricsCollectorTest : public ::testing::Test {
protected:
    MemorySink* sink_ = nullptr;
    std::unique_ptr<MetricsCollector> metrics_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        metrics_ = std::make_unique<MetricsCollector>(std::move(sink));
    }
};

TEST_F(MetricsCollectorTest, RoutingDecisionRecord) {
    UnifiedMessage message;
    message.source = "worker-a";
    message.target = "worker-\"b\"";
    RoutingDecision decision{RoutingMode::Direct, "direct path", true, 2};

    metrics_->record_routing_decision(message, decision, 0.25);

    ASSERT_EQ(sink_->lines().size(), 1u);
    const auto& line = sink_->lines()[0];
    EXPECT_NE(line.find(R"("event":"routing_decision")"), std::string::npos);
    EXPECT_NE(line.find(R"("mode":"direct")"), std::string::npos);
    EXPECT_NE(line.find(R"("max_retries":2)"), std::string::npos);
    EXPECT_NE(line.find(R"("target":"worker-\"b\"")"), std::string::npos);
}

TEST_F(MetricsCollectorTest, OperationEventWithAndWithoutStrategy) {
    metrics_->record_operation_event("op-1", "started", ExecutionStrategy::Distributed);
    metrics_->record_operation_event("op-1", "completed", std::nullopt, Millis{1200});

    EXPECT_EQ(sink_->count_containing(R"("event":"operation_event")"), 2u);
    EXPECT_EQ(sink_->count_containing(R"("strategy":"distributed")"), 1u);
    EXPECT_EQ(sink_->count_containing(R"("duration_ms":1200)"), 1u);
}

TEST_F(MetricsCollectorTest, HealthAndSchedulerRecords) {
    metrics_->record_health_update(80.0, 4, 5);

    SchedulerStats stats;
    stats.total_submitted = 7;
    stats.total_rejected = 2;
    stats.queue_length = 3;
    metrics_->record_scheduler_stats(stats);

    EXPECT_EQ(sink_->count_containing(R"("event":"health_update")"), 1u);
    EXPECT_EQ(sink_->count_containing(R"("healthy":4)"), 1u);
    EXPECT_EQ(sink_->count_containing(R"("event":"scheduler_stats")"), 1u);
    EXPECT_EQ(sink_->count_containing(R"("submitted":7)"), 1u);
    EXPECT_EQ(sink_->count_containing(R"("rejected":2)"), 1u);
}

TEST_F(MetricsCollectorTest, MetricsSnapshotRecord) {
    MetricsSnapshot snapshot;
    snapshot.status.components_total = 5;
    snapshot.status.components_healthy = 4;
    snapshot.status.hub_queue = 9;
    snapshot.routing.metrics.total_messages = 12;
    snapshot.routing.recommended_mode = RoutingMode::Direct;

    metrics_->record_metrics_snapshot(snapshot);

    ASSERT_EQ(sink_->lines().size(), 1u);
    const auto& line = sink_->lines()[0];
    EXPECT_NE(line.find(R"("event":"metrics_snapshot")"), std::string::npos);
    EXPECT_NE(line.find(R"("components_total":5)"), std::string::npos);
    EXPECT_NE(line.find(R"("hub":9)"), std::string::npos);
    EXPECT_NE(line.find(R"("total":12)"), std::string::npos);
    EXPECT_NE(line.find(R"("recommended_mode":"direct")"), std::string::npos);
}

TEST_F(MetricsCollectorTest, CustomRecordEmbedsPayload) {
    metrics_->record_custom("quota_refusal", R"({"agent":"qa-generator"})");
    EXPECT_EQ(sink_->count_containing(R"({"event":"quota_refusal","data":{"agent":"qa-generator"}})"), 1u);
}
