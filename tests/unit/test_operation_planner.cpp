/**
 * @file test_operation_planner.cpp
 * @brief Unit tests for OperationPlanner and BatchPlanner.
 */

#include "strategy/operation_planner.hpp"

#include <gtest/gtest.h>

using namespace coordination_core;

namespace {

class OperationPlannerTest : public ::testing::Test {
protected:
    RiskAssessor risk_;
    ExecutionStrategySelector selector_;
    OperationPlanner planner_{risk_, selector_};
    SystemState state_;

    void add(const ComponentId& id, HealthStatus status = HealthStatus::Healthy) {
        ComponentStatus c;
        c.id = id;
        c.status = status;
        state_.components.register_component(c);
    }

    static ExecuteOperationRequest request(std::vector<ComponentId> participants,
                                           Priority priority = Priority::P2) {
        ExecuteOperationRequest r;
        r.operation.id = "op-1";
        r.operation.type = "generation";
        r.operation.participants = std::move(participants);
        r.operation.priority = priority;
        return r;
    }
};

}  // namespace

TEST_F(OperationPlannerTest, ImmediatePlanEnrichesOperation) {
    add("a");
    add("b");

    auto response = planner_.plan(state_, request({"a", "b"}));
    ASSERT_TRUE(response.success);
    EXPECT_FALSE(response.error.has_value());
    EXPECT_EQ(response.plan.strategy, ExecutionStrategy::Immediate);
    EXPECT_TRUE(response.plan.can_execute);
    EXPECT_TRUE(response.plan.should_proceed);
    EXPECT_EQ(response.plan.estimated_duration, Millis{1000});

    const auto& op = response.operation;
    ASSERT_TRUE(op.strategy.has_value());
    EXPECT_EQ(*op.strategy, ExecutionStrategy::Immediate);
    EXPECT_EQ(op.risk_level, RiskLevel::Low);
    EXPECT_FALSE(op.reasoning.empty());
}

TEST_F(OperationPlannerTest, DistributedPlanCarriesShards) {
    add("a");
    add("b");
    add("c");
    auto req = request({"a", "b", "c"});
    req.operation.payload = GenerationPayload{9, "set"};

    auto response = planner_.plan(state_, req);
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.plan.strategy, ExecutionStrategy::Distributed);
    ASSERT_EQ(response.plan.workload_distribution.size(), 3u);
    EXPECT_EQ(response.plan.workload_distribution[2].shard.first_item, 6u);
    EXPECT_EQ(response.plan.estimated_duration, Millis{4500});
}

TEST_F(OperationPlannerTest, DelegatedPlanNarrowsParticipants) {
    add("a");
    add("b", HealthStatus::Degraded);

    auto response = planner_.plan(state_, request({"a", "b"}));
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.plan.strategy, ExecutionStrategy::Delegated);
    EXPECT_EQ(response.plan.delegated_to, ComponentId{"a"});
    EXPECT_EQ(response.operation.participants, (std::vector<ComponentId>{"a"}));
}

TEST_F(OperationPlannerTest, NoHealthyParticipantsIsRejected) {
    add("a", HealthStatus::Failed);

    auto response = planner_.plan(state_, request({"a"}));
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::NoParticipants);
    EXPECT_FALSE(response.plan.can_execute);
}

TEST_F(OperationPlannerTest, ForceExecutionQueuesAnyway) {
    add("a", HealthStatus::Failed);
    auto req = request({"a"});
    req.force_execution = true;

    auto response = planner_.plan(state_, req);
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.plan.strategy, ExecutionStrategy::Queued);
    // Queued work keeps its participants
    EXPECT_EQ(response.operation.participants, (std::vector<ComponentId>{"a"}));
    EXPECT_EQ(response.plan.estimated_duration, Millis{5000});
}

TEST_F(OperationPlannerTest, RiskGateRefusesLowPriorityWork) {
    add("a");
    state_.health = 60.0;    // forces at least High

    auto response = planner_.plan(state_, request({"a"}, Priority::P2));
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::RiskTooHigh);
    EXPECT_EQ(response.risk.level, RiskLevel::High);

    auto urgent = planner_.plan(state_, request({"a"}, Priority::P1));
    EXPECT_TRUE(urgent.success);
}

TEST_F(OperationPlannerTest, CriticalRiskNeedsOverride) {
    add("a");
    state_.health = 30.0;

    auto refused = planner_.plan(state_, request({"a"}, Priority::P0));
    EXPECT_FALSE(refused.success);

    auto req = request({"a"}, Priority::P0);
    req.override_risk = true;
    auto allowed = planner_.plan(state_, req);
    EXPECT_TRUE(allowed.success);
    EXPECT_EQ(allowed.risk.level, RiskLevel::Critical);
}

TEST_F(OperationPlannerTest, DryRunLeavesOperationUntouched) {
    add("a");
    auto req = request({"a"});
    req.dry_run = true;

    auto response = planner_.plan(state_, req);
    ASSERT_TRUE(response.success);
    EXPECT_FALSE(response.operation.strategy.has_value());
    EXPECT_FALSE(response.operation.risk_level.has_value());
    EXPECT_EQ(response.plan.strategy, ExecutionStrategy::Immediate);
}

TEST_F(OperationPlannerTest, BatchSettlesAll) {
    add("a");
    add("down", HealthStatus::Failed);
    BatchPlanner batch(planner_);

    auto ok = request({"a"});
    auto bad = request({"down"});
    bad.operation.id = "op-2";

    auto responses = batch.plan_all(state_, {ok, bad, ok});
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_TRUE(responses[0].success);
    EXPECT_FALSE(responses[1].success);
    EXPECT_EQ(responses[1].operation.id, "op-2");
    EXPECT_TRUE(responses[2].success);
}
