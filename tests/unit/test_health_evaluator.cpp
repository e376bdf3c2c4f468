/**
 * @file test_health_evaluator.cpp
 * @brief Unit tests for HealthEvaluator.
 */

#include "health/health_evaluator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace coordination_core;

namespace {

SystemState state_with(std::initializer_list<std::pair<const char*, HealthStatus>> components) {
    SystemState state;
    for (const auto& [id, status] : components) {
        ComponentStatus c;
        c.id = id;
        c.status = status;
        state.components.register_component(c);
    }
    return state;
}

}  // namespace

TEST(HealthEvaluatorTest, EmptyRegistryIsFullyHealthy) {
    ComponentRegistry empty;
    EXPECT_DOUBLE_EQ(HealthEvaluator::compute_health(empty, 0.0), 100.0);
    // Error rate still counts
    EXPECT_DOUBLE_EQ(HealthEvaluator::compute_health(empty, 1.0), 80.0);
}

TEST(HealthEvaluatorTest, WeightedComponentScore) {
    auto state = state_with({{"a", HealthStatus::Healthy},
                             {"b", HealthStatus::Degraded},
                             {"c", HealthStatus::Starting},
                             {"d", HealthStatus::Failed}});
    // (1 + 0.5 + 0.25) / 4 = 0.4375 -> 100 * (0.35 + 0.2) = 55
    EXPECT_DOUBLE_EQ(HealthEvaluator::compute_health(state.components, 0.0), 55.0);
}

TEST(HealthEvaluatorTest, ErrorRateIsClamped) {
    auto state = state_with({{"a", HealthStatus::Healthy}});
    EXPECT_DOUBLE_EQ(HealthEvaluator::compute_health(state.components, 5.0), 80.0);
    EXPECT_DOUBLE_EQ(HealthEvaluator::compute_health(state.components, -1.0), 100.0);
}

TEST(HealthEvaluatorTest, MonotonicInFailures) {
    auto state = state_with({{"a", HealthStatus::Healthy},
                             {"b", HealthStatus::Healthy},
                             {"c", HealthStatus::Healthy}});
    double previous = HealthEvaluator::compute_health(state.components, 0.1);
    for (const char* id : {"a", "b", "c"}) {
        state.components.update_status(id, HealthStatus::Failed);
        double current = HealthEvaluator::compute_health(state.components, 0.1);
        EXPECT_LE(current, previous);
        previous = current;
    }
}

TEST(HealthEvaluatorTest, ChecksProduceTransitions) {
    HealthEvaluator evaluator;
    auto state = state_with({{"a", HealthStatus::Starting}, {"b", HealthStatus::Healthy}});

    auto result = evaluator.evaluate(state, {{"a", HealthStatus::Healthy},
                                             {"b", HealthStatus::Healthy},
                                             {"ghost", HealthStatus::Failed}});

    ASSERT_EQ(result.transitions.size(), 1u);
    EXPECT_EQ(result.transitions[0].component_id, "a");
    EXPECT_EQ(result.transitions[0].from, HealthStatus::Starting);
    EXPECT_EQ(result.transitions[0].to, HealthStatus::Healthy);
    EXPECT_EQ(result.unknown_components, (std::vector<ComponentId>{"ghost"}));
    EXPECT_DOUBLE_EQ(result.health, 100.0);

    // Input state is untouched
    EXPECT_EQ(state.components.get("a")->status, HealthStatus::Starting);
}

TEST(HealthEvaluatorTest, ExplicitChecksOverrideProbes) {
    HealthEvaluator evaluator;
    auto state = state_with({{"a", HealthStatus::Healthy}});
    HealthProbeMap probes{{"a", [] { return HealthStatus::Failed; }}};

    auto result = evaluator.evaluate(state, {{"a", HealthStatus::Degraded}}, probes);
    EXPECT_EQ(result.components.get("a")->status, HealthStatus::Degraded);
    EXPECT_EQ(result.transitions.size(), 2u);
}

TEST(HealthEvaluatorTest, ThrowingProbeMarksFailed) {
    HealthEvaluator evaluator;
    auto state = state_with({{"a", HealthStatus::Healthy}, {"b", HealthStatus::Healthy}});
    HealthProbeMap probes{
        {"a", []() -> HealthStatus { throw std::runtime_error("probe timeout"); }},
        {"b", [] { return HealthStatus::Healthy; }},
    };

    auto result = evaluator.evaluate(state, {}, probes);
    EXPECT_EQ(result.probe_failures, (std::vector<ComponentId>{"a"}));
    EXPECT_EQ(result.components.get("a")->status, HealthStatus::Failed);
    EXPECT_EQ(result.components.get("b")->status, HealthStatus::Healthy);
    // (1 + 0) / 2 = 0.5 -> 100 * (0.4 + 0.2)
    EXPECT_DOUBLE_EQ(result.health, 60.0);
}

TEST(HealthEvaluatorTest, UsesStateErrorRate) {
    HealthEvaluator evaluator;
    auto state = state_with({{"a", HealthStatus::Healthy}});
    state.metrics.error_rate = 0.5;

    auto result = evaluator.evaluate(state, {});
    EXPECT_DOUBLE_EQ(result.health, 90.0);
}
