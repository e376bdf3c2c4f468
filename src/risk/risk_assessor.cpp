/**
 * @file risk_assessor.cpp
 * @brief RiskAssessor implementation.
 */

#include "risk/risk_assessor.hpp"

#include <algorithm>

namespace coordination_core {

RiskAssessment RiskAssessor::assess(const Operation& operation, const SystemState& state) const {
    RiskAssessment result;

    // System health
    if (state.health < kCriticalHealth) {
        result.score += 3;
        result.factors.emplace_back("System health below 50%");
    } else if (state.health < kDegradedHealth) {
        result.score += 2;
        result.factors.emplace_back("System health below 70%");
    }

    // System load
    double load = state.metrics.operations_per_hour;
    if (load > kVeryHighLoad) {
        result.score += 3;
        result.factors.emplace_back("Very high system load (>80 ops/hour)");
    } else if (load > kHighLoad) {
        result.score += 2;
        result.factors.emplace_back("High system load (>50 ops/hour)");
    }

    // Participants; unregistered ids count as unhealthy
    size_t total = operation.participants.size();
    size_t healthy = 0;
    size_t failed = 0;
    for (const auto& id : operation.participants) {
        const auto* entry = state.components.find(id);
        if (entry == nullptr) continue;
        if (entry->is_healthy()) ++healthy;
        if (entry->status == HealthStatus::Failed) ++failed;
    }

    if (healthy == 0) {
        result.score += 4;
        result.factors.emplace_back("No healthy participants available");
    } else if (static_cast<double>(healthy) < static_cast<double>(total) / 2.0) {
        result.score += 2;
        result.factors.emplace_back("Less than 50% of participants healthy");
    }
    if (healthy < total) {
        result.score += 1;
        result.factors.push_back(std::to_string(total - healthy) + " participant(s) not healthy");
    }
    if (failed > 0) {
        result.score += 1;
        result.factors.push_back(std::to_string(failed) + " participant(s) failed");
    }

    // Impact
    if (operation.priority == Priority::P0) {
        result.score += 1;
        result.factors.emplace_back("P0 operation impact");
    }

    result.level = level_for_score(result.score);
    if (state.health < kCriticalHealth) {
        result.level = RiskLevel::Critical;
    } else if (state.health < kDegradedHealth) {
        result.level = std::max(result.level, RiskLevel::High);
    }
    return result;
}

bool RiskAssessor::should_proceed(RiskLevel level, Priority priority,
                                  bool override_requested) noexcept {
    switch (level) {
        case RiskLevel::Low:
        case RiskLevel::Medium:
            return true;
        case RiskLevel::High:
            return priority == Priority::P0 || priority == Priority::P1;
        case RiskLevel::Critical:
            return priority == Priority::P0 && override_requested;
    }
    return false;
}

RiskLevel RiskAssessor::level_for_score(int score) noexcept {
    if (score >= 7) return RiskLevel::Critical;
    if (score >= 5) return RiskLevel::High;
    if (score >= 3) return RiskLevel::Medium;
    return RiskLevel::Low;
}

}  // namespace coordination_core
