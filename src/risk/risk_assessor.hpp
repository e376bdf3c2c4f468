/**
 * @file risk_assessor.hpp
 * @brief Operation risk scoring and the admission gate.
 *
 * Scoring is additive over system health, system load, participant health
 * and operation impact. Health floors then raise the level: below 70 the
 * level is at least High, below 50 it is Critical. Every factor only grows
 * as a participant degrades, so risk is monotonic in participant health.
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace coordination_core {

struct RiskAssessment {
    RiskLevel level{RiskLevel::Low};
    int score = 0;
    std::vector<std::string> factors;
};

class RiskAssessor {
public:
    static constexpr double kCriticalHealth = 50.0;
    static constexpr double kDegradedHealth = 70.0;
    static constexpr double kVeryHighLoad = 80.0;    ///< ops/hour
    static constexpr double kHighLoad = 50.0;        ///< ops/hour

    [[nodiscard]] RiskAssessment assess(const Operation& operation,
                                        const SystemState& state) const;

    /**
     * @brief The single admission gate. Pure.
     *
     * Low and Medium always proceed. High proceeds for P0 and P1. Critical
     * proceeds only for P0 with an explicit override.
     */
    [[nodiscard]] static bool should_proceed(RiskLevel level, Priority priority,
                                             bool override_requested = false) noexcept;

    [[nodiscard]] static RiskLevel level_for_score(int score) noexcept;
};

}  // namespace coordination_core
