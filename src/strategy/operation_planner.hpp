/**
 * @file operation_planner.hpp
 * @brief Turns an operation request into an execution plan.
 *
 * Combines the risk assessment and the strategy decision, applies the
 * admission gate, and enriches the operation with strategy, risk level and
 * reasoning. Expected refusals come back as a response carrying an Error;
 * unexpected exceptions are logged and rethrown.
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "risk/risk_assessor.hpp"
#include "strategy/execution_strategy.hpp"

#include <optional>
#include <vector>

namespace coordination_core {

struct ExecuteOperationRequest {
    Operation operation;
    bool dry_run = false;
    bool force_execution = false;   ///< Bypass participant and risk checks
    bool override_risk = false;     ///< Explicit override for critical P0 work
};

struct ExecutionPlan {
    ExecutionStrategy strategy{ExecutionStrategy::Queued};
    std::vector<ComponentId> participants;
    std::vector<WorkloadAssignment> workload_distribution;   ///< Distributed only
    std::optional<ComponentId> delegated_to;                 ///< Delegated only
    Millis estimated_duration{0};
    bool can_execute = false;
    bool should_proceed = false;
};

struct ExecuteOperationResponse {
    bool success = false;
    Operation operation;
    StrategyDecision strategy_decision;
    RiskAssessment risk;
    ExecutionPlan plan;
    Millis planning_time{0};
    std::optional<Error> error;
};

class OperationPlanner {
public:
    OperationPlanner(const RiskAssessor& risk, const ExecutionStrategySelector& selector,
                     Logger* logger = nullptr);

    [[nodiscard]] ExecuteOperationResponse plan(const SystemState& state,
                                                const ExecuteOperationRequest& request) const;

    [[nodiscard]] const ExecutionStrategySelector& selector() const noexcept { return selector_; }

private:
    [[nodiscard]] ExecutionPlan build_plan(const Operation& operation,
                                           const StrategyDecision& decision,
                                           const RiskAssessment& risk,
                                           const ExecuteOperationRequest& request) const;

    const RiskAssessor& risk_;
    const ExecutionStrategySelector& selector_;
    Logger* logger_;
};

/**
 * @brief Plans a batch with settle-all semantics.
 *
 * A request that throws yields a failed response of the same shape
 * (Queued strategy, Critical risk) and the rest still run.
 */
class BatchPlanner {
public:
    explicit BatchPlanner(const OperationPlanner& planner, Logger* logger = nullptr);

    [[nodiscard]] std::vector<ExecuteOperationResponse> plan_all(
        const SystemState& state, const std::vector<ExecuteOperationRequest>& requests) const;

private:
    const OperationPlanner& planner_;
    Logger* logger_;
};

}  // namespace coordination_core
