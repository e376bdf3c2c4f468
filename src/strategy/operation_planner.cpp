/**
 * @file operation_planner.cpp
 * @brief OperationPlanner and BatchPlanner implementation.
 */

#include "strategy/operation_planner.hpp"

#include <chrono>
#include <exception>

namespace coordination_core {

namespace {

Millis elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
}

}  // anonymous namespace

OperationPlanner::OperationPlanner(const RiskAssessor& risk,
                                   const ExecutionStrategySelector& selector,
                                   Logger* logger)
    : risk_(risk)
    , selector_(selector)
    , logger_(logger) {}

ExecuteOperationResponse OperationPlanner::plan(const SystemState& state,
                                                const ExecuteOperationRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    const auto& op = request.operation;

    if (logger_) {
        logger_->debug("Planning operation", {{"operation", op.id},
                                              {"type", op.type},
                                              {"participants", std::to_string(op.participants.size())},
                                              {"dry_run", request.dry_run ? "true" : "false"}});
    }

    try {
        ExecuteOperationResponse response;
        response.operation = op;
        response.risk = risk_.assess(op, state);
        response.strategy_decision = selector_.decide(op, state);
        response.plan = build_plan(op, response.strategy_decision, response.risk, request);

        if (logger_) {
            logger_->debug("Strategy decided",
                           {{"strategy", std::string{to_string(response.strategy_decision.strategy)}},
                            {"risk", std::string{to_string(response.risk.level)}},
                            {"reasoning", response.strategy_decision.reasoning}});
        }

        if (!response.plan.can_execute && !request.force_execution) {
            response.error = Error{ErrorCode::NoParticipants,
                                   "Operation cannot be executed - no healthy participants available"};
        } else if (!response.plan.should_proceed) {
            response.error = Error{ErrorCode::RiskTooHigh,
                                   "Operation execution not recommended: risk level "
                                   + std::string{to_string(response.risk.level)}};
        }

        if (response.error) {
            if (logger_) logger_->warn(response.error->message, {{"operation", op.id}});
            response.planning_time = elapsed_since(start);
            return response;
        }

        if (!request.dry_run) {
            auto& enriched = response.operation;
            enriched.strategy = response.strategy_decision.strategy;
            enriched.risk_level = response.risk.level;
            enriched.reasoning = response.strategy_decision.reasoning;
            // Queued work keeps its full participant list; health is re-read at dispatch
            if (response.strategy_decision.strategy != ExecutionStrategy::Queued) {
                enriched.participants = response.plan.participants;
            }
        }

        response.success = true;
        response.planning_time = elapsed_since(start);
        if (logger_) {
            logger_->info(request.dry_run ? "Dry run completed" : "Operation planned",
                          {{"operation", op.id},
                           {"strategy", std::string{to_string(response.plan.strategy)}},
                           {"planning_ms", std::to_string(response.planning_time.count())}});
        }
        return response;
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error("Operation planning failed",
                           {{"operation", op.id}, {"error", e.what()},
                            {"planning_ms", std::to_string(elapsed_since(start).count())}});
        }
        throw;
    }
}

ExecutionPlan OperationPlanner::build_plan(const Operation& operation,
                                           const StrategyDecision& decision,
                                           const RiskAssessment& risk,
                                           const ExecuteOperationRequest& request) const {
    ExecutionPlan plan;
    plan.strategy = decision.strategy;
    plan.participants = decision.participants;
    plan.can_execute = !decision.participants.empty();
    plan.should_proceed = request.force_execution
        || RiskAssessor::should_proceed(risk.level, operation.priority, request.override_risk);

    if (decision.strategy == ExecutionStrategy::Distributed) {
        plan.workload_distribution =
            ExecutionStrategySelector::distribute_workload(operation, decision.participants);
    }
    if (decision.strategy == ExecutionStrategy::Delegated) {
        plan.delegated_to = decision.delegate;
    }

    plan.estimated_duration =
        ExecutionStrategySelector::estimate_duration(decision.strategy, decision.participants.size());
    return plan;
}

// ─────────────────────────────────────────────
// BatchPlanner
// ─────────────────────────────────────────────

BatchPlanner::BatchPlanner(const OperationPlanner& planner, Logger* logger)
    : planner_(planner)
    , logger_(logger) {}

std::vector<ExecuteOperationResponse> BatchPlanner::plan_all(
    const SystemState& state, const std::vector<ExecuteOperationRequest>& requests) const {

    if (logger_) {
        logger_->info("Executing batch operations",
                      {{"operation_count", std::to_string(requests.size())}});
    }

    std::vector<ExecuteOperationResponse> responses;
    responses.reserve(requests.size());

    for (const auto& request : requests) {
        try {
            responses.push_back(planner_.plan(state, request));
        } catch (const std::exception& e) {
            ExecuteOperationResponse failed;
            failed.operation = request.operation;
            failed.strategy_decision.strategy = ExecutionStrategy::Queued;
            failed.strategy_decision.reasoning = "Batch execution failed";
            failed.risk.level = RiskLevel::Critical;
            failed.risk.factors = {"Batch execution error"};
            failed.plan.strategy = ExecutionStrategy::Queued;
            failed.error = Error{ErrorCode::Internal, e.what()};
            responses.push_back(std::move(failed));
        }
    }
    return responses;
}

}  // namespace coordination_core
