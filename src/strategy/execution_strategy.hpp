/**
 * @file execution_strategy.hpp
 * @brief Chooses how an operation is carried out and partitions its workload.
 *
 * Decision order:
 *   1. no healthy participant                          → Queued
 *   2. load above queue threshold and priority != P0   → Queued
 *   3. healthy participants >= distributed threshold   → Distributed
 *   4. every participant healthy                       → Immediate
 *   5. otherwise                                       → Delegated
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coordination_core {

struct StrategyDecision {
    ExecutionStrategy strategy{ExecutionStrategy::Queued};
    std::vector<ComponentId> participants;      ///< Healthy participants that take part
    Priority priority{Priority::P2};
    std::string reasoning;
    std::optional<ComponentId> delegate;        ///< Set for Delegated
};

struct WorkloadAssignment {
    ComponentId component_id;
    ShardInfo shard;
    OperationPayload payload;
};

class ExecutionStrategySelector {
public:
    explicit ExecutionStrategySelector(StrategyConfig config = {});

    [[nodiscard]] StrategyDecision decide(const Operation& operation,
                                          const SystemState& state) const;

    // Fast-path predicates
    [[nodiscard]] bool can_execute_immediately(const Operation& operation,
                                               const SystemState& state) const;
    [[nodiscard]] bool should_queue(const Operation& operation,
                                    const SystemState& state) const;

    /**
     * @brief Least-loaded healthy participant providing every required
     *        capability; least-loaded healthy participant if none does.
     *
     * Ties go to the earlier participant.
     */
    [[nodiscard]] std::optional<ComponentId> find_best_component_for_delegation(
        const Operation& operation, const SystemState& state) const;

    /**
     * @brief One 1-based shard per participant.
     *
     * Generation payloads are split into contiguous item ranges whose sizes
     * differ by at most one.
     */
    [[nodiscard]] static std::vector<WorkloadAssignment> distribute_workload(
        const Operation& operation, const std::vector<ComponentId>& participants);

    [[nodiscard]] static Millis estimate_duration(ExecutionStrategy strategy,
                                                  size_t participant_count) noexcept;

    [[nodiscard]] const StrategyConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] static std::vector<ComponentId> healthy_participants(
        const Operation& operation, const SystemState& state);

    StrategyConfig config_;
};

}  // namespace coordination_core
