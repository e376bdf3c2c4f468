/**
 * @file execution_strategy.cpp
 * @brief ExecutionStrategySelector implementation.
 */

#include "strategy/execution_strategy.hpp"

#include <algorithm>
#include <limits>

namespace coordination_core {

ExecutionStrategySelector::ExecutionStrategySelector(StrategyConfig config)
    : config_(config) {}

std::vector<ComponentId> ExecutionStrategySelector::healthy_participants(
    const Operation& operation, const SystemState& state) {
    std::vector<ComponentId> healthy;
    for (const auto& id : operation.participants) {
        if (state.components.is_healthy(id)
            && std::find(healthy.begin(), healthy.end(), id) == healthy.end()) {
            healthy.push_back(id);
        }
    }
    return healthy;
}

StrategyDecision ExecutionStrategySelector::decide(const Operation& operation,
                                                   const SystemState& state) const {
    StrategyDecision decision;
    decision.priority = operation.priority;
    decision.participants = healthy_participants(operation, state);

    if (decision.participants.empty()) {
        decision.strategy = ExecutionStrategy::Queued;
        decision.reasoning = "No healthy participants available - queueing";
        return decision;
    }

    if (state.metrics.operations_per_hour > config_.queue_load_threshold
        && operation.priority != Priority::P0) {
        decision.strategy = ExecutionStrategy::Queued;
        decision.reasoning = "High system load - queueing for later execution";
        return decision;
    }

    if (decision.participants.size() >= config_.distributed_threshold) {
        decision.strategy = ExecutionStrategy::Distributed;
        decision.reasoning = "Distributing across "
                           + std::to_string(decision.participants.size())
                           + " healthy participants";
        return decision;
    }

    if (decision.participants.size() == operation.participants.size()) {
        decision.strategy = ExecutionStrategy::Immediate;
        decision.reasoning = "All participants healthy - executing immediately";
        return decision;
    }

    decision.strategy = ExecutionStrategy::Delegated;
    decision.delegate = find_best_component_for_delegation(operation, state);
    if (decision.delegate) {
        decision.participants = {*decision.delegate};
        decision.reasoning = "Partial participant health - delegating to " + *decision.delegate;
    }
    return decision;
}

bool ExecutionStrategySelector::can_execute_immediately(const Operation& operation,
                                                        const SystemState& state) const {
    return decide(operation, state).strategy == ExecutionStrategy::Immediate;
}

bool ExecutionStrategySelector::should_queue(const Operation& operation,
                                             const SystemState& state) const {
    return decide(operation, state).strategy == ExecutionStrategy::Queued;
}

std::optional<ComponentId> ExecutionStrategySelector::find_best_component_for_delegation(
    const Operation& operation, const SystemState& state) const {

    std::optional<ComponentId> best_capable;
    std::optional<ComponentId> best_any;
    size_t capable_load = std::numeric_limits<size_t>::max();
    size_t any_load = std::numeric_limits<size_t>::max();

    for (const auto& id : operation.participants) {
        const auto* component = state.components.find(id);
        if (component == nullptr || !component->is_healthy()) continue;

        size_t load = state.component_load(id);
        if (load < any_load) {
            any_load = load;
            best_any = id;
        }

        bool capable = std::all_of(operation.required_capabilities.begin(),
                                   operation.required_capabilities.end(),
                                   [component](const std::string& cap) {
                                       return component->has_capability(cap);
                                   });
        if (capable && load < capable_load) {
            capable_load = load;
            best_capable = id;
        }
    }

    return best_capable ? best_capable : best_any;
}

std::vector<WorkloadAssignment> ExecutionStrategySelector::distribute_workload(
    const Operation& operation, const std::vector<ComponentId>& participants) {

    std::vector<WorkloadAssignment> assignments;
    auto total = static_cast<uint32_t>(participants.size());
    if (total == 0) return assignments;
    assignments.reserve(total);

    const auto* generation = std::get_if<GenerationPayload>(&operation.payload);
    uint64_t items = generation ? generation->item_count : 0;
    uint64_t base = items / total;
    uint64_t remainder = items % total;
    uint64_t cursor = 0;

    for (uint32_t i = 0; i < total; ++i) {
        WorkloadAssignment assignment;
        assignment.component_id = participants[i];
        assignment.shard.partition = i + 1;
        assignment.shard.total_partitions = total;
        assignment.payload = operation.payload;

        if (generation) {
            uint64_t size = base + (i < remainder ? 1 : 0);
            assignment.shard.first_item = cursor;
            assignment.shard.last_item = cursor + size;
            cursor += size;

            auto shard_payload = *generation;
            shard_payload.item_count = size;
            assignment.payload = shard_payload;
        }
        assignments.push_back(std::move(assignment));
    }
    return assignments;
}

Millis ExecutionStrategySelector::estimate_duration(ExecutionStrategy strategy,
                                                    size_t participant_count) noexcept {
    switch (strategy) {
        case ExecutionStrategy::Immediate:
            return Millis{1000};
        case ExecutionStrategy::Distributed:
            return Millis{3000 + 500 * static_cast<int64_t>(participant_count)};
        case ExecutionStrategy::Delegated:
            return Millis{2000};
        case ExecutionStrategy::Queued:
            return Millis{5000};
    }
    return Millis{3000};
}

}  // namespace coordination_core
