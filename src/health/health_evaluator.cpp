/**
 * @file health_evaluator.cpp
 * @brief HealthEvaluator implementation.
 */

#include "health/health_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace coordination_core {

namespace {

constexpr double kComponentWeight = 0.8;
constexpr double kErrorWeight = 0.2;

void apply_status(ComponentRegistry& registry, const ComponentId& id, HealthStatus status,
                  std::vector<StatusTransition>& transitions) {
    const auto* entry = registry.find(id);
    if (entry == nullptr || entry->status == status) return;
    transitions.push_back(StatusTransition{id, entry->status, status});
    registry.update_status(id, status);
}

}  // anonymous namespace

HealthEvaluator::HealthEvaluator(Logger* logger)
    : logger_(logger) {}

HealthEvaluation HealthEvaluator::evaluate(const SystemState& state,
                                           const std::vector<HealthCheckResult>& checks,
                                           const HealthProbeMap& probes) const {
    HealthEvaluation result;
    result.components = state.components;

    // Probes first, in registration order, so explicit checks win
    for (const auto& entry : state.components.entries()) {
        auto it = probes.find(entry.id);
        if (it == probes.end() || !it->second) continue;
        auto status = run_probe(entry.id, it->second, result.probe_failures);
        apply_status(result.components, entry.id, status, result.transitions);
    }

    for (const auto& check : checks) {
        if (!result.components.contains(check.component_id)) {
            result.unknown_components.push_back(check.component_id);
            if (logger_) {
                logger_->debug("Health check for unknown component",
                               {{"component", check.component_id}});
            }
            continue;
        }
        apply_status(result.components, check.component_id, check.new_status, result.transitions);
    }

    result.health = compute_health(result.components, state.metrics.error_rate);
    return result;
}

double HealthEvaluator::compute_health(const ComponentRegistry& components,
                                       double error_rate) noexcept {
    double score = 1.0;
    if (!components.empty()) {
        double weighted = static_cast<double>(components.count(HealthStatus::Healthy))
                        + 0.5 * static_cast<double>(components.count(HealthStatus::Degraded))
                        + 0.25 * static_cast<double>(components.count(HealthStatus::Starting));
        score = weighted / static_cast<double>(components.size());
    }

    double errors = std::clamp(error_rate, 0.0, 1.0);
    double health = std::round(100.0 * (kComponentWeight * score + kErrorWeight * (1.0 - errors)));
    return std::clamp(health, 0.0, 100.0);
}

HealthStatus HealthEvaluator::run_probe(const ComponentId& id, const HealthProbe& probe,
                                        std::vector<ComponentId>& failures) const {
    try {
        return probe();
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->warn("Health probe threw", {{"component", id}, {"error", e.what()}});
        }
    } catch (...) {
        if (logger_) {
            logger_->warn("Health probe threw non-standard exception", {{"component", id}});
        }
    }
    failures.push_back(id);
    return HealthStatus::Failed;
}

}  // namespace coordination_core
