/**
 * @file health_evaluator.hpp
 * @brief Component status transitions and the aggregate health score.
 *
 * Status comes from two inbound sources: explicit check results pushed by
 * external collaborators, and registered probes polled on every evaluation.
 * A probe that throws marks its component Failed; the exception never
 * reaches the caller.
 *
 * Aggregate health:
 *   score  = (healthy + 0.5 * degraded + 0.25 * starting) / total   (1 if empty)
 *   health = round(100 * (0.8 * score + 0.2 * (1 - error_rate)))    in [0, 100]
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <functional>
#include <unordered_map>
#include <vector>

namespace coordination_core {

struct HealthCheckResult {
    ComponentId component_id;
    HealthStatus new_status{HealthStatus::Healthy};
};

using HealthProbe = std::function<HealthStatus()>;
using HealthProbeMap = std::unordered_map<ComponentId, HealthProbe>;

struct StatusTransition {
    ComponentId component_id;
    HealthStatus from;
    HealthStatus to;
};

struct HealthEvaluation {
    ComponentRegistry components;               ///< Registry with transitions applied
    double health = 100.0;
    std::vector<StatusTransition> transitions;
    std::vector<ComponentId> probe_failures;    ///< Probes that threw
    std::vector<ComponentId> unknown_components;
};

class HealthEvaluator {
public:
    explicit HealthEvaluator(Logger* logger = nullptr);

    /**
     * @brief Apply probes, then explicit checks, then recompute health.
     *
     * Checks naming unregistered ids are reported in `unknown_components`
     * and otherwise ignored.
     */
    [[nodiscard]] HealthEvaluation evaluate(const SystemState& state,
                                            const std::vector<HealthCheckResult>& checks,
                                            const HealthProbeMap& probes = {}) const;

    /// Monotonic: more failed components never raises the score.
    [[nodiscard]] static double compute_health(const ComponentRegistry& components,
                                               double error_rate) noexcept;

private:
    HealthStatus run_probe(const ComponentId& id, const HealthProbe& probe,
                           std::vector<ComponentId>& failures) const;

    Logger* logger_;
};

}  // namespace coordination_core
