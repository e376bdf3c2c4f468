/**
 * @file system_validator.hpp
 * @brief Structured system integrity and readiness report.
 *
 * Validation findings are data, never exceptions: the report lists errors,
 * warnings, per-component results, dependency issues and an operational
 * readiness assessment.
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/logger.hpp"
#include "risk/risk_assessor.hpp"
#include "strategy/execution_strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coordination_core {

struct ValidateSystemRequest {
    bool check_dependencies = true;
    bool check_operational_readiness = true;
    bool strict_mode = false;                   ///< Not-ready becomes an error
    std::optional<Operation> target_operation;  ///< Assess risk for this operation
};

struct ComponentValidation {
    ComponentId component_id;
    bool is_valid = true;
    bool is_healthy = true;
    bool dependencies_satisfied = true;
    bool can_start = true;
    std::vector<std::string> issues;
};

enum class IssueSeverity : uint8_t { Warning, Error };

[[nodiscard]] constexpr std::string_view to_string(IssueSeverity severity) noexcept {
    return severity == IssueSeverity::Error ? "error" : "warning";
}

struct DependencyIssue {
    ComponentId component_id;
    std::vector<ComponentId> blocked_by;
    IssueSeverity severity{IssueSeverity::Warning};   ///< Error when the component itself failed
    std::string message;
};

struct OperationalReadiness {
    bool ready = false;
    size_t healthy_components = 0;
    size_t total_components = 0;
    std::vector<ComponentId> critical_components_down;
    RiskLevel risk_level{RiskLevel::Low};
    std::vector<std::string> risk_factors;
    std::vector<std::string> recommendations;
};

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<ComponentValidation> component_validations;   ///< Registration order
    std::vector<DependencyIssue> dependency_issues;
    OperationalReadiness readiness;
    Millis validation_time{0};
};

struct OperationValidation {
    bool can_execute = false;       ///< Runs immediately
    bool should_proceed = false;
    RiskAssessment risk;
    std::string recommendation;
};

class SystemValidator {
public:
    /// A failed or degraded component with more dependents than this is critical.
    static constexpr size_t kCriticalDependentCount = 2;

    SystemValidator(const RiskAssessor& risk, const ExecutionStrategySelector& selector,
                    Logger* logger = nullptr);

    [[nodiscard]] ValidationReport validate(const SystemState& state,
                                            const ValidateSystemRequest& request = {}) const;

    [[nodiscard]] OperationValidation validate_operation(const Operation& operation,
                                                         const SystemState& state) const;

private:
    [[nodiscard]] std::vector<ComponentValidation> validate_components(
        const SystemState& state, bool check_dependencies) const;
    [[nodiscard]] std::vector<DependencyIssue> check_dependencies(const SystemState& state) const;
    [[nodiscard]] OperationalReadiness assess_readiness(
        const SystemState& state, const std::optional<Operation>& target) const;
    [[nodiscard]] std::vector<std::string> recommendations(
        const SystemState& state, const std::vector<ComponentId>& critical_down,
        RiskLevel level) const;

    const RiskAssessor& risk_;
    const ExecutionStrategySelector& selector_;
    Logger* logger_;
};

}  // namespace coordination_core
