/**
 * @file system_validator.cpp
 * @brief SystemValidator implementation.
 */

#include "health/system_validator.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace coordination_core {

namespace {

std::string join(const std::vector<ComponentId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

}  // anonymous namespace

SystemValidator::SystemValidator(const RiskAssessor& risk,
                                 const ExecutionStrategySelector& selector,
                                 Logger* logger)
    : risk_(risk)
    , selector_(selector)
    , logger_(logger) {}

ValidationReport SystemValidator::validate(const SystemState& state,
                                           const ValidateSystemRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    ValidationReport report;

    report.component_validations = validate_components(state, request.check_dependencies);
    for (const auto& validation : report.component_validations) {
        if (validation.is_valid) continue;
        for (const auto& issue : validation.issues) {
            report.errors.push_back(validation.component_id + ": " + issue);
        }
    }

    if (request.check_dependencies) {
        report.dependency_issues = check_dependencies(state);
        for (const auto& issue : report.dependency_issues) {
            auto& bucket = issue.severity == IssueSeverity::Error ? report.errors : report.warnings;
            bucket.push_back(issue.message);
        }
    }

    if (request.check_operational_readiness) {
        report.readiness = assess_readiness(state, request.target_operation);
    } else {
        report.readiness.healthy_components = state.components.healthy_components().size();
        report.readiness.total_components = state.components.size();
        report.readiness.ready = report.readiness.healthy_components > 0;
    }

    if (request.strict_mode && !report.readiness.ready) {
        report.errors.emplace_back("System is not operationally ready");
    }

    report.valid = report.errors.empty() && (!request.strict_mode || report.readiness.ready);
    report.validation_time = std::chrono::duration_cast<Millis>(
        std::chrono::steady_clock::now() - start);

    if (logger_) {
        logger_->info("System validation completed",
                      {{"valid", report.valid ? "true" : "false"},
                       {"errors", std::to_string(report.errors.size())},
                       {"warnings", std::to_string(report.warnings.size())},
                       {"dependency_issues", std::to_string(report.dependency_issues.size())}});
    }
    return report;
}

std::vector<ComponentValidation> SystemValidator::validate_components(
    const SystemState& state, bool check_dependencies) const {

    std::vector<ComponentValidation> validations;
    validations.reserve(state.components.size());

    for (const auto& component : state.components.entries()) {
        ComponentValidation v;
        v.component_id = component.id;
        v.is_healthy = component.is_healthy();
        if (!v.is_healthy) {
            v.issues.push_back("Component is " + std::string{to_string(component.status)});
        }

        if (check_dependencies) {
            auto failed = state.components.failed_dependencies(component);
            v.dependencies_satisfied = failed.empty();
            if (!v.dependencies_satisfied) {
                v.issues.push_back("Dependencies not satisfied: " + join(failed));
            }
            auto start_check = state.components.can_start(component);
            v.can_start = start_check.can_start;
            if (!v.can_start) v.issues.push_back(start_check.reason);
        }

        v.is_valid = v.issues.empty();
        validations.push_back(std::move(v));
    }
    return validations;
}

std::vector<DependencyIssue> SystemValidator::check_dependencies(const SystemState& state) const {
    std::vector<DependencyIssue> issues;
    for (const auto& component : state.components.entries()) {
        auto start_check = state.components.can_start(component);
        if (start_check.can_start) continue;

        issues.push_back(DependencyIssue{
            .component_id = component.id,
            .blocked_by = std::move(start_check.blocked_by),
            .severity = component.status == HealthStatus::Failed ? IssueSeverity::Error
                                                                  : IssueSeverity::Warning,
            .message = component.id + " cannot start: " + start_check.reason,
        });
    }
    return issues;
}

OperationalReadiness SystemValidator::assess_readiness(
    const SystemState& state, const std::optional<Operation>& target) const {

    OperationalReadiness readiness;
    readiness.healthy_components = state.components.healthy_components().size();
    readiness.total_components = state.components.size();

    for (const auto& component : state.components.entries()) {
        if (component.status != HealthStatus::Failed && component.status != HealthStatus::Degraded) {
            continue;
        }
        if (state.components.dependents_of(component.id).size() > kCriticalDependentCount) {
            readiness.critical_components_down.push_back(component.id);
        }
    }

    if (target) {
        auto assessment = risk_.assess(*target, state);
        readiness.risk_level = assessment.level;
        readiness.risk_factors = std::move(assessment.factors);
    } else if (state.health < RiskAssessor::kCriticalHealth) {
        readiness.risk_level = RiskLevel::Critical;
        readiness.risk_factors.emplace_back("System health below 50%");
    } else if (state.health < RiskAssessor::kDegradedHealth) {
        readiness.risk_level = RiskLevel::High;
        readiness.risk_factors.emplace_back("System health below 70%");
    } else if (!readiness.critical_components_down.empty()) {
        readiness.risk_level = RiskLevel::Medium;
        readiness.risk_factors.push_back(std::to_string(readiness.critical_components_down.size())
                                         + " critical components down");
    }

    readiness.recommendations = recommendations(state, readiness.critical_components_down,
                                                readiness.risk_level);
    readiness.ready = readiness.healthy_components > 0
                   && readiness.critical_components_down.empty()
                   && readiness.risk_level != RiskLevel::Critical;
    return readiness;
}

std::vector<std::string> SystemValidator::recommendations(
    const SystemState& state, const std::vector<ComponentId>& critical_down,
    RiskLevel level) const {

    std::vector<std::string> out;
    if (!critical_down.empty()) {
        out.push_back("Restore critical components: " + join(critical_down));
    }

    if (state.health < RiskAssessor::kCriticalHealth) {
        out.emplace_back("System health critical - perform full system check");
    } else if (state.health < RiskAssessor::kDegradedHealth) {
        out.emplace_back("System health degraded - investigate component issues");
    }

    if (state.metrics.error_rate > 0.1) {
        std::ostringstream oss;
        oss << "High error rate (" << std::fixed << std::setprecision(1)
            << state.metrics.error_rate * 100.0 << "%) - review error logs";
        out.push_back(oss.str());
    }

    if (state.active_operations.size() > 10) {
        out.emplace_back("High number of active operations - consider reducing load");
    }

    if (level >= RiskLevel::High) {
        out.emplace_back("High risk level detected - defer non-critical operations");
    }
    return out;
}

OperationValidation SystemValidator::validate_operation(const Operation& operation,
                                                        const SystemState& state) const {
    OperationValidation result;
    result.risk = risk_.assess(operation, state);
    result.can_execute = selector_.can_execute_immediately(operation, state);
    result.should_proceed = RiskAssessor::should_proceed(result.risk.level, operation.priority);

    if (!result.can_execute) {
        result.recommendation = "Operation cannot be executed immediately - will be queued";
    } else if (!result.should_proceed) {
        result.recommendation = "Operation execution not recommended due to high risk";
    } else {
        result.recommendation = "Operation can proceed safely";
    }
    return result;
}

}  // namespace coordination_core
