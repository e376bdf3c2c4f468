/**
 * @file types.cpp
 * @brief Parsing helpers for the vocabulary enums.
 */

#include "core/types.hpp"

#include <algorithm>

namespace coordination_core {

std::optional<HealthStatus> parse_health_status(std::string_view text) noexcept {
    if (text == "healthy")  return HealthStatus::Healthy;
    if (text == "degraded") return HealthStatus::Degraded;
    if (text == "failed")   return HealthStatus::Failed;
    if (text == "starting") return HealthStatus::Starting;
    return std::nullopt;
}

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    if (text == "P0") return Priority::P0;
    if (text == "P1") return Priority::P1;
    if (text == "P2") return Priority::P2;
    if (text == "P3") return Priority::P3;
    return std::nullopt;
}

bool ComponentStatus::has_capability(std::string_view capability) const noexcept {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

}  // namespace coordination_core
