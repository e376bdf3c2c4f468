/**
 * @file types.hpp
 * @brief Fundamental types used throughout the coordination core.
 *
 * Defines component/operation identities, the health, priority, risk, routing
 * and strategy vocabularies, and the value types that flow between the
 * registry, the deciders and the coordinator. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coordination_core {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ComponentId = std::string;
using OperationId = std::string;
using TaskId = std::string;
using AgentId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

/// Message target that fans out to every component through the hub.
inline constexpr std::string_view kBroadcastTarget = "broadcast";

// ─────────────────────────────────────────────
// Health Status
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Failed,
    Starting
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:  return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Failed:   return "failed";
        case HealthStatus::Starting: return "starting";
    }
    return "unknown";
}

[[nodiscard]] std::optional<HealthStatus> parse_health_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Priority (P0 = topmost tier)
// ─────────────────────────────────────────────

enum class Priority : uint8_t {
    P0,
    P1,
    P2,
    P3
};

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::P0: return "P0";
        case Priority::P1: return "P1";
        case Priority::P2: return "P2";
        case Priority::P3: return "P3";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Risk Level
// ─────────────────────────────────────────────

/// Ordered: a later enumerator is strictly riskier.
enum class RiskLevel : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low:      return "low";
        case RiskLevel::Medium:   return "medium";
        case RiskLevel::High:     return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Routing Mode / Execution Strategy / Message Type
// ─────────────────────────────────────────────

enum class RoutingMode : uint8_t {
    Direct,      ///< Peer-to-peer
    Hub,         ///< Via the central coordinator
    Fallback     ///< Degraded path with retry
};

[[nodiscard]] constexpr std::string_view to_string(RoutingMode mode) noexcept {
    switch (mode) {
        case RoutingMode::Direct:   return "direct";
        case RoutingMode::Hub:      return "hub";
        case RoutingMode::Fallback: return "fallback";
    }
    return "unknown";
}

enum class ExecutionStrategy : uint8_t {
    Immediate,
    Distributed,
    Delegated,
    Queued
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStrategy strategy) noexcept {
    switch (strategy) {
        case ExecutionStrategy::Immediate:   return "immediate";
        case ExecutionStrategy::Distributed: return "distributed";
        case ExecutionStrategy::Delegated:   return "delegated";
        case ExecutionStrategy::Queued:      return "queued";
    }
    return "unknown";
}

enum class MessageType : uint8_t {
    Request,
    Response,
    Event,
    Command
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Request:  return "request";
        case MessageType::Response: return "response";
        case MessageType::Event:    return "event";
        case MessageType::Command:  return "command";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Component Status
// ─────────────────────────────────────────────

/**
 * @brief Registry entry for one component.
 *
 * Dependencies that name an unregistered id stay in the list and count as
 * permanently unsatisfied.
 */
struct ComponentStatus {
    ComponentId id;
    HealthStatus status{HealthStatus::Starting};
    std::vector<ComponentId> dependencies;
    std::vector<std::string> capabilities;
    std::string version;
    Timestamp last_heartbeat{};

    [[nodiscard]] bool is_healthy() const noexcept { return status == HealthStatus::Healthy; }
    [[nodiscard]] bool has_capability(std::string_view capability) const noexcept;
};

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

struct UnifiedMessage {
    ComponentId source;
    std::string target;                 ///< ComponentId or kBroadcastTarget
    MessageType type{MessageType::Event};
    Priority priority{Priority::P2};
    std::string correlation;
    std::string payload;
    bool broadcast_only{false};         ///< Must travel through the hub
    Timestamp timestamp{};

    [[nodiscard]] bool is_broadcast() const noexcept { return target == kBroadcastTarget; }
};

// ─────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────

/// QA generation work, shardable by item range.
struct GenerationPayload {
    uint64_t item_count{0};
    std::string dataset;
};

struct MaintenancePayload {
    std::string action;
};

struct ValidationPayload {
    std::vector<std::string> rules;
};

using OperationPayload = std::variant<std::monostate,
                                      GenerationPayload,
                                      MaintenancePayload,
                                      ValidationPayload>;

/// Shard of a distributed operation. Partitions are 1-based.
struct ShardInfo {
    uint32_t partition{0};
    uint32_t total_partitions{0};
    uint64_t first_item{0};
    uint64_t last_item{0};              ///< Exclusive
};

struct Operation {
    OperationId id;
    std::string type;
    ComponentId initiator;
    std::vector<ComponentId> participants;
    Priority priority{Priority::P2};
    std::vector<std::string> required_capabilities;
    OperationPayload payload;

    // Filled in by planning
    std::optional<ExecutionStrategy> strategy;
    std::optional<RiskLevel> risk_level;
    std::string reasoning;
    std::optional<ShardInfo> shard;

    // Filled in by the coordinator when the operation becomes active
    SteadyTime started_at{};
    SteadyTime deadline{};
};

}  // namespace coordination_core
