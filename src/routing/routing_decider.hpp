/**
 * @file routing_decider.hpp
 * @brief Per-message routing mode selection and rolling routing metrics.
 *
 * Selection order, one mode per send:
 *   1. target == broadcast                                   → Hub
 *   2. direct available, hub unhealthy, not broadcast_only    → Direct
 *   3. hub healthy                                           → Hub
 *   4. otherwise                                             → Fallback (retry)
 *
 * Every call yields a decision; Fallback always carries should_retry with a
 * bounded retry count.
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace coordination_core {

struct RoutingDecision {
    RoutingMode mode{RoutingMode::Hub};
    std::string reason;
    bool should_retry = false;
    uint32_t max_retries = 0;
};

struct RouteRequest {
    UnifiedMessage message;
    bool hub_healthy = true;
    bool direct_available = false;
};

struct RouteResponse {
    bool success = true;
    RoutingDecision decision;
    double latency_ms = 0.0;
    bool should_establish_direct_connection = false;
    bool requires_coordination = false;
    std::string error;
};

struct RoutingMetrics {
    static constexpr size_t kModeCount = 3;

    uint64_t total_messages = 0;
    std::array<uint64_t, kModeCount> mode_distribution{};     ///< Indexed by RoutingMode
    std::array<double, kModeCount> average_latency_ms{};
    double baseline_hub_ms = 100.0;
    double baseline_direct_ms = 40.0;

    [[nodiscard]] uint64_t count(RoutingMode mode) const noexcept {
        return mode_distribution[static_cast<size_t>(mode)];
    }
    [[nodiscard]] double latency(RoutingMode mode) const noexcept {
        return average_latency_ms[static_cast<size_t>(mode)];
    }
    [[nodiscard]] double share(RoutingMode mode) const noexcept {
        return total_messages == 0 ? 0.0
            : 100.0 * static_cast<double>(count(mode)) / static_cast<double>(total_messages);
    }
};

struct RoutingHistoryEntry {
    Timestamp timestamp{};
    RoutingMode mode{RoutingMode::Hub};
    std::string reason;
    double latency_ms = 0.0;
    std::string message_id;          ///< Message correlation id
    Priority priority{Priority::P2};
};

struct RoutingStatus {
    RoutingMode current_mode{RoutingMode::Hub};   ///< Last routed; Hub when none
    RoutingMetrics metrics;
    std::vector<RoutingHistoryEntry> recent_history;
    double latency_reduction_pct = 0.0;
    double direct_percentage = 0.0;
    RoutingMode recommended_mode{RoutingMode::Hub};
};

/**
 * @brief Stateful router: pure mode selection plus thread-safe metrics.
 */
class RoutingDecider {
public:
    explicit RoutingDecider(RoutingConfig config = {}, Logger* logger = nullptr);

    /// Pure selection, no metrics side effects.
    [[nodiscard]] RoutingDecision determine_mode(const UnifiedMessage& message,
                                                 bool hub_healthy,
                                                 bool direct_available) const;

    /// Select a mode, time the decision and record it.
    RouteResponse route(const SystemState& state, const RouteRequest& request);

    [[nodiscard]] bool should_establish_direct_connection(const UnifiedMessage& message,
                                                          double operations_per_hour,
                                                          bool hub_healthy) const noexcept;

    /// Broadcasts and requests need the coordinator in the loop.
    [[nodiscard]] static bool requires_coordination(const UnifiedMessage& message) noexcept;

    // ── Metrics ───────────────────────────────
    [[nodiscard]] RoutingMetrics metrics() const;
    [[nodiscard]] std::vector<RoutingHistoryEntry> history(size_t limit = 100) const;
    [[nodiscard]] RoutingStatus routing_status() const;
    [[nodiscard]] RoutingMode recommend_optimal_mode() const;

    /// Drop history and counters; baselines are kept.
    void clear();

    [[nodiscard]] uint32_t fallback_max_retries() const noexcept { return config_.fallback_max_retries; }

private:
    void record(const UnifiedMessage& message, const RoutingDecision& decision, double latency_ms);
    [[nodiscard]] RoutingMode recommend_locked() const noexcept;

    RoutingConfig config_;
    Logger* logger_;

    mutable std::mutex mutex_;
    RoutingMetrics metrics_;
    std::deque<RoutingHistoryEntry> history_;
};

/**
 * @brief Routes a batch; one request failing never aborts the others.
 */
class BatchRouter {
public:
    explicit BatchRouter(RoutingDecider& decider, Logger* logger = nullptr);

    std::vector<RouteResponse> route_all(const SystemState& state,
                                         const std::vector<RouteRequest>& requests);

private:
    RoutingDecider& decider_;
    Logger* logger_;
};

}  // namespace coordination_core
