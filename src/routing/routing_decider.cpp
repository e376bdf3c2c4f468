/**
 * @file routing_decider.cpp
 * @brief RoutingDecider and BatchRouter implementation.
 */

#include "routing/routing_decider.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>

namespace coordination_core {

namespace {

std::string format_ms(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

}  // anonymous namespace

RoutingDecider::RoutingDecider(RoutingConfig config, Logger* logger)
    : config_(config)
    , logger_(logger) {}

// ─────────────────────────────────────────────
// Mode Selection
// ─────────────────────────────────────────────

RoutingDecision RoutingDecider::determine_mode(const UnifiedMessage& message,
                                               bool hub_healthy,
                                               bool direct_available) const {
    if (message.is_broadcast()) {
        return RoutingDecision{RoutingMode::Hub, "Broadcast messages route through hub",
                               true, config_.hub_max_retries};
    }

    if (direct_available && !hub_healthy && !message.broadcast_only) {
        return RoutingDecision{RoutingMode::Direct, "Hub unhealthy - direct connection available",
                               true, config_.direct_max_retries};
    }

    if (hub_healthy) {
        return RoutingDecision{RoutingMode::Hub, "Hub healthy - standard routing",
                               true, config_.hub_max_retries};
    }

    return RoutingDecision{RoutingMode::Fallback, "Hub and direct paths unavailable",
                           true, config_.fallback_max_retries};
}

bool RoutingDecider::should_establish_direct_connection(const UnifiedMessage& message,
                                                        double operations_per_hour,
                                                        bool hub_healthy) const noexcept {
    if (message.is_broadcast()) return false;
    return operations_per_hour > config_.direct_connection_load_threshold || !hub_healthy;
}

bool RoutingDecider::requires_coordination(const UnifiedMessage& message) noexcept {
    return message.is_broadcast() || message.type == MessageType::Request;
}

RouteResponse RoutingDecider::route(const SystemState& state, const RouteRequest& request) {
    auto start = std::chrono::steady_clock::now();
    const auto& message = request.message;

    if (logger_) {
        logger_->debug("Routing message", {{"source", message.source},
                                           {"target", message.target},
                                           {"type", std::string{to_string(message.type)}},
                                           {"priority", std::string{to_string(message.priority)}}});
    }

    RouteResponse response;
    try {
        response.decision = determine_mode(message, request.hub_healthy, request.direct_available);
        response.should_establish_direct_connection = should_establish_direct_connection(
            message, state.metrics.operations_per_hour, request.hub_healthy);
        response.requires_coordination = requires_coordination(message);
    } catch (const std::exception& e) {
        response.success = false;
        response.decision = RoutingDecision{RoutingMode::Fallback, "Routing error - using fallback",
                                            true, config_.fallback_max_retries};
        response.should_establish_direct_connection = false;
        response.requires_coordination = false;
        response.error = e.what();
        if (logger_) logger_->error("Message routing failed", {{"error", e.what()}});
    }

    response.latency_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (response.success) {
        record(message, response.decision, response.latency_ms);
        if (logger_) {
            logger_->debug("Message routed", {{"mode", std::string{to_string(response.decision.mode)}},
                                              {"reason", response.decision.reason},
                                              {"latency_ms", format_ms(response.latency_ms)}});
        }
    }
    return response;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

void RoutingDecider::record(const UnifiedMessage& message, const RoutingDecision& decision,
                            double latency_ms) {
    std::lock_guard lock(mutex_);

    auto idx = static_cast<size_t>(decision.mode);
    auto count = ++metrics_.mode_distribution[idx];
    auto& avg = metrics_.average_latency_ms[idx];
    avg = (avg * static_cast<double>(count - 1) + latency_ms) / static_cast<double>(count);
    ++metrics_.total_messages;

    history_.push_back(RoutingHistoryEntry{
        .timestamp = std::chrono::system_clock::now(),
        .mode = decision.mode,
        .reason = decision.reason,
        .latency_ms = latency_ms,
        .message_id = message.correlation,
        .priority = message.priority,
    });
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }
}

RoutingMetrics RoutingDecider::metrics() const {
    std::lock_guard lock(mutex_);
    return metrics_;
}

std::vector<RoutingHistoryEntry> RoutingDecider::history(size_t limit) const {
    std::lock_guard lock(mutex_);
    size_t n = std::min(limit, history_.size());
    return {history_.end() - static_cast<std::ptrdiff_t>(n), history_.end()};
}

RoutingStatus RoutingDecider::routing_status() const {
    std::lock_guard lock(mutex_);

    RoutingStatus status;
    status.metrics = metrics_;

    size_t n = std::min<size_t>(10, history_.size());
    status.recent_history.assign(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
    status.current_mode = history_.empty() ? RoutingMode::Hub : history_.back().mode;

    status.direct_percentage = metrics_.share(RoutingMode::Direct);

    // Measured latency when available, baseline otherwise
    double hub = metrics_.latency(RoutingMode::Hub) > 0.0
        ? metrics_.latency(RoutingMode::Hub) : metrics_.baseline_hub_ms;
    double direct = metrics_.latency(RoutingMode::Direct) > 0.0
        ? metrics_.latency(RoutingMode::Direct) : metrics_.baseline_direct_ms;
    status.latency_reduction_pct = hub > direct ? (hub - direct) / hub * 100.0 : 0.0;

    status.recommended_mode = recommend_locked();
    return status;
}

RoutingMode RoutingDecider::recommend_optimal_mode() const {
    std::lock_guard lock(mutex_);
    return recommend_locked();
}

RoutingMode RoutingDecider::recommend_locked() const noexcept {
    if (metrics_.total_messages == 0) return RoutingMode::Hub;

    if (metrics_.share(RoutingMode::Fallback) > 10.0) return RoutingMode::Fallback;

    if (metrics_.share(RoutingMode::Direct) > 50.0
        && metrics_.latency(RoutingMode::Direct) < metrics_.latency(RoutingMode::Hub)) {
        return RoutingMode::Direct;
    }
    return RoutingMode::Hub;
}

void RoutingDecider::clear() {
    std::lock_guard lock(mutex_);
    history_.clear();
    RoutingMetrics fresh;
    fresh.baseline_hub_ms = metrics_.baseline_hub_ms;
    fresh.baseline_direct_ms = metrics_.baseline_direct_ms;
    metrics_ = fresh;
    if (logger_) logger_->debug("Routing history and metrics cleared");
}

// ─────────────────────────────────────────────
// BatchRouter
// ─────────────────────────────────────────────

BatchRouter::BatchRouter(RoutingDecider& decider, Logger* logger)
    : decider_(decider)
    , logger_(logger) {}

std::vector<RouteResponse> BatchRouter::route_all(const SystemState& state,
                                                  const std::vector<RouteRequest>& requests) {
    if (logger_) {
        logger_->info("Executing batch message routing",
                      {{"message_count", std::to_string(requests.size())}});
    }

    std::vector<RouteResponse> responses;
    responses.reserve(requests.size());

    for (const auto& request : requests) {
        try {
            responses.push_back(decider_.route(state, request));
        } catch (const std::exception& e) {
            RouteResponse failed;
            failed.success = false;
            failed.decision = RoutingDecision{RoutingMode::Fallback, "Batch routing error", true,
                                              decider_.fallback_max_retries()};
            failed.error = e.what();
            responses.push_back(std::move(failed));
        }
    }
    return responses;
}

}  // namespace coordination_core
