/**
 * @file event_bus.hpp
 * @brief Typed in-process publish/subscribe with bounded channels.
 *
 * Two ways to consume a topic:
 *   - a handler, invoked synchronously on the publishing thread;
 *   - an EventChannel, a bounded FIFO the consumer polls.
 *
 * Both count toward the per-topic subscriber limit. A full channel rejects
 * the event and counts it as dropped, so backpressure is visible to the
 * publisher through PublishReport and to the consumer through dropped().
 */

#pragma once

#include "coordinator/system_state.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "routing/routing_decider.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace coordination_core {

// ─────────────────────────────────────────────
// Topics
// ─────────────────────────────────────────────

namespace topics {

inline constexpr std::string_view kComponentRegistered = "component:registered";
inline constexpr std::string_view kComponentUnregistered = "component:unregistered";
inline constexpr std::string_view kMessageRouted = "message:routed";
inline constexpr std::string_view kMessageBroadcast = "message:broadcast";
inline constexpr std::string_view kOperationStarted = "operation:started";
inline constexpr std::string_view kOperationQueued = "operation:queued";
inline constexpr std::string_view kOperationCompleted = "operation:completed";
inline constexpr std::string_view kOperationFailed = "operation:failed";
inline constexpr std::string_view kOperationTimeout = "operation:timeout";
inline constexpr std::string_view kHealthUpdated = "health:updated";
inline constexpr std::string_view kMetricsExported = "metrics:exported";

/// `message:<target>`, or `message:broadcast` for broadcasts.
[[nodiscard]] std::string message_topic(std::string_view target);

/// `operation:execute:<component>`
[[nodiscard]] std::string execute_topic(std::string_view component);

}  // namespace topics

// ─────────────────────────────────────────────
// Event payloads
// ─────────────────────────────────────────────

struct ComponentUnregistered {
    ComponentId component_id;
};

struct MessageRouted {
    UnifiedMessage message;
    RoutingMode mode{RoutingMode::Hub};
    double latency_ms = 0.0;
};

struct OperationDispatch {
    Operation operation;
    std::optional<ShardInfo> shard;
};

struct OperationFinished {
    OperationId operation_id;
    bool success = true;
    Millis duration{0};
    std::string error;
};

struct HealthUpdate {
    double health = 100.0;
};

struct MetricsSnapshot {
    Timestamp exported_at{};
    SystemStatusSummary status;
    RoutingStatus routing;
};

using EventPayload = std::variant<std::monostate,
                                  ComponentStatus,
                                  ComponentUnregistered,
                                  UnifiedMessage,
                                  MessageRouted,
                                  Operation,
                                  OperationDispatch,
                                  OperationFinished,
                                  HealthUpdate,
                                  MetricsSnapshot>;

struct CoordinationEvent {
    std::string topic;
    Timestamp emitted_at{};
    EventPayload payload;
};

using EventHandler = std::function<void(const CoordinationEvent&)>;
using SubscriptionId = uint64_t;

// ─────────────────────────────────────────────
// EventChannel
// ─────────────────────────────────────────────

/**
 * @brief Bounded FIFO of events for one topic. Thread-safe.
 */
class EventChannel {
public:
    EventChannel(std::string topic, size_t capacity);

    /// False (and counted as dropped) when full or closed.
    bool offer(CoordinationEvent event);
    std::optional<CoordinationEvent> try_pop();

    void close() noexcept { closed_.store(true); }
    [[nodiscard]] bool closed() const noexcept { return closed_.load(); }

    [[nodiscard]] const std::string& topic() const noexcept { return topic_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    std::string topic_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<CoordinationEvent> buffer_;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> closed_{false};
};

// ─────────────────────────────────────────────
// EventBus
// ─────────────────────────────────────────────

struct PublishReport {
    size_t handlers_invoked = 0;
    size_t handler_failures = 0;
    size_t channels_delivered = 0;
    size_t channels_full = 0;
};

class EventBus {
public:
    explicit EventBus(EventsConfig config = {}, Logger* logger = nullptr);

    /// QueueFull once the topic has max_subscribers_per_topic consumers.
    Result<SubscriptionId> subscribe(std::string topic, EventHandler handler);
    bool unsubscribe(SubscriptionId id);

    /// Capacity 0 uses the configured channel_capacity.
    Result<std::shared_ptr<EventChannel>> open_channel(std::string topic, size_t capacity = 0);

    PublishReport publish(const CoordinationEvent& event);
    PublishReport publish(std::string topic, EventPayload payload);

    [[nodiscard]] size_t listener_count() const;
    [[nodiscard]] size_t listener_count(const std::string& topic) const;

    /// Drop every handler and close every channel.
    void clear();

private:
    struct Subscription {
        SubscriptionId id;
        EventHandler handler;
    };

    struct TopicEntry {
        std::vector<Subscription> handlers;
        std::vector<std::shared_ptr<EventChannel>> channels;

        [[nodiscard]] size_t size() const noexcept { return handlers.size() + channels.size(); }
    };

    EventsConfig config_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TopicEntry> topics_;
    SubscriptionId next_id_ = 1;
};

}  // namespace coordination_core
