/**
 * @file event_bus.cpp
 * @brief EventBus and EventChannel implementation.
 */

#include "events/event_bus.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace coordination_core {

namespace topics {

std::string message_topic(std::string_view target) {
    return "message:" + std::string{target};
}

std::string execute_topic(std::string_view component) {
    return "operation:execute:" + std::string{component};
}

}  // namespace topics

// ── EventChannel ─────────────────────────────

EventChannel::EventChannel(std::string topic, size_t capacity)
    : topic_(std::move(topic))
    , capacity_(capacity) {}

bool EventChannel::offer(CoordinationEvent event) {
    if (closed_.load()) {
        dropped_.fetch_add(1);
        return false;
    }
    std::lock_guard lock(mutex_);
    if (buffer_.size() >= capacity_) {
        dropped_.fetch_add(1);
        return false;
    }
    buffer_.push_back(std::move(event));
    return true;
}

std::optional<CoordinationEvent> EventChannel::try_pop() {
    std::lock_guard lock(mutex_);
    if (buffer_.empty()) return std::nullopt;
    auto event = std::move(buffer_.front());
    buffer_.pop_front();
    return event;
}

size_t EventChannel::size() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

// ── EventBus ─────────────────────────────────

EventBus::EventBus(EventsConfig config, Logger* logger)
    : config_(config)
    , logger_(logger) {}

Result<SubscriptionId> EventBus::subscribe(std::string topic, EventHandler handler) {
    if (!handler) {
        return Error{ErrorCode::InvalidArgument, "Empty handler for topic " + topic};
    }

    std::lock_guard lock(mutex_);
    auto& entry = topics_[topic];
    std::erase_if(entry.channels, [](const auto& ch) { return ch->closed(); });
    if (entry.size() >= config_.max_subscribers_per_topic) {
        return Error{ErrorCode::QueueFull, "Subscriber limit reached for topic " + topic};
    }

    SubscriptionId id = next_id_++;
    entry.handlers.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    for (auto it = topics_.begin(); it != topics_.end(); ++it) {
        auto& handlers = it->second.handlers;
        auto found = std::find_if(handlers.begin(), handlers.end(),
                                  [id](const Subscription& s) { return s.id == id; });
        if (found != handlers.end()) {
            handlers.erase(found);
            if (it->second.size() == 0) topics_.erase(it);
            return true;
        }
    }
    return false;
}

Result<std::shared_ptr<EventChannel>> EventBus::open_channel(std::string topic, size_t capacity) {
    std::lock_guard lock(mutex_);
    auto& entry = topics_[topic];
    std::erase_if(entry.channels, [](const auto& ch) { return ch->closed(); });
    if (entry.size() >= config_.max_subscribers_per_topic) {
        return Error{ErrorCode::QueueFull, "Subscriber limit reached for topic " + topic};
    }

    auto channel = std::make_shared<EventChannel>(
        topic, capacity == 0 ? config_.channel_capacity : capacity);
    entry.channels.push_back(channel);
    return channel;
}

PublishReport EventBus::publish(std::string topic, EventPayload payload) {
    return publish(CoordinationEvent{std::move(topic), std::chrono::system_clock::now(),
                                     std::move(payload)});
}

PublishReport EventBus::publish(const CoordinationEvent& event) {
    std::vector<EventHandler> handlers;
    std::vector<std::shared_ptr<EventChannel>> channels;

    {
        std::lock_guard lock(mutex_);
        auto it = topics_.find(event.topic);
        if (it == topics_.end()) return {};

        auto& entry = it->second;
        std::erase_if(entry.channels, [](const auto& ch) { return ch->closed(); });

        handlers.reserve(entry.handlers.size());
        for (const auto& sub : entry.handlers) handlers.push_back(sub.handler);
        channels = entry.channels;
    }

    PublishReport report;

    // Handlers run outside the lock so they may publish or subscribe
    for (const auto& handler : handlers) {
        ++report.handlers_invoked;
        try {
            handler(event);
        } catch (const std::exception& e) {
            ++report.handler_failures;
            if (logger_) {
                logger_->error("Event handler threw", {{"topic", event.topic}, {"error", e.what()}});
            }
        } catch (...) {
            ++report.handler_failures;
            if (logger_) logger_->error("Event handler threw non-standard exception",
                                        {{"topic", event.topic}});
        }
    }

    for (const auto& channel : channels) {
        if (channel->offer(event)) {
            ++report.channels_delivered;
        } else {
            ++report.channels_full;
        }
    }

    if (report.channels_full > 0 && logger_) {
        logger_->warn("Event channel full", {{"topic", event.topic},
                                             {"rejected", std::to_string(report.channels_full)}});
    }
    return report;
}

size_t EventBus::listener_count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [topic, entry] : topics_) total += entry.size();
    return total;
}

size_t EventBus::listener_count(const std::string& topic) const {
    std::lock_guard lock(mutex_);
    auto it = topics_.find(topic);
    return it == topics_.end() ? 0 : it->second.size();
}

void EventBus::clear() {
    std::lock_guard lock(mutex_);
    for (auto& [topic, entry] : topics_) {
        for (auto& channel : entry.channels) channel->close();
    }
    topics_.clear();
}

}  // namespace coordination_core
