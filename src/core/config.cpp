/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>

namespace coordination_core {

namespace {

/// Reads a non-negative integer; records the key in @p bad_key if negative or too large.
template <typename NodeView>
uint32_t read_u32(NodeView node, uint32_t fallback, const char* key,
                  std::optional<std::string>& bad_key) {
    auto raw = node[key].value_or(static_cast<int64_t>(fallback));
    if (raw < 0 || raw > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        if (!bad_key) bad_key = key;
        return fallback;
    }
    return static_cast<uint32_t>(raw);
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;
    std::optional<std::string> bad_key;

    // [coordinator]
    if (auto coord = tbl["coordinator"]; coord.is_table()) {
        auto& c = config.coordinator;
        c.health_check_interval_ms = read_u32(coord, c.health_check_interval_ms,
                                              "health_check_interval_ms", bad_key);
        c.metrics_export_interval_ms = read_u32(coord, c.metrics_export_interval_ms,
                                                "metrics_export_interval_ms", bad_key);
        c.operation_timeout_ms = read_u32(coord, c.operation_timeout_ms,
                                          "operation_timeout_ms", bad_key);
        c.hub_health_threshold = coord["hub_health_threshold"].value_or(c.hub_health_threshold);
        c.direct_queue_limit = read_u32(coord, c.direct_queue_limit, "direct_queue_limit", bad_key);
        c.message_queue_capacity = read_u32(coord, c.message_queue_capacity,
                                            "message_queue_capacity", bad_key);
    }

    // [scheduler]
    if (auto sched = tbl["scheduler"]; sched.is_table()) {
        auto& s = config.scheduler;
        s.aging_factor = sched["aging_factor"].value_or(s.aging_factor);
        s.aging_interval_ms = read_u32(sched, s.aging_interval_ms, "aging_interval_ms", bad_key);
        s.quota_enabled = sched["quota_enabled"].value_or(s.quota_enabled);
        s.fairness_enabled = sched["fairness_enabled"].value_or(s.fairness_enabled);

        // [[scheduler.quotas]]
        if (auto* quotas = sched["quotas"].as_array()) {
            for (const auto& entry : *quotas) {
                const auto* q = entry.as_table();
                if (!q) {
                    return Error{ErrorCode::ConfigError, "scheduler.quotas entries must be tables"};
                }
                toml::node_view<const toml::node> view{*q};
                QuotaConfig quota;
                quota.agent = view["agent"].value_or(std::string{});
                quota.max_concurrent = read_u32(view, 0, "max_concurrent", bad_key);
                quota.max_per_minute = read_u32(view, 0, "max_per_minute", bad_key);
                quota.max_per_hour = read_u32(view, 0, "max_per_hour", bad_key);
                s.quotas.push_back(std::move(quota));
            }
        }
    }

    // [routing]
    if (auto routing = tbl["routing"]; routing.is_table()) {
        auto& r = config.routing;
        r.history_capacity = read_u32(routing, r.history_capacity, "history_capacity", bad_key);
        r.fallback_max_retries = read_u32(routing, r.fallback_max_retries,
                                          "fallback_max_retries", bad_key);
        r.hub_max_retries = read_u32(routing, r.hub_max_retries, "hub_max_retries", bad_key);
        r.direct_max_retries = read_u32(routing, r.direct_max_retries,
                                        "direct_max_retries", bad_key);
        r.direct_connection_load_threshold = routing["direct_connection_load_threshold"]
            .value_or(r.direct_connection_load_threshold);
    }

    // [strategy]
    if (auto strategy = tbl["strategy"]; strategy.is_table()) {
        auto& st = config.strategy;
        st.distributed_threshold = read_u32(strategy, st.distributed_threshold,
                                            "distributed_threshold", bad_key);
        st.queue_load_threshold = strategy["queue_load_threshold"].value_or(st.queue_load_threshold);
    }

    // [events]
    if (auto events = tbl["events"]; events.is_table()) {
        auto& e = config.events;
        e.max_subscribers_per_topic = read_u32(events, e.max_subscribers_per_topic,
                                               "max_subscribers_per_topic", bad_key);
        e.channel_capacity = read_u32(events, e.channel_capacity, "channel_capacity", bad_key);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        auto& t = config.telemetry;
        t.log_dir = telemetry["log_dir"].value_or(t.log_dir.string());
        t.max_file_size_mb = read_u32(telemetry, t.max_file_size_mb, "max_file_size_mb", bad_key);
        t.rotate_count = read_u32(telemetry, t.rotate_count, "rotate_count", bad_key);
        t.log_level = telemetry["log_level"].value_or(t.log_level);
    }

    if (bad_key) {
        return Error{ErrorCode::InvalidArgument, "Value out of range for key: " + *bad_key};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    if (config.scheduler.aging_interval_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "scheduler.aging_interval_ms must be > 0"};
    }
    if (config.scheduler.aging_factor <= 0.0) {
        return Error{ErrorCode::InvalidArgument, "scheduler.aging_factor must be > 0"};
    }
    if (config.coordinator.health_check_interval_ms == 0
        || config.coordinator.metrics_export_interval_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "coordinator intervals must be > 0"};
    }
    if (config.coordinator.operation_timeout_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "coordinator.operation_timeout_ms must be > 0"};
    }
    if (config.coordinator.message_queue_capacity == 0
        || config.coordinator.direct_queue_limit == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "coordinator.message_queue_capacity and direct_queue_limit must be > 0"};
    }
    if (config.coordinator.hub_health_threshold < 0.0
        || config.coordinator.hub_health_threshold > 100.0) {
        return Error{ErrorCode::InvalidArgument, "coordinator.hub_health_threshold must be in [0, 100]"};
    }
    if (config.strategy.distributed_threshold < 2) {
        return Error{ErrorCode::InvalidArgument, "strategy.distributed_threshold must be >= 2"};
    }
    if (config.routing.history_capacity == 0) {
        return Error{ErrorCode::InvalidArgument, "routing.history_capacity must be > 0"};
    }
    for (const auto& quota : config.scheduler.quotas) {
        if (quota.agent.empty()) {
            return Error{ErrorCode::InvalidArgument, "scheduler.quotas entry without agent"};
        }
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidArgument,
                     "telemetry.log_level must be debug, info, warn or error"};
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace coordination_core
