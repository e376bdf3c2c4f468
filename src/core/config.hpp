/**
 * @file config.hpp
 * @brief Coordination core configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace coordination_core {

struct CoordinatorConfig {
    uint32_t health_check_interval_ms = 30000;
    uint32_t metrics_export_interval_ms = 300000;
    uint32_t operation_timeout_ms = 600000;
    double hub_health_threshold = 50.0;         ///< Hub is healthy above this health
    uint32_t direct_queue_limit = 100;          ///< Direct path available below this depth
    uint32_t message_queue_capacity = 10000;    ///< Per routing mode
};

struct QuotaConfig {
    std::string agent;
    uint32_t max_concurrent = 0;
    uint32_t max_per_minute = 0;
    uint32_t max_per_hour = 0;
};

struct SchedulerConfig {
    double aging_factor = 0.1;
    uint32_t aging_interval_ms = 10000;
    bool quota_enabled = true;
    bool fairness_enabled = true;
    std::vector<QuotaConfig> quotas;
};

struct RoutingConfig {
    uint32_t history_capacity = 500;
    uint32_t fallback_max_retries = 5;
    uint32_t hub_max_retries = 3;
    uint32_t direct_max_retries = 2;
    double direct_connection_load_threshold = 40.0;   ///< ops/hour
};

struct StrategyConfig {
    uint32_t distributed_threshold = 3;
    double queue_load_threshold = 50.0;               ///< ops/hour
};

struct EventsConfig {
    uint32_t max_subscribers_per_topic = 100;
    uint32_t channel_capacity = 1024;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    CoordinatorConfig coordinator;
    SchedulerConfig scheduler;
    RoutingConfig routing;
    StrategyConfig strategy;
    EventsConfig events;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Returns ConfigError for unreadable or
 * malformed files and InvalidArgument for out-of-range values.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an in-memory TOML document.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Check value ranges.
 */
Result<void> validate_config(const Config& config);

Config default_config();

}  // namespace coordination_core
