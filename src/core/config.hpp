/**
 * @file config.hpp
 * @brief Scheduler daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace tco_scheduler {

struct SchedulerConfig {
    std::string cluster_id = "tco-cluster-1";
    uint16_t listen_port = 50051;
    uint32_t max_placement_attempts = 3;   ///< Optimizer passes per submission
    uint32_t max_requeues = 1;             ///< Re-placements after node loss
    uint32_t result_timeout_ms = 0;        ///< 0 = executor reports never time out
};

struct RegistryConfig {
    uint32_t heartbeat_timeout_ms = 15000;
    uint32_t eviction_interval_ms = 1000;
};

struct CostConfig {
    double utilization_factor = 1.0;
};

struct LatencyConfig {
    std::string model = "load_scaled";     ///< "load_scaled", "pressure"
    uint32_t base_latency_ms = 50;
    uint32_t load_penalty_ms = 100;
    uint32_t remote_zone_penalty_ms = 25;
};

struct ExecutorConfig {
    std::string mode = "simulated";        ///< "simulated", "none"
    uint32_t thread_count = 0;             ///< 0 = hardware_concurrency
    double simulated_seconds_per_hour = 1.0;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;         ///< empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string metrics_file;              ///< empty = metrics discarded
};

/**
 * @brief A node declared statically in the configuration file.
 *
 * Registered at daemon startup so a scheduler can be exercised without
 * remote workers.
 */
struct StaticNodeConfig {
    std::string id;
    std::string location = "default";
    uint32_t cpu_cores = 0;
    double memory_gb = 0.0;
    uint32_t gpu_count = 0;
    double cost_per_hour_usd = 0.0;
    double transfer_price_per_gb = 0.0;
    double opportunity_cost_per_hour = 0.0;
    bool on_premise = false;
    uint32_t base_latency_ms = 0;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    RegistryConfig registry;
    CostConfig cost;
    LatencyConfig latency;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
    std::vector<StaticNodeConfig> nodes;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Every key is optional; absent keys keep their defaults. Fails with
 * ErrorCode::Config if the file is missing, unparsable, or declares an
 * invalid value (unknown latency model, negative utilization factor, a
 * static node without id).
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace tco_scheduler
