/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <cmath>

#include <toml++/toml.hpp>

namespace tco_scheduler {

namespace {

Result<void> validate(const Config& config) {
    if (config.latency.model != "load_scaled" && config.latency.model != "pressure") {
        return Error{ErrorCode::Config, "Unknown latency model: " + config.latency.model};
    }
    if (config.executor.mode != "simulated" && config.executor.mode != "none") {
        return Error{ErrorCode::Config, "Unknown executor mode: " + config.executor.mode};
    }
    if (!std::isfinite(config.cost.utilization_factor) || config.cost.utilization_factor < 0.0) {
        return Error{ErrorCode::Config, "cost.utilization_factor must be a non-negative number"};
    }
    if (config.scheduler.max_placement_attempts == 0) {
        return Error{ErrorCode::Config, "scheduler.max_placement_attempts must be at least 1"};
    }
    for (const auto& node : config.nodes) {
        if (node.id.empty()) {
            return Error{ErrorCode::Config, "Static node entry without id"};
        }
    }
    return Result<void>{};
}

StaticNodeConfig parse_node(const toml::table& tbl) {
    StaticNodeConfig node;
    node.id = tbl["id"].value_or(std::string{});
    node.location = tbl["location"].value_or(std::string{"default"});
    node.cpu_cores = static_cast<uint32_t>(tbl["cpu_cores"].value_or(int64_t{0}));
    node.memory_gb = tbl["memory_gb"].value_or(0.0);
    node.gpu_count = static_cast<uint32_t>(tbl["gpu_count"].value_or(int64_t{0}));
    node.cost_per_hour_usd = tbl["cost_per_hour_usd"].value_or(0.0);
    node.transfer_price_per_gb = tbl["transfer_price_per_gb"].value_or(0.0);
    node.opportunity_cost_per_hour = tbl["opportunity_cost_per_hour"].value_or(0.0);
    node.on_premise = tbl["on_premise"].value_or(false);
    node.base_latency_ms = static_cast<uint32_t>(tbl["base_latency_ms"].value_or(int64_t{0}));
    return node;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            config.scheduler.cluster_id =
                scheduler["cluster_id"].value_or(std::string{"tco-cluster-1"});
            config.scheduler.listen_port = static_cast<uint16_t>(
                scheduler["listen_port"].value_or(int64_t{50051}));
            config.scheduler.max_placement_attempts = static_cast<uint32_t>(
                scheduler["max_placement_attempts"].value_or(int64_t{3}));
            config.scheduler.max_requeues = static_cast<uint32_t>(
                scheduler["max_requeues"].value_or(int64_t{1}));
            config.scheduler.result_timeout_ms = static_cast<uint32_t>(
                scheduler["result_timeout_ms"].value_or(int64_t{0}));
        }

        // [registry]
        if (auto registry = tbl["registry"]; registry.is_table()) {
            config.registry.heartbeat_timeout_ms = static_cast<uint32_t>(
                registry["heartbeat_timeout_ms"].value_or(int64_t{15000}));
            config.registry.eviction_interval_ms = static_cast<uint32_t>(
                registry["eviction_interval_ms"].value_or(int64_t{1000}));
        }

        // [cost]
        if (auto cost = tbl["cost"]; cost.is_table()) {
            config.cost.utilization_factor = cost["utilization_factor"].value_or(1.0);
        }

        // [latency]
        if (auto latency = tbl["latency"]; latency.is_table()) {
            config.latency.model = latency["model"].value_or(std::string{"load_scaled"});
            config.latency.base_latency_ms = static_cast<uint32_t>(
                latency["base_latency_ms"].value_or(int64_t{50}));
            config.latency.load_penalty_ms = static_cast<uint32_t>(
                latency["load_penalty_ms"].value_or(int64_t{100}));
            config.latency.remote_zone_penalty_ms = static_cast<uint32_t>(
                latency["remote_zone_penalty_ms"].value_or(int64_t{25}));
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.mode = executor["mode"].value_or(std::string{"simulated"});
            config.executor.thread_count = static_cast<uint32_t>(
                executor["thread_count"].value_or(int64_t{0}));
            config.executor.simulated_seconds_per_hour =
                executor["simulated_seconds_per_hour"].value_or(1.0);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_file =
                telemetry["metrics_file"].value_or(std::string{});
        }

        // [[nodes]]
        if (auto* nodes = tbl["nodes"].as_array()) {
            for (const auto& entry : *nodes) {
                if (const auto* node_tbl = entry.as_table()) {
                    config.nodes.push_back(parse_node(*node_tbl));
                }
            }
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace tco_scheduler
