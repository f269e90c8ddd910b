/**
 * @file latency_model.cpp
 * @brief Latency estimator implementations.
 */

#include "scheduler/latency_model.hpp"

#include <cmath>

namespace tco_scheduler {

LoadScaledLatencyModel::LoadScaledLatencyModel(LatencyConfig config)
    : config_(std::move(config)) {}

uint64_t LoadScaledLatencyModel::estimate_ms(const Job& job, const NodeState& node) const {
    double base = node.spec.base_latency_ms > 0
        ? static_cast<double>(node.spec.base_latency_ms)
        : static_cast<double>(config_.base_latency_ms);

    double latency = base + static_cast<double>(config_.load_penalty_ms) * node.utilization();

    if (job.preferred_location && *job.preferred_location != node.spec.location) {
        latency += static_cast<double>(config_.remote_zone_penalty_ms);
    }

    return static_cast<uint64_t>(std::ceil(latency));
}

uint64_t PressureLatencyModel::estimate_ms(const Job& /*job*/, const NodeState& node) const {
    constexpr uint64_t TWO_GB_MB = 2 * 1024;
    auto free = node.free();

    uint64_t latency = BASE_MS;
    if (free.cpu_cores < 2) latency += CPU_PRESSURE_MS;
    if (free.memory_mb < TWO_GB_MB) latency += MEMORY_PRESSURE_MS;
    return latency;
}

Result<std::unique_ptr<ILatencyModel>> make_latency_model(const LatencyConfig& config) {
    if (config.model == "load_scaled") {
        return std::unique_ptr<ILatencyModel>(std::make_unique<LoadScaledLatencyModel>(config));
    }
    if (config.model == "pressure") {
        return std::unique_ptr<ILatencyModel>(std::make_unique<PressureLatencyModel>());
    }
    return Error{ErrorCode::Config, "Unknown latency model: " + config.model};
}

}  // namespace tco_scheduler
