/**
 * @file latency_model.hpp
 * @brief Pluggable service-latency estimators used by the SLA filter.
 */

#pragma once

#include "cluster/cluster_registry.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "scheduler/job.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace tco_scheduler {

/**
 * @brief Abstract latency estimator (runtime-selected from config).
 */
class ILatencyModel {
public:
    virtual ~ILatencyModel() = default;

    /// Estimated service latency of @p job on @p node, in whole milliseconds.
    [[nodiscard]] virtual uint64_t estimate_ms(const Job& job, const NodeState& node) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Base latency scaled by current load, plus a locality penalty.
 *
 *   latency = base + load_penalty * utilization
 *           + (job prefers another location ? remote_zone_penalty : 0)
 *
 * base is the node's declared base_latency_ms, or the configured default
 * when the node declares none. utilization is NodeState::utilization().
 */
class LoadScaledLatencyModel : public ILatencyModel {
public:
    explicit LoadScaledLatencyModel(LatencyConfig config);

    [[nodiscard]] uint64_t estimate_ms(const Job& job, const NodeState& node) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "load_scaled"; }

private:
    LatencyConfig config_;
};

/**
 * @brief Step-function estimate from free-resource pressure.
 *
 * 50 ms base, +50 ms when fewer than 2 cores are free, +30 ms when less
 * than 2 GB of memory is free.
 */
class PressureLatencyModel : public ILatencyModel {
public:
    static constexpr uint64_t BASE_MS = 50;
    static constexpr uint64_t CPU_PRESSURE_MS = 50;
    static constexpr uint64_t MEMORY_PRESSURE_MS = 30;

    [[nodiscard]] uint64_t estimate_ms(const Job& job, const NodeState& node) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "pressure"; }
};

/// Build the model named by config.model.
Result<std::unique_ptr<ILatencyModel>> make_latency_model(const LatencyConfig& config);

}  // namespace tco_scheduler
