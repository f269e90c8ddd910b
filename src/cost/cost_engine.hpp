/**
 * @file cost_engine.hpp
 * @brief Total-Cost-of-Ownership model (Formula 4.1).
 *
 *   C_total = C_comp + C_data + C_idle
 *   C_comp  = price_per_hour * duration_hours * utilization_factor
 *   C_data  = data_size_gb * transfer_price_per_gb
 *   C_idle  = idle_capacity_hours * opportunity_cost_per_hour
 *
 * Stateless; every function is safe to call concurrently.
 */

#pragma once

#include "core/result.hpp"

namespace tco_scheduler {

/**
 * @brief Cost of one placement decision, in USD. Immutable once produced.
 */
struct CostBreakdown {
    double compute_usd{0.0};
    double data_transfer_usd{0.0};
    double idle_opportunity_usd{0.0};
    double total_usd{0.0};

    bool operator==(const CostBreakdown&) const = default;
};

/**
 * @brief The seven numeric inputs of Formula 4.1.
 */
struct CostInputs {
    double price_per_hour{0.0};
    double duration_hours{0.0};
    double utilization_factor{1.0};
    double data_size_gb{0.0};
    double transfer_price_per_gb{0.0};
    double idle_capacity_hours{0.0};
    double opportunity_cost_per_hour{0.0};
};

class CostEngine {
public:
    /**
     * @brief Evaluate Formula 4.1.
     *
     * Fails with ErrorCode::InvalidCostInput if any input is negative, NaN
     * or infinite, or if the resulting total overflows to infinity.
     */
    [[nodiscard]] static Result<CostBreakdown> evaluate(double price_per_hour,
                                                        double duration_hours,
                                                        double utilization_factor,
                                                        double data_size_gb,
                                                        double transfer_price_per_gb,
                                                        double idle_capacity_hours,
                                                        double opportunity_cost_per_hour);

    [[nodiscard]] static Result<CostBreakdown> evaluate(const CostInputs& inputs);

    // Individual components; no validation.
    [[nodiscard]] static constexpr double compute_cost(double price_per_hour,
                                                       double duration_hours,
                                                       double utilization_factor) noexcept {
        return price_per_hour * duration_hours * utilization_factor;
    }

    [[nodiscard]] static constexpr double data_transfer_cost(double data_size_gb,
                                                             double transfer_price_per_gb) noexcept {
        return data_size_gb * transfer_price_per_gb;
    }

    [[nodiscard]] static constexpr double idle_opportunity_cost(double idle_capacity_hours,
                                                                double opportunity_cost_per_hour) noexcept {
        return idle_capacity_hours * opportunity_cost_per_hour;
    }
};

}  // namespace tco_scheduler
