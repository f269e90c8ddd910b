/**
 * @file cost_engine.cpp
 * @brief CostEngine input validation and evaluation.
 */

#include "cost/cost_engine.hpp"

#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace tco_scheduler {

namespace {

Result<void> check_input(std::string_view name, double value) {
    if (std::isnan(value)) {
        return Error{ErrorCode::InvalidCostInput, std::string{name} + " is NaN"};
    }
    if (std::isinf(value)) {
        return Error{ErrorCode::InvalidCostInput, std::string{name} + " is infinite"};
    }
    if (value < 0.0) {
        return Error{ErrorCode::InvalidCostInput,
                     std::string{name} + " is negative (" + std::to_string(value) + ")"};
    }
    return Result<void>{};
}

}  // anonymous namespace

Result<CostBreakdown> CostEngine::evaluate(double price_per_hour,
                                           double duration_hours,
                                           double utilization_factor,
                                           double data_size_gb,
                                           double transfer_price_per_gb,
                                           double idle_capacity_hours,
                                           double opportunity_cost_per_hour) {
    const std::array<std::pair<std::string_view, double>, 7> inputs{{
        {"price_per_hour", price_per_hour},
        {"duration_hours", duration_hours},
        {"utilization_factor", utilization_factor},
        {"data_size_gb", data_size_gb},
        {"transfer_price_per_gb", transfer_price_per_gb},
        {"idle_capacity_hours", idle_capacity_hours},
        {"opportunity_cost_per_hour", opportunity_cost_per_hour},
    }};

    for (const auto& [name, value] : inputs) {
        if (auto ok = check_input(name, value); !ok) {
            return ok.error();
        }
    }

    CostBreakdown cost;
    cost.compute_usd = compute_cost(price_per_hour, duration_hours, utilization_factor);
    cost.data_transfer_usd = data_transfer_cost(data_size_gb, transfer_price_per_gb);
    cost.idle_opportunity_usd = idle_opportunity_cost(idle_capacity_hours, opportunity_cost_per_hour);
    cost.total_usd = cost.compute_usd + cost.data_transfer_usd + cost.idle_opportunity_usd;

    if (!std::isfinite(cost.total_usd)) {
        return Error{ErrorCode::InvalidCostInput, "cost overflows to infinity"};
    }
    return cost;
}

Result<CostBreakdown> CostEngine::evaluate(const CostInputs& in) {
    return evaluate(in.price_per_hour, in.duration_hours, in.utilization_factor,
                    in.data_size_gb, in.transfer_price_per_gb,
                    in.idle_capacity_hours, in.opportunity_cost_per_hour);
}

}  // namespace tco_scheduler
