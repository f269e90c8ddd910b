/**
 * @file job.cpp
 * @brief Job admission checks.
 */

#include "scheduler/job.hpp"

#include <cmath>

namespace tco_scheduler {

namespace {

bool non_negative_finite(double v) {
    return std::isfinite(v) && v >= 0.0;
}

}  // anonymous namespace

Result<void> validate_job(const Job& job) {
    if (job.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "job id must not be empty"};
    }
    if (job.request.cpu_cores == 0 && job.request.memory_mb == 0 && job.request.gpu_count == 0) {
        return Error{ErrorCode::InvalidArgument, "job " + job.id + " requests no resources"};
    }
    if (job.sla.max_latency_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "job " + job.id + " has a zero latency bound"};
    }
    if (!non_negative_finite(job.estimated_duration_hours)) {
        return Error{ErrorCode::InvalidCostInput,
                     "job " + job.id + " estimated_duration_hours must be non-negative and finite"};
    }
    if (!non_negative_finite(job.estimated_data_gb)) {
        return Error{ErrorCode::InvalidCostInput,
                     "job " + job.id + " estimated_data_gb must be non-negative and finite"};
    }
    if (job.sla.max_budget_usd && !non_negative_finite(*job.sla.max_budget_usd)) {
        return Error{ErrorCode::InvalidCostInput,
                     "job " + job.id + " budget must be non-negative and finite"};
    }
    return Result<void>{};
}

}  // namespace tco_scheduler
