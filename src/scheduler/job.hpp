/**
 * @file job.hpp
 * @brief Job description and SLA constraints submitted by users.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Per-job service-level constraints a placement must satisfy.
 */
struct SlaConstraints {
    uint64_t max_latency_ms{1000};
    std::optional<double> max_budget_usd;    ///< Budget ceiling on total cost
    std::optional<Timestamp> deadline;       ///< Completion deadline
};

/**
 * @brief A submitted workload. Immutable once admitted.
 */
struct Job {
    JobId id;
    Resources request;
    SlaConstraints sla;
    double estimated_duration_hours{1.0};
    double estimated_data_gb{0.0};
    std::optional<std::string> preferred_location;
    std::string image;                       ///< Executor container image
    std::vector<std::string> command;        ///< Executor command override
    Timestamp submitted_at;
};

/**
 * @brief Check request and SLA fields before a job is admitted.
 *
 * Returns InvalidArgument for structural problems (empty id, empty request,
 * zero latency bound) and InvalidCostInput for numeric fields that would be
 * rejected by the cost model (negative or non-finite duration, data volume
 * or budget).
 */
Result<void> validate_job(const Job& job);

}  // namespace tco_scheduler
