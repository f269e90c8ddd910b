/**
 * @file job_lifecycle.hpp
 * @brief Per-job state machine and the table of all known jobs.
 *
 *   Pending ──► Scheduled ──► Running ──► Completed
 *      ▲  │         │  │         │
 *      │  │         │  └─────────┴──────► Failed
 *      │  └─────────┼───────────────────► Failed
 *      └────────────┴─── node evicted (requeue)
 *
 * Every transition is validated under the table mutex; the mutex is never
 * held while calling into the registry or the executor.
 */

#pragma once

#include "cluster/cluster_registry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "cost/cost_engine.hpp"
#include "scheduler/job.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Binding of a job to a node, with the reservation backing it.
 */
struct Assignment {
    JobId job_id;
    NodeId node_id;
    CostBreakdown cost;
    uint64_t estimated_latency_ms{0};
    AssignmentToken token;
};

/**
 * @brief Terminal outcome applied by JobLifecycle::finish().
 */
struct JobOutcome {
    JobStatus status{JobStatus::Completed};    ///< Completed or Failed
    FailureReason reason{FailureReason::None};
    std::string detail;
    std::optional<int> exit_code;
    std::string output;
};

struct JobRecord {
    Job job;
    JobStatus status{JobStatus::Pending};
    std::optional<Assignment> assignment;      ///< Present while Scheduled/Running
    std::optional<CostBreakdown> cost;         ///< Current or final assignment cost
    std::optional<NodeId> last_node;           ///< Node of the current or final assignment
    std::optional<Timestamp> scheduled_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> ended_at;
    FailureReason failure{FailureReason::None};
    std::string failure_detail;
    uint32_t requeue_count{0};
    SteadyTime last_progress;
    std::optional<int> exit_code;
    std::string output;
};

struct JobCounts {
    size_t total{0};
    size_t pending{0};
    size_t scheduled{0};
    size_t running{0};
    size_t completed{0};
    size_t failed{0};
};

/// Whether the state machine permits @p from → @p to.
[[nodiscard]] constexpr bool can_transition(JobStatus from, JobStatus to) noexcept {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Scheduled || to == JobStatus::Failed;
        case JobStatus::Scheduled:
            return to == JobStatus::Running || to == JobStatus::Completed
                || to == JobStatus::Failed || to == JobStatus::Pending;
        case JobStatus::Running:
            return to == JobStatus::Completed || to == JobStatus::Failed
                || to == JobStatus::Pending;
        case JobStatus::Completed:
        case JobStatus::Failed:
            return false;
    }
    return false;
}

class JobLifecycle {
public:
    /// Store a validated job as Pending. AlreadyExists on duplicate id.
    Result<void> admit(Job job, SteadyTime now = std::chrono::steady_clock::now());

    /// Pending → Scheduled, taking ownership of the assignment.
    Result<void> mark_scheduled(const JobId& id,
                                Assignment assignment,
                                Timestamp now = std::chrono::system_clock::now(),
                                SteadyTime steady_now = std::chrono::steady_clock::now());

    /// Scheduled → Running; guarded like finish() when @p expected_reservation is set.
    Result<void> mark_running(const JobId& id,
                              std::optional<uint64_t> expected_reservation = std::nullopt,
                              Timestamp now = std::chrono::system_clock::now(),
                              SteadyTime steady_now = std::chrono::steady_clock::now());

    /**
     * @brief Scheduled/Running → Completed/Failed.
     *
     * With @p expected_reservation set, only applies while the job still
     * holds that reservation.
     * @return the reservation the caller must release.
     */
    Result<AssignmentToken> finish(const JobId& id,
                                   JobOutcome outcome,
                                   std::optional<uint64_t> expected_reservation = std::nullopt,
                                   Timestamp now = std::chrono::system_clock::now());

    /**
     * @brief Scheduled/Running → Pending after the node was lost.
     *
     * Only succeeds if the job still holds reservation @p reservation_id, so
     * two observers of the same eviction cannot both requeue the job.
     * @return the revoked reservation, for callers that need to release it.
     */
    Result<AssignmentToken> requeue(const JobId& id, uint64_t reservation_id,
                                    SteadyTime now = std::chrono::steady_clock::now());

    /// Pending → Failed (infeasible at submission, or lost and not re-placeable).
    Result<void> fail_unplaced(const JobId& id,
                               FailureReason reason,
                               std::string detail,
                               Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const;

    /// Live assignments held on @p node_id.
    [[nodiscard]] std::vector<Assignment> assignments_on(const NodeId& node_id) const;

    /// Scheduled/Running jobs with no progress for longer than @p timeout.
    [[nodiscard]] std::vector<Assignment> overdue(Millis timeout, SteadyTime now) const;

    [[nodiscard]] JobCounts counts() const;

private:
    static Error transition_error(const JobRecord& rec, JobStatus to);

    mutable std::mutex mutex_;
    std::unordered_map<JobId, JobRecord> jobs_;
};

}  // namespace tco_scheduler
