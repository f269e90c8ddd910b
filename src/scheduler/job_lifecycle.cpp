/**
 * @file job_lifecycle.cpp
 * @brief JobLifecycle state machine implementation.
 */

#include "scheduler/job_lifecycle.hpp"

namespace tco_scheduler {

Error JobLifecycle::transition_error(const JobRecord& rec, JobStatus to) {
    return Error{ErrorCode::InvalidTransition,
                 "job " + rec.job.id + ": " + std::string{to_string(rec.status)}
                 + " -> " + std::string{to_string(to)} + " not allowed"};
}

Result<void> JobLifecycle::admit(Job job, SteadyTime now) {
    std::lock_guard lock(mutex_);
    if (jobs_.count(job.id) > 0) {
        return Error{ErrorCode::AlreadyExists, "job " + job.id + " already submitted"};
    }
    JobRecord rec;
    rec.last_progress = now;
    auto id = job.id;
    rec.job = std::move(job);
    jobs_.emplace(std::move(id), std::move(rec));
    return Result<void>{};
}

Result<void> JobLifecycle::mark_scheduled(const JobId& id,
                                          Assignment assignment,
                                          Timestamp now,
                                          SteadyTime steady_now) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    auto& rec = it->second;
    if (rec.status != JobStatus::Pending) {
        return transition_error(rec, JobStatus::Scheduled);
    }

    rec.status = JobStatus::Scheduled;
    rec.cost = assignment.cost;
    rec.last_node = assignment.node_id;
    rec.assignment = std::move(assignment);
    rec.scheduled_at = now;
    rec.last_progress = steady_now;
    return Result<void>{};
}

Result<void> JobLifecycle::mark_running(const JobId& id,
                                        std::optional<uint64_t> expected_reservation,
                                        Timestamp now,
                                        SteadyTime steady_now) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    auto& rec = it->second;
    if (rec.status != JobStatus::Scheduled || !rec.assignment) {
        return transition_error(rec, JobStatus::Running);
    }
    if (expected_reservation && rec.assignment->token.reservation_id != *expected_reservation) {
        return Error{ErrorCode::InvalidTransition,
                     "job " + id + " no longer holds reservation "
                     + std::to_string(*expected_reservation)};
    }

    rec.status = JobStatus::Running;
    rec.started_at = now;
    rec.last_progress = steady_now;
    return Result<void>{};
}

Result<AssignmentToken> JobLifecycle::finish(const JobId& id,
                                             JobOutcome outcome,
                                             std::optional<uint64_t> expected_reservation,
                                             Timestamp now) {
    if (outcome.status != JobStatus::Completed && outcome.status != JobStatus::Failed) {
        return Error{ErrorCode::InvalidArgument,
                     "finish() requires a terminal status, got "
                     + std::string{to_string(outcome.status)}};
    }

    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    auto& rec = it->second;
    if (!can_transition(rec.status, outcome.status) || !rec.assignment) {
        return transition_error(rec, outcome.status);
    }
    if (expected_reservation && rec.assignment->token.reservation_id != *expected_reservation) {
        return Error{ErrorCode::InvalidTransition,
                     "job " + id + " no longer holds reservation "
                     + std::to_string(*expected_reservation)};
    }

    auto token = rec.assignment->token;
    rec.status = outcome.status;
    rec.assignment.reset();
    rec.ended_at = now;
    if (outcome.status == JobStatus::Completed && !rec.started_at) {
        rec.started_at = now;
    }
    rec.failure = outcome.status == JobStatus::Failed ? outcome.reason : FailureReason::None;
    rec.failure_detail = std::move(outcome.detail);
    rec.exit_code = outcome.exit_code;
    rec.output = std::move(outcome.output);
    return token;
}

Result<AssignmentToken> JobLifecycle::requeue(const JobId& id, uint64_t reservation_id,
                                              SteadyTime now) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    auto& rec = it->second;
    if (!can_transition(rec.status, JobStatus::Pending) || !rec.assignment) {
        return transition_error(rec, JobStatus::Pending);
    }
    if (rec.assignment->token.reservation_id != reservation_id) {
        return Error{ErrorCode::InvalidTransition,
                     "job " + id + " no longer holds reservation " + std::to_string(reservation_id)};
    }

    auto token = rec.assignment->token;
    rec.status = JobStatus::Pending;
    rec.assignment.reset();
    rec.cost.reset();
    rec.scheduled_at.reset();
    rec.started_at.reset();
    ++rec.requeue_count;
    rec.last_progress = now;
    return token;
}

Result<void> JobLifecycle::fail_unplaced(const JobId& id,
                                         FailureReason reason,
                                         std::string detail,
                                         Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    auto& rec = it->second;
    if (rec.status != JobStatus::Pending) {
        return transition_error(rec, JobStatus::Failed);
    }

    rec.status = JobStatus::Failed;
    rec.failure = reason;
    rec.failure_detail = std::move(detail);
    rec.ended_at = now;
    return Result<void>{};
}

std::optional<JobRecord> JobLifecycle::get(const JobId& id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<Assignment> JobLifecycle::assignments_on(const NodeId& node_id) const {
    std::lock_guard lock(mutex_);
    std::vector<Assignment> result;
    for (const auto& [id, rec] : jobs_) {
        if (rec.assignment && rec.assignment->node_id == node_id) {
            result.push_back(*rec.assignment);
        }
    }
    return result;
}

std::vector<Assignment> JobLifecycle::overdue(Millis timeout, SteadyTime now) const {
    std::lock_guard lock(mutex_);
    std::vector<Assignment> result;
    for (const auto& [id, rec] : jobs_) {
        if (!rec.assignment) continue;
        if (now - rec.last_progress > timeout) {
            result.push_back(*rec.assignment);
        }
    }
    return result;
}

JobCounts JobLifecycle::counts() const {
    std::lock_guard lock(mutex_);
    JobCounts c;
    c.total = jobs_.size();
    for (const auto& [id, rec] : jobs_) {
        switch (rec.status) {
            case JobStatus::Pending:   ++c.pending; break;
            case JobStatus::Scheduled: ++c.scheduled; break;
            case JobStatus::Running:   ++c.running; break;
            case JobStatus::Completed: ++c.completed; break;
            case JobStatus::Failed:    ++c.failed; break;
        }
    }
    return c;
}

}  // namespace tco_scheduler
