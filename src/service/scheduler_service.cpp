/**
 * @file scheduler_service.cpp
 * @brief SchedulerService implementation.
 */

#include "service/scheduler_service.hpp"

#include "scheduler/latency_model.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <vector>

namespace tco_scheduler {

namespace {

constexpr std::string_view COMPONENT = "service";

std::string format_usd(double usd) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(6);
    oss << usd;
    return oss.str();
}

}  // namespace

NodeSpec to_node_spec(const StaticNodeConfig& node) {
    return NodeSpec{
        .id = node.id,
        .location = node.location,
        .capacity = Resources{
            .cpu_cores = node.cpu_cores,
            .memory_mb = gb_to_mb(node.memory_gb),
            .gpu_count = node.gpu_count,
        },
        .price_per_hour = node.cost_per_hour_usd,
        .transfer_price_per_gb = node.transfer_price_per_gb,
        .opportunity_cost_per_hour = node.opportunity_cost_per_hour,
        .on_premise = node.on_premise,
        .base_latency_ms = node.base_latency_ms,
    };
}

// ═══════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════

Result<std::unique_ptr<SchedulerService>> SchedulerService::create(
    Config config,
    std::shared_ptr<IJobExecutor> executor,
    std::shared_ptr<ExecutorMailbox> mailbox,
    Logger& logger,
    MetricsCollector* metrics) {

    auto model = make_latency_model(config.latency);
    if (!model) {
        return model.error();
    }
    std::shared_ptr<const ILatencyModel> shared_model = std::move(model.value());
    return std::make_unique<SchedulerService>(std::move(config),
                                              std::move(shared_model),
                                              std::move(executor),
                                              std::move(mailbox),
                                              logger,
                                              metrics);
}

SchedulerService::SchedulerService(Config config,
                                   std::shared_ptr<const ILatencyModel> latency_model,
                                   std::shared_ptr<IJobExecutor> executor,
                                   std::shared_ptr<ExecutorMailbox> mailbox,
                                   Logger& logger,
                                   MetricsCollector* metrics)
    : config_(std::move(config))
    , logger_(logger)
    , metrics_(metrics)
    , executor_(executor ? std::move(executor) : std::make_shared<ExternalExecutor>())
    , mailbox_(mailbox ? std::move(mailbox) : std::make_shared<ExecutorMailbox>())
    , optimizer_(config_.cost, std::move(latency_model)) {
    if (config_.scheduler.max_placement_attempts == 0) {
        config_.scheduler.max_placement_attempts = 1;
    }
}

SchedulerService::~SchedulerService() {
    stop();
}

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

void SchedulerService::start() {
    if (running_.exchange(true)) return;

    logger_.info(COMPONENT, "maintenance started: cluster=" + config_.scheduler.cluster_id
                 + " interval_ms=" + std::to_string(config_.registry.eviction_interval_ms)
                 + " heartbeat_timeout_ms="
                 + std::to_string(config_.registry.heartbeat_timeout_ms));

    maintenance_thread_ = std::jthread([this](std::stop_token stop) {
        maintenance_loop(stop);
    });
}

void SchedulerService::stop() {
    if (!running_.exchange(false)) return;

    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_thread_.join();
    }
    logger_.info(COMPONENT, "maintenance stopped");
}

void SchedulerService::maintenance_loop(std::stop_token stop) {
    const auto interval = Millis(std::max<uint32_t>(config_.registry.eviction_interval_ms, 1));

    while (!stop.stop_requested()) {
        run_maintenance();

        // Sleep in 50 ms slices
        auto deadline = std::chrono::steady_clock::now() + interval;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<Millis>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(remaining, Millis(50)));
        }
    }
}

// ═══════════════════════════════════════════════
// Jobs
// ═══════════════════════════════════════════════

Result<SubmitOutcome> SchedulerService::submit(Job job) {
    if (auto valid = validate_job(job); !valid) {
        logger_.warn(COMPONENT, "rejected job " + job.id + ": " + valid.error().message);
        return valid.error();
    }
    if (job.submitted_at == Timestamp{}) {
        job.submitted_at = std::chrono::system_clock::now();
    }

    if (auto admitted = jobs_.admit(job); !admitted) {
        logger_.warn(COMPONENT, admitted.error().message);
        return admitted.error();
    }
    logger_.debug(COMPONENT, "job " + job.id + " admitted: " + to_string(job.request));

    SubmitOutcome outcome{.job_id = job.id};
    auto reserved = place_and_reserve(job, outcome.attempts);

    if (!reserved) {
        const auto& infeasible = reserved.error();
        if (auto failed = jobs_.fail_unplaced(job.id, FailureReason::Infeasible,
                                              infeasible.detail);
            !failed) {
            logger_.error(COMPONENT, failed.error().message);
        }
        logger_.info(COMPONENT, "job " + job.id + " infeasible ("
                     + std::string{to_string(infeasible.reason)} + "): " + infeasible.detail);
        if (metrics_) {
            metrics_->record_infeasible(job.id, infeasible);
            metrics_->record_job_state(job.id, JobStatus::Failed, FailureReason::Infeasible);
        }
        outcome.status = JobStatus::Failed;
        outcome.infeasible = infeasible;
        return outcome;
    }

    outcome.placement = reserved->placement;
    outcome.status = commit(job, std::move(reserved.value()), outcome.attempts);
    return outcome;
}

Result<SchedulerService::Reserved, Infeasible> SchedulerService::place_and_reserve(
    const Job& job, uint32_t& attempts) {

    const uint32_t max_attempts = config_.scheduler.max_placement_attempts;
    attempts = 0;

    while (attempts < max_attempts) {
        ++attempts;
        auto snapshot = registry_.snapshot();
        auto placement = optimizer_.place(job, snapshot);
        if (!placement) {
            return placement.error();
        }

        auto token = registry_.reserve(placement->node_id, job.request);
        if (token) {
            return Reserved{std::move(placement.value()), std::move(token.value())};
        }

        // Lost the race for this node since the snapshot; re-snapshot and retry.
        logger_.debug(COMPONENT, "job " + job.id + " attempt " + std::to_string(attempts)
                      + ": reserve on " + placement->node_id + " failed: "
                      + token.error().message);
    }

    return Infeasible{InfeasibleReason::NoCapacity,
                      "capacity taken by concurrent placements after "
                      + std::to_string(attempts) + " attempts"};
}

JobStatus SchedulerService::commit(const Job& job, Reserved reserved, uint32_t attempt) {
    Assignment assignment{
        .job_id = job.id,
        .node_id = reserved.placement.node_id,
        .cost = reserved.placement.cost,
        .estimated_latency_ms = reserved.placement.estimated_latency_ms,
        .token = reserved.token,
    };

    if (auto scheduled = jobs_.mark_scheduled(job.id, assignment); !scheduled) {
        logger_.error(COMPONENT, scheduled.error().message);
        release(reserved.token);
        auto rec = jobs_.get(job.id);
        return rec ? rec->status : JobStatus::Failed;
    }

    logger_.info(COMPONENT, "job " + job.id + " -> " + assignment.node_id
                 + " total_usd=" + format_usd(assignment.cost.total_usd)
                 + " latency_ms=" + std::to_string(assignment.estimated_latency_ms));
    if (metrics_) {
        metrics_->record_placement(reserved.placement, attempt);
        metrics_->record_job_state(job.id, JobStatus::Scheduled, FailureReason::None);
    }

    // The node may have been evicted between reserve() and the transition.
    if (!registry_.holds(reserved.token)) {
        relocate(assignment, "reservation revoked during placement");
    } else {
        dispatch(job, assignment);
    }

    auto rec = jobs_.get(job.id);
    return rec ? rec->status : JobStatus::Failed;
}

void SchedulerService::dispatch(const Job& job, const Assignment& assignment) {
    DispatchRequest request{
        .job_id = job.id,
        .node_id = assignment.node_id,
        .limits = job.request,
        .image = job.image,
        .command = job.command,
        .estimated_duration_hours = job.estimated_duration_hours,
    };

    auto started = executor_->start(request);
    if (started) {
        logger_.debug(COMPONENT, "job " + job.id + " dispatched to "
                      + std::string{executor_->name()} + " executor");
        return;
    }

    logger_.error(COMPONENT, "dispatch of job " + job.id + " failed: "
                  + started.error().message);
    auto finished = jobs_.finish(job.id,
                                 JobOutcome{
                                     .status = JobStatus::Failed,
                                     .reason = FailureReason::DispatchFailed,
                                     .detail = started.error().message,
                                 },
                                 assignment.token.reservation_id);
    if (finished) {
        release(*finished);
        if (metrics_) {
            metrics_->record_job_state(job.id, JobStatus::Failed, FailureReason::DispatchFailed);
        }
    }
}

void SchedulerService::release(const AssignmentToken& token) {
    if (!registry_.release(token)) {
        logger_.debug(COMPONENT, "reservation " + std::to_string(token.reservation_id)
                      + " on " + token.node_id + " already revoked");
    }
}

Result<JobStatusView> SchedulerService::get_status(const JobId& job_id) const {
    auto rec = jobs_.get(job_id);
    if (!rec) {
        return Error{ErrorCode::NotFound, "job " + job_id + " not found"};
    }
    return JobStatusView{
        .job_id = rec->job.id,
        .status = rec->status,
        .node_id = rec->last_node,
        .submitted_at = rec->job.submitted_at,
        .scheduled_at = rec->scheduled_at,
        .started_at = rec->started_at,
        .ended_at = rec->ended_at,
        .failure = rec->failure,
        .failure_detail = rec->failure_detail,
        .requeue_count = rec->requeue_count,
        .exit_code = rec->exit_code,
    };
}

Result<CostBreakdown> SchedulerService::get_cost(const JobId& job_id) const {
    auto rec = jobs_.get(job_id);
    if (!rec) {
        return Error{ErrorCode::NotFound, "job " + job_id + " not found"};
    }
    if (!rec->cost) {
        return Error{ErrorCode::NotFound,
                     "job " + job_id + " has no placement (" + std::string{to_string(rec->status)}
                     + ")"};
    }
    return *rec->cost;
}

// ═══════════════════════════════════════════════
// Cluster
// ═══════════════════════════════════════════════

ClusterStatus SchedulerService::cluster_status() const {
    auto counts = jobs_.counts();
    return ClusterStatus{
        .cluster_id = config_.scheduler.cluster_id,
        .total_nodes = registry_.node_count(),
        .active_nodes = registry_.active_node_count(),
        .total_jobs = counts.total,
        .running_jobs = counts.scheduled + counts.running,
    };
}

std::vector<NodeView> SchedulerService::list_nodes() const {
    auto snapshot = registry_.snapshot();
    std::vector<NodeView> views;
    views.reserve(snapshot.nodes.size());
    for (const auto& node : snapshot.nodes) {
        views.push_back(NodeView{
            .id = node.spec.id,
            .location = node.spec.location,
            .capacity = node.spec.capacity,
            .free = node.free(),
            .price_per_hour = node.spec.price_per_hour,
            .on_premise = node.spec.on_premise,
            .liveness = node.liveness,
            .reservation_count = node.reservation_count,
        });
    }
    return views;
}

Result<NodeId> SchedulerService::register_node(const NodeSpec& spec) {
    auto registered = registry_.register_node(spec);
    if (!registered) {
        logger_.warn(COMPONENT, "node registration rejected: " + registered.error().message);
        return registered;
    }
    logger_.info(COMPONENT, "node registered: " + spec.id + " location=" + spec.location
                 + " " + to_string(spec.capacity)
                 + " price_per_hour=" + format_usd(spec.price_per_hour));
    if (metrics_) metrics_->record_node_event(spec.id, "registered");
    return registered;
}

Result<void> SchedulerService::heartbeat(const NodeId& node_id,
                                         std::optional<Resources> reported_free) {
    auto result = registry_.heartbeat(node_id, reported_free);
    if (!result) {
        logger_.warn(COMPONENT, "heartbeat rejected: " + result.error().message);
    }
    return result;
}

// ═══════════════════════════════════════════════
// Executor outcomes
// ═══════════════════════════════════════════════

Result<void> SchedulerService::report_node_result(const ExecutorMessage& message) {
    auto rec = jobs_.get(message.job_id);
    if (!rec) {
        return Error{ErrorCode::NotFound, "job " + message.job_id + " not found"};
    }
    if (!rec->assignment) {
        return Error{ErrorCode::InvalidTransition,
                     "stale " + std::string{to_string(message.event)} + " report for job "
                     + message.job_id + " (" + std::string{to_string(rec->status)} + ")"};
    }
    if (!message.node_id.empty() && message.node_id != rec->assignment->node_id) {
        return Error{ErrorCode::InvalidTransition,
                     "stale report for job " + message.job_id + " from " + message.node_id
                     + "; job is assigned to " + rec->assignment->node_id};
    }
    const auto reservation = rec->assignment->token.reservation_id;

    if (message.event == ExecutorEvent::Started) {
        auto running = jobs_.mark_running(message.job_id, reservation);
        if (!running) return running;
        logger_.info(COMPONENT, "job " + message.job_id + " running on "
                     + rec->assignment->node_id);
        if (metrics_) {
            metrics_->record_job_state(message.job_id, JobStatus::Running, FailureReason::None);
        }
        return Result<void>{};
    }

    const bool completed = message.event == ExecutorEvent::Completed;
    JobOutcome outcome{
        .status = completed ? JobStatus::Completed : JobStatus::Failed,
        .reason = completed ? FailureReason::None : FailureReason::ExecutionFailed,
        .detail = message.error,
        .exit_code = message.exit_code,
        .output = message.output,
    };
    auto finished = jobs_.finish(message.job_id, std::move(outcome), reservation);
    if (!finished) return finished.error();

    release(*finished);
    if (completed) {
        logger_.info(COMPONENT, "job " + message.job_id + " completed on "
                     + finished->node_id);
    } else {
        logger_.warn(COMPONENT, "job " + message.job_id + " failed on " + finished->node_id
                     + " exit_code=" + std::to_string(message.exit_code)
                     + (message.error.empty() ? "" : ": " + message.error));
    }
    if (metrics_) {
        metrics_->record_job_state(message.job_id,
                                   completed ? JobStatus::Completed : JobStatus::Failed,
                                   completed ? FailureReason::None
                                             : FailureReason::ExecutionFailed);
    }
    return Result<void>{};
}

bool SchedulerService::post_outcome(ExecutorMessage message) {
    auto job_id = message.job_id;
    if (!mailbox_->post(std::move(message))) {
        logger_.error(COMPONENT, "executor mailbox full; dropped report for job " + job_id);
        return false;
    }
    return true;
}

size_t SchedulerService::drain_outcomes() {
    size_t applied = 0;
    for (const auto& message : mailbox_->drain()) {
        auto result = report_node_result(message);
        if (result) {
            ++applied;
        } else {
            logger_.debug(COMPONENT, "ignored executor report: " + result.error().message);
        }
    }
    return applied;
}

// ═══════════════════════════════════════════════
// Maintenance
// ═══════════════════════════════════════════════

void SchedulerService::handle_evicted_nodes(const std::vector<NodeId>& node_ids) {
    for (const auto& node_id : node_ids) {
        // A node revived since eviction may already carry new, live reservations.
        auto lost = jobs_.assignments_on(node_id);
        std::erase_if(lost, [this](const Assignment& a) { return registry_.holds(a.token); });
        logger_.warn(COMPONENT, "node evicted: " + node_id + " jobs_affected="
                     + std::to_string(lost.size()));
        if (metrics_) metrics_->record_node_event(node_id, "evicted");

        for (const auto& assignment : lost) {
            relocate(assignment, "node " + node_id + " evicted");
        }
    }
}

void SchedulerService::relocate(const Assignment& assignment, std::string_view why) {
    const auto& job_id = assignment.job_id;
    auto rec = jobs_.get(job_id);
    if (!rec) return;

    executor_->cancel(job_id);

    if (rec->requeue_count >= config_.scheduler.max_requeues) {
        auto finished = jobs_.finish(job_id,
                                     JobOutcome{
                                         .status = JobStatus::Failed,
                                         .reason = FailureReason::NodeLost,
                                         .detail = std::string{why},
                                     },
                                     assignment.token.reservation_id);
        if (!finished) {
            logger_.debug(COMPONENT, "relocate " + job_id + ": " + finished.error().message);
            return;
        }
        release(*finished);
        logger_.warn(COMPONENT, "job " + job_id + " failed: " + std::string{why}
                     + " after " + std::to_string(rec->requeue_count) + " requeues");
        if (metrics_) {
            metrics_->record_job_state(job_id, JobStatus::Failed, FailureReason::NodeLost);
        }
        return;
    }

    auto requeued = jobs_.requeue(job_id, assignment.token.reservation_id);
    if (!requeued) {
        // Another observer of the same loss already moved the job.
        logger_.debug(COMPONENT, "relocate " + job_id + ": " + requeued.error().message);
        return;
    }
    release(*requeued);
    logger_.info(COMPONENT, "job " + job_id + " requeued: " + std::string{why});
    if (metrics_) {
        metrics_->record_requeue(job_id, assignment.node_id);
        metrics_->record_job_state(job_id, JobStatus::Pending, FailureReason::None);
    }

    uint32_t attempts = 0;
    auto reserved = place_and_reserve(rec->job, attempts);
    if (!reserved) {
        auto detail = std::string{why} + "; re-placement infeasible ("
                    + std::string{to_string(reserved.error().reason)} + "): "
                    + reserved.error().detail;
        if (auto failed = jobs_.fail_unplaced(job_id, FailureReason::NodeLost, detail); !failed) {
            logger_.error(COMPONENT, failed.error().message);
            return;
        }
        logger_.warn(COMPONENT, "job " + job_id + " failed: " + detail);
        if (metrics_) {
            metrics_->record_infeasible(job_id, reserved.error());
            metrics_->record_job_state(job_id, JobStatus::Failed, FailureReason::NodeLost);
        }
        return;
    }

    commit(rec->job, std::move(reserved.value()), attempts);
}

void SchedulerService::fail_timed_out(SteadyTime now) {
    const auto timeout = Millis(config_.scheduler.result_timeout_ms);
    for (const auto& assignment : jobs_.overdue(timeout, now)) {
        auto finished = jobs_.finish(assignment.job_id,
                                     JobOutcome{
                                         .status = JobStatus::Failed,
                                         .reason = FailureReason::ResultTimeout,
                                         .detail = "no executor report within "
                                                   + std::to_string(timeout.count()) + " ms",
                                     },
                                     assignment.token.reservation_id);
        if (!finished) continue;

        executor_->cancel(assignment.job_id);
        release(*finished);
        logger_.warn(COMPONENT, "job " + assignment.job_id + " timed out on "
                     + assignment.node_id);
        if (metrics_) {
            metrics_->record_job_state(assignment.job_id, JobStatus::Failed,
                                       FailureReason::ResultTimeout);
        }
    }
}

void SchedulerService::run_maintenance(SteadyTime now) {
    // Reports before eviction.
    drain_outcomes();

    auto evicted = registry_.evict_stale(Millis(config_.registry.heartbeat_timeout_ms), now);
    if (!evicted.empty()) {
        handle_evicted_nodes(evicted);
    }

    if (config_.scheduler.result_timeout_ms > 0) {
        fail_timed_out(now);
    }

    if (metrics_) metrics_->flush();
}

}  // namespace tco_scheduler
