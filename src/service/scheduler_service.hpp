/**
 * @file scheduler_service.hpp
 * @brief SchedulerService: the boundary that ties registry, optimizer, job
 *        lifecycle and executor together.
 *
 * Provides a single entry point for:
 *   1. Submitting a job (validate → place → reserve → dispatch)
 *   2. Querying job status, job cost and cluster state
 *   3. Node registration and heartbeats
 *   4. Executor outcome reports (direct or through the mailbox)
 *   5. Periodic maintenance: eviction, requeue, result timeouts
 *
 * The service holds no lock of its own across calls; each collaborator
 * guards its own state, and no lock is held while calling the executor.
 */

#pragma once

#include "cluster/cluster_registry.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/job_executor.hpp"
#include "scheduler/job.hpp"
#include "scheduler/job_lifecycle.hpp"
#include "scheduler/optimizer.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Definitive answer to a submission.
 *
 * Exactly one of placement / infeasible is set.
 */
struct SubmitOutcome {
    JobId job_id;
    JobStatus status{JobStatus::Pending};     ///< Status right after submit()
    std::optional<Placement> placement;
    std::optional<Infeasible> infeasible;
    uint32_t attempts{0};                     ///< Optimizer passes used

    [[nodiscard]] bool placed() const noexcept { return placement.has_value(); }
};

struct JobStatusView {
    JobId job_id;
    JobStatus status{JobStatus::Pending};
    std::optional<NodeId> node_id;
    std::optional<Timestamp> submitted_at;
    std::optional<Timestamp> scheduled_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> ended_at;
    FailureReason failure{FailureReason::None};
    std::string failure_detail;
    uint32_t requeue_count{0};
    std::optional<int> exit_code;
};

struct ClusterStatus {
    std::string cluster_id;
    size_t total_nodes{0};
    size_t active_nodes{0};
    size_t total_jobs{0};
    size_t running_jobs{0};                   ///< Jobs holding an assignment
};

struct NodeView {
    NodeId id;
    std::string location;
    Resources capacity;
    Resources free;
    double price_per_hour{0.0};
    bool on_premise{false};
    NodeLiveness liveness{NodeLiveness::Active};
    size_t reservation_count{0};
};

class SchedulerService {
public:
    /**
     * @brief Build a service from configuration.
     *
     * Fails with ErrorCode::Config when the latency model is unknown.
     * @p metrics may be null.
     */
    static Result<std::unique_ptr<SchedulerService>> create(
        Config config,
        std::shared_ptr<IJobExecutor> executor,
        std::shared_ptr<ExecutorMailbox> mailbox,
        Logger& logger,
        MetricsCollector* metrics = nullptr);

    SchedulerService(Config config,
                     std::shared_ptr<const ILatencyModel> latency_model,
                     std::shared_ptr<IJobExecutor> executor,
                     std::shared_ptr<ExecutorMailbox> mailbox,
                     Logger& logger,
                     MetricsCollector* metrics = nullptr);
    ~SchedulerService();

    SchedulerService(const SchedulerService&) = delete;
    SchedulerService& operator=(const SchedulerService&) = delete;

    // ── Lifecycle ────────────────────────────
    /// Start the background maintenance thread.
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Jobs ─────────────────────────────────
    /**
     * @brief Admit, place and dispatch a job.
     *
     * Validation failures and duplicate ids are errors and leave no record.
     * Every admitted job gets a definitive SubmitOutcome: placed (Scheduled)
     * or infeasible (recorded as Failed with reason Infeasible).
     */
    Result<SubmitOutcome> submit(Job job);

    [[nodiscard]] Result<JobStatusView> get_status(const JobId& job_id) const;

    /// Cost of the current or final assignment. NotFound before placement.
    [[nodiscard]] Result<CostBreakdown> get_cost(const JobId& job_id) const;

    // ── Cluster ──────────────────────────────
    [[nodiscard]] ClusterStatus cluster_status() const;
    [[nodiscard]] std::vector<NodeView> list_nodes() const;

    Result<NodeId> register_node(const NodeSpec& spec);
    Result<void> heartbeat(const NodeId& node_id,
                           std::optional<Resources> reported_free = std::nullopt);

    // ── Executor outcomes ────────────────────
    /**
     * @brief Apply one executor report.
     *
     * Reports for a job that is already terminal, was requeued, or now runs
     * on a different node are rejected with InvalidTransition.
     */
    Result<void> report_node_result(const ExecutorMessage& message);

    /// Queue a report for the next maintenance pass.
    bool post_outcome(ExecutorMessage message);

    /// Apply every queued report in order. Returns how many were applied.
    size_t drain_outcomes();

    // ── Maintenance ──────────────────────────
    /// Requeue or fail every job assigned to the given (evicted) nodes.
    void handle_evicted_nodes(const std::vector<NodeId>& node_ids);

    /// One pass: evict stale nodes, time out silent jobs, drain the mailbox.
    void run_maintenance(SteadyTime now = std::chrono::steady_clock::now());

    // ── Accessors (for testing) ─────────────
    [[nodiscard]] ClusterRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const JobLifecycle& jobs() const noexcept { return jobs_; }
    [[nodiscard]] const Optimizer& optimizer() const noexcept { return optimizer_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Reserved {
        Placement placement;
        AssignmentToken token;
    };

    /// Snapshot → optimize → reserve, retrying on lost reservation races.
    Result<Reserved, Infeasible> place_and_reserve(const Job& job, uint32_t& attempts);

    /// Scheduled transition + reservation check + dispatch for a reserved job.
    JobStatus commit(const Job& job, Reserved reserved, uint32_t attempt);

    /// Move a job off a lost node: requeue and re-place, or fail with NodeLost.
    void relocate(const Assignment& assignment, std::string_view why);

    void dispatch(const Job& job, const Assignment& assignment);
    void release(const AssignmentToken& token);
    void fail_timed_out(SteadyTime now);
    void maintenance_loop(std::stop_token stop);

    Config config_;
    Logger& logger_;
    MetricsCollector* metrics_;
    std::shared_ptr<IJobExecutor> executor_;
    std::shared_ptr<ExecutorMailbox> mailbox_;

    ClusterRegistry registry_;
    JobLifecycle jobs_;
    Optimizer optimizer_;

    std::atomic<bool> running_{false};
    std::jthread maintenance_thread_;
};

/// Registry attributes for a node declared in the [[nodes]] config section.
[[nodiscard]] NodeSpec to_node_spec(const StaticNodeConfig& node);

}  // namespace tco_scheduler
