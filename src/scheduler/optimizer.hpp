/**
 * @file optimizer.hpp
 * @brief TCO-minimizing placement of a single job against a cluster snapshot.
 *
 * Greedy and single-job: the optimizer never moves existing assignments and
 * never packs several jobs in one pass. It scores *this* job against the
 * *current* snapshot; the registry's reserve() remains the final authority.
 */

#pragma once

#include "cluster/cluster_registry.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "cost/cost_engine.hpp"
#include "scheduler/job.hpp"
#include "scheduler/latency_model.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tco_scheduler {

/**
 * @brief The chosen node for a job, with the cost that justified it.
 */
struct Placement {
    JobId job_id;
    NodeId node_id;
    CostBreakdown cost;
    uint64_t estimated_latency_ms{0};
};

/**
 * @brief Why no node could take the job.
 */
struct Infeasible {
    InfeasibleReason reason;
    std::string detail;
};

/**
 * @brief Evaluation of one node for one job.
 */
struct CandidateScore {
    NodeId node_id;
    bool has_capacity{false};
    bool meets_sla{false};
    bool within_budget{false};
    uint64_t estimated_latency_ms{0};
    std::optional<CostBreakdown> cost;       ///< Empty if capacity/SLA failed or cost invalid

    [[nodiscard]] bool feasible() const noexcept {
        return has_capacity && meets_sla && within_budget && cost.has_value();
    }
};

class Optimizer {
public:
    Optimizer(CostConfig cost_config, std::shared_ptr<const ILatencyModel> latency_model);

    /**
     * @brief Pick the minimum-total-cost feasible node.
     *
     * Ties on total cost go to the lexicographically smaller node id.
     * The Infeasible reason reflects the first filter that emptied the
     * candidate set: capacity, then SLA (latency and deadline), then budget.
     */
    [[nodiscard]] Result<Placement, Infeasible> place(
        const Job& job,
        const ClusterSnapshot& snapshot,
        Timestamp now = std::chrono::system_clock::now()) const;

    /// Evaluate one node without comparing it against others.
    [[nodiscard]] CandidateScore score(const Job& job,
                                       const NodeState& node,
                                       Timestamp now = std::chrono::system_clock::now()) const;

    [[nodiscard]] const ILatencyModel& latency_model() const noexcept { return *latency_model_; }

private:
    [[nodiscard]] Result<CostBreakdown> evaluate_cost(const Job& job, const NodeState& node) const;

    CostConfig cost_config_;
    std::shared_ptr<const ILatencyModel> latency_model_;
};

}  // namespace tco_scheduler
