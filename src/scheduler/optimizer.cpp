/**
 * @file optimizer.cpp
 * @brief Optimizer: filter feasible nodes, score with Formula 4.1, pick the cheapest.
 *
 * Algorithm (per submitted job):
 *   1. Keep Active nodes whose free capacity covers the request in every
 *      dimension.
 *   2. Estimate latency with the configured ILatencyModel; drop nodes above
 *      the SLA bound or that cannot finish before the deadline.
 *   3. Cost each survivor:
 *        C_comp = node price * duration * utilization_factor
 *        C_data = job data volume * node transfer price
 *        C_idle = duration * idle CPU fraction after placement
 *                 * node opportunity cost
 *   4. Drop nodes whose total exceeds the budget ceiling.
 *   5. argmin(total), ties to the smaller node id.
 *
 * Complexity: O(N) in the number of nodes.
 */

#include "scheduler/optimizer.hpp"

#include <chrono>

namespace tco_scheduler {

namespace {

double idle_cpu_fraction_after(const NodeState& node, const Resources& request) {
    if (node.spec.capacity.cpu_cores == 0) return 0.0;
    auto free_cpu = node.free().cpu_cores;
    auto left = free_cpu >= request.cpu_cores ? free_cpu - request.cpu_cores : 0u;
    return static_cast<double>(left) / static_cast<double>(node.spec.capacity.cpu_cores);
}

bool meets_deadline(const Job& job, uint64_t latency_ms, Timestamp now) {
    if (!job.sla.deadline) return true;
    // In double seconds; durations may exceed the clock's range.
    double remaining_s = std::chrono::duration<double>(*job.sla.deadline - now).count();
    double needed_s = job.estimated_duration_hours * 3600.0
                    + static_cast<double>(latency_ms) / 1000.0;
    return needed_s <= remaining_s;
}

bool better(const CostBreakdown& cost, const NodeId& id,
            const Placement& incumbent) {
    if (cost.total_usd < incumbent.cost.total_usd) return true;
    return cost.total_usd == incumbent.cost.total_usd && id < incumbent.node_id;
}

}  // anonymous namespace

Optimizer::Optimizer(CostConfig cost_config, std::shared_ptr<const ILatencyModel> latency_model)
    : cost_config_(cost_config), latency_model_(std::move(latency_model)) {}

Result<CostBreakdown> Optimizer::evaluate_cost(const Job& job, const NodeState& node) const {
    double duration = job.estimated_duration_hours;
    return CostEngine::evaluate(CostInputs{
        .price_per_hour = node.spec.price_per_hour,
        .duration_hours = duration,
        .utilization_factor = cost_config_.utilization_factor,
        .data_size_gb = job.estimated_data_gb,
        .transfer_price_per_gb = node.spec.transfer_price_per_gb,
        .idle_capacity_hours = duration * idle_cpu_fraction_after(node, job.request),
        .opportunity_cost_per_hour = node.spec.opportunity_cost_per_hour
    });
}

CandidateScore Optimizer::score(const Job& job, const NodeState& node, Timestamp now) const {
    CandidateScore s;
    s.node_id = node.spec.id;
    s.has_capacity = node.liveness == NodeLiveness::Active
                  && job.request.fits_within(node.free());
    if (!s.has_capacity) return s;

    s.estimated_latency_ms = latency_model_->estimate_ms(job, node);
    s.meets_sla = s.estimated_latency_ms <= job.sla.max_latency_ms
               && meets_deadline(job, s.estimated_latency_ms, now);
    if (!s.meets_sla) return s;

    auto cost = evaluate_cost(job, node);
    if (!cost) return s;

    s.cost = *cost;
    s.within_budget = !job.sla.max_budget_usd || cost->total_usd <= *job.sla.max_budget_usd;
    return s;
}

Result<Placement, Infeasible> Optimizer::place(const Job& job,
                                               const ClusterSnapshot& snapshot,
                                               Timestamp now) const {
    size_t with_capacity = 0;
    size_t within_sla = 0;
    double cheapest_rejected = -1.0;
    std::optional<Placement> best;

    for (const auto& node : snapshot.nodes) {
        auto s = score(job, node, now);
        if (!s.has_capacity) continue;
        ++with_capacity;
        if (!s.meets_sla) continue;
        ++within_sla;
        if (!s.cost) continue;

        if (!s.within_budget) {
            if (cheapest_rejected < 0.0 || s.cost->total_usd < cheapest_rejected) {
                cheapest_rejected = s.cost->total_usd;
            }
            continue;
        }

        if (!best || better(*s.cost, s.node_id, *best)) {
            best = Placement{
                .job_id = job.id,
                .node_id = s.node_id,
                .cost = *s.cost,
                .estimated_latency_ms = s.estimated_latency_ms
            };
        }
    }

    if (best) return *best;

    if (with_capacity == 0) {
        return Infeasible{InfeasibleReason::NoCapacity,
                          "no active node has " + to_string(job.request) + " free"};
    }
    if (within_sla == 0) {
        return Infeasible{InfeasibleReason::SlaUnreachable,
                          "no node meets latency bound " + std::to_string(job.sla.max_latency_ms)
                          + "ms" + (job.sla.deadline ? " and deadline" : "")};
    }
    if (cheapest_rejected >= 0.0) {
        return Infeasible{InfeasibleReason::OverBudget,
                          "cheapest candidate costs $" + std::to_string(cheapest_rejected)
                          + ", budget $" + std::to_string(job.sla.max_budget_usd.value_or(0.0))};
    }
    return Infeasible{InfeasibleReason::OverBudget,
                      "cost could not be evaluated for any candidate"};
}

}  // namespace tco_scheduler
