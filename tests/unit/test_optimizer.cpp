/**
 * @file test_optimizer.cpp
 * @brief Unit tests for TCO-minimizing placement and job validation.
 */

#include "scheduler/optimizer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <map>

using namespace tco_scheduler;
using namespace std::chrono_literals;

namespace {

/// Latency fixed per node id.
class TableLatencyModel : public ILatencyModel {
public:
    explicit TableLatencyModel(std::map<NodeId, uint64_t> table) : table_(std::move(table)) {}

    [[nodiscard]] uint64_t estimate_ms(const Job&, const NodeState& node) const override {
        auto it = table_.find(node.spec.id);
        return it == table_.end() ? 10 : it->second;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "table"; }

private:
    std::map<NodeId, uint64_t> table_;
};

NodeState make_node(const std::string& id, uint32_t cpu, double price,
                    NodeLiveness liveness = NodeLiveness::Active) {
    NodeState state;
    state.spec = NodeSpec{
        .id = id,
        .location = "eu-west",
        .capacity = Resources{.cpu_cores = cpu, .memory_mb = 8192},
        .price_per_hour = price,
    };
    state.liveness = liveness;
    return state;
}

Job make_job(uint32_t cpu = 1, uint64_t latency_ms = 1000) {
    Job job;
    job.id = "job-1";
    job.request = Resources{.cpu_cores = cpu, .memory_mb = 1024};
    job.sla.max_latency_ms = latency_ms;
    job.estimated_duration_hours = 1.0;
    return job;
}

Optimizer make_optimizer(std::map<NodeId, uint64_t> latencies = {}) {
    return Optimizer(CostConfig{}, std::make_shared<TableLatencyModel>(std::move(latencies)));
}

}  // namespace

TEST(OptimizerTest, PicksCheapestFeasibleNode) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 4, 0.30), make_node("b", 4, 0.10), make_node("c", 4, 0.20)};

    auto placement = optimizer.place(make_job(), snap);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "b");
    EXPECT_EQ(placement->job_id, "job-1");
    EXPECT_DOUBLE_EQ(placement->cost.compute_usd, 0.10);
    EXPECT_DOUBLE_EQ(placement->cost.total_usd, 0.10);
    EXPECT_EQ(placement->estimated_latency_ms, 10u);
}

TEST(OptimizerTest, NoCapacityWhenRequestExceedsEveryNode) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 2, 0.10), make_node("b", 4, 0.20)};

    auto placement = optimizer.place(make_job(8), snap);
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().reason, InfeasibleReason::NoCapacity);
}

TEST(OptimizerTest, EmptyClusterIsNoCapacity) {
    auto placement = make_optimizer().place(make_job(), ClusterSnapshot{});
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().reason, InfeasibleReason::NoCapacity);
}

TEST(OptimizerTest, SkipsNodesThatAreNotActive) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("cheap", 4, 0.01, NodeLiveness::Suspected),
                  make_node("gone", 4, 0.01, NodeLiveness::Evicted),
                  make_node("live", 4, 0.50)};

    auto placement = optimizer.place(make_job(), snap);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "live");
}

TEST(OptimizerTest, LatencyBoundOverridesCost) {
    auto optimizer = make_optimizer({{"cheap", 500}, {"fast", 20}});
    ClusterSnapshot snap;
    snap.nodes = {make_node("cheap", 4, 0.05), make_node("fast", 4, 0.90)};

    auto placement = optimizer.place(make_job(1, 100), snap);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "fast");
    EXPECT_EQ(placement->estimated_latency_ms, 20u);
}

TEST(OptimizerTest, SlaUnreachable) {
    auto optimizer = make_optimizer({{"a", 500}, {"b", 300}});
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 4, 0.05), make_node("b", 4, 0.90)};

    auto placement = optimizer.place(make_job(1, 100), snap);
    ASSERT_FALSE(placement.has_value());
    EXPECT_EQ(placement.error().reason, InfeasibleReason::SlaUnreachable);
}

TEST(OptimizerTest, DeadlineFiltersSlowCompletion) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 4, 0.10)};

    auto now = std::chrono::system_clock::now();
    auto job = make_job();
    job.sla.deadline = now + 30min;

    auto late = optimizer.place(job, snap, now);
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().reason, InfeasibleReason::SlaUnreachable);

    job.sla.deadline = now + 2h;
    EXPECT_TRUE(optimizer.place(job, snap, now).has_value());
}

TEST(OptimizerTest, DeadlineRejectsDurationBeyondClockRange) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 4, 0.10)};

    auto now = std::chrono::system_clock::now();
    auto job = make_job();
    job.estimated_duration_hours = 1e15;
    job.sla.deadline = now + 24h;

    auto placed = optimizer.place(job, snap, now);
    ASSERT_FALSE(placed.has_value());
    EXPECT_EQ(placed.error().reason, InfeasibleReason::SlaUnreachable);
}

TEST(OptimizerTest, BudgetCeiling) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("a", 4, 0.50), make_node("b", 4, 0.80)};

    auto job = make_job();
    job.sla.max_budget_usd = 0.40;
    auto over = optimizer.place(job, snap);
    ASSERT_FALSE(over.has_value());
    EXPECT_EQ(over.error().reason, InfeasibleReason::OverBudget);

    job.sla.max_budget_usd = 0.50;
    auto exact = optimizer.place(job, snap);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->node_id, "a");
}

TEST(OptimizerTest, TieBreaksOnNodeId) {
    auto optimizer = make_optimizer();
    ClusterSnapshot snap;
    snap.nodes = {make_node("zeta", 4, 0.25), make_node("alpha", 4, 0.25), make_node("mid", 4, 0.25)};

    auto placement = optimizer.place(make_job(), snap);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "alpha");
}

TEST(OptimizerTest, IdleOpportunityCostCountsLeftoverCpu) {
    auto optimizer = make_optimizer();
    auto node = make_node("onprem", 4, 0.0);
    node.spec.opportunity_cost_per_hour = 0.40;
    node.spec.on_premise = true;

    auto s = optimizer.score(make_job(1), node);
    ASSERT_TRUE(s.feasible());
    // 3 of 4 cores stay idle for one hour.
    EXPECT_DOUBLE_EQ(s.cost->idle_opportunity_usd, 0.30);
    EXPECT_DOUBLE_EQ(s.cost->total_usd, 0.30);
}

TEST(OptimizerTest, DataTransferCostChangesChoice) {
    auto optimizer = make_optimizer();
    auto local = make_node("local", 4, 0.20);
    auto remote = make_node("remote", 4, 0.10);
    remote.spec.transfer_price_per_gb = 0.05;

    ClusterSnapshot snap;
    snap.nodes = {local, remote};
    auto job = make_job();
    job.estimated_data_gb = 10.0;

    auto placement = optimizer.place(job, snap);
    ASSERT_TRUE(placement.has_value());
    EXPECT_EQ(placement->node_id, "local");
}

TEST(OptimizerTest, ScoreReportsEachFilter) {
    auto optimizer = make_optimizer({{"slow", 900}});
    auto small = optimizer.score(make_job(16), make_node("small", 4, 0.1));
    EXPECT_FALSE(small.has_capacity);
    EXPECT_FALSE(small.cost.has_value());

    auto slow = optimizer.score(make_job(1, 100), make_node("slow", 4, 0.1));
    EXPECT_TRUE(slow.has_capacity);
    EXPECT_FALSE(slow.meets_sla);
    EXPECT_EQ(slow.estimated_latency_ms, 900u);
}

TEST(JobValidationTest, AcceptsWellFormedJob) {
    EXPECT_TRUE(validate_job(make_job()));
}

TEST(JobValidationTest, RejectsStructuralProblems) {
    auto job = make_job();
    job.id.clear();
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidArgument));

    job = make_job();
    job.request = Resources{};
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidArgument));

    job = make_job();
    job.sla.max_latency_ms = 0;
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidArgument));
}

TEST(JobValidationTest, RejectsInvalidCostFields) {
    auto job = make_job();
    job.estimated_duration_hours = -1.0;
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidCostInput));

    job = make_job();
    job.estimated_data_gb = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidCostInput));

    job = make_job();
    job.sla.max_budget_usd = -0.01;
    EXPECT_TRUE(validate_job(job).error().is(ErrorCode::InvalidCostInput));
}
