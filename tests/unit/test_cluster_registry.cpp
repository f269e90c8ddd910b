/**
 * @file test_cluster_registry.cpp
 * @brief Unit tests for ClusterRegistry reservations, heartbeats and eviction.
 */

#include "cluster/cluster_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tco_scheduler;
using namespace std::chrono_literals;

namespace {

NodeSpec make_node(const std::string& id, uint32_t cpu, uint64_t mem_mb, double price = 0.10) {
    return NodeSpec{
        .id = id,
        .location = "eu-west",
        .capacity = Resources{.cpu_cores = cpu, .memory_mb = mem_mb, .gpu_count = 0},
        .price_per_hour = price,
    };
}

}  // namespace

class ClusterRegistryTest : public ::testing::Test {
protected:
    ClusterRegistry registry_;
    SteadyTime t0_ = std::chrono::steady_clock::now();
};

TEST_F(ClusterRegistryTest, RegisterAndSnapshot) {
    ASSERT_TRUE(registry_.register_node(make_node("b", 4, 4096), t0_));
    ASSERT_TRUE(registry_.register_node(make_node("a", 2, 2048), t0_));

    auto snap = registry_.snapshot();
    ASSERT_EQ(snap.nodes.size(), 2u);
    EXPECT_EQ(snap.nodes[0].spec.id, "a");
    EXPECT_EQ(snap.nodes[1].spec.id, "b");
    EXPECT_EQ(snap.active_count(), 2u);
    ASSERT_NE(snap.find("b"), nullptr);
    EXPECT_EQ(snap.find("b")->free().cpu_cores, 4u);
    EXPECT_EQ(snap.find("zzz"), nullptr);
}

TEST_F(ClusterRegistryTest, RegisterRejectsInvalidSpec) {
    auto no_id = registry_.register_node(make_node("", 4, 4096));
    ASSERT_FALSE(no_id);
    EXPECT_TRUE(no_id.error().is(ErrorCode::InvalidArgument));

    EXPECT_FALSE(registry_.register_node(make_node("n", 0, 4096)));
    EXPECT_FALSE(registry_.register_node(make_node("n", 4, 4096, -1.0)));
    EXPECT_EQ(registry_.node_count(), 0u);
}

TEST_F(ClusterRegistryTest, ReRegistrationKeepsReservations) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096, 0.10)));
    auto token = registry_.reserve("n", Resources{.cpu_cores = 2, .memory_mb = 1024});
    ASSERT_TRUE(token);

    ASSERT_TRUE(registry_.register_node(make_node("n", 8, 8192, 0.20)));
    auto node = registry_.get_node("n");
    ASSERT_TRUE(node.has_value());
    EXPECT_DOUBLE_EQ(node->spec.price_per_hour, 0.20);
    EXPECT_EQ(node->reserved.cpu_cores, 2u);
    EXPECT_EQ(node->reservation_count, 1u);

    auto shrink = registry_.register_node(make_node("n", 1, 8192));
    ASSERT_FALSE(shrink);
    EXPECT_TRUE(shrink.error().is(ErrorCode::CapacityExceeded));
}

TEST_F(ClusterRegistryTest, ReserveAndRelease) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096)));

    auto token = registry_.reserve("n", Resources{.cpu_cores = 3, .memory_mb = 1024});
    ASSERT_TRUE(token) << token.error().message;
    EXPECT_TRUE(registry_.holds(*token));
    EXPECT_EQ(registry_.get_node("n")->free().cpu_cores, 1u);

    auto second = registry_.reserve("n", Resources{.cpu_cores = 2, .memory_mb = 1024});
    ASSERT_FALSE(second);
    EXPECT_TRUE(second.error().is(ErrorCode::CapacityExceeded));
    EXPECT_EQ(registry_.get_node("n")->reserved.cpu_cores, 3u);

    EXPECT_TRUE(registry_.release(*token));
    EXPECT_FALSE(registry_.holds(*token));
    EXPECT_TRUE(registry_.get_node("n")->reserved.is_zero());
}

TEST_F(ClusterRegistryTest, ReserveUnknownNode) {
    auto token = registry_.reserve("ghost", Resources{.cpu_cores = 1});
    ASSERT_FALSE(token);
    EXPECT_TRUE(token.error().is(ErrorCode::UnknownNode));
}

TEST_F(ClusterRegistryTest, DoubleReleaseIsBookkeepingError) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096)));
    auto token = registry_.reserve("n", Resources{.cpu_cores = 1, .memory_mb = 512});
    ASSERT_TRUE(token);
    EXPECT_TRUE(registry_.release(*token));
    EXPECT_THROW(registry_.release(*token), std::logic_error);
}

TEST_F(ClusterRegistryTest, HeartbeatUnknownNode) {
    auto hb = registry_.heartbeat("ghost");
    ASSERT_FALSE(hb);
    EXPECT_TRUE(hb.error().is(ErrorCode::UnknownNode));
}

TEST_F(ClusterRegistryTest, HeartbeatStoresReportedFree) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096), t0_));
    ASSERT_TRUE(registry_.heartbeat("n", Resources{.cpu_cores = 3, .memory_mb = 2048}, t0_ + 1s));
    auto node = registry_.get_node("n");
    ASSERT_TRUE(node->reported_free.has_value());
    EXPECT_EQ(node->reported_free->cpu_cores, 3u);
}

TEST_F(ClusterRegistryTest, SuspectThenEvict) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096), t0_));
    auto token = registry_.reserve("n", Resources{.cpu_cores = 2, .memory_mb = 1024});
    ASSERT_TRUE(token);

    EXPECT_TRUE(registry_.evict_stale(10s, t0_ + 6s).empty());
    EXPECT_EQ(registry_.get_node("n")->liveness, NodeLiveness::Suspected);

    auto suspected = registry_.reserve("n", Resources{.cpu_cores = 1});
    ASSERT_FALSE(suspected);
    EXPECT_TRUE(suspected.error().is(ErrorCode::NodeUnavailable));

    auto evicted = registry_.evict_stale(10s, t0_ + 11s);
    ASSERT_EQ(evicted, std::vector<NodeId>{"n"});

    auto node = registry_.get_node("n");
    EXPECT_EQ(node->liveness, NodeLiveness::Evicted);
    EXPECT_TRUE(node->reserved.is_zero());
    EXPECT_EQ(node->reservation_count, 0u);
    EXPECT_FALSE(registry_.holds(*token));

    // Stale release after eviction is reported, not thrown.
    EXPECT_FALSE(registry_.release(*token));

    // Already evicted nodes are not reported twice.
    EXPECT_TRUE(registry_.evict_stale(10s, t0_ + 20s).empty());
}

TEST_F(ClusterRegistryTest, HeartbeatRevivesEvictedNode) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096), t0_));
    ASSERT_EQ(registry_.evict_stale(1s, t0_ + 2s).size(), 1u);
    EXPECT_EQ(registry_.active_node_count(), 0u);

    ASSERT_TRUE(registry_.heartbeat("n", std::nullopt, t0_ + 3s));
    EXPECT_EQ(registry_.active_node_count(), 1u);
    EXPECT_TRUE(registry_.reserve("n", Resources{.cpu_cores = 4, .memory_mb = 4096}));
}

TEST_F(ClusterRegistryTest, UtilizationIsMaxOverDimensions) {
    ASSERT_TRUE(registry_.register_node(make_node("n", 4, 4096)));
    ASSERT_TRUE(registry_.reserve("n", Resources{.cpu_cores = 1, .memory_mb = 3072}));
    EXPECT_DOUBLE_EQ(registry_.get_node("n")->utilization(), 0.75);
}

TEST_F(ClusterRegistryTest, ConcurrentReserveReleaseEvictNeverOvercommits) {
    constexpr uint32_t CPU = 8;
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(registry_.register_node(make_node("n" + std::to_string(i), CPU, 8192)));
    }

    std::atomic<bool> stop{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> workers;
    for (int w = 0; w < 6; ++w) {
        workers.emplace_back([&, w] {
            std::vector<AssignmentToken> held;
            for (int i = 0; i < 2000; ++i) {
                NodeId id = "n" + std::to_string((i + w) % 4);
                auto token = registry_.reserve(id, Resources{.cpu_cores = 3, .memory_mb = 1024});
                if (token) held.push_back(*token);
                if (held.size() > 2 || (!token && !held.empty())) {
                    registry_.release(held.front());
                    held.erase(held.begin());
                }
            }
            for (const auto& token : held) registry_.release(token);
        });
    }

    std::thread evictor([&] {
        while (!stop.load()) {
            auto now = std::chrono::steady_clock::now();
            registry_.evict_stale(1ms, now + 10ms);
            for (int i = 0; i < 4; ++i) {
                (void)registry_.heartbeat("n" + std::to_string(i), std::nullopt, now + 10ms);
            }
            std::this_thread::yield();
        }
    });

    std::thread checker([&] {
        while (!stop.load()) {
            for (const auto& node : registry_.snapshot().nodes) {
                if (!node.reserved.fits_within(node.spec.capacity)) violations.fetch_add(1);
            }
        }
    });

    for (auto& t : workers) t.join();
    stop.store(true);
    evictor.join();
    checker.join();

    EXPECT_EQ(violations.load(), 0);
    for (const auto& node : registry_.snapshot().nodes) {
        EXPECT_TRUE(node.reserved.is_zero()) << node.spec.id;
        EXPECT_EQ(node.reservation_count, 0u);
    }
}
