/**
 * @file test_latency_model.cpp
 * @brief Unit tests for the latency estimators.
 */

#include "scheduler/latency_model.hpp"

#include <gtest/gtest.h>

using namespace tco_scheduler;

namespace {

NodeState make_state(uint32_t cpu, uint64_t mem_mb, Resources reserved = {},
                     uint32_t base_latency_ms = 0) {
    NodeState state;
    state.spec.id = "n";
    state.spec.location = "eu-west";
    state.spec.capacity = Resources{.cpu_cores = cpu, .memory_mb = mem_mb};
    state.spec.base_latency_ms = base_latency_ms;
    state.reserved = reserved;
    return state;
}

Job make_job() {
    Job job;
    job.id = "j";
    job.request = Resources{.cpu_cores = 1, .memory_mb = 1024};
    return job;
}

}  // namespace

TEST(LoadScaledLatencyModelTest, IdleNodeUsesConfiguredBase) {
    LoadScaledLatencyModel model(LatencyConfig{});
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(4, 4096)), 50u);
    EXPECT_EQ(model.name(), "load_scaled");
}

TEST(LoadScaledLatencyModelTest, NodeBaseOverridesDefault) {
    LoadScaledLatencyModel model(LatencyConfig{});
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(4, 4096, {}, 20)), 20u);
}

TEST(LoadScaledLatencyModelTest, LoadAddsProportionalPenalty) {
    LoadScaledLatencyModel model(LatencyConfig{});
    auto half_loaded = make_state(4, 4096, Resources{.cpu_cores = 2, .memory_mb = 1024});
    EXPECT_EQ(model.estimate_ms(make_job(), half_loaded), 100u);
}

TEST(LoadScaledLatencyModelTest, RemoteZonePenalty) {
    LoadScaledLatencyModel model(LatencyConfig{});
    auto job = make_job();
    job.preferred_location = "us-east";
    EXPECT_EQ(model.estimate_ms(job, make_state(4, 4096)), 75u);

    job.preferred_location = "eu-west";
    EXPECT_EQ(model.estimate_ms(job, make_state(4, 4096)), 50u);
}

TEST(PressureLatencyModelTest, StepsOnFreeResources) {
    PressureLatencyModel model;
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(4, 8192)), 50u);
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(1, 8192)), 100u);
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(4, 1024)), 80u);
    EXPECT_EQ(model.estimate_ms(make_job(), make_state(1, 1024)), 130u);
}

TEST(LatencyModelFactoryTest, BuildsByName) {
    LatencyConfig config;
    config.model = "pressure";
    auto model = make_latency_model(config);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ((*model)->name(), "pressure");

    config.model = "bogus";
    auto bad = make_latency_model(config);
    ASSERT_FALSE(bad.has_value());
    EXPECT_TRUE(bad.error().is(ErrorCode::Config));
}
