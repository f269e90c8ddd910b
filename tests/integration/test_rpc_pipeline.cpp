/**
 * @file test_rpc_pipeline.cpp
 * @brief End-to-end tests: SchedulerClient -> TCP -> SchedulerRpcServer -> SchedulerService.
 */

#include "executor/simulated_executor.hpp"
#include "rpc/rpc_client.hpp"
#include "rpc/rpc_codec.hpp"
#include "rpc/rpc_server.hpp"
#include "service/scheduler_service.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace tco_scheduler;
using namespace std::chrono_literals;

namespace {

RegisterNodeRequest node_request(const std::string& id, uint32_t cpu, double price) {
    return RegisterNodeRequest{
        .node_id = id,
        .location = "eu-west",
        .cpu_cores = cpu,
        .memory_gb = 16.0,
        .cost_per_hour_usd = price,
    };
}

SubmitJobRequest job_request(const std::string& id, uint32_t cpu = 2) {
    return SubmitJobRequest{
        .job_id = id,
        .cpu_cores = cpu,
        .memory_gb = 2.0,
        .max_latency_ms = 1000,
        .estimated_duration_hours = 1.0,
    };
}

/**
 * @brief A scheduler daemon on an ephemeral loopback port.
 */
class RpcPipeline : public ::testing::Test {
protected:
    void SetUp() override { start_with(nullptr); }

    void start_with(std::shared_ptr<IJobExecutor> executor) {
        config_ = default_config();
        config_.executor.simulated_seconds_per_hour = 0.02;
        config_.registry.eviction_interval_ms = 10;

        mailbox_ = std::make_shared<ExecutorMailbox>();
        if (!executor) {
            simulated_ = std::make_shared<SimulatedExecutor>(config_.executor, mailbox_, logger_);
            executor = simulated_;
        }

        auto created = SchedulerService::create(config_, executor, mailbox_, logger_);
        ASSERT_TRUE(created.has_value());
        service_ = std::move(*created);
        service_->start();

        server_ = std::make_unique<SchedulerRpcServer>(*service_, logger_);
        auto port = server_->start(0, 2);
        if (!port) {
            GTEST_SKIP() << "loopback listen unavailable: " << port.error().message;
        }
        client_ = std::make_unique<SchedulerClient>(Endpoint{.host = "127.0.0.1", .port = *port});
    }

    void TearDown() override {
        if (server_) server_->stop();
        if (service_) service_->stop();
    }

    void restart_with(std::shared_ptr<IJobExecutor> executor) {
        TearDown();
        client_.reset();
        server_.reset();
        service_.reset();
        simulated_.reset();
        start_with(std::move(executor));
    }

    /// Poll until the job reaches a terminal status or the deadline passes.
    JobStatusResponse wait_terminal(const JobId& id, std::chrono::milliseconds limit = 5s) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        JobStatusResponse last;
        while (std::chrono::steady_clock::now() < deadline) {
            auto status = client_->get_job_status(id);
            if (status) {
                last = *status;
                if (last.status == "completed" || last.status == "failed") break;
            }
            std::this_thread::sleep_for(10ms);
        }
        return last;
    }

    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
    Config config_;
    std::shared_ptr<ExecutorMailbox> mailbox_;
    std::shared_ptr<SimulatedExecutor> simulated_;
    std::unique_ptr<SchedulerService> service_;
    std::unique_ptr<SchedulerRpcServer> server_;
    std::unique_ptr<SchedulerClient> client_;
};

}  // namespace

// ═══════════════════════════════════════════════
// Full round trips
// ═══════════════════════════════════════════════

TEST_F(RpcPipeline, RegisterSubmitAndComplete) {
    ASSERT_TRUE(client_->register_node(node_request("cheap", 8, 0.10)).has_value());
    ASSERT_TRUE(client_->register_node(node_request("pricey", 8, 0.90)).has_value());

    auto submitted = client_->submit_job(job_request("job-1"));
    ASSERT_TRUE(submitted.has_value()) << submitted.error().message;
    EXPECT_TRUE(submitted->placed);
    EXPECT_EQ(submitted->assigned_node, "cheap");
    EXPECT_NEAR(submitted->cost.total_usd, 0.10, 1e-9);

    auto status = wait_terminal("job-1");
    EXPECT_EQ(status.status, "completed");
    EXPECT_EQ(status.assigned_node, "cheap");
    EXPECT_GT(status.submitted_at_ms, 0);
    EXPECT_GE(status.ended_at_ms, status.submitted_at_ms);
    EXPECT_TRUE(status.failure_reason.empty());

    auto cost = client_->get_job_cost("job-1");
    ASSERT_TRUE(cost.has_value());
    EXPECT_EQ(cost->cost, submitted->cost);
}

TEST_F(RpcPipeline, SimulatedFailureIsReported) {
    ASSERT_TRUE(client_->register_node(node_request("n1", 4, 0.20)).has_value());

    auto req = job_request("job-fail");
    req.command = {"exit", "3"};
    auto submitted = client_->submit_job(req);
    ASSERT_TRUE(submitted.has_value());
    ASSERT_TRUE(submitted->placed);

    auto status = wait_terminal("job-fail");
    EXPECT_EQ(status.status, "failed");
    EXPECT_FALSE(status.failure_reason.empty());
}

TEST_F(RpcPipeline, ClusterStatusAndNodeListing) {
    ASSERT_TRUE(client_->register_node(node_request("a", 4, 0.20)).has_value());
    auto onprem = node_request("b", 16, 0.05);
    onprem.on_premise = true;
    onprem.opportunity_cost_per_hour = 0.01;
    ASSERT_TRUE(client_->register_node(onprem).has_value());

    auto cluster = client_->cluster_status();
    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(cluster->cluster_id, config_.scheduler.cluster_id);
    EXPECT_EQ(cluster->total_nodes, 2u);
    EXPECT_EQ(cluster->active_nodes, 2u);
    EXPECT_EQ(cluster->total_jobs, 0u);

    auto nodes = client_->list_nodes();
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->nodes.size(), 2u);
    bool saw_onprem = false;
    for (const auto& node : nodes->nodes) {
        EXPECT_DOUBLE_EQ(node.memory_gb, 16.0);
        EXPECT_EQ(node.status, "active");
        if (node.node_id == "b") {
            saw_onprem = true;
            EXPECT_TRUE(node.on_premise);
            EXPECT_EQ(node.cpu_cores, 16u);
        }
    }
    EXPECT_TRUE(saw_onprem);
}

TEST_F(RpcPipeline, HeartbeatForUnknownNodeFails) {
    auto result = client_->heartbeat(HeartbeatRequest{.node_id = "ghost"});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::UnknownNode));

    ASSERT_TRUE(client_->register_node(node_request("n1", 4, 0.20)).has_value());
    EXPECT_TRUE(client_->heartbeat(HeartbeatRequest{
        .node_id = "n1",
        .has_free_capacity = true,
        .free_cpu_cores = 4,
        .free_memory_gb = 16.0,
    }).has_value());
}

// ═══════════════════════════════════════════════
// Errors over the wire
// ═══════════════════════════════════════════════

TEST_F(RpcPipeline, UnknownJobIsNotFound) {
    auto status = client_->get_job_status("nope");
    ASSERT_FALSE(status.has_value());
    EXPECT_TRUE(status.error().is(ErrorCode::NotFound));

    auto cost = client_->get_job_cost("nope");
    ASSERT_FALSE(cost.has_value());
    EXPECT_TRUE(cost.error().is(ErrorCode::NotFound));
}

TEST_F(RpcPipeline, InfeasibleSubmitIsRecordedAsFailed) {
    ASSERT_TRUE(client_->register_node(node_request("small", 2, 0.10)).has_value());

    auto submitted = client_->submit_job(job_request("too-big", 64));
    ASSERT_TRUE(submitted.has_value());
    EXPECT_FALSE(submitted->placed);
    EXPECT_EQ(submitted->infeasible_reason, "no_capacity");

    auto status = client_->get_job_status("too-big");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, "failed");
    EXPECT_EQ(status->failure_reason, "infeasible");

    auto cost = client_->get_job_cost("too-big");
    ASSERT_FALSE(cost.has_value());
    EXPECT_TRUE(cost.error().is(ErrorCode::NotFound));
}

TEST_F(RpcPipeline, DuplicateAndInvalidSubmissions) {
    ASSERT_TRUE(client_->register_node(node_request("n1", 8, 0.10)).has_value());
    ASSERT_TRUE(client_->submit_job(job_request("dup")).has_value());

    auto again = client_->submit_job(job_request("dup"));
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().is(ErrorCode::AlreadyExists));

    auto empty = job_request("empty", 0);
    empty.memory_gb = 0.0;
    auto rejected = client_->submit_job(empty);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().is(ErrorCode::InvalidArgument));
}

TEST_F(RpcPipeline, GarbageBytesYieldProtocolError) {
    auto reply = server_->handle({0xEE, 0x01, 0x02});
    auto decoded = RpcCodec::decode_response(reply);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::Protocol));
}

TEST_F(RpcPipeline, ClosedPortIsTransportError) {
    auto port = client_->endpoint().port;
    server_->stop();

    SchedulerClient dead(Endpoint{.host = "127.0.0.1", .port = port}, 500);
    auto result = dead.cluster_status();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Transport));
}

// ═══════════════════════════════════════════════
// Remote workers
// ═══════════════════════════════════════════════

TEST_F(RpcPipeline, ExternalWorkerReportsResult) {
    restart_with(std::make_shared<ExternalExecutor>());
    ASSERT_NE(client_, nullptr);

    ASSERT_TRUE(client_->register_node(node_request("worker-1", 8, 0.10)).has_value());
    auto submitted = client_->submit_job(job_request("remote"));
    ASSERT_TRUE(submitted.has_value());
    ASSERT_TRUE(submitted->placed);

    ReportJobResultRequest started{
        .job_id = "remote",
        .node_id = "worker-1",
        .outcome = static_cast<uint8_t>(ExecutorEvent::Started),
    };
    ASSERT_TRUE(client_->report_job_result(started).has_value());
    auto running = client_->get_job_status("remote");
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->status, "running");
    EXPECT_GT(running->started_at_ms, 0);

    auto cluster = client_->cluster_status();
    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(cluster->running_jobs, 1u);

    ReportJobResultRequest wrong_node = started;
    wrong_node.node_id = "worker-2";
    wrong_node.outcome = static_cast<uint8_t>(ExecutorEvent::Completed);
    EXPECT_FALSE(client_->report_job_result(wrong_node).has_value());

    ReportJobResultRequest done{
        .job_id = "remote",
        .node_id = "worker-1",
        .outcome = static_cast<uint8_t>(ExecutorEvent::Completed),
        .message = "ok",
    };
    ASSERT_TRUE(client_->report_job_result(done).has_value());

    auto status = client_->get_job_status("remote");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, "completed");

    auto nodes = client_->list_nodes();
    ASSERT_TRUE(nodes.has_value());
    ASSERT_EQ(nodes->nodes.size(), 1u);
    EXPECT_EQ(nodes->nodes[0].free_cpu_cores, 8u);
}

TEST_F(RpcPipeline, UnknownOutcomeIsRejected) {
    ReportJobResultRequest bogus{.job_id = "x", .node_id = "y", .outcome = 42};
    auto result = client_->report_job_result(bogus);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidArgument));
}

// ═══════════════════════════════════════════════
// Endpoint parsing
// ═══════════════════════════════════════════════

TEST(EndpointParse, HostAndPort) {
    auto ep = parse_endpoint("10.0.0.5:6000");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->host, "10.0.0.5");
    EXPECT_EQ(ep->port, 6000);
}

TEST(EndpointParse, SchemePrefixAndDefaultPort) {
    auto ep = parse_endpoint("http://scheduler.local");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->host, "scheduler.local");
    EXPECT_EQ(ep->port, SchedulerClient::DEFAULT_PORT);
}

TEST(EndpointParse, RejectsBadPort) {
    EXPECT_FALSE(parse_endpoint("host:notaport").has_value());
    EXPECT_FALSE(parse_endpoint("host:70000").has_value());
    EXPECT_FALSE(parse_endpoint("").has_value());
}
