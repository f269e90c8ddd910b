/**
 * @file test_executor.cpp
 * @brief Unit tests for the executor mailbox and the simulated executor.
 */

#include "executor/job_executor.hpp"
#include "executor/simulated_executor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace tco_scheduler;
using namespace std::chrono_literals;

namespace {

DispatchRequest make_request(const std::string& job_id, double hours = 0.0,
                             std::vector<std::string> command = {}) {
    return DispatchRequest{
        .job_id = job_id,
        .node_id = "node-1",
        .limits = Resources{.cpu_cores = 1, .memory_mb = 512},
        .image = "alpine:latest",
        .command = std::move(command),
        .estimated_duration_hours = hours,
    };
}

Logger& quiet_logger() {
    static Logger logger(std::make_unique<NullSink>(), LogLevel::Error);
    return logger;
}

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

ExecutorConfig fast_config(double seconds_per_hour = 0.01) {
    ExecutorConfig config;
    config.thread_count = 2;
    config.simulated_seconds_per_hour = seconds_per_hour;
    return config;
}

}  // namespace

// ─────────────────────────────────────────────
// ExecutorMailbox
// ─────────────────────────────────────────────

TEST(ExecutorMailboxTest, DrainPreservesOrder) {
    ExecutorMailbox mailbox;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(mailbox.post(ExecutorMessage{.job_id = "j" + std::to_string(i)}));
    }
    EXPECT_EQ(mailbox.size(), 5u);

    auto drained = mailbox.drain();
    ASSERT_EQ(drained.size(), 5u);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(drained[i].job_id, "j" + std::to_string(i));
    EXPECT_EQ(mailbox.size(), 0u);
    EXPECT_TRUE(mailbox.drain().empty());
}

TEST(ExecutorMailboxTest, DropsWhenFull) {
    ExecutorMailbox mailbox(2);
    EXPECT_TRUE(mailbox.post(ExecutorMessage{.job_id = "a"}));
    EXPECT_TRUE(mailbox.post(ExecutorMessage{.job_id = "b"}));
    EXPECT_FALSE(mailbox.post(ExecutorMessage{.job_id = "c"}));
    EXPECT_EQ(mailbox.dropped(), 1u);
    EXPECT_EQ(mailbox.drain().size(), 2u);
}

TEST(ExecutorMailboxTest, ConcurrentProducers) {
    ExecutorMailbox mailbox;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&mailbox, p] {
            for (int i = 0; i < 250; ++i) {
                mailbox.post(ExecutorMessage{.job_id = std::to_string(p) + "-" + std::to_string(i)});
            }
        });
    }
    for (auto& t : producers) t.join();
    EXPECT_EQ(mailbox.drain().size(), 1000u);
}

TEST(ExternalExecutorTest, AcceptsEverything) {
    ExternalExecutor executor;
    EXPECT_TRUE(executor.start(make_request("j1")));
    executor.cancel("j1");
    EXPECT_EQ(executor.name(), "external");
}

// ─────────────────────────────────────────────
// SimulatedExecutor
// ─────────────────────────────────────────────

TEST(SimulatedExitCodeTest, ParsesExitCommand) {
    EXPECT_EQ(simulated_exit_code({"exit", "3"}), 3);
    EXPECT_EQ(simulated_exit_code({"exit", "0"}), 0);
    EXPECT_EQ(simulated_exit_code({"exit", "x"}), 0);
    EXPECT_EQ(simulated_exit_code({"python", "train.py"}), 0);
    EXPECT_EQ(simulated_exit_code({}), 0);
}

TEST(SimulatedExecutorTest, PostsStartedThenCompleted) {
    auto mailbox = std::make_shared<ExecutorMailbox>();
    SimulatedExecutor executor(fast_config(), mailbox, quiet_logger());

    ASSERT_TRUE(executor.start(make_request("j1", 1.0)));
    ASSERT_TRUE(executor.wait_idle(5s));

    auto messages = mailbox->drain();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].event, ExecutorEvent::Started);
    EXPECT_EQ(messages[1].event, ExecutorEvent::Completed);
    EXPECT_EQ(messages[1].job_id, "j1");
    EXPECT_EQ(messages[1].node_id, "node-1");
    EXPECT_EQ(messages[1].output, "simulated run on node-1");
    EXPECT_EQ(executor.in_flight(), 0u);
}

TEST(SimulatedExecutorTest, ExitCommandFails) {
    auto mailbox = std::make_shared<ExecutorMailbox>();
    SimulatedExecutor executor(fast_config(), mailbox, quiet_logger());

    ASSERT_TRUE(executor.start(make_request("j1", 0.0, {"exit", "4"})));
    ASSERT_TRUE(executor.wait_idle(5s));

    auto messages = mailbox->drain();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].event, ExecutorEvent::Failed);
    EXPECT_EQ(messages[1].exit_code, 4);
}

TEST(SimulatedExecutorTest, RejectsDuplicateAndEmptyIds) {
    auto mailbox = std::make_shared<ExecutorMailbox>();
    SimulatedExecutor executor(fast_config(3600.0), mailbox, quiet_logger());

    ASSERT_TRUE(executor.start(make_request("j1", 1.0)));
    auto dup = executor.start(make_request("j1", 1.0));
    ASSERT_FALSE(dup);
    EXPECT_TRUE(dup.error().is(ErrorCode::AlreadyExists));

    EXPECT_TRUE(executor.start(make_request("", 1.0)).error().is(ErrorCode::InvalidArgument));
    executor.cancel("j1");
}

TEST(SimulatedExecutorTest, CancelledRunPostsNoOutcome) {
    auto mailbox = std::make_shared<ExecutorMailbox>();
    SimulatedExecutor executor(fast_config(3600.0), mailbox, quiet_logger());

    ASSERT_TRUE(executor.start(make_request("j1", 1.0)));
    EXPECT_EQ(executor.in_flight(), 1u);
    executor.cancel("j1");
    EXPECT_EQ(executor.in_flight(), 0u);
    ASSERT_TRUE(executor.wait_idle(5s));

    for (const auto& msg : mailbox->drain()) {
        EXPECT_EQ(msg.event, ExecutorEvent::Started);
    }
}

TEST(SimulatedExecutorTest, CancelThenRedispatchSameJob) {
    auto mailbox = std::make_shared<ExecutorMailbox>();
    SimulatedExecutor executor(fast_config(3600.0), mailbox, quiet_logger());

    ASSERT_TRUE(executor.start(make_request("j1", 1.0)));
    executor.cancel("j1");

    auto second = make_request("j1", 0.0);
    second.node_id = "node-2";
    ASSERT_TRUE(executor.start(second));
    ASSERT_TRUE(executor.wait_idle(5s));

    size_t completed = 0;
    for (const auto& msg : mailbox->drain()) {
        if (msg.event == ExecutorEvent::Completed) {
            ++completed;
            EXPECT_EQ(msg.node_id, "node-2");
        }
    }
    EXPECT_EQ(completed, 1u);
}

TEST(SimulatedExecutorTest, NoMailboxIsAnError) {
    SimulatedExecutor executor(fast_config(), nullptr, quiet_logger());
    EXPECT_FALSE(executor.start(make_request("j1")));
}

TEST(SimulatedExecutorTest, FullMailboxHoldsOutcomeUntilDrained) {
    auto mailbox = std::make_shared<ExecutorMailbox>(1);
    ASSERT_TRUE(mailbox->post(ExecutorMessage{.job_id = "backlog"}));

    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);
    SimulatedExecutor executor(fast_config(), mailbox, logger);

    ASSERT_TRUE(executor.start(make_request("j1", 0.0)));
    EXPECT_FALSE(executor.wait_idle(100ms));

    auto first = mailbox->drain();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].job_id, "backlog");

    ASSERT_TRUE(executor.wait_idle(5s));
    auto second = mailbox->drain();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].job_id, "j1");
    EXPECT_EQ(second[0].event, ExecutorEvent::Completed);

    bool warned = false;
    for (const auto& line : lines) {
        if (line.find("mailbox full") != std::string::npos) warned = true;
    }
    EXPECT_TRUE(warned);
}
