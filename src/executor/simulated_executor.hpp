/**
 * @file simulated_executor.hpp
 * @brief In-process executor that emulates job runs on the thread pool.
 *
 * Each dispatched job sleeps for its estimated duration scaled by
 * `seconds_per_hour`, then posts Completed. A command of the form
 * `exit N` with N != 0 finishes as Failed with exit code N.
 *
 * A terminal outcome that finds the mailbox full is re-posted until it fits
 * or the executor shuts down.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/job_executor.hpp"
#include "executor/thread_pool.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>

namespace tco_scheduler {

class SimulatedExecutor : public IJobExecutor {
public:
    static constexpr std::chrono::milliseconds DELIVERY_RETRY{10};

    SimulatedExecutor(const ExecutorConfig& config,
                      std::shared_ptr<ExecutorMailbox> mailbox,
                      Logger& logger);
    ~SimulatedExecutor() override;

    SimulatedExecutor(const SimulatedExecutor&) = delete;
    SimulatedExecutor& operator=(const SimulatedExecutor&) = delete;

    Result<void> start(const DispatchRequest& request) override;
    void cancel(const JobId& job_id) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    /// Jobs started and not yet finished or cancelled.
    [[nodiscard]] size_t in_flight() const;

    /// Block until every started job has posted its outcome.
    bool wait_idle(std::chrono::milliseconds timeout) { return pool_.wait_idle(timeout); }

private:
    void run(DispatchRequest request, std::stop_token pool_stop, std::stop_token job_stop);
    bool deliver(const ExecutorMessage& message, std::stop_token pool_stop);

    double seconds_per_hour_;
    std::shared_ptr<ExecutorMailbox> mailbox_;
    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::stop_source> running_;
    ThreadPool pool_;
};

/// Parse the exit code out of an `exit N` command; 0 for anything else.
[[nodiscard]] int simulated_exit_code(const std::vector<std::string>& command);

}  // namespace tco_scheduler
