/**
 * @file job_executor.hpp
 * @brief Contract between the scheduler and the job execution collaborator.
 *
 * The scheduler hands a DispatchRequest to an IJobExecutor; the executor
 * reports back asynchronously by posting ExecutorMessages to an
 * ExecutorMailbox. No callbacks into scheduler state are involved.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tco_scheduler {

/**
 * @brief What the executor needs to start an isolated job.
 */
struct DispatchRequest {
    JobId job_id;
    NodeId node_id;
    Resources limits;                     ///< Enforced CPU / memory / GPU limits
    std::string image;
    std::vector<std::string> command;
    double estimated_duration_hours{0.0};
};

enum class ExecutorEvent : uint8_t {
    Started,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ExecutorEvent event) noexcept {
    switch (event) {
        case ExecutorEvent::Started:   return "started";
        case ExecutorEvent::Completed: return "completed";
        case ExecutorEvent::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * @brief Outcome message posted by an executor.
 */
struct ExecutorMessage {
    JobId job_id;
    NodeId node_id;                       ///< Node that ran the job; empty = unknown
    ExecutorEvent event{ExecutorEvent::Started};
    int exit_code{0};
    std::string output;                   ///< Captured stdout/stderr tail
    std::string error;
};

/**
 * @brief Abstract execution collaborator.
 */
class IJobExecutor {
public:
    virtual ~IJobExecutor() = default;

    /// Begin executing; must not block on job completion.
    virtual Result<void> start(const DispatchRequest& request) = 0;

    /// Stop a job the scheduler no longer tracks on this node (best effort).
    virtual void cancel(const JobId& job_id) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Bounded multi-producer queue of executor outcomes.
 *
 * Producers are executor threads or RPC handlers; the scheduler's
 * maintenance task is the only consumer.
 */
class ExecutorMailbox {
public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit ExecutorMailbox(size_t capacity = DEFAULT_CAPACITY);

    /// @return false if the mailbox is full and the message was dropped.
    bool post(ExecutorMessage message);

    /// Take every queued message in posting order.
    [[nodiscard]] std::vector<ExecutorMessage> drain();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t dropped() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<ExecutorMessage> queue_;
    size_t dropped_{0};
};

/**
 * @brief Executor that accepts every dispatch and never reports.
 *
 * Used when outcomes arrive from remote workers through ReportJobResult.
 */
class ExternalExecutor : public IJobExecutor {
public:
    Result<void> start(const DispatchRequest& /*request*/) override { return Result<void>{}; }
    void cancel(const JobId& /*job_id*/) override {}
    [[nodiscard]] std::string_view name() const noexcept override { return "external"; }
};

}  // namespace tco_scheduler
