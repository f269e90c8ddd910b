/**
 * @file simulated_executor.cpp
 * @brief SimulatedExecutor implementation.
 */

#include "executor/simulated_executor.hpp"

#include <algorithm>
#include <charconv>
#include <condition_variable>
#include <thread>

namespace tco_scheduler {

namespace {

constexpr std::string_view COMPONENT = "executor";

// Upper bound on one simulated run (one year).
constexpr double MAX_SIMULATED_SECONDS = 365.0 * 24 * 3600;

}  // namespace

int simulated_exit_code(const std::vector<std::string>& command) {
    if (command.size() != 2 || command[0] != "exit") return 0;
    int code = 0;
    const auto& arg = command[1];
    auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), code);
    if (ec != std::errc{} || ptr != arg.data() + arg.size()) return 0;
    return code;
}

SimulatedExecutor::SimulatedExecutor(const ExecutorConfig& config,
                                     std::shared_ptr<ExecutorMailbox> mailbox,
                                     Logger& logger)
    : seconds_per_hour_(config.simulated_seconds_per_hour > 0.0
                            ? config.simulated_seconds_per_hour : 0.0)
    , mailbox_(std::move(mailbox))
    , logger_(logger)
    , pool_(config.thread_count) {}

SimulatedExecutor::~SimulatedExecutor() {
    std::lock_guard lock(mutex_);
    for (auto& [id, source] : running_) {
        source.request_stop();
    }
}

Result<void> SimulatedExecutor::start(const DispatchRequest& request) {
    if (!mailbox_) {
        return Error{ErrorCode::InvalidArgument, "simulated executor has no mailbox"};
    }
    if (request.job_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "dispatch without job id"};
    }

    std::stop_source job_stop;
    {
        std::lock_guard lock(mutex_);
        if (running_.count(request.job_id) > 0) {
            return Error{ErrorCode::AlreadyExists,
                         "job " + request.job_id + " already running"};
        }
        running_.emplace(request.job_id, job_stop);
    }

    auto token = job_stop.get_token();
    // Outcome is reported through the mailbox; the future is not needed.
    (void)pool_.submit_cancellable([this, request, token](std::stop_token pool_stop) {
        run(request, pool_stop, token);
    });
    return Result<void>{};
}

void SimulatedExecutor::cancel(const JobId& job_id) {
    std::lock_guard lock(mutex_);
    auto it = running_.find(job_id);
    if (it == running_.end()) return;
    it->second.request_stop();
    running_.erase(it);
}

size_t SimulatedExecutor::in_flight() const {
    std::lock_guard lock(mutex_);
    return running_.size();
}

void SimulatedExecutor::run(DispatchRequest request,
                            std::stop_token pool_stop,
                            std::stop_token job_stop) {
    if (!mailbox_->post(ExecutorMessage{
            .job_id = request.job_id,
            .node_id = request.node_id,
            .event = ExecutorEvent::Started,
        })) {
        logger_.warn(COMPONENT, "mailbox full; dropped started report for job "
                     + request.job_id);
    }

    auto duration = std::chrono::duration<double>(
        std::min(request.estimated_duration_hours * seconds_per_hour_, MAX_SIMULATED_SECONDS));

    // Sleep until the duration elapses or either stop is requested.
    std::mutex wait_mutex;
    std::condition_variable_any cv;
    std::stop_callback on_pool_stop(pool_stop, [&cv] { cv.notify_all(); });
    {
        std::unique_lock lock(wait_mutex);
        cv.wait_for(lock, job_stop, duration,
                    [&pool_stop] { return pool_stop.stop_requested(); });
    }

    {
        // A cancelled run no longer owns the entry; a re-dispatch may.
        std::lock_guard lock(mutex_);
        auto it = running_.find(request.job_id);
        if (job_stop.stop_requested() || it == running_.end()
            || it->second.get_token() != job_stop) {
            return;
        }
        running_.erase(it);
    }

    if (pool_stop.stop_requested()) {
        (void)deliver(ExecutorMessage{
            .job_id = request.job_id,
            .node_id = request.node_id,
            .event = ExecutorEvent::Failed,
            .exit_code = -1,
            .error = "executor shut down",
        }, pool_stop);
        return;
    }

    int code = simulated_exit_code(request.command);
    if (code == 0) {
        (void)deliver(ExecutorMessage{
            .job_id = request.job_id,
            .node_id = request.node_id,
            .event = ExecutorEvent::Completed,
            .exit_code = 0,
            .output = "simulated run on " + request.node_id,
        }, pool_stop);
    } else {
        (void)deliver(ExecutorMessage{
            .job_id = request.job_id,
            .node_id = request.node_id,
            .event = ExecutorEvent::Failed,
            .exit_code = code,
            .error = "exit code " + std::to_string(code),
        }, pool_stop);
    }
}

bool SimulatedExecutor::deliver(const ExecutorMessage& message, std::stop_token pool_stop) {
    if (mailbox_->post(message)) return true;

    logger_.warn(COMPONENT, "mailbox full; retrying " + std::string{to_string(message.event)}
                 + " report for job " + message.job_id);
    while (!pool_stop.stop_requested()) {
        std::this_thread::sleep_for(DELIVERY_RETRY);
        if (mailbox_->post(message)) return true;
    }

    logger_.error(COMPONENT, "dropped " + std::string{to_string(message.event)}
                  + " report for job " + message.job_id + " at shutdown");
    return false;
}

}  // namespace tco_scheduler
