/**
 * @file rpc_client.hpp
 * @brief Client side of the scheduler RPC protocol.
 */

#pragma once

#include "core/result.hpp"
#include "rpc/messages.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace tco_scheduler {

struct Endpoint {
    std::string host;
    uint16_t port{0};
};

/// Parse "host:port", tolerating an "http://" prefix. Port defaults to 50051.
[[nodiscard]] Result<Endpoint> parse_endpoint(std::string_view text);

/**
 * @brief Issues one RPC per connection against a scheduler daemon.
 *
 * Remote errors come back with the ErrorCode the scheduler reported;
 * connection problems are ErrorCode::Transport.
 */
class SchedulerClient {
public:
    static constexpr uint16_t DEFAULT_PORT = 50051;

    explicit SchedulerClient(Endpoint endpoint, uint32_t timeout_ms = 5000);

    Result<SubmitJobResponse> submit_job(const SubmitJobRequest& request);
    Result<JobStatusResponse> get_job_status(const JobId& job_id);
    Result<JobCostResponse> get_job_cost(const JobId& job_id);
    Result<ClusterStatusResponse> cluster_status();
    Result<ListNodesResponse> list_nodes();
    Result<RegisterNodeResponse> register_node(const RegisterNodeRequest& request);
    Result<HeartbeatResponse> heartbeat(const HeartbeatRequest& request);
    Result<ReportJobResultResponse> report_job_result(const ReportJobResultRequest& request);

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    template <typename Response>
    Result<Response> call(const RpcRequest& request);

    Endpoint endpoint_;
    uint32_t timeout_ms_;
};

}  // namespace tco_scheduler
