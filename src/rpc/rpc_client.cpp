/**
 * @file rpc_client.cpp
 * @brief SchedulerClient implementation.
 */

#include "rpc/rpc_client.hpp"

#include "network/transport.hpp"
#include "rpc/rpc_codec.hpp"

#include <charconv>

namespace tco_scheduler {

Result<Endpoint> parse_endpoint(std::string_view text) {
    for (std::string_view prefix : {"http://", "tcp://"}) {
        if (text.substr(0, prefix.size()) == prefix) {
            text.remove_prefix(prefix.size());
            break;
        }
    }
    if (text.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty scheduler address"};
    }

    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return Endpoint{std::string{text}, SchedulerClient::DEFAULT_PORT};
    }

    auto host = text.substr(0, colon);
    auto port_text = text.substr(colon + 1);
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (host.empty() || ec != std::errc{} || ptr != port_text.data() + port_text.size()
        || port == 0 || port > 65535) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid scheduler address '" + std::string{text} + "'"};
    }
    return Endpoint{std::string{host}, static_cast<uint16_t>(port)};
}

SchedulerClient::SchedulerClient(Endpoint endpoint, uint32_t timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

template <typename Response>
Result<Response> SchedulerClient::call(const RpcRequest& request) {
    TcpTransport transport;
    if (auto connected = transport.connect(endpoint_.host, endpoint_.port, timeout_ms_);
        !connected) {
        return connected.error();
    }
    if (auto sent = transport.send(RpcCodec::encode_request(request)); !sent) {
        return sent.error();
    }
    auto raw = transport.receive(timeout_ms_);
    if (!raw) {
        return raw.error();
    }

    auto decoded = RpcCodec::decode_response(*raw);
    if (!decoded) {
        return decoded.error();
    }
    if (auto* response = std::get_if<Response>(&decoded.value())) {
        return std::move(*response);
    }
    return Error{ErrorCode::Protocol,
                 "expected " + std::string{to_string(message_type(request))}
                 + " response, got " + std::string{to_string(message_type(*decoded))}};
}

Result<SubmitJobResponse> SchedulerClient::submit_job(const SubmitJobRequest& request) {
    return call<SubmitJobResponse>(request);
}

Result<JobStatusResponse> SchedulerClient::get_job_status(const JobId& job_id) {
    return call<JobStatusResponse>(JobStatusRequest{.job_id = job_id});
}

Result<JobCostResponse> SchedulerClient::get_job_cost(const JobId& job_id) {
    return call<JobCostResponse>(JobCostRequest{.job_id = job_id});
}

Result<ClusterStatusResponse> SchedulerClient::cluster_status() {
    return call<ClusterStatusResponse>(ClusterStatusRequest{});
}

Result<ListNodesResponse> SchedulerClient::list_nodes() {
    return call<ListNodesResponse>(ListNodesRequest{});
}

Result<RegisterNodeResponse> SchedulerClient::register_node(const RegisterNodeRequest& request) {
    return call<RegisterNodeResponse>(request);
}

Result<HeartbeatResponse> SchedulerClient::heartbeat(const HeartbeatRequest& request) {
    return call<HeartbeatResponse>(request);
}

Result<ReportJobResultResponse> SchedulerClient::report_job_result(
    const ReportJobResultRequest& request) {
    return call<ReportJobResultResponse>(request);
}

}  // namespace tco_scheduler
