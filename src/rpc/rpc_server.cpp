/**
 * @file rpc_server.cpp
 * @brief SchedulerRpcServer implementation.
 */

#include "rpc/rpc_server.hpp"

#include "rpc/rpc_codec.hpp"

#include <algorithm>

namespace tco_scheduler {

namespace {

constexpr std::string_view COMPONENT = "rpc";

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

// ─────────────────────────────────────────────
// Conversions
// ─────────────────────────────────────────────

int64_t to_epoch_ms(const std::optional<Timestamp>& ts) noexcept {
    if (!ts) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts->time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) noexcept {
    constexpr auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Timestamp::duration::max()).count();
    constexpr auto min_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Timestamp::duration::min()).count();
    ms = std::clamp<int64_t>(ms, min_ms, max_ms);
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(ms))};
}

Job to_job(const SubmitJobRequest& request) {
    Job job;
    job.id = request.job_id;
    job.request = Resources{
        .cpu_cores = request.cpu_cores,
        .memory_mb = gb_to_mb(request.memory_gb),
        .gpu_count = request.gpu_count,
    };
    job.sla.max_latency_ms = request.max_latency_ms;
    // A zero budget on the wire means "no ceiling"; negative values are
    // forwarded so validation can reject them.
    if (request.budget_usd != 0.0) {
        job.sla.max_budget_usd = request.budget_usd;
    }
    if (request.deadline_ms > 0) {
        job.sla.deadline = from_epoch_ms(request.deadline_ms);
    }
    job.estimated_duration_hours = request.estimated_duration_hours;
    job.estimated_data_gb = request.estimated_data_gb;
    if (!request.preferred_location.empty()) {
        job.preferred_location = request.preferred_location;
    }
    job.image = request.image;
    job.command = request.command;
    return job;
}

NodeSpec to_node_spec(const RegisterNodeRequest& request) {
    return NodeSpec{
        .id = request.node_id,
        .location = request.location,
        .capacity = Resources{
            .cpu_cores = request.cpu_cores,
            .memory_mb = gb_to_mb(request.memory_gb),
            .gpu_count = request.gpu_count,
        },
        .price_per_hour = request.cost_per_hour_usd,
        .transfer_price_per_gb = request.transfer_price_per_gb,
        .opportunity_cost_per_hour = request.opportunity_cost_per_hour,
        .on_premise = request.on_premise,
        .base_latency_ms = request.base_latency_ms,
    };
}

// ─────────────────────────────────────────────
// Server
// ─────────────────────────────────────────────

SchedulerRpcServer::SchedulerRpcServer(SchedulerService& service, Logger& logger)
    : service_(service), logger_(logger) {}

SchedulerRpcServer::~SchedulerRpcServer() {
    stop();
}

Result<uint16_t> SchedulerRpcServer::start(uint16_t port, size_t worker_threads) {
    auto listening = transport_.listen(port);
    if (!listening) {
        return listening.error();
    }
    transport_.serve([this](const std::vector<uint8_t>& request) {
        return handle(request);
    }, worker_threads);

    logger_.info(COMPONENT, "listening on port " + std::to_string(transport_.bound_port()));
    return transport_.bound_port();
}

void SchedulerRpcServer::stop() {
    if (!transport_.is_listening()) return;
    transport_.stop_serving();
    logger_.info(COMPONENT, "stopped");
}

std::vector<uint8_t> SchedulerRpcServer::handle(const std::vector<uint8_t>& request) {
    auto decoded = RpcCodec::decode_request(request);
    if (!decoded) {
        logger_.warn(COMPONENT, "bad request: " + decoded.error().message);
        auto type = !request.empty() && request[0] >= 1 && request[0] <= 8
                  ? static_cast<MessageType>(request[0]) : MessageType::SubmitJob;
        return RpcCodec::encode_error(type, decoded.error());
    }

    auto type = message_type(*decoded);
    logger_.debug(COMPONENT, "request " + std::string{to_string(type)});

    auto response = dispatch(*decoded);
    if (!response) {
        logger_.debug(COMPONENT, std::string{to_string(type)} + " failed: "
                      + response.error().message);
        return RpcCodec::encode_error(type, response.error());
    }
    return RpcCodec::encode_response(*response);
}

Result<RpcResponse> SchedulerRpcServer::dispatch(const RpcRequest& request) {
    return std::visit(Overloaded{
        [this](const SubmitJobRequest& req) -> Result<RpcResponse> {
            auto outcome = service_.submit(to_job(req));
            if (!outcome) return outcome.error();

            SubmitJobResponse resp;
            resp.job_id = outcome->job_id;
            if (outcome->placement) {
                resp.placed = true;
                resp.assigned_node = outcome->placement->node_id;
                resp.cost = outcome->placement->cost;
                resp.estimated_latency_ms = outcome->placement->estimated_latency_ms;
                resp.message = "job " + outcome->job_id + " "
                             + std::string{to_string(outcome->status)} + " on "
                             + resp.assigned_node;
            } else if (outcome->infeasible) {
                resp.infeasible_reason = std::string{to_string(outcome->infeasible->reason)};
                resp.message = outcome->infeasible->detail;
            }
            return RpcResponse{std::move(resp)};
        },
        [this](const JobStatusRequest& req) -> Result<RpcResponse> {
            auto view = service_.get_status(req.job_id);
            if (!view) return view.error();

            JobStatusResponse resp;
            resp.job_id = view->job_id;
            resp.status = std::string{to_string(view->status)};
            resp.assigned_node = view->node_id.value_or("");
            resp.submitted_at_ms = to_epoch_ms(view->submitted_at);
            resp.started_at_ms = to_epoch_ms(view->started_at);
            resp.ended_at_ms = to_epoch_ms(view->ended_at);
            if (view->failure != FailureReason::None) {
                resp.failure_reason = std::string{to_string(view->failure)};
            }
            resp.failure_detail = view->failure_detail;
            resp.requeue_count = view->requeue_count;
            return RpcResponse{std::move(resp)};
        },
        [this](const JobCostRequest& req) -> Result<RpcResponse> {
            auto cost = service_.get_cost(req.job_id);
            if (!cost) return cost.error();
            return RpcResponse{JobCostResponse{.job_id = req.job_id, .cost = *cost}};
        },
        [this](const ClusterStatusRequest&) -> Result<RpcResponse> {
            auto status = service_.cluster_status();
            return RpcResponse{ClusterStatusResponse{
                .cluster_id = status.cluster_id,
                .total_nodes = status.total_nodes,
                .active_nodes = status.active_nodes,
                .total_jobs = status.total_jobs,
                .running_jobs = status.running_jobs,
            }};
        },
        [this](const ListNodesRequest&) -> Result<RpcResponse> {
            ListNodesResponse resp;
            for (const auto& node : service_.list_nodes()) {
                resp.nodes.push_back(NodeInfo{
                    .node_id = node.id,
                    .location = node.location,
                    .cpu_cores = node.capacity.cpu_cores,
                    .memory_gb = mb_to_gb(node.capacity.memory_mb),
                    .gpu_count = node.capacity.gpu_count,
                    .cost_per_hour_usd = node.price_per_hour,
                    .status = std::string{to_string(node.liveness)},
                    .free_cpu_cores = node.free.cpu_cores,
                    .free_memory_gb = mb_to_gb(node.free.memory_mb),
                    .on_premise = node.on_premise,
                });
            }
            return RpcResponse{std::move(resp)};
        },
        [this](const RegisterNodeRequest& req) -> Result<RpcResponse> {
            auto id = service_.register_node(to_node_spec(req));
            if (!id) return id.error();
            return RpcResponse{RegisterNodeResponse{.node_id = *id}};
        },
        [this](const HeartbeatRequest& req) -> Result<RpcResponse> {
            std::optional<Resources> free;
            if (req.has_free_capacity) {
                free = Resources{
                    .cpu_cores = req.free_cpu_cores,
                    .memory_mb = gb_to_mb(req.free_memory_gb),
                    .gpu_count = req.free_gpu_count,
                };
            }
            auto result = service_.heartbeat(req.node_id, free);
            if (!result) return result.error();
            return RpcResponse{HeartbeatResponse{}};
        },
        [this](const ReportJobResultRequest& req) -> Result<RpcResponse> {
            if (req.outcome > static_cast<uint8_t>(ExecutorEvent::Failed)) {
                return Error{ErrorCode::InvalidArgument,
                             "unknown outcome " + std::to_string(req.outcome)};
            }
            ExecutorMessage message{
                .job_id = req.job_id,
                .node_id = req.node_id,
                .event = static_cast<ExecutorEvent>(req.outcome),
                .exit_code = req.exit_code,
            };
            if (message.event == ExecutorEvent::Failed) {
                message.error = req.message;
            } else {
                message.output = req.message;
            }
            auto result = service_.report_node_result(message);
            if (!result) return result.error();
            return RpcResponse{ReportJobResultResponse{}};
        },
    }, request);
}

}  // namespace tco_scheduler
