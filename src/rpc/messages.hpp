/**
 * @file messages.hpp
 * @brief Request and response messages of the scheduler RPC protocol.
 *
 * Quantities follow the wire conventions of the test client: memory in GB,
 * money in USD, times in milliseconds since the Unix epoch (0 = unset).
 */

#pragma once

#include "cost/cost_engine.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tco_scheduler {

enum class MessageType : uint8_t {
    SubmitJob       = 1,
    GetJobStatus    = 2,
    GetJobCost      = 3,
    ClusterStatus   = 4,
    ListNodes       = 5,
    RegisterNode    = 6,
    Heartbeat       = 7,
    ReportJobResult = 8
};

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::SubmitJob:       return "SubmitJob";
        case MessageType::GetJobStatus:    return "GetJobStatus";
        case MessageType::GetJobCost:      return "GetJobCost";
        case MessageType::ClusterStatus:   return "ClusterStatus";
        case MessageType::ListNodes:       return "ListNodes";
        case MessageType::RegisterNode:    return "RegisterNode";
        case MessageType::Heartbeat:       return "Heartbeat";
        case MessageType::ReportJobResult: return "ReportJobResult";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

struct SubmitJobRequest {
    JobId job_id;
    uint32_t cpu_cores{0};
    double memory_gb{0.0};
    uint32_t gpu_count{0};
    double budget_usd{0.0};                  ///< 0 = no budget ceiling
    uint64_t max_latency_ms{1000};
    double estimated_duration_hours{1.0};
    double estimated_data_gb{0.0};
    int64_t deadline_ms{0};                  ///< 0 = no deadline
    std::string preferred_location;          ///< empty = no preference
    std::string image;
    std::vector<std::string> command;
};

struct JobStatusRequest {
    JobId job_id;
};

struct JobCostRequest {
    JobId job_id;
};

struct ClusterStatusRequest {};

struct ListNodesRequest {};

struct RegisterNodeRequest {
    NodeId node_id;
    std::string location;
    uint32_t cpu_cores{0};
    double memory_gb{0.0};
    uint32_t gpu_count{0};
    double cost_per_hour_usd{0.0};
    double transfer_price_per_gb{0.0};
    double opportunity_cost_per_hour{0.0};
    bool on_premise{false};
    uint32_t base_latency_ms{0};
};

struct HeartbeatRequest {
    NodeId node_id;
    bool has_free_capacity{false};
    uint32_t free_cpu_cores{0};
    double free_memory_gb{0.0};
    uint32_t free_gpu_count{0};
};

struct ReportJobResultRequest {
    JobId job_id;
    NodeId node_id;
    uint8_t outcome{0};                      ///< ExecutorEvent value
    int32_t exit_code{0};
    std::string message;                     ///< Output on success, error otherwise
};

using RpcRequest = std::variant<SubmitJobRequest,
                                JobStatusRequest,
                                JobCostRequest,
                                ClusterStatusRequest,
                                ListNodesRequest,
                                RegisterNodeRequest,
                                HeartbeatRequest,
                                ReportJobResultRequest>;

// ─────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────

struct SubmitJobResponse {
    JobId job_id;
    bool placed{false};
    NodeId assigned_node;
    std::string infeasible_reason;           ///< to_string(InfeasibleReason); empty if placed
    std::string message;
    CostBreakdown cost;
    uint64_t estimated_latency_ms{0};
};

struct JobStatusResponse {
    JobId job_id;
    std::string status;                      ///< to_string(JobStatus)
    NodeId assigned_node;                    ///< empty if never placed
    int64_t submitted_at_ms{0};
    int64_t started_at_ms{0};
    int64_t ended_at_ms{0};
    std::string failure_reason;              ///< empty if none
    std::string failure_detail;
    uint32_t requeue_count{0};
};

struct JobCostResponse {
    JobId job_id;
    CostBreakdown cost;
};

struct ClusterStatusResponse {
    std::string cluster_id;
    uint64_t total_nodes{0};
    uint64_t active_nodes{0};
    uint64_t total_jobs{0};
    uint64_t running_jobs{0};
};

struct NodeInfo {
    NodeId node_id;
    std::string location;
    uint32_t cpu_cores{0};
    double memory_gb{0.0};
    uint32_t gpu_count{0};
    double cost_per_hour_usd{0.0};
    std::string status;                      ///< to_string(NodeLiveness)
    uint32_t free_cpu_cores{0};
    double free_memory_gb{0.0};
    bool on_premise{false};
};

struct ListNodesResponse {
    std::vector<NodeInfo> nodes;
};

struct RegisterNodeResponse {
    NodeId node_id;
};

struct HeartbeatResponse {};

struct ReportJobResultResponse {};

using RpcResponse = std::variant<SubmitJobResponse,
                                 JobStatusResponse,
                                 JobCostResponse,
                                 ClusterStatusResponse,
                                 ListNodesResponse,
                                 RegisterNodeResponse,
                                 HeartbeatResponse,
                                 ReportJobResultResponse>;

/// Message type carried by a request or response alternative.
[[nodiscard]] MessageType message_type(const RpcRequest& request) noexcept;
[[nodiscard]] MessageType message_type(const RpcResponse& response) noexcept;

}  // namespace tco_scheduler
