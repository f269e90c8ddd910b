/**
 * @file rpc_codec.cpp
 * @brief RpcCodec binary serialization for scheduler messages.
 */

#include "rpc/rpc_codec.hpp"

#include <bit>

namespace tco_scheduler {

// ─────────────────────────────────────────────
// WireWriter / WireReader
// ─────────────────────────────────────────────

void WireWriter::put_u32(uint32_t val) {
    buf_.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf_.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf_.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf_.push_back(static_cast<uint8_t>(val & 0xFF));
}

void WireWriter::put_u64(uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf_.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void WireWriter::put_f64(double val) {
    put_u64(std::bit_cast<uint64_t>(val));
}

void WireWriter::put_string(const std::string& val) {
    put_u32(static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void WireWriter::put_strings(const std::vector<std::string>& vals) {
    put_u32(static_cast<uint32_t>(vals.size()));
    for (const auto& v : vals) put_string(v);
}

bool WireReader::need(size_t n) {
    if (!ok_ || data_.size() - offset_ < n) {
        ok_ = false;
        return false;
    }
    return true;
}

uint8_t WireReader::get_u8() {
    if (!need(1)) return 0;
    return data_[offset_++];
}

uint32_t WireReader::get_u32() {
    if (!need(4)) return 0;
    const uint8_t* p = data_.data() + offset_;
    offset_ += 4;
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

uint64_t WireReader::get_u64() {
    if (!need(8)) return 0;
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | data_[offset_ + static_cast<size_t>(i)];
    }
    offset_ += 8;
    return val;
}

double WireReader::get_f64() {
    return std::bit_cast<double>(get_u64());
}

bool WireReader::get_bool() {
    auto byte = get_u8();
    if (byte > 1) ok_ = false;
    return byte == 1;
}

std::string WireReader::get_string() {
    auto len = get_u32();
    if (!need(len)) return {};
    std::string out(reinterpret_cast<const char*>(data_.data() + offset_), len);
    offset_ += len;
    return out;
}

std::vector<std::string> WireReader::get_strings() {
    auto count = get_u32();
    std::vector<std::string> out;
    // Each string costs at least its 4-byte length prefix.
    if (!ok_ || count > remaining() / 4) {
        ok_ = false;
        return out;
    }
    out.reserve(count);
    for (uint32_t i = 0; i < count && ok_; ++i) {
        out.push_back(get_string());
    }
    return out;
}

namespace {

// ─────────────────────────────────────────────
// Bodies
// ─────────────────────────────────────────────

void write_cost(WireWriter& w, const CostBreakdown& c) {
    w.put_f64(c.compute_usd);
    w.put_f64(c.data_transfer_usd);
    w.put_f64(c.idle_opportunity_usd);
    w.put_f64(c.total_usd);
}

void read_cost(WireReader& r, CostBreakdown& c) {
    c.compute_usd = r.get_f64();
    c.data_transfer_usd = r.get_f64();
    c.idle_opportunity_usd = r.get_f64();
    c.total_usd = r.get_f64();
}

void write_body(WireWriter& w, const SubmitJobRequest& m) {
    w.put_string(m.job_id);
    w.put_u32(m.cpu_cores);
    w.put_f64(m.memory_gb);
    w.put_u32(m.gpu_count);
    w.put_f64(m.budget_usd);
    w.put_u64(m.max_latency_ms);
    w.put_f64(m.estimated_duration_hours);
    w.put_f64(m.estimated_data_gb);
    w.put_i64(m.deadline_ms);
    w.put_string(m.preferred_location);
    w.put_string(m.image);
    w.put_strings(m.command);
}

void read_body(WireReader& r, SubmitJobRequest& m) {
    m.job_id = r.get_string();
    m.cpu_cores = r.get_u32();
    m.memory_gb = r.get_f64();
    m.gpu_count = r.get_u32();
    m.budget_usd = r.get_f64();
    m.max_latency_ms = r.get_u64();
    m.estimated_duration_hours = r.get_f64();
    m.estimated_data_gb = r.get_f64();
    m.deadline_ms = r.get_i64();
    m.preferred_location = r.get_string();
    m.image = r.get_string();
    m.command = r.get_strings();
}

void write_body(WireWriter& w, const JobStatusRequest& m) { w.put_string(m.job_id); }
void read_body(WireReader& r, JobStatusRequest& m) { m.job_id = r.get_string(); }

void write_body(WireWriter& w, const JobCostRequest& m) { w.put_string(m.job_id); }
void read_body(WireReader& r, JobCostRequest& m) { m.job_id = r.get_string(); }

void write_body(WireWriter&, const ClusterStatusRequest&) {}
void read_body(WireReader&, ClusterStatusRequest&) {}

void write_body(WireWriter&, const ListNodesRequest&) {}
void read_body(WireReader&, ListNodesRequest&) {}

void write_body(WireWriter& w, const RegisterNodeRequest& m) {
    w.put_string(m.node_id);
    w.put_string(m.location);
    w.put_u32(m.cpu_cores);
    w.put_f64(m.memory_gb);
    w.put_u32(m.gpu_count);
    w.put_f64(m.cost_per_hour_usd);
    w.put_f64(m.transfer_price_per_gb);
    w.put_f64(m.opportunity_cost_per_hour);
    w.put_bool(m.on_premise);
    w.put_u32(m.base_latency_ms);
}

void read_body(WireReader& r, RegisterNodeRequest& m) {
    m.node_id = r.get_string();
    m.location = r.get_string();
    m.cpu_cores = r.get_u32();
    m.memory_gb = r.get_f64();
    m.gpu_count = r.get_u32();
    m.cost_per_hour_usd = r.get_f64();
    m.transfer_price_per_gb = r.get_f64();
    m.opportunity_cost_per_hour = r.get_f64();
    m.on_premise = r.get_bool();
    m.base_latency_ms = r.get_u32();
}

void write_body(WireWriter& w, const HeartbeatRequest& m) {
    w.put_string(m.node_id);
    w.put_bool(m.has_free_capacity);
    w.put_u32(m.free_cpu_cores);
    w.put_f64(m.free_memory_gb);
    w.put_u32(m.free_gpu_count);
}

void read_body(WireReader& r, HeartbeatRequest& m) {
    m.node_id = r.get_string();
    m.has_free_capacity = r.get_bool();
    m.free_cpu_cores = r.get_u32();
    m.free_memory_gb = r.get_f64();
    m.free_gpu_count = r.get_u32();
}

void write_body(WireWriter& w, const ReportJobResultRequest& m) {
    w.put_string(m.job_id);
    w.put_string(m.node_id);
    w.put_u8(m.outcome);
    w.put_i32(m.exit_code);
    w.put_string(m.message);
}

void read_body(WireReader& r, ReportJobResultRequest& m) {
    m.job_id = r.get_string();
    m.node_id = r.get_string();
    m.outcome = r.get_u8();
    m.exit_code = r.get_i32();
    m.message = r.get_string();
}

void write_body(WireWriter& w, const SubmitJobResponse& m) {
    w.put_string(m.job_id);
    w.put_bool(m.placed);
    w.put_string(m.assigned_node);
    w.put_string(m.infeasible_reason);
    w.put_string(m.message);
    write_cost(w, m.cost);
    w.put_u64(m.estimated_latency_ms);
}

void read_body(WireReader& r, SubmitJobResponse& m) {
    m.job_id = r.get_string();
    m.placed = r.get_bool();
    m.assigned_node = r.get_string();
    m.infeasible_reason = r.get_string();
    m.message = r.get_string();
    read_cost(r, m.cost);
    m.estimated_latency_ms = r.get_u64();
}

void write_body(WireWriter& w, const JobStatusResponse& m) {
    w.put_string(m.job_id);
    w.put_string(m.status);
    w.put_string(m.assigned_node);
    w.put_i64(m.submitted_at_ms);
    w.put_i64(m.started_at_ms);
    w.put_i64(m.ended_at_ms);
    w.put_string(m.failure_reason);
    w.put_string(m.failure_detail);
    w.put_u32(m.requeue_count);
}

void read_body(WireReader& r, JobStatusResponse& m) {
    m.job_id = r.get_string();
    m.status = r.get_string();
    m.assigned_node = r.get_string();
    m.submitted_at_ms = r.get_i64();
    m.started_at_ms = r.get_i64();
    m.ended_at_ms = r.get_i64();
    m.failure_reason = r.get_string();
    m.failure_detail = r.get_string();
    m.requeue_count = r.get_u32();
}

void write_body(WireWriter& w, const JobCostResponse& m) {
    w.put_string(m.job_id);
    write_cost(w, m.cost);
}

void read_body(WireReader& r, JobCostResponse& m) {
    m.job_id = r.get_string();
    read_cost(r, m.cost);
}

void write_body(WireWriter& w, const ClusterStatusResponse& m) {
    w.put_string(m.cluster_id);
    w.put_u64(m.total_nodes);
    w.put_u64(m.active_nodes);
    w.put_u64(m.total_jobs);
    w.put_u64(m.running_jobs);
}

void read_body(WireReader& r, ClusterStatusResponse& m) {
    m.cluster_id = r.get_string();
    m.total_nodes = r.get_u64();
    m.active_nodes = r.get_u64();
    m.total_jobs = r.get_u64();
    m.running_jobs = r.get_u64();
}

void write_body(WireWriter& w, const ListNodesResponse& m) {
    w.put_u32(static_cast<uint32_t>(m.nodes.size()));
    for (const auto& n : m.nodes) {
        w.put_string(n.node_id);
        w.put_string(n.location);
        w.put_u32(n.cpu_cores);
        w.put_f64(n.memory_gb);
        w.put_u32(n.gpu_count);
        w.put_f64(n.cost_per_hour_usd);
        w.put_string(n.status);
        w.put_u32(n.free_cpu_cores);
        w.put_f64(n.free_memory_gb);
        w.put_bool(n.on_premise);
    }
}

void read_body(WireReader& r, ListNodesResponse& m) {
    auto count = r.get_u32();
    // Smallest encoded node: two empty strings plus fixed fields.
    constexpr size_t MIN_NODE_SIZE = 4 + 4 + 4 + 8 + 4 + 8 + 4 + 4 + 8 + 1;
    if (!r.ok() || count > r.remaining() / MIN_NODE_SIZE) {
        r.fail();
        return;
    }
    m.nodes.reserve(count);
    for (uint32_t i = 0; i < count && r.ok(); ++i) {
        NodeInfo n;
        n.node_id = r.get_string();
        n.location = r.get_string();
        n.cpu_cores = r.get_u32();
        n.memory_gb = r.get_f64();
        n.gpu_count = r.get_u32();
        n.cost_per_hour_usd = r.get_f64();
        n.status = r.get_string();
        n.free_cpu_cores = r.get_u32();
        n.free_memory_gb = r.get_f64();
        n.on_premise = r.get_bool();
        m.nodes.push_back(std::move(n));
    }
}

void write_body(WireWriter& w, const RegisterNodeResponse& m) { w.put_string(m.node_id); }
void read_body(WireReader& r, RegisterNodeResponse& m) { m.node_id = r.get_string(); }

void write_body(WireWriter&, const HeartbeatResponse&) {}
void read_body(WireReader&, HeartbeatResponse&) {}

void write_body(WireWriter&, const ReportJobResultResponse&) {}
void read_body(WireReader&, ReportJobResultResponse&) {}

template <typename Msg, typename Variant>
Result<Variant> decode_body(WireReader& r, MessageType type) {
    Msg msg;
    read_body(r, msg);
    if (!r.ok()) {
        return Error{ErrorCode::Protocol,
                     "truncated " + std::string{to_string(type)} + " message"};
    }
    if (!r.at_end()) {
        return Error{ErrorCode::Protocol,
                     std::to_string(r.remaining()) + " trailing bytes after "
                     + std::string{to_string(type)} + " message"};
    }
    return Variant{std::move(msg)};
}

bool valid_type(uint8_t raw) noexcept {
    return raw >= static_cast<uint8_t>(MessageType::SubmitJob)
        && raw <= static_cast<uint8_t>(MessageType::ReportJobResult);
}

}  // namespace

// ─────────────────────────────────────────────
// Envelope
// ─────────────────────────────────────────────

MessageType message_type(const RpcRequest& request) noexcept {
    return static_cast<MessageType>(request.index() + 1);
}

MessageType message_type(const RpcResponse& response) noexcept {
    return static_cast<MessageType>(response.index() + 1);
}

std::vector<uint8_t> RpcCodec::encode_request(const RpcRequest& request) {
    WireWriter w;
    w.put_u8(static_cast<uint8_t>(message_type(request)));
    std::visit([&w](const auto& msg) { write_body(w, msg); }, request);
    return std::move(w.bytes());
}

Result<RpcRequest> RpcCodec::decode_request(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return Error{ErrorCode::Protocol, "empty request"};
    }
    if (!valid_type(data[0])) {
        return Error{ErrorCode::Protocol,
                     "unknown message type " + std::to_string(data[0])};
    }

    auto type = static_cast<MessageType>(data[0]);
    WireReader r(data, 1);
    switch (type) {
        case MessageType::SubmitJob:
            return decode_body<SubmitJobRequest, RpcRequest>(r, type);
        case MessageType::GetJobStatus:
            return decode_body<JobStatusRequest, RpcRequest>(r, type);
        case MessageType::GetJobCost:
            return decode_body<JobCostRequest, RpcRequest>(r, type);
        case MessageType::ClusterStatus:
            return decode_body<ClusterStatusRequest, RpcRequest>(r, type);
        case MessageType::ListNodes:
            return decode_body<ListNodesRequest, RpcRequest>(r, type);
        case MessageType::RegisterNode:
            return decode_body<RegisterNodeRequest, RpcRequest>(r, type);
        case MessageType::Heartbeat:
            return decode_body<HeartbeatRequest, RpcRequest>(r, type);
        case MessageType::ReportJobResult:
            return decode_body<ReportJobResultRequest, RpcRequest>(r, type);
    }
    return Error{ErrorCode::Protocol, "unknown message type"};
}

std::vector<uint8_t> RpcCodec::encode_response(const RpcResponse& response) {
    WireWriter w;
    w.put_u8(static_cast<uint8_t>(message_type(response)));
    w.put_u8(STATUS_OK);
    std::visit([&w](const auto& msg) { write_body(w, msg); }, response);
    return std::move(w.bytes());
}

std::vector<uint8_t> RpcCodec::encode_error(MessageType type, const Error& error) {
    WireWriter w;
    w.put_u8(static_cast<uint8_t>(type));
    w.put_u8(STATUS_ERROR);
    w.put_u8(static_cast<uint8_t>(error.code));
    w.put_string(error.message);
    return std::move(w.bytes());
}

Result<RpcResponse> RpcCodec::decode_response(const std::vector<uint8_t>& data) {
    if (data.size() < 2) {
        return Error{ErrorCode::Protocol, "response shorter than envelope"};
    }
    if (!valid_type(data[0])) {
        return Error{ErrorCode::Protocol,
                     "unknown message type " + std::to_string(data[0])};
    }

    auto type = static_cast<MessageType>(data[0]);
    WireReader r(data, 2);

    if (data[1] == STATUS_ERROR) {
        auto raw_code = r.get_u8();
        auto message = r.get_string();
        if (!r.ok() || raw_code > static_cast<uint8_t>(ErrorCode::Config)) {
            return Error{ErrorCode::Protocol, "malformed error response"};
        }
        return Error{static_cast<ErrorCode>(raw_code), std::move(message)};
    }
    if (data[1] != STATUS_OK) {
        return Error{ErrorCode::Protocol, "unknown status byte " + std::to_string(data[1])};
    }

    switch (type) {
        case MessageType::SubmitJob:
            return decode_body<SubmitJobResponse, RpcResponse>(r, type);
        case MessageType::GetJobStatus:
            return decode_body<JobStatusResponse, RpcResponse>(r, type);
        case MessageType::GetJobCost:
            return decode_body<JobCostResponse, RpcResponse>(r, type);
        case MessageType::ClusterStatus:
            return decode_body<ClusterStatusResponse, RpcResponse>(r, type);
        case MessageType::ListNodes:
            return decode_body<ListNodesResponse, RpcResponse>(r, type);
        case MessageType::RegisterNode:
            return decode_body<RegisterNodeResponse, RpcResponse>(r, type);
        case MessageType::Heartbeat:
            return decode_body<HeartbeatResponse, RpcResponse>(r, type);
        case MessageType::ReportJobResult:
            return decode_body<ReportJobResultResponse, RpcResponse>(r, type);
    }
    return Error{ErrorCode::Protocol, "unknown message type"};
}

}  // namespace tco_scheduler
