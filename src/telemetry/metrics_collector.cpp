/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace tco_scheduler {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_placement(const Placement& placement, uint32_t attempt) {
    std::ostringstream oss;
    oss << R"({"event":"placement")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"job":")" << json_escape(placement.job_id) << "\""
        << R"(,"node":")" << json_escape(placement.node_id) << "\""
        << R"(,"attempt":)" << attempt
        << R"(,"latency_ms":)" << placement.estimated_latency_ms
        << R"(,"compute_usd":)" << placement.cost.compute_usd
        << R"(,"transfer_usd":)" << placement.cost.data_transfer_usd
        << R"(,"idle_usd":)" << placement.cost.idle_opportunity_usd
        << R"(,"total_usd":)" << placement.cost.total_usd
        << "}";
    {
        std::lock_guard lock(write_mutex_);
        ++totals_.placements;
        totals_.committed_usd += placement.cost.total_usd;
    }
    emit(oss.str());
}

void MetricsCollector::record_infeasible(const JobId& job_id, const Infeasible& infeasible) {
    std::ostringstream oss;
    oss << R"({"event":"infeasible")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"job":")" << json_escape(job_id) << "\""
        << R"(,"reason":")" << to_string(infeasible.reason) << "\""
        << R"(,"detail":")" << json_escape(infeasible.detail) << "\""
        << "}";
    {
        std::lock_guard lock(write_mutex_);
        ++totals_.infeasible;
    }
    emit(oss.str());
}

void MetricsCollector::record_job_state(const JobId& job_id, JobStatus status,
                                        FailureReason reason) {
    std::ostringstream oss;
    oss << R"({"event":"job_state_change")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"job":")" << json_escape(job_id) << "\""
        << R"(,"state":")" << to_string(status) << "\"";
    if (reason != FailureReason::None) {
        oss << R"(,"reason":")" << to_string(reason) << "\"";
    }
    oss << "}";
    {
        std::lock_guard lock(write_mutex_);
        if (status == JobStatus::Completed) ++totals_.completed;
        if (status == JobStatus::Failed) ++totals_.failed;
    }
    emit(oss.str());
}

void MetricsCollector::record_requeue(const JobId& job_id, const NodeId& from_node) {
    std::ostringstream oss;
    oss << R"({"event":"requeue")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"job":")" << json_escape(job_id) << "\""
        << R"(,"from_node":")" << json_escape(from_node) << "\""
        << "}";
    {
        std::lock_guard lock(write_mutex_);
        ++totals_.requeues;
    }
    emit(oss.str());
}

void MetricsCollector::record_node_event(const NodeId& node_id, std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"node_)" << event_type << "\""
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"node":")" << json_escape(node_id) << "\""
        << "}";
    if (event_type == "evicted") {
        std::lock_guard lock(write_mutex_);
        ++totals_.evictions;
    }
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

MetricsTotals MetricsCollector::totals() const {
    std::lock_guard lock(write_mutex_);
    return totals_;
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace tco_scheduler
