/**
 * @file metrics_collector.hpp
 * @brief Structured scheduling events, one NDJSON object per event.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/optimizer.hpp"

#include <memory>
#include <mutex>

namespace tco_scheduler {

/**
 * @brief Running totals kept alongside the event stream.
 */
struct MetricsTotals {
    uint64_t placements{0};
    uint64_t infeasible{0};
    uint64_t requeues{0};
    uint64_t evictions{0};
    uint64_t completed{0};
    uint64_t failed{0};
    double committed_usd{0.0};               ///< Sum of placed total_usd
};

/**
 * @brief Collects and emits structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_placement(const Placement& placement, uint32_t attempt);
    void record_infeasible(const JobId& job_id, const Infeasible& infeasible);
    void record_job_state(const JobId& job_id, JobStatus status, FailureReason reason);
    void record_requeue(const JobId& job_id, const NodeId& from_node);
    void record_node_event(const NodeId& node_id, std::string_view event_type);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] MetricsTotals totals() const;

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    MetricsTotals totals_;
};

}  // namespace tco_scheduler
