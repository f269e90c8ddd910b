/**
 * @file types.hpp
 * @brief Fundamental types used throughout the TCO scheduler.
 *
 * Defines NodeId, JobId, Resources, and the lifecycle enumerations shared by
 * the registry, optimizer and job table. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace tco_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using JobId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

/**
 * @brief A quantity of schedulable capacity.
 *
 * Integer units keep reserve/release arithmetic exact: CPU cores, memory in
 * megabytes, whole GPU devices. Used both for a node's declared capacity and
 * for a job's request.
 */
struct Resources {
    uint32_t cpu_cores{0};
    uint64_t memory_mb{0};
    uint32_t gpu_count{0};

    auto operator<=>(const Resources&) const = default;

    /// True if every dimension of *this is <= the same dimension of other.
    [[nodiscard]] constexpr bool fits_within(const Resources& other) const noexcept {
        return cpu_cores <= other.cpu_cores
            && memory_mb <= other.memory_mb
            && gpu_count <= other.gpu_count;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return cpu_cores == 0 && memory_mb == 0 && gpu_count == 0;
    }

    constexpr Resources& operator+=(const Resources& rhs) noexcept {
        cpu_cores += rhs.cpu_cores;
        memory_mb += rhs.memory_mb;
        gpu_count += rhs.gpu_count;
        return *this;
    }

    /// Caller guarantees rhs.fits_within(*this).
    constexpr Resources& operator-=(const Resources& rhs) noexcept {
        cpu_cores -= rhs.cpu_cores;
        memory_mb -= rhs.memory_mb;
        gpu_count -= rhs.gpu_count;
        return *this;
    }
};

[[nodiscard]] constexpr Resources operator+(Resources lhs, const Resources& rhs) noexcept {
    lhs += rhs;
    return lhs;
}

[[nodiscard]] constexpr Resources operator-(Resources lhs, const Resources& rhs) noexcept {
    lhs -= rhs;
    return lhs;
}

/// Wire and config quantities use GB; internal accounting uses whole MB (rounded up).
[[nodiscard]] uint64_t gb_to_mb(double gb) noexcept;
[[nodiscard]] constexpr double mb_to_gb(uint64_t mb) noexcept {
    return static_cast<double>(mb) / 1024.0;
}

[[nodiscard]] std::string to_string(const Resources& r);

// ─────────────────────────────────────────────
// Node Liveness
// ─────────────────────────────────────────────

enum class NodeLiveness : uint8_t {
    Active,        ///< Heartbeating; eligible for placement
    Suspected,     ///< Heartbeat overdue; not eligible for new placements
    Evicted        ///< Heartbeat timed out; reservations revoked
};

[[nodiscard]] constexpr std::string_view to_string(NodeLiveness liveness) noexcept {
    switch (liveness) {
        case NodeLiveness::Active:    return "active";
        case NodeLiveness::Suspected: return "suspected";
        case NodeLiveness::Evicted:   return "evicted";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Job Status
// ─────────────────────────────────────────────

enum class JobStatus : uint8_t {
    Pending,       ///< Awaiting a placement pass
    Scheduled,     ///< Node reserved, handed to the executor
    Running,       ///< Executor reported start
    Completed,     ///< Finished successfully
    Failed         ///< Terminal failure (see FailureReason)
};

[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Scheduled: return "scheduled";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

enum class FailureReason : uint8_t {
    None,
    Infeasible,        ///< No placement at submission
    NodeLost,          ///< Node evicted and re-placement impossible
    ExecutionFailed,   ///< Executor reported failure
    ResultTimeout,     ///< No executor report within the result window
    DispatchFailed     ///< Executor refused the job
};

[[nodiscard]] constexpr std::string_view to_string(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::None:            return "none";
        case FailureReason::Infeasible:      return "infeasible";
        case FailureReason::NodeLost:        return "node_lost";
        case FailureReason::ExecutionFailed: return "execution_failed";
        case FailureReason::ResultTimeout:   return "result_timeout";
        case FailureReason::DispatchFailed:  return "dispatch_failed";
    }
    return "unknown";
}

enum class InfeasibleReason : uint8_t {
    NoCapacity,
    SlaUnreachable,
    OverBudget
};

[[nodiscard]] constexpr std::string_view to_string(InfeasibleReason reason) noexcept {
    switch (reason) {
        case InfeasibleReason::NoCapacity:     return "no_capacity";
        case InfeasibleReason::SlaUnreachable: return "sla_unreachable";
        case InfeasibleReason::OverBudget:     return "over_budget";
    }
    return "unknown";
}

}  // namespace tco_scheduler
