/**
 * @file cluster_registry.hpp
 * @brief Authoritative, thread-safe registry of cluster nodes and their
 *        capacity reservations.
 *
 * The registry is the only shared mutable cluster state. Every mutation takes
 * the exclusive lock, so reserve / release / heartbeat / evict_stale on the
 * same node are linearizable; snapshot() takes the shared lock and therefore
 * never observes a half-updated node.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tco_scheduler {

// ─────────────────────────────────────────────
// Node records
// ─────────────────────────────────────────────

/**
 * @brief Declared attributes of a node. Pricing differences between
 *        on-premise and elastic nodes are plain data.
 */
struct NodeSpec {
    NodeId id;
    std::string location;
    Resources capacity;
    double price_per_hour{0.0};              ///< USD / hour
    double transfer_price_per_gb{0.0};       ///< USD / GB moved to this node
    double opportunity_cost_per_hour{0.0};   ///< USD / hour of idle capacity
    bool on_premise{false};
    uint32_t base_latency_ms{0};             ///< 0 = latency model default
};

/**
 * @brief Registry view of one node at a point in time.
 */
struct NodeState {
    NodeSpec spec;
    Resources reserved;
    std::optional<Resources> reported_free;  ///< Last value sent by the node
    SteadyTime last_heartbeat;
    NodeLiveness liveness{NodeLiveness::Active};
    uint64_t epoch{0};                       ///< Bumped whenever reservations are revoked
    size_t reservation_count{0};

    [[nodiscard]] Resources free() const noexcept { return spec.capacity - reserved; }

    /// Max over dimensions of reserved / capacity, in [0, 1].
    [[nodiscard]] double utilization() const noexcept;
};

/**
 * @brief Immutable copy of every node, ordered by node id.
 */
struct ClusterSnapshot {
    std::vector<NodeState> nodes;
    SteadyTime taken_at;

    [[nodiscard]] const NodeState* find(const NodeId& id) const noexcept;
    [[nodiscard]] size_t active_count() const noexcept;
};

/**
 * @brief Proof of a successful reserve(); handed back to release().
 */
struct AssignmentToken {
    NodeId node_id;
    uint64_t reservation_id{0};
    uint64_t epoch{0};
    Resources reserved;

    bool operator==(const AssignmentToken&) const = default;
};

// ─────────────────────────────────────────────
// ClusterRegistry
// ─────────────────────────────────────────────

class ClusterRegistry {
public:
    /**
     * @brief Register or refresh a node.
     *
     * Idempotent by id: re-registration replaces the declared attributes and
     * refreshes the heartbeat but keeps live reservations. An Evicted node is
     * revived as Active. Shrinking capacity below what is currently reserved
     * fails with CapacityExceeded.
     */
    Result<NodeId> register_node(const NodeSpec& spec,
                                 SteadyTime now = std::chrono::steady_clock::now());

    /**
     * @brief Record a heartbeat. Fails with UnknownNode for unregistered ids.
     *
     * A Suspected node becomes Active again; an Evicted node is revived with
     * a fresh epoch and no reservations.
     */
    Result<void> heartbeat(const NodeId& id,
                           std::optional<Resources> reported_free = std::nullopt,
                           SteadyTime now = std::chrono::steady_clock::now());

    [[nodiscard]] ClusterSnapshot snapshot() const;

    /**
     * @brief Atomically reserve capacity on a node.
     *
     * Succeeds iff the node is Active and reserved + request <= capacity in
     * every dimension. On failure nothing is mutated.
     */
    Result<AssignmentToken> reserve(const NodeId& id, const Resources& request);

    /**
     * @brief Return a reservation.
     *
     * @return false if the reservation was already revoked by eviction.
     * @throws std::logic_error on bookkeeping violations: unknown node,
     *         unknown reservation in the current epoch, or underflow.
     */
    bool release(const AssignmentToken& token);

    /// True while the reservation behind @p token is still live.
    [[nodiscard]] bool holds(const AssignmentToken& token) const;

    /**
     * @brief Evict nodes whose heartbeat is older than @p timeout.
     *
     * Evicted nodes lose all reservations. Nodes older than half the timeout
     * are marked Suspected. Returns the ids evicted by this call.
     */
    std::vector<NodeId> evict_stale(Millis timeout,
                                    SteadyTime now = std::chrono::steady_clock::now());

    [[nodiscard]] std::optional<NodeState> get_node(const NodeId& id) const;
    [[nodiscard]] size_t node_count() const;
    [[nodiscard]] size_t active_node_count() const;

private:
    struct Entry {
        NodeState state;
        std::unordered_map<uint64_t, Resources> reservations;
    };

    static void revoke_all(Entry& entry);

    mutable std::shared_mutex mutex_;
    std::map<NodeId, Entry> nodes_;
    uint64_t next_reservation_id_{1};
};

/// Validate declared attributes before they enter the registry.
Result<void> validate_node_spec(const NodeSpec& spec);

}  // namespace tco_scheduler
