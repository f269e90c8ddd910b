/**
 * @file cluster_registry.cpp
 * @brief ClusterRegistry implementation.
 */

#include "cluster/cluster_registry.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace tco_scheduler {

namespace {

double ratio(uint64_t used, uint64_t total) {
    if (total == 0) return 0.0;
    return static_cast<double>(used) / static_cast<double>(total);
}

bool is_valid_price(double v) {
    return std::isfinite(v) && v >= 0.0;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// NodeState / ClusterSnapshot
// ─────────────────────────────────────────────

double NodeState::utilization() const noexcept {
    double u = std::max({ratio(reserved.cpu_cores, spec.capacity.cpu_cores),
                         ratio(reserved.memory_mb, spec.capacity.memory_mb),
                         ratio(reserved.gpu_count, spec.capacity.gpu_count)});
    return std::clamp(u, 0.0, 1.0);
}

const NodeState* ClusterSnapshot::find(const NodeId& id) const noexcept {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const NodeState& n) { return n.spec.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

size_t ClusterSnapshot::active_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(nodes.begin(), nodes.end(),
                      [](const NodeState& n) { return n.liveness == NodeLiveness::Active; }));
}

Result<void> validate_node_spec(const NodeSpec& spec) {
    if (spec.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "node id must not be empty"};
    }
    if (spec.capacity.cpu_cores == 0 || spec.capacity.memory_mb == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "node " + spec.id + " must declare non-zero CPU and memory capacity"};
    }
    if (!is_valid_price(spec.price_per_hour)
        || !is_valid_price(spec.transfer_price_per_gb)
        || !is_valid_price(spec.opportunity_cost_per_hour)) {
        return Error{ErrorCode::InvalidArgument,
                     "node " + spec.id + " prices must be non-negative finite numbers"};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Registration / Heartbeat
// ─────────────────────────────────────────────

Result<NodeId> ClusterRegistry::register_node(const NodeSpec& spec, SteadyTime now) {
    if (auto valid = validate_node_spec(spec); !valid) {
        return valid.error();
    }

    std::unique_lock lock(mutex_);
    auto it = nodes_.find(spec.id);
    if (it == nodes_.end()) {
        Entry entry;
        entry.state.spec = spec;
        entry.state.last_heartbeat = now;
        entry.state.liveness = NodeLiveness::Active;
        nodes_.emplace(spec.id, std::move(entry));
        return spec.id;
    }

    auto& state = it->second.state;
    if (!state.reserved.fits_within(spec.capacity)) {
        return Error{ErrorCode::CapacityExceeded,
                     "node " + spec.id + " re-registered with capacity below current reservations ("
                     + to_string(state.reserved) + ")"};
    }

    state.spec = spec;
    state.last_heartbeat = now;
    if (state.liveness != NodeLiveness::Active) {
        // Evicted nodes already had their reservations revoked.
        state.liveness = NodeLiveness::Active;
    }
    return spec.id;
}

Result<void> ClusterRegistry::heartbeat(const NodeId& id,
                                        std::optional<Resources> reported_free,
                                        SteadyTime now) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownNode, "heartbeat from unregistered node " + id};
    }

    auto& state = it->second.state;
    state.last_heartbeat = now;
    state.liveness = NodeLiveness::Active;
    if (reported_free) {
        state.reported_free = *reported_free;
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────

ClusterSnapshot ClusterRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    ClusterSnapshot snap;
    snap.taken_at = std::chrono::steady_clock::now();
    snap.nodes.reserve(nodes_.size());
    for (const auto& [id, entry] : nodes_) {
        snap.nodes.push_back(entry.state);
    }
    return snap;
}

// ─────────────────────────────────────────────
// Reserve / Release
// ─────────────────────────────────────────────

Result<AssignmentToken> ClusterRegistry::reserve(const NodeId& id, const Resources& request) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::UnknownNode, "reserve on unregistered node " + id};
    }

    auto& entry = it->second;
    auto& state = entry.state;
    if (state.liveness != NodeLiveness::Active) {
        return Error{ErrorCode::NodeUnavailable,
                     "node " + id + " is " + std::string{to_string(state.liveness)}};
    }
    if (!(state.reserved + request).fits_within(state.spec.capacity)) {
        return Error{ErrorCode::CapacityExceeded,
                     "node " + id + " cannot fit " + to_string(request)
                     + " (free " + to_string(state.free()) + ")"};
    }

    auto reservation_id = next_reservation_id_++;
    state.reserved += request;
    ++state.reservation_count;
    entry.reservations.emplace(reservation_id, request);

    return AssignmentToken{
        .node_id = id,
        .reservation_id = reservation_id,
        .epoch = state.epoch,
        .reserved = request
    };
}

bool ClusterRegistry::release(const AssignmentToken& token) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(token.node_id);
    if (it == nodes_.end()) {
        throw std::logic_error("release on unregistered node " + token.node_id);
    }

    auto& entry = it->second;
    auto& state = entry.state;
    if (token.epoch < state.epoch) {
        return false;  // revoked by eviction
    }

    auto res = entry.reservations.find(token.reservation_id);
    if (token.epoch != state.epoch || res == entry.reservations.end()) {
        throw std::logic_error("release of unknown reservation "
                               + std::to_string(token.reservation_id)
                               + " on node " + token.node_id);
    }
    if (!res->second.fits_within(state.reserved) || res->second != token.reserved) {
        throw std::logic_error("release would underflow reserved capacity on node "
                               + token.node_id);
    }

    state.reserved -= res->second;
    --state.reservation_count;
    entry.reservations.erase(res);
    return true;
}

bool ClusterRegistry::holds(const AssignmentToken& token) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(token.node_id);
    if (it == nodes_.end()) return false;
    const auto& entry = it->second;
    return token.epoch == entry.state.epoch
        && entry.reservations.count(token.reservation_id) > 0;
}

// ─────────────────────────────────────────────
// Eviction
// ─────────────────────────────────────────────

void ClusterRegistry::revoke_all(Entry& entry) {
    entry.reservations.clear();
    entry.state.reserved = Resources{};
    entry.state.reservation_count = 0;
    ++entry.state.epoch;
}

std::vector<NodeId> ClusterRegistry::evict_stale(Millis timeout, SteadyTime now) {
    std::vector<NodeId> evicted;
    const auto suspect_after = timeout / 2;

    std::unique_lock lock(mutex_);
    for (auto& [id, entry] : nodes_) {
        auto& state = entry.state;
        if (state.liveness == NodeLiveness::Evicted) continue;

        auto age = now - state.last_heartbeat;
        if (age > timeout) {
            state.liveness = NodeLiveness::Evicted;
            revoke_all(entry);
            evicted.push_back(id);
        } else if (age > suspect_after) {
            state.liveness = NodeLiveness::Suspected;
        }
    }
    return evicted;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<NodeState> ClusterRegistry::get_node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second.state;
}

size_t ClusterRegistry::node_count() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

size_t ClusterRegistry::active_node_count() const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(
        std::count_if(nodes_.begin(), nodes_.end(), [](const auto& kv) {
            return kv.second.state.liveness == NodeLiveness::Active;
        }));
}

}  // namespace tco_scheduler
