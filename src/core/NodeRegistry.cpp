#include "chunkfs/core/NodeRegistry.hpp"

#include <utility>

namespace chunkfs {

NodeStatus derive_node_status(Clock::time_point last_heartbeat,
                              Clock::time_point now,
                              std::chrono::milliseconds timeout) noexcept {
    if (now - last_heartbeat > timeout) {
        return NodeStatus::Inactive;
    }
    return NodeStatus::Active;
}

NodeRegistry::NodeRegistry(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

NodeRegistry::HeartbeatResult NodeRegistry::upsert(const NodeId& id,
                                                   const std::string& address,
                                                   const NodeMetrics& metrics,
                                                   Clock::time_point now) {
    HeartbeatResult result{};
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        NodeRecord record{};
        record.id = id;
        record.registered_at = now;
        it = nodes_.emplace(id, std::move(record)).first;
        result.created = true;
    } else {
        result.address_changed = it->second.address != address;
    }

    auto& record = it->second;
    const auto previous = record.status;
    record.address = address;
    record.metrics = metrics;
    record.last_heartbeat = now;
    record.status = derive_node_status(record.last_heartbeat, now, timeout_);
    result.reactivated = !result.created && previous == NodeStatus::Inactive && record.status == NodeStatus::Active;
    return result;
}

std::vector<NodeRegistry::Transition> NodeRegistry::refresh(Clock::time_point now) {
    std::vector<Transition> transitions;
    for (auto& [id, record] : nodes_) {
        const auto next = derive_node_status(record.last_heartbeat, now, timeout_);
        if (next != record.status) {
            transitions.push_back(Transition{id, record.status, next});
            record.status = next;
        }
    }
    return transitions;
}

std::vector<NodeRecord> NodeRegistry::active_snapshot(Clock::time_point now) const {
    std::vector<NodeRecord> active;
    active.reserve(nodes_.size());
    for (const auto& [id, record] : nodes_) {
        if (derive_node_status(record.last_heartbeat, now, timeout_) == NodeStatus::Active) {
            active.push_back(record);
            active.back().status = NodeStatus::Active;
        }
    }
    return active;
}

std::vector<NodeRecord> NodeRegistry::nodes() const {
    std::vector<NodeRecord> result;
    result.reserve(nodes_.size());
    for (const auto& [id, record] : nodes_) {
        result.push_back(record);
    }
    return result;
}

std::optional<NodeRecord> NodeRegistry::find(const NodeId& id) const {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void NodeRegistry::restore(NodeRecord record) {
    auto id = record.id;
    nodes_.insert_or_assign(std::move(id), std::move(record));
}

}  // namespace chunkfs
