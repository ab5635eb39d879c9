#pragma once

#include "chunkfs/Types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkfs {

// The only place a node status is computed. A node is Active while
// now - last_heartbeat <= timeout.
NodeStatus derive_node_status(Clock::time_point last_heartbeat,
                              Clock::time_point now,
                              std::chrono::milliseconds timeout) noexcept;

// Storage node records keyed by node id. Not synchronized; MetadataStore
// guards every call with its own lock.
class NodeRegistry {
public:
    explicit NodeRegistry(std::chrono::milliseconds timeout);

    struct HeartbeatResult {
        bool created{false};
        bool reactivated{false};
        bool address_changed{false};
    };

    struct Transition {
        NodeId id;
        NodeStatus from{NodeStatus::Active};
        NodeStatus to{NodeStatus::Inactive};
    };

    HeartbeatResult upsert(const NodeId& id,
                           const std::string& address,
                           const NodeMetrics& metrics,
                           Clock::time_point now);

    // Re-derives every status; returns the nodes whose status changed.
    std::vector<Transition> refresh(Clock::time_point now);

    // Active nodes at `now`, ordered by node id.
    std::vector<NodeRecord> active_snapshot(Clock::time_point now) const;
    std::vector<NodeRecord> nodes() const;
    std::optional<NodeRecord> find(const NodeId& id) const;

    void restore(NodeRecord record);

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::map<NodeId, NodeRecord> nodes_;
};

}  // namespace chunkfs
