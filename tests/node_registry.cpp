#include "chunkfs/core/MetadataStore.hpp"
#include "chunkfs/core/NodeRegistry.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace chunkfs;
using namespace std::chrono_literals;

int main() {
    const auto t0 = Clock::now();

    assert(derive_node_status(t0, t0, 30s) == NodeStatus::Active);
    assert(derive_node_status(t0, t0 + 30s, 30s) == NodeStatus::Active);
    assert(derive_node_status(t0, t0 + 30s + 1ms, 30s) == NodeStatus::Inactive);

    NodeRegistry registry(30s);
    NodeMetrics metrics{};
    metrics.chunks_stored = 3;

    auto result = registry.upsert("b", "10.0.0.2:8001", metrics, t0);
    assert(result.created && !result.reactivated && !result.address_changed);
    registry.upsert("a", "10.0.0.1:8001", {}, t0 + 10s);

    // Snapshot is ordered by node id regardless of arrival order.
    auto snapshot = registry.active_snapshot(t0 + 20s);
    assert(snapshot.size() == 2);
    assert(snapshot[0].id == "a" && snapshot[1].id == "b");
    assert(snapshot[1].metrics.chunks_stored == 3);

    // "b" goes silent; "a" is still inside the window.
    auto transitions = registry.refresh(t0 + 31s);
    assert(transitions.size() == 1);
    assert(transitions[0].id == "b");
    assert(transitions[0].from == NodeStatus::Active && transitions[0].to == NodeStatus::Inactive);
    assert(registry.find("b")->status == NodeStatus::Inactive);
    snapshot = registry.active_snapshot(t0 + 31s);
    assert(snapshot.size() == 1 && snapshot[0].id == "a");

    // Refresh is idempotent.
    assert(registry.refresh(t0 + 31s).empty());

    // A fresh heartbeat revives the node and reports the move.
    result = registry.upsert("b", "10.0.0.9:8001", metrics, t0 + 40s);
    assert(!result.created && result.reactivated && result.address_changed);
    assert(registry.find("b")->address == "10.0.0.9:8001");
    assert(registry.find("b")->registered_at == t0);
    assert(registry.size() == 2);

    // Concurrent heartbeats from distinct nodes all land.
    MetadataStore store("", 1024, 30s);
    constexpr int kNodes = 32;
    std::vector<std::thread> threads;
    for (int i = 0; i < kNodes; ++i) {
        threads.emplace_back([&store, i]() {
            for (int beat = 0; beat < 5; ++beat) {
                store.record_heartbeat("node-" + std::to_string(i),
                                       "127.0.0.1:" + std::to_string(10000 + i),
                                       NodeMetrics{});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    const auto active = store.active_nodes();
    assert(active.size() == kNodes);
    for (const auto& node : active) {
        assert(node.status == NodeStatus::Active);
    }

    return 0;
}
