#include "chunkfs/Error.hpp"
#include "chunkfs/client/ChunkTransport.hpp"
#include "chunkfs/core/Coordinator.hpp"
#include "chunkfs/daemon/Rpc.hpp"
#include "chunkfs/protocol/Message.hpp"
#include "chunkfs/storage/StorageNode.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <string>

using namespace chunkfs;
using namespace std::chrono_literals;

int main() {
    test::quiet_logs();
    test::TempDir dir("heartbeat");
    auto base = test::local_config(dir);

    // Reserve a coordinator port, then leave it closed for a while.
    std::uint16_t coordinator_port = 0;
    {
        Coordinator probe(base);
        probe.start();
        coordinator_port = probe.port();
        probe.stop();
    }
    std::filesystem::remove(base.metadata_path);

    auto node_config = base;
    node_config.node_id = "hb-node";
    node_config.coordinator_port = coordinator_port;
    node_config.io_timeout = 1s;
    storage::StorageNode node(node_config);
    node.start();
    assert(node.running());

    // No coordinator: failures are counted, chunks are still served.
    assert(test::wait_until([&]() { return node.heartbeats_failed() >= 2; }));
    assert(node.heartbeats_sent() == 0);
    assert(!node.coordinator_chunk_size().has_value());
    assert(!node.send_heartbeat());

    client::ChunkTransport transport(2s);
    const auto data = test::random_bytes(1000, 3);
    assert(transport.put_chunk(node.address(), "123_0", data) == data.size());
    assert(transport.get_chunk(node.address(), "123_0") == data);
    assert(node.metrics().chunks_stored == 1);
    assert(node.metrics().writes == 1 && node.metrics().reads == 1);

    // Coordinator comes up on the expected port; the node registers on its own.
    auto coordinator_config = base;
    coordinator_config.listen_port = coordinator_port;
    coordinator_config.chunk_size = 128 * 1024;
    Coordinator coordinator(coordinator_config);
    coordinator.start();
    assert(coordinator.port() == coordinator_port);

    assert(test::wait_until([&]() { return node.coordinator_chunk_size() == coordinator_config.chunk_size; }));
    assert(node.heartbeats_sent() >= 1);
    assert(test::wait_until([&]() {
        const auto active = coordinator.store().active_nodes();
        return active.size() == 1 && active.front().id == "hb-node" && active.front().address == node.address()
            && active.front().metrics.chunks_stored == 1;
    }));
    assert(node.send_heartbeat());

    // METRICS over the wire.
    {
        const auto endpoint = parse_endpoint(node.address());
        assert(endpoint.has_value());
        daemon::RpcClient rpc(endpoint->first, endpoint->second, 2s);
        const auto response = rpc.send(protocol::make_request(protocol::command::kMetrics));
        assert(response.has_value() && response->success);
        assert(protocol::find_field(response->fields, "NODE-ID") == std::string("hb-node"));
        const auto metrics = protocol::decode_metrics(response->fields);
        assert(metrics.chunks_stored == 1);
        assert(metrics.bytes_written == data.size());

        const auto unknown = rpc.send(protocol::make_request("DELETE-CHUNK", {{"CHUNK-ID", "123_0"}}));
        assert(unknown.has_value() && !unknown->success);
        assert(protocol::find_field(unknown->fields, "CODE") == std::string("PROTOCOL_ERROR"));

        const auto missing = rpc.send(protocol::make_request(protocol::command::kGetChunk, {{"CHUNK-ID", "9_9"}}));
        assert(missing.has_value() && !missing->success);
        assert(protocol::find_field(missing->fields, "CODE") == std::string("CHUNK_NOT_FOUND"));

        const auto traversal
            = rpc.send(protocol::make_request(protocol::command::kGetChunk, {{"CHUNK-ID", "../metadata.db"}}));
        assert(traversal.has_value() && !traversal->success);
        assert(protocol::find_field(traversal->fields, "CODE") == std::string("INVALID_ARGUMENT"));
    }

    // Stop is prompt even with a heartbeat loop running.
    const auto stop_started = std::chrono::steady_clock::now();
    node.stop();
    assert(!node.running());
    assert(std::chrono::steady_clock::now() - stop_started < 2s);

    // The node goes inactive once heartbeats stop.
    coordinator.stop();
    coordinator_config.liveness_timeout = 300ms;
    Coordinator strict(coordinator_config);
    strict.start();
    assert(test::wait_until([&]() {
        const auto nodes = strict.store().nodes();
        return nodes.size() == 1 && nodes.front().status == NodeStatus::Inactive;
    }));
    assert(strict.store().active_nodes().empty());
    strict.stop();

    // A restart on the same storage counts what is already on disk.
    storage::StorageNode restarted(node_config);
    restarted.start();
    assert(restarted.metrics().chunks_stored == 1);
    assert(restarted.retrieve_chunk("123_0") == data);
    try {
        restarted.retrieve_chunk("123_1");
        assert(false && "missing chunk must throw");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::ChunkNotFound);
    }
    restarted.stop();

    node_config.node_id = "bad/id";
    storage::StorageNode invalid(node_config);
    try {
        invalid.start();
        assert(false && "invalid node id must be refused");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::InvalidArgument);
    }
    return 0;
}
