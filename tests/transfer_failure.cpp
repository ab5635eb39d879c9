#include "chunkfs/Error.hpp"
#include "chunkfs/client/ChunkTransport.hpp"
#include "chunkfs/client/CoordinatorClient.hpp"
#include "chunkfs/client/TransferEngine.hpp"
#include "chunkfs/core/Coordinator.hpp"
#include "chunkfs/storage/StorageNode.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace chunkfs;
using namespace std::chrono_literals;

namespace {

Config node_config(const Config& base, const test::TempDir& dir, int index, std::uint16_t coordinator_port) {
    auto config = base;
    config.node_id = "node-" + std::to_string(index);
    config.coordinator_port = coordinator_port;
    config.storage_directory = (dir / ("node" + std::to_string(index))).string();
    return config;
}

}  // namespace

int main() {
    test::quiet_logs();
    test::TempDir dir("failure");
    const auto base = test::local_config(dir);

    Coordinator coordinator(base);
    coordinator.start();

    std::vector<std::unique_ptr<storage::StorageNode>> nodes;
    for (int i = 0; i < 3; ++i) {
        nodes.push_back(std::make_unique<storage::StorageNode>(node_config(base, dir, i, coordinator.port())));
        nodes.back()->start();
    }
    assert(test::wait_until([&]() { return coordinator.store().active_nodes().size() == 3; }));

    client::CoordinatorClient coordinator_client("127.0.0.1", coordinator.port(), 5s);
    client::ChunkTransport transport(2s);
    client::TransferEngine engine(coordinator_client, transport, 3);

    // Six chunks; node-1 owns indices 1 and 4.
    const auto content = test::random_bytes(base.chunk_size * 6, 7);
    const auto early = dir / "early.bin";
    const auto late = dir / "late.bin";
    test::write_file(early, content);
    test::write_file(late, content);
    assert(engine.upload(early).complete());

    const auto node1_port = nodes[1]->port();
    nodes[1]->stop();

    // The coordinator still believes node-1 is alive, so it is planned in.
    const auto upload = engine.upload(late);
    assert(!upload.complete());
    assert(upload.failure == ErrorCode::UploadIncomplete);
    assert((upload.failed_indices() == std::vector<std::uint64_t>{1, 4}));
    for (const auto& outcome : upload.outcomes) {
        if (outcome.success) {
            assert(outcome.node_id != "node-1");
            continue;
        }
        assert(outcome.node_id == "node-1");
        assert(outcome.error == ErrorCode::ChunkTransferFailed);
        assert(!outcome.message.empty());
    }
    const auto summary = upload.summary();
    assert(summary.find("UPLOAD_INCOMPLETE") != std::string::npos);
    assert(summary.find("node-1") != std::string::npos);

    // Metadata stays registered; the name is taken.
    assert(coordinator_client.file_info("late.bin").chunks.size() == 6);

    const auto destination = dir / "restored.bin";
    auto staging = destination;
    staging += ".partial";

    const auto download = engine.download("early.bin", destination);
    assert(!download.complete());
    assert(download.failure == ErrorCode::DownloadIncomplete);
    assert((download.failed_indices() == std::vector<std::uint64_t>{1, 4}));
    assert(!std::filesystem::exists(destination));
    assert(!std::filesystem::exists(staging));

    // A restarted node with the same storage and endpoint makes the file whole again.
    auto revived_config = node_config(base, dir, 1, coordinator.port());
    revived_config.listen_port = node1_port;
    storage::StorageNode revived(revived_config);
    revived.start();
    assert(revived.metrics().chunks_stored == 2);

    const auto retry = engine.download("early.bin", destination);
    assert(retry.complete());
    assert(!retry.failure.has_value());
    assert(test::read_file(destination) == content);
    assert(!std::filesystem::exists(staging));

    // A chunk that never arrived stays missing.
    const auto late_download = engine.download("late.bin", dir / "late.out");
    assert(!late_download.complete());
    for (const auto& outcome : late_download.outcomes) {
        if (!outcome.success) {
            assert(outcome.error == ErrorCode::ChunkNotFound);
        }
    }
    assert((late_download.failed_indices() == std::vector<std::uint64_t>{1, 4}));
    assert(!std::filesystem::exists(dir / "late.out"));

    revived.stop();
    for (auto& node : nodes) {
        node->stop();
    }
    coordinator.stop();
    return 0;
}
