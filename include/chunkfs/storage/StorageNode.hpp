#pragma once

#include "chunkfs/Config.hpp"
#include "chunkfs/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace chunkfs::storage {

// A storage node: serves PUT-CHUNK, GET-CHUNK and METRICS from a ChunkStore
// and heartbeats to the coordinator on its own schedule.
class StorageNode {
public:
    explicit StorageNode(Config config);
    ~StorageNode();

    StorageNode(const StorageNode&) = delete;
    StorageNode& operator=(const StorageNode&) = delete;

    // Opens the store, binds the listener and starts the heartbeat loop.
    // Throws Error(InvalidArgument | StorageFailure) or std::runtime_error
    // when the listener cannot bind.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept;

    [[nodiscard]] std::uint16_t port() const noexcept;
    // host:port the coordinator hands to clients.
    [[nodiscard]] std::string address() const;
    [[nodiscard]] const NodeId& id() const noexcept;

    std::uint64_t store_chunk(const ChunkId& chunk_id, const ChunkData& data);
    // Throws Error(ChunkNotFound) when the chunk is absent.
    ChunkData retrieve_chunk(const ChunkId& chunk_id);
    [[nodiscard]] NodeMetrics metrics() const;

    // Sends one heartbeat now. Failures are logged and reported as false.
    bool send_heartbeat();
    [[nodiscard]] std::uint64_t heartbeats_sent() const noexcept;
    [[nodiscard]] std::uint64_t heartbeats_failed() const noexcept;
    // Chunk size the coordinator reported on the last successful heartbeat.
    [[nodiscard]] std::optional<std::uint64_t> coordinator_chunk_size() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunkfs::storage
