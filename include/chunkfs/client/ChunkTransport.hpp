#pragma once

#include "chunkfs/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkfs::client {

// Moves chunk bytes to and from storage nodes addressed as "host:port".
// Safe to share between transfer threads; each call opens its own connection.
class ChunkTransport {
public:
    explicit ChunkTransport(std::chrono::milliseconds timeout,
                            std::size_t max_payload_bytes = 256ull * 1024ull * 1024ull);

    // Returns the size the node acknowledged. Throws Error(ChunkTransferFailed)
    // or Error(InvalidArgument) for an unparseable address.
    std::uint64_t put_chunk(const std::string& address, const ChunkId& chunk_id, ChunkData data) const;

    // Throws Error(ChunkNotFound) when the node does not hold the chunk and
    // Error(ChunkTransferFailed) for every other failure.
    ChunkData get_chunk(const std::string& address, const ChunkId& chunk_id) const;

private:
    std::chrono::milliseconds timeout_;
    std::size_t max_payload_bytes_;
};

}  // namespace chunkfs::client
