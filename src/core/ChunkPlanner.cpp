#include "chunkfs/core/ChunkPlanner.hpp"

#include "chunkfs/Error.hpp"

#include <algorithm>

namespace chunkfs {

std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw_error(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

std::vector<ChunkDescriptor> plan_chunks(const FileId& file_id,
                                         std::uint64_t file_size,
                                         std::uint64_t chunk_size,
                                         const std::vector<NodeRecord>& snapshot) {
    const auto total = chunk_count(file_size, chunk_size);
    if (snapshot.empty()) {
        throw_error(ErrorCode::NoActiveNodes,
                    "No active storage nodes available",
                    "Start a storage node or wait for its next heartbeat");
    }

    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(static_cast<std::size_t>(total));
    for (std::uint64_t index = 0; index < total; ++index) {
        const auto& node = snapshot[static_cast<std::size_t>(index % snapshot.size())];
        const auto start = index * chunk_size;

        ChunkDescriptor descriptor{};
        descriptor.chunk_id = make_chunk_id(file_id, index);
        descriptor.index = index;
        descriptor.node_id = node.id;
        descriptor.node_address = node.address;
        descriptor.start = start;
        descriptor.size = std::min(chunk_size, file_size - start);
        chunks.push_back(std::move(descriptor));
    }
    return chunks;
}

bool plan_covers_file(const std::vector<ChunkDescriptor>& chunks, std::uint64_t file_size) noexcept {
    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != i || chunk.start != expected_start || chunk.size == 0) {
            return false;
        }
        if (chunk.size > file_size - expected_start) {
            return false;
        }
        expected_start += chunk.size;
    }
    return expected_start == file_size;
}

}  // namespace chunkfs
