#pragma once

#include "chunkfs/Types.hpp"

#include <cstdint>
#include <vector>

namespace chunkfs {

// ceil(file_size / chunk_size); zero-byte files have no chunks.
std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size);

// Splits [0, file_size) into chunk_size ranges and assigns chunk i to
// snapshot[i % snapshot.size()]. The snapshot is taken by the caller and is
// never re-read, so concurrent registry changes cannot skew a plan.
// Throws Error(InvalidArgument) for a zero chunk size and Error(NoActiveNodes)
// for an empty snapshot.
std::vector<ChunkDescriptor> plan_chunks(const FileId& file_id,
                                         std::uint64_t file_size,
                                         std::uint64_t chunk_size,
                                         const std::vector<NodeRecord>& snapshot);

// True when the descriptors are ordered, contiguous, non-overlapping and cover
// exactly [0, file_size).
bool plan_covers_file(const std::vector<ChunkDescriptor>& chunks, std::uint64_t file_size) noexcept;

}  // namespace chunkfs
