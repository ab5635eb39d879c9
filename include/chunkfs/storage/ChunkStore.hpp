#pragma once

#include "chunkfs/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkfs::storage {

// One file per chunk under a storage root. Writes go to a temporary file that
// is renamed over the target, so readers never observe a partial chunk.
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path root);

    struct SnapshotEntry {
        ChunkId id;
        std::uint64_t size{0};
    };

    // Creates the storage root if needed. Throws Error(StorageFailure).
    void open();

    // Returns the number of bytes stored. Overwrites any previous chunk with
    // the same id. Throws Error(InvalidArgument | StorageFailure).
    std::uint64_t put(const ChunkId& id, const ChunkData& data);

    // std::nullopt when the chunk is absent. Throws Error(InvalidArgument |
    // StorageFailure).
    std::optional<ChunkData> get(const ChunkId& id) const;

    bool contains(const ChunkId& id) const;
    std::vector<SnapshotEntry> snapshot() const;
    std::size_t size() const;

    const std::filesystem::path& root() const noexcept { return root_; }

    static bool valid_chunk_id(std::string_view id) noexcept;

private:
    std::filesystem::path path_for(const ChunkId& id) const;

    std::filesystem::path root_;
};

}  // namespace chunkfs::storage
