#pragma once

#include "chunkfs/Types.hpp"
#include "chunkfs/core/NodeRegistry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkfs {

// Authoritative coordinator state: file records, chunk plans and the node
// registry. Every read-modify-write runs under one mutex and every mutation is
// flushed to `state_path` before it becomes visible to callers. An empty
// state path keeps the store in memory only.
class MetadataStore {
public:
    MetadataStore(std::filesystem::path state_path,
                  std::uint64_t chunk_size,
                  std::chrono::milliseconds liveness_timeout,
                  std::uint64_t max_chunks_per_file = 1ull << 20);

    // Replaces the in-memory state with the contents of the state file, if
    // one exists. Throws Error(StorageFailure) on an unreadable or corrupt file.
    void load();

    // Throws Error(InvalidArgument | DuplicateFile | NoActiveNodes | StorageFailure).
    FileRecord register_file(const std::string& filename,
                             std::uint64_t size,
                             Clock::time_point now = Clock::now());

    std::optional<FileRecord> find_file(const std::string& filename) const;
    std::vector<FileSummary> list_files() const;

    NodeRegistry::HeartbeatResult record_heartbeat(const NodeId& node_id,
                                                   const std::string& address,
                                                   const NodeMetrics& metrics,
                                                   Clock::time_point now = Clock::now());

    std::vector<NodeRegistry::Transition> sweep(Clock::time_point now = Clock::now());

    std::vector<NodeRecord> nodes() const;
    std::vector<NodeRecord> active_nodes(Clock::time_point now = Clock::now()) const;

    [[nodiscard]] std::size_t file_count() const;
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] const std::filesystem::path& state_path() const noexcept { return state_path_; }

    static bool valid_filename(const std::string& filename) noexcept;

private:
    FileId next_file_id_locked(Clock::time_point now);
    void flush_locked() const;

    std::filesystem::path state_path_;
    std::uint64_t chunk_size_;
    std::uint64_t max_chunks_per_file_;
    mutable std::mutex mutex_;
    std::map<std::string, FileRecord> files_;
    NodeRegistry registry_;
    std::uint64_t last_file_id_{0};
};

}  // namespace chunkfs
