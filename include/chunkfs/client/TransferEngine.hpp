#pragma once

#include "chunkfs/Error.hpp"
#include "chunkfs/Types.hpp"
#include "chunkfs/client/ChunkTransport.hpp"
#include "chunkfs/client/CoordinatorClient.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkfs::client {

struct ChunkOutcome {
    std::uint64_t index{0};
    ChunkId chunk_id;
    NodeId node_id;
    std::string node_address;
    std::uint64_t bytes{0};
    bool success{false};
    std::optional<ErrorCode> error;
    std::string message;
};

struct TransferReport {
    std::string operation;
    std::string filename;
    FileId file_id;
    std::uint64_t total_bytes{0};
    std::uint64_t chunk_count{0};
    std::vector<ChunkOutcome> outcomes;
    std::chrono::milliseconds duration{0};
    // UploadIncomplete or DownloadIncomplete when any chunk failed.
    std::optional<ErrorCode> failure;

    [[nodiscard]] bool complete() const noexcept { return !failure.has_value(); }
    std::vector<std::uint64_t> failed_indices() const;
    double throughput_mib_s() const noexcept;
    std::string summary() const;
};

// Moves whole files by fanning one task per chunk out over a fixed-size
// worker pool. Per-chunk failures are collected into the report rather than
// thrown; errors that happen before any chunk is dispatched (local file
// missing, coordinator refusal) are thrown as Error.
class TransferEngine {
public:
    TransferEngine(CoordinatorClient& coordinator, ChunkTransport& transport, std::size_t parallelism);

    TransferReport upload(const std::filesystem::path& source, std::optional<std::string> name = std::nullopt);

    // Chunks are written into "<destination>.partial" which is renamed onto
    // the destination only when every chunk arrived. Failing to finish the
    // staging file after that throws Error(StorageFailure).
    TransferReport download(const std::string& name, const std::filesystem::path& destination);

    [[nodiscard]] std::size_t parallelism() const noexcept { return parallelism_; }

private:
    CoordinatorClient& coordinator_;
    ChunkTransport& transport_;
    std::size_t parallelism_;
};

}  // namespace chunkfs::client
