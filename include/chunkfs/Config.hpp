#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkfs {

struct Config {
    std::uint64_t chunk_size{4ull * 1024ull * 1024ull};
    // Upper bound on chunks in one file; larger registrations are refused.
    std::uint64_t max_chunks_per_file{1ull << 20};
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds liveness_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
    std::size_t transfer_parallelism{5};
    std::size_t server_workers{8};
    std::size_t max_payload_bytes{256ull * 1024ull * 1024ull};
    std::string coordinator_host{"127.0.0.1"};
    std::uint16_t coordinator_port{5000};
    std::string listen_host{"0.0.0.0"};
    std::uint16_t listen_port{0};
    std::optional<std::string> advertise_host{};
    std::string node_id{"1"};
    std::string storage_directory{"storage"};
    std::string metadata_path{"metadata.db"};
    bool report_transfer_stats{true};
};

}  // namespace chunkfs
