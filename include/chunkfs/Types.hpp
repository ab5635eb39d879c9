#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkfs {

using NodeId = std::string;
using FileId = std::string;
using ChunkId = std::string;
using ChunkData = std::vector<std::uint8_t>;
using Clock = std::chrono::system_clock;

struct ChunkDescriptor {
    ChunkId chunk_id;
    std::uint64_t index{0};
    NodeId node_id;
    std::string node_address;
    std::uint64_t start{0};
    std::uint64_t size{0};
};

struct FileRecord {
    std::string filename;
    FileId file_id;
    std::uint64_t size{0};
    std::uint64_t chunk_size{0};
    std::int64_t created_at{0};
    std::vector<ChunkDescriptor> chunks;
};

struct FileSummary {
    std::string filename;
    std::uint64_t size{0};
    std::int64_t created_at{0};
};

// Counters a storage node accumulates and reports with every heartbeat.
struct NodeMetrics {
    std::uint64_t chunks_stored{0};
    std::uint64_t bytes_written{0};
    std::uint64_t bytes_read{0};
    std::uint64_t writes{0};
    std::uint64_t reads{0};
    std::uint64_t write_millis{0};
    std::uint64_t read_millis{0};

    bool operator==(const NodeMetrics&) const = default;
};

enum class NodeStatus {
    Active,
    Inactive
};

struct NodeRecord {
    NodeId id;
    std::string address;
    Clock::time_point registered_at{};
    Clock::time_point last_heartbeat{};
    NodeMetrics metrics{};
    NodeStatus status{NodeStatus::Active};
};

std::string make_chunk_id(const FileId& file_id, std::uint64_t index);
const char* node_status_to_string(NodeStatus status);
std::optional<NodeStatus> node_status_from_string(std::string_view text);

// Node ids travel inside comma separated wire fields and whitespace separated
// state files, so they are restricted to [A-Za-z0-9_.-].
bool valid_node_id(std::string_view id) noexcept;

std::int64_t to_unix_millis(Clock::time_point point);
Clock::time_point from_unix_millis(std::int64_t millis);

std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& endpoint);
std::string format_endpoint(const std::string& host, std::uint16_t port);

}  // namespace chunkfs
