#pragma once

#include "chunkfs/Error.hpp"
#include "chunkfs/Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chunkfs::protocol {

using Fields = std::unordered_map<std::string, std::string>;

namespace command {
inline constexpr std::string_view kRegister = "REGISTER";
inline constexpr std::string_view kListFiles = "LIST-FILES";
inline constexpr std::string_view kFileInfo = "FILE-INFO";
inline constexpr std::string_view kHeartbeat = "HEARTBEAT";
inline constexpr std::string_view kNodes = "NODES";
inline constexpr std::string_view kStats = "STATS";
inline constexpr std::string_view kPutChunk = "PUT-CHUNK";
inline constexpr std::string_view kGetChunk = "GET-CHUNK";
inline constexpr std::string_view kMetrics = "METRICS";
}  // namespace command

// One request per connection: header lines followed by an optional payload.
struct Request {
    std::string command;
    Fields fields;
    bool has_payload{false};
    ChunkData payload;
};

struct Response {
    bool success{false};
    Fields fields;
    bool has_payload{false};
    ChunkData payload;
};

Request make_request(std::string_view command, Fields fields = {});
Response make_ok(std::string_view code = "OK");
Response make_error(ErrorCode code, std::string_view message, std::string_view hint = {});
Response make_error(const Error& error);

// Throws the Error carried by an unsuccessful response.
void raise_for_status(const Response& response);

std::optional<std::uint64_t> parse_uint64(std::string_view text);
std::optional<std::string> find_field(const Fields& fields, const std::string& key);
// Both throw Error(ProtocolError) when the field is absent or malformed.
std::string require_field(const Fields& fields, const std::string& key);
std::uint64_t require_uint64(const Fields& fields, const std::string& key);

// CHUNK-COUNT plus CHUNK-<i>:<chunk_id>,<node_id>,<start>,<size>,<address>
void encode_chunks(const std::vector<ChunkDescriptor>& chunks, Fields& fields);
std::vector<ChunkDescriptor> decode_chunks(const Fields& fields);

void encode_file_record(const FileRecord& record, Fields& fields);
FileRecord decode_file_record(const Fields& fields);

// FILE-COUNT plus FILE-<i>:<size>,<created_at>,<filename>
void encode_file_summaries(const std::vector<FileSummary>& files, Fields& fields);
std::vector<FileSummary> decode_file_summaries(const Fields& fields);

// METRIC-* fields
void encode_metrics(const NodeMetrics& metrics, Fields& fields);
NodeMetrics decode_metrics(const Fields& fields);

struct NodeView {
    NodeId id;
    NodeStatus status{NodeStatus::Inactive};
    std::int64_t heartbeat_age_ms{0};
    std::string address;
    NodeMetrics metrics{};
};

// NODE-COUNT plus
// NODE-<i>:<id>,<status>,<age_ms>,<chunks_stored>,<bytes_written>,<bytes_read>,<address>
void encode_nodes(const std::vector<NodeView>& nodes, Fields& fields);
std::vector<NodeView> decode_nodes(const Fields& fields);

}  // namespace chunkfs::protocol
