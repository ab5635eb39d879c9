#include "chunkfs/protocol/Message.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

namespace chunkfs::protocol {

namespace {

// Splits on commas into at most `parts` pieces; the last piece keeps any
// remaining commas (filenames may contain them).
std::vector<std::string> split_fields(const std::string& value, std::size_t parts) {
    std::vector<std::string> result;
    std::size_t begin = 0;
    while (result.size() + 1 < parts) {
        const auto comma = value.find(',', begin);
        if (comma == std::string::npos) {
            break;
        }
        result.push_back(value.substr(begin, comma - begin));
        begin = comma + 1;
    }
    result.push_back(value.substr(begin));
    return result;
}

[[noreturn]] void malformed(const std::string& what) {
    throw_error(ErrorCode::ProtocolError, "Malformed field " + what);
}

std::uint64_t to_uint64(const std::string& text, const std::string& what) {
    const auto value = parse_uint64(text);
    if (!value.has_value()) {
        malformed(what);
    }
    return *value;
}

std::size_t require_count(const Fields& fields, const std::string& key) {
    const auto count = require_uint64(fields, key);
    if (count > fields.size()) {
        malformed(key);
    }
    return static_cast<std::size_t>(count);
}

constexpr std::pair<const char*, std::uint64_t NodeMetrics::*> kMetricFields[] = {
    {"METRIC-CHUNKS-STORED", &NodeMetrics::chunks_stored},
    {"METRIC-BYTES-WRITTEN", &NodeMetrics::bytes_written},
    {"METRIC-BYTES-READ", &NodeMetrics::bytes_read},
    {"METRIC-WRITES", &NodeMetrics::writes},
    {"METRIC-READS", &NodeMetrics::reads},
    {"METRIC-WRITE-MS", &NodeMetrics::write_millis},
    {"METRIC-READ-MS", &NodeMetrics::read_millis},
};

}  // namespace

Request make_request(std::string_view command, Fields fields) {
    Request request{};
    request.command = std::string(command);
    request.fields = std::move(fields);
    return request;
}

Response make_ok(std::string_view code) {
    Response response{};
    response.success = true;
    response.fields["CODE"] = std::string(code);
    return response;
}

Response make_error(ErrorCode code, std::string_view message, std::string_view hint) {
    Response response{};
    response.success = false;
    response.fields["CODE"] = std::string(error_code_to_string(code));
    response.fields["MESSAGE"] = std::string(message);
    if (!hint.empty()) {
        response.fields["HINT"] = std::string(hint);
    }
    return response;
}

Response make_error(const Error& error) {
    return make_error(error.code(), error.message(), error.hint());
}

void raise_for_status(const Response& response) {
    if (response.success) {
        return;
    }
    auto code = ErrorCode::ProtocolError;
    if (const auto it = response.fields.find("CODE"); it != response.fields.end()) {
        code = error_code_from_string(it->second).value_or(ErrorCode::ProtocolError);
    }
    const auto message = find_field(response.fields, "MESSAGE").value_or("Request failed");
    throw Error(code, message, find_field(response.fields, "HINT").value_or(""));
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
    std::uint64_t value{};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> find_field(const Fields& fields, const std::string& key) {
    const auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string require_field(const Fields& fields, const std::string& key) {
    auto value = find_field(fields, key);
    if (!value.has_value()) {
        throw_error(ErrorCode::ProtocolError, "Missing field " + key);
    }
    return std::move(*value);
}

std::uint64_t require_uint64(const Fields& fields, const std::string& key) {
    return to_uint64(require_field(fields, key), key);
}

void encode_chunks(const std::vector<ChunkDescriptor>& chunks, Fields& fields) {
    fields["CHUNK-COUNT"] = std::to_string(chunks.size());
    for (const auto& chunk : chunks) {
        fields["CHUNK-" + std::to_string(chunk.index)] = chunk.chunk_id + "," + chunk.node_id + ","
            + std::to_string(chunk.start) + "," + std::to_string(chunk.size) + "," + chunk.node_address;
    }
}

std::vector<ChunkDescriptor> decode_chunks(const Fields& fields) {
    const auto count = require_count(fields, "CHUNK-COUNT");
    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        const auto key = "CHUNK-" + std::to_string(index);
        const auto parts = split_fields(require_field(fields, key), 5);
        if (parts.size() != 5 || parts[0].empty() || parts[1].empty() || parts[4].empty()) {
            malformed(key);
        }
        ChunkDescriptor chunk{};
        chunk.chunk_id = parts[0];
        chunk.index = index;
        chunk.node_id = parts[1];
        chunk.start = to_uint64(parts[2], key);
        chunk.size = to_uint64(parts[3], key);
        chunk.node_address = parts[4];
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

void encode_file_record(const FileRecord& record, Fields& fields) {
    fields["FILENAME"] = record.filename;
    fields["FILE-ID"] = record.file_id;
    fields["SIZE"] = std::to_string(record.size);
    fields["CHUNK-SIZE"] = std::to_string(record.chunk_size);
    fields["CREATED"] = std::to_string(record.created_at);
    encode_chunks(record.chunks, fields);
}

FileRecord decode_file_record(const Fields& fields) {
    FileRecord record{};
    record.filename = require_field(fields, "FILENAME");
    record.file_id = require_field(fields, "FILE-ID");
    record.size = require_uint64(fields, "SIZE");
    record.chunk_size = require_uint64(fields, "CHUNK-SIZE");
    record.created_at = static_cast<std::int64_t>(require_uint64(fields, "CREATED"));
    record.chunks = decode_chunks(fields);
    return record;
}

void encode_file_summaries(const std::vector<FileSummary>& files, Fields& fields) {
    fields["FILE-COUNT"] = std::to_string(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        fields["FILE-" + std::to_string(i)] = std::to_string(file.size) + ","
            + std::to_string(std::max<std::int64_t>(file.created_at, 0)) + "," + file.filename;
    }
}

std::vector<FileSummary> decode_file_summaries(const Fields& fields) {
    const auto count = require_count(fields, "FILE-COUNT");
    std::vector<FileSummary> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto key = "FILE-" + std::to_string(i);
        const auto parts = split_fields(require_field(fields, key), 3);
        if (parts.size() != 3 || parts[2].empty()) {
            malformed(key);
        }
        FileSummary summary{};
        summary.size = to_uint64(parts[0], key);
        summary.created_at = static_cast<std::int64_t>(to_uint64(parts[1], key));
        summary.filename = parts[2];
        files.push_back(std::move(summary));
    }
    return files;
}

void encode_metrics(const NodeMetrics& metrics, Fields& fields) {
    for (const auto& [key, member] : kMetricFields) {
        fields[key] = std::to_string(metrics.*member);
    }
}

NodeMetrics decode_metrics(const Fields& fields) {
    NodeMetrics metrics{};
    for (const auto& [key, member] : kMetricFields) {
        if (const auto value = find_field(fields, key); value.has_value()) {
            metrics.*member = to_uint64(*value, key);
        }
    }
    return metrics;
}

void encode_nodes(const std::vector<NodeView>& nodes, Fields& fields) {
    fields["NODE-COUNT"] = std::to_string(nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];
        fields["NODE-" + std::to_string(i)] = node.id + "," + node_status_to_string(node.status) + ","
            + std::to_string(std::max<std::int64_t>(node.heartbeat_age_ms, 0)) + ","
            + std::to_string(node.metrics.chunks_stored) + "," + std::to_string(node.metrics.bytes_written) + ","
            + std::to_string(node.metrics.bytes_read) + "," + node.address;
    }
}

std::vector<NodeView> decode_nodes(const Fields& fields) {
    const auto count = require_count(fields, "NODE-COUNT");
    std::vector<NodeView> nodes;
    nodes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto key = "NODE-" + std::to_string(i);
        const auto parts = split_fields(require_field(fields, key), 7);
        if (parts.size() != 7) {
            malformed(key);
        }
        const auto status = node_status_from_string(parts[1]);
        if (!status.has_value()) {
            malformed(key);
        }
        NodeView view{};
        view.id = parts[0];
        view.status = *status;
        view.heartbeat_age_ms = static_cast<std::int64_t>(to_uint64(parts[2], key));
        view.metrics.chunks_stored = to_uint64(parts[3], key);
        view.metrics.bytes_written = to_uint64(parts[4], key);
        view.metrics.bytes_read = to_uint64(parts[5], key);
        view.address = parts[6];
        nodes.push_back(std::move(view));
    }
    return nodes;
}

}  // namespace chunkfs::protocol
