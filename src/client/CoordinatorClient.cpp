#include "chunkfs/client/CoordinatorClient.hpp"

#include <utility>

namespace chunkfs::client {

using namespace protocol;

CoordinatorClient::CoordinatorClient(std::string host,
                                     std::uint16_t port,
                                     std::chrono::milliseconds timeout,
                                     std::size_t max_payload_bytes)
    : rpc_(std::move(host), port, timeout, max_payload_bytes) {}

std::string CoordinatorClient::endpoint() const {
    return format_endpoint(rpc_.host(), rpc_.port());
}

Response CoordinatorClient::call(const Request& request) {
    auto response = rpc_.send(request);
    if (!response.has_value()) {
        throw_error(ErrorCode::CoordinatorUnreachable,
                    "No response from coordinator at " + endpoint(),
                    "Check --coordinator or CHUNKFS_COORDINATOR and that the coordinator is running");
    }
    raise_for_status(*response);
    return std::move(*response);
}

FileRecord CoordinatorClient::register_file(const std::string& filename, std::uint64_t size) {
    const auto response = call(make_request(command::kRegister,
                                            {{"FILENAME", filename}, {"SIZE", std::to_string(size)}}));
    return decode_file_record(response.fields);
}

FileRecord CoordinatorClient::file_info(const std::string& filename) {
    const auto response = call(make_request(command::kFileInfo, {{"FILENAME", filename}}));
    return decode_file_record(response.fields);
}

std::vector<FileSummary> CoordinatorClient::list_files() {
    const auto response = call(make_request(command::kListFiles));
    return decode_file_summaries(response.fields);
}

std::uint64_t CoordinatorClient::heartbeat(const NodeId& node_id,
                                           const std::string& address,
                                           const NodeMetrics& metrics) {
    Fields fields{{"NODE-ID", node_id}, {"ADDRESS", address}};
    encode_metrics(metrics, fields);
    const auto response = call(make_request(command::kHeartbeat, std::move(fields)));
    return require_uint64(response.fields, "CHUNK-SIZE");
}

std::vector<NodeView> CoordinatorClient::list_nodes() {
    const auto response = call(make_request(command::kNodes));
    return decode_nodes(response.fields);
}

void CoordinatorClient::report_stats(const NodeId& node_id,
                                     std::string_view operation,
                                     std::uint64_t bytes,
                                     std::uint64_t duration_ms) {
    call(make_request(command::kStats,
                      {{"NODE-ID", node_id},
                       {"OPERATION", std::string(operation)},
                       {"BYTES", std::to_string(bytes)},
                       {"DURATION-MS", std::to_string(duration_ms)}}));
}

}  // namespace chunkfs::client
