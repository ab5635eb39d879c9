#include "chunkfs/client/ChunkTransport.hpp"

#include "chunkfs/Error.hpp"
#include "chunkfs/daemon/Rpc.hpp"
#include "chunkfs/protocol/Message.hpp"

#include <utility>

namespace chunkfs::client {

namespace {

std::pair<std::string, std::uint16_t> resolve(const std::string& address) {
    auto endpoint = parse_endpoint(address);
    if (!endpoint.has_value()) {
        throw_error(ErrorCode::InvalidArgument, "Invalid node address: " + address);
    }
    return std::move(*endpoint);
}

}  // namespace

ChunkTransport::ChunkTransport(std::chrono::milliseconds timeout, std::size_t max_payload_bytes)
    : timeout_(timeout), max_payload_bytes_(max_payload_bytes) {}

std::uint64_t ChunkTransport::put_chunk(const std::string& address,
                                        const ChunkId& chunk_id,
                                        ChunkData data) const {
    const auto [host, port] = resolve(address);
    daemon::RpcClient rpc(host, port, timeout_, max_payload_bytes_);

    auto request = protocol::make_request(protocol::command::kPutChunk, {{"CHUNK-ID", chunk_id}});
    request.has_payload = true;
    const auto expected = data.size();
    request.payload = std::move(data);

    const auto response = rpc.send(request);
    if (!response.has_value()) {
        throw_error(ErrorCode::ChunkTransferFailed,
                    "Node " + address + " unreachable while storing " + chunk_id);
    }
    if (!response->success) {
        const auto message = protocol::find_field(response->fields, "MESSAGE").value_or("store rejected");
        throw_error(ErrorCode::ChunkTransferFailed, "Node " + address + ": " + message);
    }
    const auto stored = protocol::parse_uint64(protocol::find_field(response->fields, "SIZE").value_or(""));
    if (!stored.has_value() || *stored != expected) {
        throw_error(ErrorCode::ChunkTransferFailed,
                    "Node " + address + " acknowledged a different size for " + chunk_id);
    }
    return *stored;
}

ChunkData ChunkTransport::get_chunk(const std::string& address, const ChunkId& chunk_id) const {
    const auto [host, port] = resolve(address);
    daemon::RpcClient rpc(host, port, timeout_, max_payload_bytes_);

    auto response = rpc.send(protocol::make_request(protocol::command::kGetChunk, {{"CHUNK-ID", chunk_id}}));
    if (!response.has_value()) {
        throw_error(ErrorCode::ChunkTransferFailed,
                    "Node " + address + " unreachable while fetching " + chunk_id);
    }
    if (!response->success) {
        const auto code = protocol::find_field(response->fields, "CODE").value_or("");
        const auto message = protocol::find_field(response->fields, "MESSAGE").value_or("fetch rejected");
        if (error_code_from_string(code) == ErrorCode::ChunkNotFound) {
            throw_error(ErrorCode::ChunkNotFound, "Node " + address + ": " + message);
        }
        throw_error(ErrorCode::ChunkTransferFailed, "Node " + address + ": " + message);
    }
    if (!response->has_payload) {
        throw_error(ErrorCode::ChunkTransferFailed, "Node " + address + " sent no payload for " + chunk_id);
    }
    return std::move(response->payload);
}

}  // namespace chunkfs::client
