#pragma once

#include "chunkfs/Types.hpp"
#include "chunkfs/daemon/Rpc.hpp"
#include "chunkfs/protocol/Message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkfs::client {

// Typed calls against the coordinator. Every method throws
// Error(CoordinatorUnreachable) when no response arrives and otherwise
// rethrows the error code the coordinator answered with.
class CoordinatorClient {
public:
    CoordinatorClient(std::string host,
                      std::uint16_t port,
                      std::chrono::milliseconds timeout,
                      std::size_t max_payload_bytes = 256ull * 1024ull * 1024ull);

    FileRecord register_file(const std::string& filename, std::uint64_t size);
    FileRecord file_info(const std::string& filename);
    std::vector<FileSummary> list_files();

    // Returns the coordinator's chunk size.
    std::uint64_t heartbeat(const NodeId& node_id, const std::string& address, const NodeMetrics& metrics);

    std::vector<protocol::NodeView> list_nodes();

    void report_stats(const NodeId& node_id,
                      std::string_view operation,
                      std::uint64_t bytes,
                      std::uint64_t duration_ms);

    std::string endpoint() const;

private:
    protocol::Response call(const protocol::Request& request);

    daemon::RpcClient rpc_;
};

}  // namespace chunkfs::client
