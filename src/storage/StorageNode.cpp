#include "chunkfs/storage/StorageNode.hpp"

#include "chunkfs/Error.hpp"
#include "chunkfs/client/CoordinatorClient.hpp"
#include "chunkfs/core/PeriodicTask.hpp"
#include "chunkfs/core/WorkerPool.hpp"
#include "chunkfs/daemon/Rpc.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/storage/ChunkStore.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace chunkfs::storage {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

constexpr std::size_t kMaxPendingStats = 64;

std::uint64_t elapsed_millis(std::chrono::steady_clock::time_point started) {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now() - started)
                                          .count());
}

}  // namespace

class StorageNode::Impl {
public:
    explicit Impl(Config config)
        : config_(std::move(config)),
          store_(config_.storage_directory),
          coordinator_(config_.coordinator_host, config_.coordinator_port, config_.io_timeout, config_.max_payload_bytes),
          server_("node",
                  [this](const protocol::Request& request, const std::string& remote) {
                      return handle(request, remote);
                  },
                  daemon::RpcServer::Options{config_.server_workers, config_.max_payload_bytes, config_.io_timeout}),
          heartbeat_("heartbeat", config_.heartbeat_interval, [this]() { send_heartbeat(); }) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.load(std::memory_order_acquire)) {
            return;
        }
        if (!valid_node_id(config_.node_id)) {
            throw_error(ErrorCode::InvalidArgument,
                        "Invalid node id: " + config_.node_id,
                        "Node ids may contain letters, digits, '_', '-' and '.'");
        }
        store_.open();

        const auto existing = store_.snapshot();
        chunks_stored_.store(existing.size(), std::memory_order_relaxed);

        server_.start(config_.listen_host, config_.listen_port);
        if (config_.report_transfer_stats) {
            stats_pool_ = std::make_unique<WorkerPool>(1);
        }
        running_.store(true, std::memory_order_release);

        log_event(StructuredLogger::Level::Info,
                  "node.started",
                  {{"node_id", config_.node_id},
                   {"address", address()},
                   {"storage", store_.root().string()},
                   {"existing_chunks", std::to_string(existing.size())},
                   {"coordinator", coordinator_.endpoint()}});

        heartbeat_.start();
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        heartbeat_.stop();
        server_.stop();
        if (stats_pool_) {
            stats_pool_->shutdown();
            stats_pool_.reset();
        }
        log_event(StructuredLogger::Level::Info, "node.stopped", {{"node_id", config_.node_id}});
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return server_.port();
    }

    std::string address() const {
        std::string host;
        if (config_.advertise_host.has_value() && !config_.advertise_host->empty()) {
            host = *config_.advertise_host;
        } else if (config_.listen_host.empty() || config_.listen_host == "0.0.0.0") {
            host = "127.0.0.1";
        } else {
            host = config_.listen_host;
        }
        return format_endpoint(host, port());
    }

    const NodeId& id() const noexcept {
        return config_.node_id;
    }

    std::uint64_t store_chunk(const ChunkId& chunk_id, const ChunkData& data) {
        const auto started = std::chrono::steady_clock::now();
        const bool existed = store_.contains(chunk_id);
        const auto size = store_.put(chunk_id, data);
        const auto millis = elapsed_millis(started);

        if (!existed) {
            chunks_stored_.fetch_add(1, std::memory_order_relaxed);
        }
        bytes_written_.fetch_add(size, std::memory_order_relaxed);
        writes_.fetch_add(1, std::memory_order_relaxed);
        write_millis_.fetch_add(millis, std::memory_order_relaxed);

        log_event(StructuredLogger::Level::Info,
                  "node.chunk.stored",
                  {{"chunk_id", chunk_id},
                   {"bytes", std::to_string(size)},
                   {"duration_ms", std::to_string(millis)},
                   {"overwrite", existed ? "true" : "false"}});
        report_stats("store", size, millis);
        return size;
    }

    ChunkData retrieve_chunk(const ChunkId& chunk_id) {
        const auto started = std::chrono::steady_clock::now();
        auto data = store_.get(chunk_id);
        if (!data.has_value()) {
            log_event(StructuredLogger::Level::Warning, "node.chunk.missing", {{"chunk_id", chunk_id}});
            throw_error(ErrorCode::ChunkNotFound, "Chunk not found: " + chunk_id);
        }
        const auto millis = elapsed_millis(started);

        bytes_read_.fetch_add(data->size(), std::memory_order_relaxed);
        reads_.fetch_add(1, std::memory_order_relaxed);
        read_millis_.fetch_add(millis, std::memory_order_relaxed);

        log_event(StructuredLogger::Level::Info,
                  "node.chunk.served",
                  {{"chunk_id", chunk_id},
                   {"bytes", std::to_string(data->size())},
                   {"duration_ms", std::to_string(millis)}});
        report_stats("retrieve", data->size(), millis);
        return std::move(*data);
    }

    NodeMetrics metrics() const {
        NodeMetrics metrics{};
        metrics.chunks_stored = chunks_stored_.load(std::memory_order_relaxed);
        metrics.bytes_written = bytes_written_.load(std::memory_order_relaxed);
        metrics.bytes_read = bytes_read_.load(std::memory_order_relaxed);
        metrics.writes = writes_.load(std::memory_order_relaxed);
        metrics.reads = reads_.load(std::memory_order_relaxed);
        metrics.write_millis = write_millis_.load(std::memory_order_relaxed);
        metrics.read_millis = read_millis_.load(std::memory_order_relaxed);
        return metrics;
    }

    bool send_heartbeat() {
        try {
            const auto chunk_size = coordinator_.heartbeat(config_.node_id, address(), metrics());
            heartbeats_sent_.fetch_add(1, std::memory_order_relaxed);
            if (!registered_.exchange(true, std::memory_order_acq_rel)) {
                log_event(StructuredLogger::Level::Info,
                          "node.heartbeat.registered",
                          {{"node_id", config_.node_id},
                           {"coordinator", coordinator_.endpoint()},
                           {"chunk_size", std::to_string(chunk_size)}});
            }
            chunk_size_.store(chunk_size, std::memory_order_release);
            return true;
        } catch (const Error& error) {
            heartbeats_failed_.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Warning,
                      "node.heartbeat.failed",
                      {{"node_id", config_.node_id},
                       {"code", std::string(error_code_to_string(ErrorCode::NodeUnreachable))},
                       {"cause", std::string(error_code_to_string(error.code()))},
                       {"message", error.message()}});
            return false;
        }
    }

    std::uint64_t heartbeats_sent() const noexcept {
        return heartbeats_sent_.load(std::memory_order_relaxed);
    }

    std::uint64_t heartbeats_failed() const noexcept {
        return heartbeats_failed_.load(std::memory_order_relaxed);
    }

    std::optional<std::uint64_t> coordinator_chunk_size() const noexcept {
        const auto value = chunk_size_.load(std::memory_order_acquire);
        if (value == 0) {
            return std::nullopt;
        }
        return value;
    }

private:
    protocol::Response handle(const protocol::Request& request, const std::string& remote) {
        if (request.command == protocol::command::kPutChunk) {
            const auto chunk_id = protocol::require_field(request.fields, "CHUNK-ID");
            if (!request.has_payload) {
                throw_error(ErrorCode::InvalidArgument, "PUT-CHUNK requires a payload");
            }
            const auto size = store_chunk(chunk_id, request.payload);
            auto response = protocol::make_ok("OK_STORED");
            response.fields["CHUNK-ID"] = chunk_id;
            response.fields["SIZE"] = std::to_string(size);
            response.fields["NODE-ID"] = config_.node_id;
            return response;
        }
        if (request.command == protocol::command::kGetChunk) {
            const auto chunk_id = protocol::require_field(request.fields, "CHUNK-ID");
            auto response = protocol::make_ok("OK_CHUNK");
            response.payload = retrieve_chunk(chunk_id);
            response.has_payload = true;
            response.fields["CHUNK-ID"] = chunk_id;
            response.fields["SIZE"] = std::to_string(response.payload.size());
            return response;
        }
        if (request.command == protocol::command::kMetrics) {
            auto response = protocol::make_ok("OK_METRICS");
            response.fields["NODE-ID"] = config_.node_id;
            protocol::encode_metrics(metrics(), response.fields);
            return response;
        }

        log_event(StructuredLogger::Level::Warning,
                  "node.command.unsupported",
                  {{"remote", remote}, {"command", request.command}});
        throw_error(ErrorCode::ProtocolError, "Unsupported command " + request.command);
    }

    // Best effort; a failed report never affects the chunk operation.
    void report_stats(std::string_view operation, std::uint64_t bytes, std::uint64_t millis) {
        if (!stats_pool_ || stats_pool_->pending() >= kMaxPendingStats) {
            return;
        }
        try {
            stats_pool_->post([this, op = std::string(operation), bytes, millis]() {
                try {
                    coordinator_.report_stats(config_.node_id, op, bytes, millis);
                } catch (const Error& error) {
                    log_event(StructuredLogger::Level::Warning,
                              "node.stats.failed",
                              {{"operation", op},
                               {"code", std::string(error_code_to_string(error.code()))},
                               {"message", error.message()}});
                }
            });
        } catch (const std::runtime_error&) {
            // Pool already shutting down.
        }
    }

    Config config_;
    ChunkStore store_;
    client::CoordinatorClient coordinator_;
    daemon::RpcServer server_;
    PeriodicTask heartbeat_;
    std::unique_ptr<WorkerPool> stats_pool_;
    std::atomic<bool> running_{false};
    std::atomic<bool> registered_{false};

    std::atomic<std::uint64_t> chunks_stored_{0};
    std::atomic<std::uint64_t> bytes_written_{0};
    std::atomic<std::uint64_t> bytes_read_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> reads_{0};
    std::atomic<std::uint64_t> write_millis_{0};
    std::atomic<std::uint64_t> read_millis_{0};

    std::atomic<std::uint64_t> heartbeats_sent_{0};
    std::atomic<std::uint64_t> heartbeats_failed_{0};
    std::atomic<std::uint64_t> chunk_size_{0};
};

StorageNode::StorageNode(Config config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

StorageNode::~StorageNode() = default;

void StorageNode::start() {
    impl_->start();
}

void StorageNode::stop() {
    impl_->stop();
}

bool StorageNode::running() const noexcept {
    return impl_->running();
}

std::uint16_t StorageNode::port() const noexcept {
    return impl_->port();
}

std::string StorageNode::address() const {
    return impl_->address();
}

const NodeId& StorageNode::id() const noexcept {
    return impl_->id();
}

std::uint64_t StorageNode::store_chunk(const ChunkId& chunk_id, const ChunkData& data) {
    return impl_->store_chunk(chunk_id, data);
}

ChunkData StorageNode::retrieve_chunk(const ChunkId& chunk_id) {
    return impl_->retrieve_chunk(chunk_id);
}

NodeMetrics StorageNode::metrics() const {
    return impl_->metrics();
}

bool StorageNode::send_heartbeat() {
    return impl_->send_heartbeat();
}

std::uint64_t StorageNode::heartbeats_sent() const noexcept {
    return impl_->heartbeats_sent();
}

std::uint64_t StorageNode::heartbeats_failed() const noexcept {
    return impl_->heartbeats_failed();
}

std::optional<std::uint64_t> StorageNode::coordinator_chunk_size() const noexcept {
    return impl_->coordinator_chunk_size();
}

}  // namespace chunkfs::storage
