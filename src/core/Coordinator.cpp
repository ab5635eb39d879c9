#include "chunkfs/core/Coordinator.hpp"

#include "chunkfs/Error.hpp"
#include "chunkfs/core/NodeRegistry.hpp"
#include "chunkfs/core/PeriodicTask.hpp"
#include "chunkfs/daemon/Rpc.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/protocol/Message.hpp"

#include <atomic>
#include <cstdio>
#include <unordered_map>
#include <utility>

namespace chunkfs {

using daemon::StructuredLogger;
using daemon::log_event;
using namespace protocol;

namespace {

std::string format_throughput(std::uint64_t bytes, std::uint64_t millis) {
    const double seconds = static_cast<double>(millis == 0 ? 1 : millis) / 1000.0;
    const double mib = static_cast<double>(bytes) / (1024.0 * 1024.0);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", mib / seconds);
    return buffer;
}

}  // namespace

class Coordinator::Impl {
public:
    explicit Impl(Config config)
        : config_(std::move(config)),
          store_(config_.metadata_path,
                 config_.chunk_size,
                 config_.liveness_timeout,
                 config_.max_chunks_per_file),
          server_("coordinator",
                  [this](const Request& request, const std::string& remote) { return handle(request, remote); },
                  daemon::RpcServer::Options{config_.server_workers, config_.max_payload_bytes, config_.io_timeout}),
          sweep_("liveness-sweep", config_.sweep_interval, [this]() { sweep_now(); }) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.load(std::memory_order_acquire)) {
            return;
        }
        store_.load();
        log_event(StructuredLogger::Level::Info,
                  "coordinator.metadata.loaded",
                  {{"path", store_.state_path().string()},
                   {"files", std::to_string(store_.file_count())},
                   {"nodes", std::to_string(store_.nodes().size())},
                   {"chunk_size", std::to_string(store_.chunk_size())}});

        server_.start(config_.listen_host, config_.listen_port);
        sweep_.start();
        running_.store(true, std::memory_order_release);
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        sweep_.stop();
        server_.stop();
        log_event(StructuredLogger::Level::Info, "coordinator.stopped");
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return server_.port();
    }

    void sweep_now() {
        const auto transitions = store_.sweep(Clock::now());
        for (const auto& transition : transitions) {
            const auto level = transition.to == NodeStatus::Inactive ? StructuredLogger::Level::Warning
                                                                     : StructuredLogger::Level::Info;
            log_event(level,
                      "coordinator.node.status_changed",
                      {{"node_id", transition.id},
                       {"from", node_status_to_string(transition.from)},
                       {"to", node_status_to_string(transition.to)}});
        }
    }

    MetadataStore& store() noexcept {
        return store_;
    }

private:
    Response handle(const Request& request, const std::string& remote) {
        if (request.command == command::kRegister) {
            return handle_register(request, remote);
        }
        if (request.command == command::kListFiles) {
            auto response = make_ok("OK_FILES");
            encode_file_summaries(store_.list_files(), response.fields);
            return response;
        }
        if (request.command == command::kFileInfo) {
            const auto filename = require_field(request.fields, "FILENAME");
            const auto record = store_.find_file(filename);
            if (!record.has_value()) {
                throw_error(ErrorCode::NotFound, "File not found: " + filename, "Run listfiles to see stored files");
            }
            auto response = make_ok("OK_FILE");
            encode_file_record(*record, response.fields);
            return response;
        }
        if (request.command == command::kHeartbeat) {
            return handle_heartbeat(request);
        }
        if (request.command == command::kNodes) {
            return handle_nodes();
        }
        if (request.command == command::kStats) {
            return handle_stats(request, remote);
        }

        log_event(StructuredLogger::Level::Warning,
                  "coordinator.command.unsupported",
                  {{"remote", remote}, {"command", request.command}});
        throw_error(ErrorCode::ProtocolError, "Unsupported command " + request.command);
    }

    Response handle_register(const Request& request, const std::string& remote) {
        const auto filename = require_field(request.fields, "FILENAME");
        const auto size = require_uint64(request.fields, "SIZE");
        try {
            const auto record = store_.register_file(filename, size, Clock::now());
            std::unordered_map<NodeId, std::size_t> per_node;
            for (const auto& chunk : record.chunks) {
                ++per_node[chunk.node_id];
            }
            log_event(StructuredLogger::Level::Info,
                      "coordinator.file.registered",
                      {{"filename", record.filename},
                       {"file_id", record.file_id},
                       {"size", std::to_string(record.size)},
                       {"chunks", std::to_string(record.chunks.size())},
                       {"nodes", std::to_string(per_node.size())},
                       {"remote", remote}});
            auto response = make_ok("OK_REGISTERED");
            encode_file_record(record, response.fields);
            return response;
        } catch (const Error& error) {
            log_event(StructuredLogger::Level::Warning,
                      "coordinator.file.rejected",
                      {{"filename", filename},
                       {"code", std::string(error_code_to_string(error.code()))},
                       {"message", error.message()}});
            throw;
        }
    }

    Response handle_heartbeat(const Request& request) {
        const auto node_id = require_field(request.fields, "NODE-ID");
        const auto address = require_field(request.fields, "ADDRESS");
        const auto metrics = decode_metrics(request.fields);

        const auto result = store_.record_heartbeat(node_id, address, metrics, Clock::now());
        if (result.created) {
            log_event(StructuredLogger::Level::Info,
                      "coordinator.node.registered",
                      {{"node_id", node_id}, {"address", address}});
        } else if (result.reactivated) {
            log_event(StructuredLogger::Level::Info,
                      "coordinator.node.status_changed",
                      {{"node_id", node_id}, {"from", "inactive"}, {"to", "active"}});
        }
        if (result.address_changed) {
            log_event(StructuredLogger::Level::Info,
                      "coordinator.node.address_changed",
                      {{"node_id", node_id}, {"address", address}});
        }

        auto response = make_ok("OK_HEARTBEAT");
        response.fields["CHUNK-SIZE"] = std::to_string(store_.chunk_size());
        return response;
    }

    Response handle_nodes() {
        const auto now = Clock::now();
        std::vector<NodeView> views;
        for (const auto& node : store_.nodes()) {
            NodeView view{};
            view.id = node.id;
            view.address = node.address;
            view.metrics = node.metrics;
            view.status = derive_node_status(node.last_heartbeat, now, config_.liveness_timeout);
            view.heartbeat_age_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - node.last_heartbeat).count();
            views.push_back(std::move(view));
        }
        auto response = make_ok("OK_NODES");
        encode_nodes(views, response.fields);
        return response;
    }

    Response handle_stats(const Request& request, const std::string& remote) {
        const auto node_id = require_field(request.fields, "NODE-ID");
        const auto operation = require_field(request.fields, "OPERATION");
        const auto bytes = require_uint64(request.fields, "BYTES");
        const auto millis = require_uint64(request.fields, "DURATION-MS");
        log_event(StructuredLogger::Level::Info,
                  "coordinator.transfer.stats",
                  {{"node_id", node_id},
                   {"operation", operation},
                   {"bytes", std::to_string(bytes)},
                   {"duration_ms", std::to_string(millis)},
                   {"throughput_mib_s", format_throughput(bytes, millis)},
                   {"remote", remote}});
        return make_ok("OK_STATS");
    }

    Config config_;
    MetadataStore store_;
    daemon::RpcServer server_;
    PeriodicTask sweep_;
    std::atomic<bool> running_{false};
};

Coordinator::Coordinator(Config config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Coordinator::~Coordinator() = default;

void Coordinator::start() {
    impl_->start();
}

void Coordinator::stop() {
    impl_->stop();
}

bool Coordinator::running() const noexcept {
    return impl_->running();
}

std::uint16_t Coordinator::port() const noexcept {
    return impl_->port();
}

void Coordinator::sweep_now() {
    impl_->sweep_now();
}

MetadataStore& Coordinator::store() noexcept {
    return impl_->store();
}

}  // namespace chunkfs
