#include "chunkfs/daemon/Rpc.hpp"

#include "chunkfs/core/WorkerPool.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/protocol/Framing.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace chunkfs::daemon {

using protocol::NativeSocket;
using protocol::ScopedSocket;
using protocol::kInvalidSocket;

class RpcServer::Impl {
public:
    Impl(std::string name, Handler handler, Options options)
        : name_(std::move(name)), handler_(std::move(handler)), options_(options) {}

    ~Impl() {
        stop();
    }

    void start(const std::string& host, std::uint16_t port) {
        if (running_.load(std::memory_order_acquire)) {
            return;
        }

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        hints.ai_flags = AI_PASSIVE;
        addrinfo* result = nullptr;
        const auto port_text = std::to_string(port);
        const char* node = host.empty() ? nullptr : host.c_str();
        if (::getaddrinfo(node, port_text.c_str(), &hints, &result) != 0 || result == nullptr) {
            throw std::runtime_error("Invalid listen host: " + host);
        }

        ScopedSocket server(::socket(result->ai_family, result->ai_socktype, result->ai_protocol));
        if (!server.valid()) {
            ::freeaddrinfo(result);
            throw std::runtime_error("Failed to create " + name_ + " socket");
        }

        const int opt = 1;
        ::setsockopt(server.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        const bool bound = ::bind(server.get(), result->ai_addr, result->ai_addrlen) == 0;
        ::freeaddrinfo(result);
        if (!bound) {
            throw std::runtime_error("Failed to bind " + name_ + " socket on " + host + ":" + port_text
                                     + " (" + std::strerror(errno) + ")");
        }
        if (::listen(server.get(), SOMAXCONN) < 0) {
            throw std::runtime_error("Failed to listen on " + name_ + " socket");
        }

        sockaddr_in bound_addr{};
        socklen_t length = sizeof(bound_addr);
        if (::getsockname(server.get(), reinterpret_cast<sockaddr*>(&bound_addr), &length) == 0) {
            port_.store(ntohs(bound_addr.sin_port), std::memory_order_release);
        } else {
            port_.store(port, std::memory_order_release);
        }

        pool_ = std::make_unique<WorkerPool>(options_.workers);
        {
            std::scoped_lock lock(socket_mutex_);
            listen_socket_ = std::move(server);
        }
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        log_event(StructuredLogger::Level::Info,
                  "rpc.server.started",
                  {{"server", name_},
                   {"host", host},
                   {"port", std::to_string(port_.load(std::memory_order_acquire))},
                   {"workers", std::to_string(pool_->size())}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        {
            std::scoped_lock lock(socket_mutex_);
            listen_socket_.reset();
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (pool_) {
            pool_->shutdown();
            pool_.reset();
        }
        log_event(StructuredLogger::Level::Info, "rpc.server.stopped", {{"server", name_}});
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return port_.load(std::memory_order_acquire);
    }

private:
    void accept_loop() {
        NativeSocket listener = kInvalidSocket;
        {
            std::scoped_lock lock(socket_mutex_);
            listener = listen_socket_.get();
        }
        while (running_.load(std::memory_order_acquire)) {
            const auto client = ::accept(listener, nullptr, nullptr);
            if (client == kInvalidSocket) {
                if (running_.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            auto connection = std::make_shared<ScopedSocket>(client);
            try {
                pool_->post([this, connection]() { serve(connection->get()); });
            } catch (const std::runtime_error& ex) {
                log_event(StructuredLogger::Level::Warning,
                          "rpc.connection.rejected",
                          {{"server", name_}, {"error", ex.what()}});
            }
        }
    }

    void serve(NativeSocket client) {
        protocol::set_socket_timeout(client, options_.io_timeout);
        const auto remote = protocol::socket_peer(client);

        auto parse = protocol::read_request(client, options_.max_payload_bytes);
        if (parse.connection_closed) {
            return;
        }
        if (!parse.success) {
            const auto code = error_code_from_string(parse.error_code).value_or(ErrorCode::ProtocolError);
            log_event(StructuredLogger::Level::Warning,
                      "rpc.request.parse_error",
                      {{"server", name_},
                       {"remote", remote},
                       {"code", std::string(error_code_to_string(code))},
                       {"message", parse.error_message}});
            protocol::write_response(client, protocol::make_error(code, parse.error_message));
            return;
        }

        protocol::Response response;
        try {
            response = handler_(parse.request, remote);
        } catch (const Error& error) {
            response = protocol::make_error(error);
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error,
                      "rpc.request.failed",
                      {{"server", name_},
                       {"remote", remote},
                       {"command", parse.request.command},
                       {"error", ex.what()}});
            response = protocol::make_error(ErrorCode::StorageFailure, ex.what());
        }

        if (!protocol::write_response(client, response)) {
            log_event(StructuredLogger::Level::Warning,
                      "rpc.response.write_failed",
                      {{"server", name_}, {"remote", remote}, {"command", parse.request.command}});
        }
    }

    std::string name_;
    Handler handler_;
    Options options_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    std::mutex socket_mutex_;
    ScopedSocket listen_socket_;
    std::thread accept_thread_;
    std::unique_ptr<WorkerPool> pool_;
};

RpcServer::RpcServer(std::string name, Handler handler, Options options)
    : impl_(std::make_unique<Impl>(std::move(name), std::move(handler), options)) {}

RpcServer::~RpcServer() = default;

void RpcServer::start(const std::string& host, std::uint16_t port) {
    impl_->start(host, port);
}

void RpcServer::stop() {
    impl_->stop();
}

bool RpcServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t RpcServer::port() const noexcept {
    return impl_->port();
}

class RpcClient::Impl {
public:
    Impl(std::string host, std::uint16_t port, std::chrono::milliseconds timeout, std::size_t max_payload_bytes)
        : host_(std::move(host)), port_(port), timeout_(timeout), max_payload_bytes_(max_payload_bytes) {}

    std::optional<protocol::Response> send(const protocol::Request& request) {
        const auto& target = (host_.empty() || host_ == "0.0.0.0") ? kLoopback : host_;
        auto socket = protocol::open_connection(target, port_, timeout_);
        if (!socket.has_value()) {
            return std::nullopt;
        }
        if (!protocol::write_request(socket->get(), request)) {
            return std::nullopt;
        }
        return protocol::read_response(socket->get(), max_payload_bytes_);
    }

    std::string host_;
    std::uint16_t port_;

private:
    inline static const std::string kLoopback{"127.0.0.1"};

    std::chrono::milliseconds timeout_;
    std::size_t max_payload_bytes_;
};

RpcClient::RpcClient(std::string host,
                     std::uint16_t port,
                     std::chrono::milliseconds timeout,
                     std::size_t max_payload_bytes)
    : impl_(std::make_unique<Impl>(std::move(host), port, timeout, max_payload_bytes)) {}

RpcClient::~RpcClient() = default;

std::optional<protocol::Response> RpcClient::send(const protocol::Request& request) {
    return impl_->send(request);
}

const std::string& RpcClient::host() const noexcept {
    return impl_->host_;
}

std::uint16_t RpcClient::port() const noexcept {
    return impl_->port_;
}

}  // namespace chunkfs::daemon
