#pragma once

#include "chunkfs/protocol/Message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chunkfs::daemon {

// Accepts one request per connection and dispatches it to a handler on a
// worker pool. Errors thrown by the handler become ERROR responses.
class RpcServer {
public:
    using Handler = std::function<protocol::Response(const protocol::Request& request,
                                                     const std::string& remote)>;

    struct Options {
        std::size_t workers{8};
        std::size_t max_payload_bytes{256ull * 1024ull * 1024ull};
        std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
    };

    RpcServer(std::string name, Handler handler, Options options);
    ~RpcServer();

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    // Port 0 binds an ephemeral port; port() reports the bound one.
    void start(const std::string& host, std::uint16_t port);
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class RpcClient {
public:
    RpcClient(std::string host,
              std::uint16_t port,
              std::chrono::milliseconds timeout,
              std::size_t max_payload_bytes = 256ull * 1024ull * 1024ull);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // std::nullopt when the peer could not be reached or hung up mid-exchange.
    std::optional<protocol::Response> send(const protocol::Request& request);

    const std::string& host() const noexcept;
    std::uint16_t port() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunkfs::daemon
