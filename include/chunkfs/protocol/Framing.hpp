#pragma once

#include "chunkfs/protocol/Message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkfs::protocol {

using NativeSocket = int;
inline constexpr NativeSocket kInvalidSocket = -1;

class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(NativeSocket handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ScopedSocket(ScopedSocket&& other) noexcept : handle_(other.handle_) {
        other.handle_ = kInvalidSocket;
    }
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = kInvalidSocket;
        }
        return *this;
    }
    ~ScopedSocket() { reset(); }

    NativeSocket get() const { return handle_; }
    bool valid() const { return handle_ != kInvalidSocket; }
    explicit operator bool() const { return valid(); }

    void reset(NativeSocket handle = kInvalidSocket);

private:
    NativeSocket handle_{kInvalidSocket};
};

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length);
bool recv_exact(NativeSocket socket, std::uint8_t* buffer, std::size_t length);

// Applies the same timeout to receive and send.
bool set_socket_timeout(NativeSocket socket, std::chrono::milliseconds timeout);

std::string socket_peer(NativeSocket socket);

std::optional<ScopedSocket> open_connection(const std::string& host,
                                            std::uint16_t port,
                                            std::chrono::milliseconds timeout);

bool write_request(NativeSocket socket, const Request& request);
bool write_response(NativeSocket socket, const Response& response);

struct RequestReadResult {
    bool success{false};
    // Peer disconnected before sending a header line.
    bool connection_closed{false};
    Request request;
    std::string error_code;
    std::string error_message;
};

RequestReadResult read_request(NativeSocket socket, std::size_t max_payload_bytes);

// std::nullopt when the stream ended before a complete response arrived.
std::optional<Response> read_response(NativeSocket socket, std::size_t max_payload_bytes);

}  // namespace chunkfs::protocol
