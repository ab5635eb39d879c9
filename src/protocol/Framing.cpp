#include "chunkfs/protocol/Framing.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace chunkfs::protocol {

namespace {

constexpr std::size_t kMaxLineLength = 16 * 1024;
constexpr std::size_t kMaxHeaderLines = 1 << 16;

bool recv_line(NativeSocket socket, std::string& line) {
    line.clear();
    char ch = 0;
    while (true) {
        const auto received = ::recv(socket, &ch, 1, 0);
        if (received <= 0) {
            return false;
        }
        if (ch == '\n') {
            break;
        }
        if (ch != '\r') {
            line.push_back(ch);
            if (line.size() > kMaxLineLength) {
                return false;
            }
        }
    }
    return true;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

void append_fields(std::ostringstream& oss, const Fields& fields) {
    for (const auto& [key, value] : fields) {
        if (key == "PAYLOAD-LENGTH" || key == "COMMAND" || key == "STATUS") {
            continue;
        }
        oss << to_upper(key) << ':' << value << "\n";
    }
}

bool send_framed(NativeSocket socket, const std::string& header, bool has_payload, const ChunkData& payload) {
    if (!send_all(socket, reinterpret_cast<const std::uint8_t*>(header.data()), header.size())) {
        return false;
    }
    if (has_payload && !payload.empty()) {
        return send_all(socket, payload.data(), payload.size());
    }
    return true;
}

}  // namespace

void ScopedSocket::reset(NativeSocket handle) {
    if (handle_ != kInvalidSocket) {
        ::shutdown(handle_, SHUT_RDWR);
        ::close(handle_);
    }
    handle_ = handle;
}

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length) {
    std::size_t total_sent = 0;
    while (total_sent < length) {
        const auto sent = ::send(socket, data + total_sent, length - total_sent, MSG_NOSIGNAL);
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_exact(NativeSocket socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t received_total = 0;
    while (received_total < length) {
        const auto received = ::recv(socket, buffer + received_total, length - received_total, 0);
        if (received <= 0) {
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

bool set_socket_timeout(NativeSocket socket, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return true;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const bool receive_ok = ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    const bool send_ok = ::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    return receive_ok && send_ok;
}

std::string socket_peer(NativeSocket socket) {
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        return "unknown";
    }
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (address.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&address);
        if (::inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer)) != nullptr) {
            return std::string(buffer) + ":" + std::to_string(ntohs(v4->sin_port));
        }
    } else if (address.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&address);
        if (::inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
            return std::string(buffer) + ":" + std::to_string(ntohs(v6->sin6_port));
        }
    }
    return "unknown";
}

std::optional<ScopedSocket> open_connection(const std::string& host,
                                            std::uint16_t port,
                                            std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    const auto port_text = std::to_string(port);
    if (::getaddrinfo(host.c_str(), port_text.c_str(), &hints, &result) != 0 || result == nullptr) {
        return std::nullopt;
    }

    std::optional<ScopedSocket> connected;
    for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
        ScopedSocket socket(::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol));
        if (!socket.valid()) {
            continue;
        }
        set_socket_timeout(socket.get(), timeout);
        if (::connect(socket.get(), entry->ai_addr, entry->ai_addrlen) == 0) {
            connected = std::move(socket);
            break;
        }
    }
    ::freeaddrinfo(result);
    return connected;
}

bool write_request(NativeSocket socket, const Request& request) {
    std::ostringstream oss;
    oss << "COMMAND:" << to_upper(request.command) << "\n";
    append_fields(oss, request.fields);
    if (request.has_payload) {
        oss << "PAYLOAD-LENGTH:" << request.payload.size() << "\n";
    }
    oss << "\n";
    return send_framed(socket, oss.str(), request.has_payload, request.payload);
}

bool write_response(NativeSocket socket, const Response& response) {
    std::ostringstream oss;
    oss << "STATUS:" << (response.success ? "OK" : "ERROR") << "\n";
    append_fields(oss, response.fields);
    if (response.has_payload) {
        oss << "PAYLOAD-LENGTH:" << response.payload.size() << "\n";
    }
    oss << "\n";
    return send_framed(socket, oss.str(), response.has_payload, response.payload);
}

RequestReadResult read_request(NativeSocket socket, std::size_t max_payload_bytes) {
    RequestReadResult result;
    std::string line;
    std::optional<std::size_t> payload_length;
    std::size_t lines = 0;
    bool terminated = false;

    while (recv_line(socket, line)) {
        if (line.empty()) {
            terminated = true;
            break;
        }
        if (++lines > kMaxHeaderLines) {
            result.error_code = "PROTOCOL_ERROR";
            result.error_message = "Too many header lines";
            return result;
        }
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            result.error_code = "PROTOCOL_ERROR";
            result.error_message = "Malformed header line";
            return result;
        }
        const auto key = to_upper(line.substr(0, pos));
        auto value = line.substr(pos + 1);
        if (key == "COMMAND") {
            result.request.command = to_upper(std::move(value));
            continue;
        }
        if (key == "PAYLOAD-LENGTH") {
            const auto parsed = parse_uint64(value);
            if (!parsed.has_value()) {
                result.error_code = "PROTOCOL_ERROR";
                result.error_message = "Invalid PAYLOAD-LENGTH";
                return result;
            }
            if (*parsed > max_payload_bytes) {
                result.error_code = "INVALID_ARGUMENT";
                result.error_message = "Payload exceeds server allowance";
                return result;
            }
            payload_length = static_cast<std::size_t>(*parsed);
            result.request.has_payload = true;
            continue;
        }
        result.request.fields[key] = std::move(value);
    }

    if (lines == 0) {
        result.connection_closed = true;
        return result;
    }
    if (!terminated) {
        result.error_code = "PROTOCOL_ERROR";
        result.error_message = "Truncated request header";
        return result;
    }
    if (result.request.command.empty()) {
        result.error_code = "PROTOCOL_ERROR";
        result.error_message = "COMMAND header missing";
        return result;
    }

    if (payload_length.value_or(0) > 0) {
        result.request.payload.resize(*payload_length);
        if (!recv_exact(socket, result.request.payload.data(), *payload_length)) {
            result.error_code = "PROTOCOL_ERROR";
            result.error_message = "Truncated request payload";
            return result;
        }
    }

    result.success = true;
    return result;
}

std::optional<Response> read_response(NativeSocket socket, std::size_t max_payload_bytes) {
    Response response{};
    std::string line;
    std::optional<std::size_t> payload_length;
    bool saw_status = false;
    bool terminated = false;

    while (recv_line(socket, line)) {
        if (line.empty()) {
            terminated = true;
            break;
        }
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        const auto key = to_upper(line.substr(0, pos));
        auto value = line.substr(pos + 1);
        if (key == "STATUS") {
            saw_status = true;
            response.success = to_upper(value) == "OK";
        } else if (key == "PAYLOAD-LENGTH") {
            const auto parsed = parse_uint64(value);
            if (!parsed.has_value() || *parsed > max_payload_bytes) {
                return std::nullopt;
            }
            payload_length = static_cast<std::size_t>(*parsed);
            response.has_payload = true;
        } else {
            response.fields[key] = std::move(value);
        }
    }

    if (!terminated || !saw_status) {
        return std::nullopt;
    }
    if (payload_length.value_or(0) > 0) {
        response.payload.resize(*payload_length);
        if (!recv_exact(socket, response.payload.data(), *payload_length)) {
            return std::nullopt;
        }
    }
    return response;
}

}  // namespace chunkfs::protocol
