#include "chunkfs/Types.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace chunkfs {

std::string make_chunk_id(const FileId& file_id, std::uint64_t index) {
    return file_id + "_" + std::to_string(index);
}

const char* node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::Active:
            return "active";
        case NodeStatus::Inactive:
            return "inactive";
    }
    return "inactive";
}

std::optional<NodeStatus> node_status_from_string(std::string_view text) {
    if (text == "active") {
        return NodeStatus::Active;
    }
    if (text == "inactive") {
        return NodeStatus::Inactive;
    }
    return std::nullopt;
}

bool valid_node_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    for (const unsigned char ch : id) {
        if (!std::isalnum(ch) && ch != '_' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

std::int64_t to_unix_millis(Clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

Clock::time_point from_unix_millis(std::int64_t millis) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& endpoint) {
    const auto pos = endpoint.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= endpoint.size()) {
        return std::nullopt;
    }
    const auto host = endpoint.substr(0, pos);
    for (const unsigned char ch : host) {
        if (std::isspace(ch) || ch == ',' || ch < 0x20) {
            return std::nullopt;
        }
    }
    const auto port_text = std::string_view(endpoint).substr(pos + 1);

    std::uint32_t port = 0;
    const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size()) {
        return std::nullopt;
    }
    if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<std::uint16_t>(port));
}

std::string format_endpoint(const std::string& host, std::uint16_t port) {
    return host + ":" + std::to_string(port);
}

}  // namespace chunkfs
