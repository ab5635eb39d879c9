#pragma once

#include "chunkfs/Config.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace chunkfs::test {

class TempDir {
public:
    explicit TempDir(const std::string& label) {
        static std::atomic<unsigned> counter{0};
        path_ = std::filesystem::temp_directory_path()
            / ("chunkfs_" + label + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::uint8_t> random_bytes(std::size_t size, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<std::uint8_t> bytes(size);
    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    return bytes;
}

inline void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Polls until `predicate` holds or `timeout` elapses.
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

// Loopback config with ephemeral ports and short intervals.
inline Config local_config(const TempDir& dir) {
    Config config{};
    config.chunk_size = 64 * 1024;
    config.heartbeat_interval = std::chrono::milliseconds(100);
    config.sweep_interval = std::chrono::milliseconds(100);
    config.liveness_timeout = std::chrono::seconds(5);
    config.io_timeout = std::chrono::seconds(5);
    config.server_workers = 4;
    config.coordinator_host = "127.0.0.1";
    config.listen_host = "127.0.0.1";
    config.listen_port = 0;
    config.metadata_path = (dir / "metadata.db").string();
    config.storage_directory = (dir / "storage").string();
    config.report_transfer_stats = false;
    return config;
}

inline void quiet_logs() {
    daemon::StructuredLogger::instance().set_enabled(false);
}

}  // namespace chunkfs::test
