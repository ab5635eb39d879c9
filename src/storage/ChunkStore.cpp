#include "chunkfs/storage/ChunkStore.hpp"

#include "chunkfs/Error.hpp"

#include <atomic>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

namespace chunkfs::storage {

namespace {

constexpr std::string_view kTempSuffix = ".tmp";

std::atomic<std::uint64_t> g_temp_counter{0};

bool is_temp_name(const std::string& name) {
    return name.size() > kTempSuffix.size()
        && name.compare(name.size() - kTempSuffix.size(), kTempSuffix.size(), kTempSuffix) == 0;
}

}  // namespace

ChunkStore::ChunkStore(std::filesystem::path root)
    : root_(std::move(root)) {}

void ChunkStore::open() {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        if (!std::filesystem::is_directory(root_, ec)) {
            throw_error(ErrorCode::StorageFailure,
                        "Storage path is not a directory: " + root_.string(),
                        "Point --storage at a directory");
        }
        return;
    }
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw_error(ErrorCode::StorageFailure,
                    "Cannot create storage directory " + root_.string() + ": " + ec.message());
    }
}

bool ChunkStore::valid_chunk_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 255 || id == "." || id == "..") {
        return false;
    }
    for (const unsigned char ch : id) {
        if (!std::isalnum(ch) && ch != '_' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return !is_temp_name(std::string(id));
}

std::filesystem::path ChunkStore::path_for(const ChunkId& id) const {
    if (!valid_chunk_id(id)) {
        throw_error(ErrorCode::InvalidArgument, "Invalid chunk id: " + id);
    }
    return root_ / id;
}

std::uint64_t ChunkStore::put(const ChunkId& id, const ChunkData& data) {
    const auto target = path_for(id);
    auto temp = target;
    temp += "." + std::to_string(g_temp_counter.fetch_add(1, std::memory_order_relaxed)) + std::string(kTempSuffix);

    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw_error(ErrorCode::StorageFailure, "Cannot open " + temp.string() + " for writing");
        }
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        output.flush();
        if (!output) {
            output.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw_error(ErrorCode::StorageFailure, "Short write on chunk " + id);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw_error(ErrorCode::StorageFailure, "Cannot commit chunk " + id + ": " + ec.message());
    }
    return data.size();
}

std::optional<ChunkData> ChunkStore::get(const ChunkId& id) const {
    const auto path = path_for(id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw_error(ErrorCode::StorageFailure, "Cannot stat chunk " + id + ": " + ec.message());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw_error(ErrorCode::StorageFailure, "Cannot open chunk " + id);
    }
    ChunkData data(static_cast<std::size_t>(size));
    input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::uintmax_t>(input.gcount()) != size) {
        throw_error(ErrorCode::StorageFailure, "Short read on chunk " + id);
    }
    return data;
}

bool ChunkStore::contains(const ChunkId& id) const {
    if (!valid_chunk_id(id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(root_ / id, ec);
}

std::vector<ChunkStore::SnapshotEntry> ChunkStore::snapshot() const {
    std::vector<SnapshotEntry> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return entries;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (!valid_chunk_id(name)) {
            continue;
        }
        const auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        entries.push_back(SnapshotEntry{name, static_cast<std::uint64_t>(size)});
    }
    return entries;
}

std::size_t ChunkStore::size() const {
    return snapshot().size();
}

}  // namespace chunkfs::storage
