#include "chunkfs/core/MetadataStore.hpp"

#include "chunkfs/Error.hpp"
#include "chunkfs/core/ChunkPlanner.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace chunkfs {

namespace {

constexpr const char* kStateHeader = "CHUNKFS-METADATA";
constexpr int kStateVersion = 1;

// Filenames may contain spaces; the state file is whitespace separated.
std::string escape_token(const std::string& value) {
    std::ostringstream oss;
    for (const unsigned char ch : value) {
        if (ch == '%' || std::isspace(ch) || ch < 0x20 || ch >= 0x7F) {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(ch)
                << std::dec;
        } else {
            oss << static_cast<char>(ch);
        }
    }
    return oss.str();
}

std::optional<std::string> unescape_token(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            result.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.size()) {
            return std::nullopt;
        }
        const auto hex = value.substr(i + 1, 2);
        if (!std::isxdigit(static_cast<unsigned char>(hex[0]))
            || !std::isxdigit(static_cast<unsigned char>(hex[1]))) {
            return std::nullopt;
        }
        result.push_back(static_cast<char>(std::stoi(hex, nullptr, 16)));
        i += 2;
    }
    return result;
}

[[noreturn]] void corrupt_state(const std::filesystem::path& path, const std::string& detail) {
    throw_error(ErrorCode::StorageFailure,
                "Corrupt metadata file " + path.string() + ": " + detail,
                "Restore the file from a backup or move it aside to start empty");
}

void write_node(std::ostream& out, const NodeRecord& node) {
    const auto& m = node.metrics;
    out << "NODE " << node.id << ' ' << node.address << ' ' << to_unix_millis(node.registered_at) << ' '
        << to_unix_millis(node.last_heartbeat) << ' ' << node_status_to_string(node.status) << ' '
        << m.chunks_stored << ' ' << m.bytes_written << ' ' << m.bytes_read << ' ' << m.writes << ' ' << m.reads
        << ' ' << m.write_millis << ' ' << m.read_millis << '\n';
}

void write_file(std::ostream& out, const FileRecord& file) {
    out << "FILE " << escape_token(file.filename) << ' ' << file.file_id << ' ' << file.size << ' '
        << file.chunk_size << ' ' << file.created_at << ' ' << file.chunks.size() << '\n';
    for (const auto& chunk : file.chunks) {
        out << "CHUNK " << chunk.index << ' ' << chunk.chunk_id << ' ' << chunk.node_id << ' '
            << chunk.node_address << ' ' << chunk.start << ' ' << chunk.size << '\n';
    }
}

}  // namespace

MetadataStore::MetadataStore(std::filesystem::path state_path,
                             std::uint64_t chunk_size,
                             std::chrono::milliseconds liveness_timeout,
                             std::uint64_t max_chunks_per_file)
    : state_path_(std::move(state_path)),
      chunk_size_(chunk_size),
      max_chunks_per_file_(max_chunks_per_file),
      registry_(liveness_timeout) {
    if (chunk_size_ == 0) {
        throw_error(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
}

bool MetadataStore::valid_filename(const std::string& filename) noexcept {
    if (filename.empty() || filename.size() > 1024 || filename == "." || filename == "..") {
        return false;
    }
    for (const unsigned char ch : filename) {
        if (ch < 0x20 || ch == 0x7F || ch == '/') {
            return false;
        }
    }
    return true;
}

void MetadataStore::load() {
    std::scoped_lock lock(mutex_);
    if (state_path_.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::exists(state_path_, ec)) {
        return;
    }

    std::ifstream input(state_path_);
    if (!input) {
        throw_error(ErrorCode::StorageFailure, "Cannot open metadata file " + state_path_.string());
    }

    std::string header;
    int version = 0;
    if (!(input >> header >> version) || header != kStateHeader || version != kStateVersion) {
        corrupt_state(state_path_, "unexpected header");
    }

    std::map<std::string, FileRecord> files;
    NodeRegistry registry(registry_.timeout());
    std::uint64_t last_file_id = 0;
    bool saw_end = false;

    std::string tag;
    while (input >> tag) {
        if (tag == "LAST-FILE-ID") {
            if (!(input >> last_file_id)) {
                corrupt_state(state_path_, "bad LAST-FILE-ID");
            }
        } else if (tag == "CHUNK-SIZE") {
            std::uint64_t ignored = 0;
            if (!(input >> ignored)) {
                corrupt_state(state_path_, "bad CHUNK-SIZE");
            }
        } else if (tag == "NODE") {
            NodeRecord node{};
            std::int64_t registered = 0;
            std::int64_t heartbeat = 0;
            std::string status;
            auto& m = node.metrics;
            if (!(input >> node.id >> node.address >> registered >> heartbeat >> status >> m.chunks_stored
                      >> m.bytes_written >> m.bytes_read >> m.writes >> m.reads >> m.write_millis >> m.read_millis)) {
                corrupt_state(state_path_, "bad NODE record");
            }
            const auto parsed_status = node_status_from_string(status);
            if (!parsed_status.has_value()) {
                corrupt_state(state_path_, "bad node status " + status);
            }
            node.registered_at = from_unix_millis(registered);
            node.last_heartbeat = from_unix_millis(heartbeat);
            node.status = *parsed_status;
            registry.restore(std::move(node));
        } else if (tag == "FILE") {
            FileRecord file{};
            std::string escaped;
            std::size_t count = 0;
            if (!(input >> escaped >> file.file_id >> file.size >> file.chunk_size >> file.created_at >> count)) {
                corrupt_state(state_path_, "bad FILE record");
            }
            auto name = unescape_token(escaped);
            if (!name.has_value()) {
                corrupt_state(state_path_, "bad filename encoding");
            }
            file.filename = std::move(*name);
            file.chunks.reserve(std::min<std::size_t>(count, 4096));
            for (std::size_t i = 0; i < count; ++i) {
                ChunkDescriptor chunk{};
                if (!(input >> tag) || tag != "CHUNK"
                    || !(input >> chunk.index >> chunk.chunk_id >> chunk.node_id >> chunk.node_address >> chunk.start
                               >> chunk.size)) {
                    corrupt_state(state_path_, "bad CHUNK record for " + file.filename);
                }
                file.chunks.push_back(std::move(chunk));
            }
            if (!plan_covers_file(file.chunks, file.size)) {
                corrupt_state(state_path_, "chunk plan does not cover " + file.filename);
            }
            auto key = file.filename;
            files.insert_or_assign(std::move(key), std::move(file));
        } else if (tag == "END") {
            saw_end = true;
            break;
        } else {
            corrupt_state(state_path_, "unknown record " + tag);
        }
    }

    if (!saw_end) {
        corrupt_state(state_path_, "truncated file");
    }

    files_ = std::move(files);
    registry_ = std::move(registry);
    last_file_id_ = last_file_id;
}

FileRecord MetadataStore::register_file(const std::string& filename, std::uint64_t size, Clock::time_point now) {
    if (!valid_filename(filename)) {
        throw_error(ErrorCode::InvalidArgument,
                    "Invalid filename '" + filename + "'",
                    "Names must be non-empty and free of '/' and control characters");
    }
    if (chunk_count(size, chunk_size_) > max_chunks_per_file_) {
        throw_error(ErrorCode::InvalidArgument,
                    "File size " + std::to_string(size) + " needs more than "
                        + std::to_string(max_chunks_per_file_) + " chunks",
                    "Split the file or raise the coordinator chunk size");
    }

    std::scoped_lock lock(mutex_);
    if (files_.find(filename) != files_.end()) {
        throw_error(ErrorCode::DuplicateFile,
                    "File '" + filename + "' already exists",
                    "Choose another name; stored files are immutable");
    }

    // Snapshot is copied out of the registry so the plan below cannot observe
    // a partially updated node list.
    const auto snapshot = registry_.active_snapshot(now);
    if (snapshot.empty()) {
        throw_error(ErrorCode::NoActiveNodes,
                    "No active storage nodes available",
                    "Start a storage node or wait for its next heartbeat");
    }

    const auto previous_file_id = last_file_id_;
    FileRecord record{};
    record.filename = filename;
    record.file_id = next_file_id_locked(now);
    record.size = size;
    record.chunk_size = chunk_size_;
    record.created_at = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    record.chunks = plan_chunks(record.file_id, size, chunk_size_, snapshot);

    files_.emplace(filename, record);
    try {
        flush_locked();
    } catch (const Error&) {
        files_.erase(filename);
        last_file_id_ = previous_file_id;
        throw;
    }
    return record;
}

std::optional<FileRecord> MetadataStore::find_file(const std::string& filename) const {
    std::scoped_lock lock(mutex_);
    const auto it = files_.find(filename);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileSummary> MetadataStore::list_files() const {
    std::scoped_lock lock(mutex_);
    std::vector<FileSummary> summaries;
    summaries.reserve(files_.size());
    for (const auto& [name, record] : files_) {
        summaries.push_back(FileSummary{name, record.size, record.created_at});
    }
    return summaries;
}

NodeRegistry::HeartbeatResult MetadataStore::record_heartbeat(const NodeId& node_id,
                                                              const std::string& address,
                                                              const NodeMetrics& metrics,
                                                              Clock::time_point now) {
    if (!valid_node_id(node_id)) {
        throw_error(ErrorCode::InvalidArgument, "Invalid node id '" + node_id + "'");
    }
    if (!parse_endpoint(address).has_value()) {
        throw_error(ErrorCode::InvalidArgument, "Invalid node address '" + address + "'", "Expected host:port");
    }

    std::scoped_lock lock(mutex_);
    const auto previous = registry_.find(node_id);
    const auto result = registry_.upsert(node_id, address, metrics, now);
    try {
        flush_locked();
    } catch (const Error&) {
        if (previous.has_value()) {
            registry_.restore(*previous);
        } else {
            auto nodes = registry_.nodes();
            NodeRegistry rebuilt(registry_.timeout());
            for (auto& node : nodes) {
                if (node.id != node_id) {
                    rebuilt.restore(std::move(node));
                }
            }
            registry_ = std::move(rebuilt);
        }
        throw;
    }
    return result;
}

std::vector<NodeRegistry::Transition> MetadataStore::sweep(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto transitions = registry_.refresh(now);
    if (transitions.empty()) {
        return transitions;
    }
    try {
        flush_locked();
    } catch (const Error&) {
        // Undo so the next sweep reports and persists the same transitions.
        for (const auto& transition : transitions) {
            if (auto record = registry_.find(transition.id)) {
                record->status = transition.from;
                registry_.restore(std::move(*record));
            }
        }
        throw;
    }
    return transitions;
}

std::vector<NodeRecord> MetadataStore::nodes() const {
    std::scoped_lock lock(mutex_);
    return registry_.nodes();
}

std::vector<NodeRecord> MetadataStore::active_nodes(Clock::time_point now) const {
    std::scoped_lock lock(mutex_);
    return registry_.active_snapshot(now);
}

std::size_t MetadataStore::file_count() const {
    std::scoped_lock lock(mutex_);
    return files_.size();
}

FileId MetadataStore::next_file_id_locked(Clock::time_point now) {
    const auto millis = static_cast<std::uint64_t>(std::max<std::int64_t>(to_unix_millis(now), 0));
    last_file_id_ = millis > last_file_id_ ? millis : last_file_id_ + 1;
    return std::to_string(last_file_id_);
}

void MetadataStore::flush_locked() const {
    if (state_path_.empty()) {
        return;
    }

    std::error_code ec;
    if (const auto parent = state_path_.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw_error(ErrorCode::StorageFailure,
                        "Cannot create metadata directory " + parent.string() + ": " + ec.message());
        }
    }

    auto temp_path = state_path_;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output) {
            throw_error(ErrorCode::StorageFailure, "Cannot write metadata file " + temp_path.string());
        }
        output << kStateHeader << ' ' << kStateVersion << '\n';
        output << "CHUNK-SIZE " << chunk_size_ << '\n';
        output << "LAST-FILE-ID " << last_file_id_ << '\n';
        for (const auto& node : registry_.nodes()) {
            write_node(output, node);
        }
        for (const auto& [name, file] : files_) {
            write_file(output, file);
        }
        output << "END\n";
        output.flush();
        if (!output) {
            output.close();
            std::filesystem::remove(temp_path, ec);
            throw_error(ErrorCode::StorageFailure, "Failed writing metadata file " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, state_path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw_error(ErrorCode::StorageFailure,
                    "Cannot replace metadata file " + state_path_.string() + ": " + ec.message());
    }
}

}  // namespace chunkfs
