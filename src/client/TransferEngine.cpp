#include "chunkfs/client/TransferEngine.hpp"

#include "chunkfs/core/ChunkPlanner.hpp"
#include "chunkfs/core/WorkerPool.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <future>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkfs::client {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

class ScopedFile {
public:
    ScopedFile(const std::filesystem::path& path, int flags, mode_t mode = 0644)
        : fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)) {}
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;
    ~ScopedFile() { close(); }

    bool valid() const { return fd_ >= 0; }
    int get() const { return fd_; }

    bool close() {
        if (fd_ < 0) {
            return true;
        }
        const bool ok = ::close(fd_) == 0;
        fd_ = -1;
        return ok;
    }

private:
    int fd_{-1};
};

bool read_at(int fd, std::uint8_t* buffer, std::size_t length, std::uint64_t offset) {
    std::size_t done = 0;
    while (done < length) {
        const auto n = ::pread(fd, buffer + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool write_at(int fd, const std::uint8_t* buffer, std::size_t length, std::uint64_t offset) {
    std::size_t done = 0;
    while (done < length) {
        const auto n = ::pwrite(fd, buffer + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

ChunkOutcome outcome_for(const ChunkDescriptor& chunk) {
    ChunkOutcome outcome{};
    outcome.index = chunk.index;
    outcome.chunk_id = chunk.chunk_id;
    outcome.node_id = chunk.node_id;
    outcome.node_address = chunk.node_address;
    return outcome;
}

void fail(ChunkOutcome& outcome, ErrorCode code, std::string message) {
    outcome.success = false;
    outcome.error = code;
    outcome.message = std::move(message);
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

void log_report(const TransferReport& report) {
    StructuredLogger::FieldList fields{{"filename", report.filename},
                                       {"file_id", report.file_id},
                                       {"bytes", std::to_string(report.total_bytes)},
                                       {"chunks", std::to_string(report.chunk_count)},
                                       {"duration_ms", std::to_string(report.duration.count())}};
    if (report.complete()) {
        log_event(StructuredLogger::Level::Info, "client." + report.operation + ".completed", std::move(fields));
        return;
    }
    std::string failed;
    for (const auto index : report.failed_indices()) {
        if (!failed.empty()) {
            failed.push_back(',');
        }
        failed += std::to_string(index);
    }
    fields.emplace_back("failed_chunks", failed);
    log_event(StructuredLogger::Level::Error, "client." + report.operation + ".incomplete", std::move(fields));
}

}  // namespace

std::vector<std::uint64_t> TransferReport::failed_indices() const {
    std::vector<std::uint64_t> indices;
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            indices.push_back(outcome.index);
        }
    }
    return indices;
}

double TransferReport::throughput_mib_s() const noexcept {
    const auto millis = std::max<std::int64_t>(duration.count(), 1);
    return (static_cast<double>(total_bytes) / (1024.0 * 1024.0)) / (static_cast<double>(millis) / 1000.0);
}

std::string TransferReport::summary() const {
    std::ostringstream oss;
    if (complete()) {
        char rate[32];
        std::snprintf(rate, sizeof(rate), "%.2f", throughput_mib_s());
        oss << operation << " of '" << filename << "' complete: " << total_bytes << " bytes in " << chunk_count
            << " chunk(s), " << duration.count() << " ms, " << rate << " MiB/s";
        return oss.str();
    }
    const auto failed = failed_indices();
    oss << operation << " of '" << filename << "' incomplete [" << error_code_to_string(*failure) << "]: "
        << failed.size() << " of " << chunk_count << " chunk(s) failed";
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            oss << "\n  chunk " << outcome.index << " (" << outcome.chunk_id << " on node " << outcome.node_id
                << " at " << outcome.node_address << "): "
                << (outcome.error.has_value() ? error_code_to_string(*outcome.error) : "UNKNOWN") << " "
                << outcome.message;
        }
    }
    return oss.str();
}

TransferEngine::TransferEngine(CoordinatorClient& coordinator, ChunkTransport& transport, std::size_t parallelism)
    : coordinator_(coordinator), transport_(transport), parallelism_(std::max<std::size_t>(parallelism, 1)) {}

TransferReport TransferEngine::upload(const std::filesystem::path& source, std::optional<std::string> name) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw_error(ErrorCode::InvalidArgument, "Not a regular file: " + source.string());
    }
    const auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        throw_error(ErrorCode::InvalidArgument, "Cannot stat " + source.string() + ": " + ec.message());
    }
    ScopedFile input(source, O_RDONLY);
    if (!input.valid()) {
        throw_error(ErrorCode::InvalidArgument,
                    "Cannot open " + source.string() + ": " + std::strerror(errno));
    }

    const auto filename = name.value_or(source.filename().string());
    const auto started = std::chrono::steady_clock::now();
    const auto record = coordinator_.register_file(filename, static_cast<std::uint64_t>(size));

    TransferReport report{};
    report.operation = "upload";
    report.filename = record.filename;
    report.file_id = record.file_id;
    report.total_bytes = record.size;
    report.chunk_count = record.chunks.size();

    log_event(StructuredLogger::Level::Info,
              "client.upload.started",
              {{"filename", record.filename},
               {"file_id", record.file_id},
               {"chunks", std::to_string(record.chunks.size())},
               {"parallelism", std::to_string(parallelism_)}});

    {
        WorkerPool pool(std::min<std::size_t>(parallelism_, std::max<std::size_t>(record.chunks.size(), 1)));
        std::vector<std::future<ChunkOutcome>> pending;
        pending.reserve(record.chunks.size());
        const int fd = input.get();
        for (const auto& chunk : record.chunks) {
            pending.push_back(pool.submit([this, fd, chunk]() {
                auto outcome = outcome_for(chunk);
                ChunkData data(static_cast<std::size_t>(chunk.size));
                if (!read_at(fd, data.data(), data.size(), chunk.start)) {
                    fail(outcome, ErrorCode::StorageFailure, "Short read from local file");
                    return outcome;
                }
                try {
                    outcome.bytes = transport_.put_chunk(chunk.node_address, chunk.chunk_id, std::move(data));
                    outcome.success = true;
                } catch (const Error& error) {
                    fail(outcome, error.code(), error.message());
                }
                return outcome;
            }));
        }
        for (auto& future : pending) {
            report.outcomes.push_back(future.get());
        }
    }

    report.duration = since(started);
    if (!report.failed_indices().empty()) {
        report.failure = ErrorCode::UploadIncomplete;
    }
    log_report(report);
    return report;
}

TransferReport TransferEngine::download(const std::string& name, const std::filesystem::path& destination) {
    const auto started = std::chrono::steady_clock::now();
    const auto record = coordinator_.file_info(name);
    if (!plan_covers_file(record.chunks, record.size)) {
        throw_error(ErrorCode::ProtocolError, "Coordinator returned an inconsistent chunk plan for " + name);
    }

    auto staging = destination;
    staging += ".partial";
    ScopedFile output(staging, O_WRONLY | O_CREAT | O_TRUNC);
    if (!output.valid()) {
        throw_error(ErrorCode::InvalidArgument,
                    "Cannot create " + staging.string() + ": " + std::strerror(errno));
    }
    if (::ftruncate(output.get(), static_cast<off_t>(record.size)) != 0) {
        const auto reason = std::string(std::strerror(errno));
        output.close();
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw_error(ErrorCode::StorageFailure, "Cannot size " + staging.string() + ": " + reason);
    }

    TransferReport report{};
    report.operation = "download";
    report.filename = record.filename;
    report.file_id = record.file_id;
    report.total_bytes = record.size;
    report.chunk_count = record.chunks.size();

    log_event(StructuredLogger::Level::Info,
              "client.download.started",
              {{"filename", record.filename},
               {"file_id", record.file_id},
               {"chunks", std::to_string(record.chunks.size())},
               {"parallelism", std::to_string(parallelism_)}});

    {
        WorkerPool pool(std::min<std::size_t>(parallelism_, std::max<std::size_t>(record.chunks.size(), 1)));
        std::vector<std::future<ChunkOutcome>> pending;
        pending.reserve(record.chunks.size());
        const int fd = output.get();
        for (const auto& chunk : record.chunks) {
            pending.push_back(pool.submit([this, fd, chunk]() {
                auto outcome = outcome_for(chunk);
                try {
                    const auto data = transport_.get_chunk(chunk.node_address, chunk.chunk_id);
                    if (data.size() != chunk.size) {
                        fail(outcome,
                             ErrorCode::ChunkTransferFailed,
                             "Expected " + std::to_string(chunk.size) + " bytes, received "
                                 + std::to_string(data.size()));
                        return outcome;
                    }
                    if (!write_at(fd, data.data(), data.size(), chunk.start)) {
                        fail(outcome, ErrorCode::StorageFailure, "Cannot write staging file");
                        return outcome;
                    }
                    outcome.bytes = data.size();
                    outcome.success = true;
                } catch (const Error& error) {
                    fail(outcome, error.code(), error.message());
                }
                return outcome;
            }));
        }
        for (auto& future : pending) {
            report.outcomes.push_back(future.get());
        }
    }

    const bool all_arrived = report.failed_indices().empty();
    const bool closed = output.close();
    const int close_errno = closed ? 0 : errno;
    std::error_code ec;
    if (!all_arrived) {
        std::filesystem::remove(staging, ec);
        report.failure = ErrorCode::DownloadIncomplete;
    } else if (!closed) {
        std::filesystem::remove(staging, ec);
        throw_error(ErrorCode::StorageFailure,
                    "Cannot finish writing " + staging.string() + ": " + std::strerror(close_errno));
    } else {
        std::filesystem::rename(staging, destination, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
            throw_error(ErrorCode::StorageFailure,
                        "Cannot move " + staging.string() + " to " + destination.string() + ": " + ec.message());
        }
    }

    report.duration = since(started);
    log_report(report);
    return report;
}

}  // namespace chunkfs::client
