#include "chunkfs/Config.hpp"
#include "chunkfs/Error.hpp"
#include "chunkfs/client/ChunkTransport.hpp"
#include "chunkfs/client/CoordinatorClient.hpp"
#include "chunkfs/client/TransferEngine.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/protocol/Message.hpp"

#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using chunkfs::Config;
using chunkfs::Error;
using chunkfs::client::ChunkTransport;
using chunkfs::client::CoordinatorClient;
using chunkfs::client::TransferEngine;
using chunkfs::client::TransferReport;
using chunkfs::daemon::StructuredLogger;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Command-line misuse. Reported with exit status 2.
class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = "[" + code_ + "] " + message_;
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

struct GlobalOptions {
    Config config{};
    bool verbose{false};
    bool coordinator_set{false};
};

void print_usage() {
    std::cout << "chunkfs client\n"
              << "Usage: chunkfs [options] <command> [args]\n\n"
              << "Options:\n"
              << "  --coordinator <host:port>  Coordinator endpoint (default 127.0.0.1:5000,\n"
              << "                             or $CHUNKFS_COORDINATOR)\n"
              << "  --parallel <n>             Concurrent chunk transfers (default 5)\n"
              << "  --timeout <sec>            Per-request I/O timeout (default 30)\n"
              << "  --verbose                  Emit structured logs on stderr\n"
              << "  -h, --help                 Show this message\n\n"
              << "Commands:\n"
              << "  upload <path> [--name <name>]  Store a local file\n"
              << "  download <name> <dest>         Fetch a stored file into <dest>\n"
              << "  listfiles                      List stored files\n"
              << "  info <name>                    Show the chunk layout of a file\n"
              << "  nodes                          Show storage nodes and their liveness\n";
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

std::string format_timestamp(std::int64_t unix_seconds) {
    const auto raw = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " UTC";
    return oss.str();
}

std::uint64_t parse_positive(std::string_view option, const std::string& value, std::uint64_t max) {
    const auto parsed = chunkfs::protocol::parse_uint64(value);
    if (!parsed.has_value() || *parsed == 0 || *parsed > max) {
        throw_cli_error("E_INVALID_VALUE",
                        "Invalid value for " + std::string(option) + ": " + value,
                        "Expected an integer between 1 and " + std::to_string(max));
    }
    return *parsed;
}

void apply_coordinator(GlobalOptions& options, const std::string& endpoint, std::string_view source) {
    const auto parsed = chunkfs::parse_endpoint(endpoint);
    if (!parsed.has_value()) {
        throw_cli_error("E_INVALID_COORDINATOR",
                        "Invalid coordinator endpoint from " + std::string(source) + ": " + endpoint,
                        "Use host:port, for example 127.0.0.1:5000");
    }
    options.config.coordinator_host = parsed->first;
    options.config.coordinator_port = parsed->second;
    options.coordinator_set = true;
}

void expect_arguments(const std::string& command, const std::vector<std::string>& args, std::size_t count) {
    if (args.size() != count) {
        throw_cli_error("E_USAGE",
                        command + " expects " + std::to_string(count) + " argument(s)",
                        "Run 'chunkfs --help' for usage");
    }
}

int report_outcome(const TransferReport& report) {
    if (report.complete()) {
        std::cout << report.summary() << std::endl;
        return kExitSuccess;
    }
    std::cerr << report.summary() << std::endl;
    return kExitFailure;
}

int run_upload(TransferEngine& engine, const std::vector<std::string>& args) {
    std::optional<std::string> name;
    std::vector<std::string> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--name") {
            if (i + 1 >= args.size()) {
                throw_cli_error("E_MISSING_VALUE", "--name requires a value");
            }
            if (name.has_value()) {
                throw_cli_error("E_DUPLICATE_OPTION", "--name given more than once");
            }
            name = args[++i];
            continue;
        }
        positional.push_back(args[i]);
    }
    expect_arguments("upload", positional, 1);
    return report_outcome(engine.upload(positional.front(), name));
}

int run_download(TransferEngine& engine, const std::vector<std::string>& args) {
    expect_arguments("download", args, 2);
    return report_outcome(engine.download(args[0], args[1]));
}

int run_listfiles(CoordinatorClient& coordinator) {
    const auto files = coordinator.list_files();
    if (files.empty()) {
        std::cout << "No files stored" << std::endl;
        return kExitSuccess;
    }
    std::cout << std::left << std::setw(40) << "NAME" << std::setw(12) << "SIZE" << "CREATED" << "\n";
    for (const auto& file : files) {
        std::cout << std::left << std::setw(40) << file.filename << std::setw(12) << format_bytes(file.size)
                  << format_timestamp(file.created_at) << "\n";
    }
    std::cout << files.size() << " file(s)" << std::endl;
    return kExitSuccess;
}

int run_info(CoordinatorClient& coordinator, const std::vector<std::string>& args) {
    expect_arguments("info", args, 1);
    const auto record = coordinator.file_info(args[0]);

    std::cout << "File:       " << record.filename << "\n"
              << "File ID:    " << record.file_id << "\n"
              << "Size:       " << record.size << " bytes (" << format_bytes(record.size) << ")\n"
              << "Chunk size: " << format_bytes(record.chunk_size) << "\n"
              << "Created:    " << format_timestamp(record.created_at) << "\n"
              << "Chunks:     " << record.chunks.size() << "\n";

    struct Share {
        std::string address;
        std::size_t chunks{0};
        std::uint64_t bytes{0};
    };
    std::map<chunkfs::NodeId, Share> distribution;
    for (const auto& chunk : record.chunks) {
        std::cout << "  [" << chunk.index << "] " << chunk.chunk_id << "  node " << chunk.node_id << " ("
                  << chunk.node_address << ")  offset " << chunk.start << "  " << format_bytes(chunk.size) << "\n";
        auto& share = distribution[chunk.node_id];
        share.address = chunk.node_address;
        ++share.chunks;
        share.bytes += chunk.size;
    }
    if (!distribution.empty()) {
        std::cout << "Distribution:\n";
        for (const auto& [node_id, share] : distribution) {
            std::cout << "  node " << node_id << " (" << share.address << "): " << share.chunks << " chunk(s), "
                      << format_bytes(share.bytes) << "\n";
        }
    }
    std::cout.flush();
    return kExitSuccess;
}

int run_nodes(CoordinatorClient& coordinator) {
    const auto nodes = coordinator.list_nodes();
    if (nodes.empty()) {
        std::cout << "No storage nodes registered" << std::endl;
        return kExitSuccess;
    }
    std::cout << std::left << std::setw(16) << "ID" << std::setw(10) << "STATUS" << std::setw(12) << "LAST SEEN"
              << std::setw(24) << "ADDRESS" << std::setw(8) << "CHUNKS" << std::setw(12) << "WRITTEN" << "READ\n";
    for (const auto& node : nodes) {
        std::cout << std::left << std::setw(16) << node.id << std::setw(10) << chunkfs::node_status_to_string(node.status)
                  << std::setw(12) << (std::to_string(node.heartbeat_age_ms / 1000) + "s ago") << std::setw(24)
                  << node.address << std::setw(8) << node.metrics.chunks_stored << std::setw(12)
                  << format_bytes(node.metrics.bytes_written) << format_bytes(node.metrics.bytes_read) << "\n";
    }
    std::cout.flush();
    return kExitSuccess;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    try {
        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return args[index++];
        };

        while (index < args.size() && args[index].starts_with("-")) {
            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return kExitSuccess;
            }
            if (opt == "--verbose" || opt == "-v") {
                options.verbose = true;
                continue;
            }
            if (opt == "--coordinator") {
                apply_coordinator(options, require_value(opt), "--coordinator");
                continue;
            }
            if (opt == "--parallel") {
                options.config.transfer_parallelism =
                    static_cast<std::size_t>(parse_positive(opt, require_value(opt), 256));
                continue;
            }
            if (opt == "--timeout") {
                options.config.io_timeout =
                    std::chrono::seconds(parse_positive(opt, require_value(opt), 3600));
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION", "Unknown option: " + opt, "Run 'chunkfs --help' for usage");
        }

        if (index >= args.size()) {
            print_usage();
            return kExitUsage;
        }
        const auto command = args[index++];
        const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(index), args.end());

        if (!options.coordinator_set) {
            if (const char* env = std::getenv("CHUNKFS_COORDINATOR"); env != nullptr && *env != '\0') {
                apply_coordinator(options, env, "CHUNKFS_COORDINATOR");
            }
        }

        auto& logger = StructuredLogger::instance();
        logger.set_component("client");
        logger.set_enabled(options.verbose);

        const auto& config = options.config;
        CoordinatorClient coordinator(config.coordinator_host,
                                      config.coordinator_port,
                                      config.io_timeout,
                                      config.max_payload_bytes);
        ChunkTransport transport(config.io_timeout, config.max_payload_bytes);
        TransferEngine engine(coordinator, transport, config.transfer_parallelism);

        if (command == "upload") {
            return run_upload(engine, rest);
        }
        if (command == "download") {
            return run_download(engine, rest);
        }
        if (command == "listfiles") {
            expect_arguments(command, rest, 0);
            return run_listfiles(coordinator);
        }
        if (command == "info") {
            return run_info(coordinator, rest);
        }
        if (command == "nodes") {
            expect_arguments(command, rest, 0);
            return run_nodes(coordinator);
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + command,
                        "Run 'chunkfs --help' to see the list of available commands");
    } catch (const CliException& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return kExitUsage;
    } catch (const Error& ex) {
        std::cerr << "Error " << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return kExitFailure;
    } catch (const std::exception& ex) {
        std::cerr << "Error [UNEXPECTED]: " << ex.what() << std::endl;
        return kExitFailure;
    }
}
