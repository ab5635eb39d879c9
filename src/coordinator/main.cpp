#include "chunkfs/Config.hpp"
#include "chunkfs/Error.hpp"
#include "chunkfs/core/Coordinator.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

using chunkfs::Config;
using chunkfs::daemon::StructuredLogger;

std::atomic<bool> g_run_loop{false};

extern "C" void handle_signal(int) {
    g_run_loop.store(false, std::memory_order_release);
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    struct sigaction action{};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

struct CliConfig {
    Config config;
    bool show_help{false};
    bool quiet{false};
    bool valid{true};
    std::string error;
};

bool parse_seconds(const std::string& text, std::chrono::milliseconds& out) {
    const auto value = chunkfs::protocol::parse_uint64(text);
    if (!value.has_value() || *value == 0 || *value > 86400) {
        return false;
    }
    out = std::chrono::seconds(*value);
    return true;
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    parsed.config.listen_port = 5000;
    auto fail = [&](std::string message) {
        parsed.valid = false;
        parsed.error = std::move(message);
    };

    for (int i = 1; i < argc && parsed.valid; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--quiet") {
            parsed.quiet = true;
            continue;
        }
        if (i + 1 >= argc) {
            fail(arg + " requires a value");
            break;
        }
        const std::string value = argv[++i];
        if (arg == "--listen") {
            const auto endpoint = chunkfs::parse_endpoint(value);
            if (!endpoint) {
                fail("Invalid --listen value, expected host:port");
                break;
            }
            parsed.config.listen_host = endpoint->first;
            parsed.config.listen_port = endpoint->second;
        } else if (arg == "--metadata") {
            parsed.config.metadata_path = value;
        } else if (arg == "--chunk-size") {
            const auto size = chunkfs::protocol::parse_uint64(value);
            if (!size || *size == 0 || *size > parsed.config.max_payload_bytes) {
                fail("Invalid --chunk-size value");
            } else {
                parsed.config.chunk_size = *size;
            }
        } else if (arg == "--max-chunks") {
            const auto limit = chunkfs::protocol::parse_uint64(value);
            if (!limit || *limit == 0) {
                fail("Invalid --max-chunks value");
            } else {
                parsed.config.max_chunks_per_file = *limit;
            }
        } else if (arg == "--timeout") {
            if (!parse_seconds(value, parsed.config.liveness_timeout)) {
                fail("Invalid --timeout value");
            }
        } else if (arg == "--sweep-interval") {
            if (!parse_seconds(value, parsed.config.sweep_interval)) {
                fail("Invalid --sweep-interval value");
            }
        } else if (arg == "--workers") {
            const auto workers = chunkfs::protocol::parse_uint64(value);
            if (!workers || *workers == 0 || *workers > 1024) {
                fail("Invalid --workers value");
            } else {
                parsed.config.server_workers = static_cast<std::size_t>(*workers);
            }
        } else {
            fail("Unknown argument: " + arg);
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --listen host:port       Address to bind (default 0.0.0.0:5000)\n";
    std::cout << "  --metadata <path>        Metadata state file (default metadata.db)\n";
    std::cout << "  --chunk-size <bytes>     Chunk size for new files (default 4194304)\n";
    std::cout << "  --max-chunks <n>         Largest chunk count per file (default 1048576)\n";
    std::cout << "  --timeout <sec>          Heartbeat liveness timeout (default 30)\n";
    std::cout << "  --sweep-interval <sec>   Liveness sweep period (default 10)\n";
    std::cout << "  --workers <n>            Request worker threads (default 8)\n";
    std::cout << "  --quiet                  Suppress structured logs\n";
    std::cout << "  -h, --help               Show this message\n";
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.valid) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return 2;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto& logger = StructuredLogger::instance();
    logger.set_component("coordinator");
    logger.set_enabled(!cli.quiet);

    g_run_loop.store(true, std::memory_order_release);
    install_signal_handlers();

    try {
        chunkfs::Coordinator coordinator(cli.config);
        coordinator.start();
        std::cout << "Coordinator listening on " << cli.config.listen_host << ":" << coordinator.port() << std::endl;

        while (g_run_loop.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        coordinator.stop();
    } catch (const chunkfs::Error& ex) {
        std::cerr << "Error " << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
