#include "chunkfs/Config.hpp"
#include "chunkfs/Error.hpp"
#include "chunkfs/daemon/StructuredLogger.hpp"
#include "chunkfs/protocol/Message.hpp"
#include "chunkfs/storage/StorageNode.hpp"

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
    bool id_set{false};
    bool coordinator_set{false};
    bool valid{true};
    std::string error;
};

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    parsed.config.listen_port = 8001;
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
        if (arg == "--no-stats") {
            parsed.config.report_transfer_stats = false;
            continue;
        }
        if (i + 1 >= argc) {
            fail(arg + " requires a value");
            break;
        }
        const std::string value = argv[++i];
        if (arg == "--id") {
            if (!chunkfs::valid_node_id(value)) {
                fail("Invalid --id value, use letters, digits, '_', '-' or '.'");
            } else {
                parsed.config.node_id = value;
                parsed.id_set = true;
            }
        } else if (arg == "--listen") {
            const auto endpoint = chunkfs::parse_endpoint(value);
            if (!endpoint) {
                fail("Invalid --listen value, expected host:port");
            } else {
                parsed.config.listen_host = endpoint->first;
                parsed.config.listen_port = endpoint->second;
            }
        } else if (arg == "--advertise") {
            parsed.config.advertise_host = value;
        } else if (arg == "--coordinator") {
            const auto endpoint = chunkfs::parse_endpoint(value);
            if (!endpoint) {
                fail("Invalid --coordinator value, expected host:port");
            } else {
                parsed.config.coordinator_host = endpoint->first;
                parsed.config.coordinator_port = endpoint->second;
                parsed.coordinator_set = true;
            }
        } else if (arg == "--storage") {
            parsed.config.storage_directory = value;
        } else if (arg == "--heartbeat") {
            const auto seconds = chunkfs::protocol::parse_uint64(value);
            if (!seconds || *seconds == 0 || *seconds > 3600) {
                fail("Invalid --heartbeat value");
            } else {
                parsed.config.heartbeat_interval = std::chrono::seconds(*seconds);
            }
        } else {
            fail("Unknown argument: " + arg);
        }
    }

    if (parsed.valid && !parsed.id_set) {
        if (const char* env = std::getenv("CHUNKFS_NODE_ID"); env != nullptr && *env != '\0') {
            if (!chunkfs::valid_node_id(env)) {
                fail("Invalid CHUNKFS_NODE_ID value");
            } else {
                parsed.config.node_id = env;
            }
        }
    }
    if (parsed.valid && !parsed.coordinator_set) {
        if (const char* env = std::getenv("CHUNKFS_COORDINATOR"); env != nullptr && *env != '\0') {
            const auto endpoint = chunkfs::parse_endpoint(env);
            if (!endpoint) {
                fail("Invalid CHUNKFS_COORDINATOR value, expected host:port");
            } else {
                parsed.config.coordinator_host = endpoint->first;
                parsed.config.coordinator_port = endpoint->second;
            }
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --id <node-id>             Node identifier (default 1, or $CHUNKFS_NODE_ID)\n";
    std::cout << "  --listen host:port         Address to bind (default 0.0.0.0:8001)\n";
    std::cout << "  --advertise <host>         Host reported to the coordinator\n";
    std::cout << "  --coordinator host:port    Coordinator endpoint (default 127.0.0.1:5000,\n";
    std::cout << "                             or $CHUNKFS_COORDINATOR)\n";
    std::cout << "  --storage <dir>            Chunk directory (default ./storage)\n";
    std::cout << "  --heartbeat <sec>          Heartbeat period (default 5)\n";
    std::cout << "  --no-stats                 Do not report transfer stats to the coordinator\n";
    std::cout << "  --quiet                    Suppress structured logs\n";
    std::cout << "  -h, --help                 Show this message\n";
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
    logger.set_component("node");
    logger.set_enabled(!cli.quiet);

    g_run_loop.store(true, std::memory_order_release);
    install_signal_handlers();

    try {
        chunkfs::storage::StorageNode node(cli.config);
        node.start();
        std::cout << "Storage node " << node.id() << " serving " << node.address() << std::endl;

        while (g_run_loop.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        node.stop();
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
