#include "chunkfs/core/Coordinator.hpp"
#include "chunkfs/storage/StorageNode.hpp"

#include "test_support.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool check(const std::string& label, const CommandResult& result, int exit_code, const std::string& needle) {
    if (result.exit_code != exit_code || !expect_contains(result.output, needle)) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << " (expected " << exit_code
                  << ", output containing '" << needle << "')\n"
                  << result.output << std::endl;
        return false;
    }
    return true;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("CHUNKFS_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "CHUNKFS_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();
    ::unsetenv("CHUNKFS_COORDINATOR");

    try {
        if (!check("--help", run_cli(executable, "--help"), 0, "Usage: chunkfs")) {
            return 1;
        }
        if (!check("no command", run_cli(executable, ""), 2, "Usage: chunkfs")) {
            return 1;
        }
        if (!check("unknown command", run_cli(executable, "frobnicate"), 2, "E_UNKNOWN_COMMAND")) {
            return 1;
        }
        if (!check("unknown option", run_cli(executable, "--frob listfiles"), 2, "E_UNKNOWN_OPTION")) {
            return 1;
        }
        if (!check("upload without path", run_cli(executable, "upload"), 2, "E_USAGE")) {
            return 1;
        }
        if (!check("download with one argument", run_cli(executable, "download only-name"), 2, "E_USAGE")) {
            return 1;
        }
        if (!check("--parallel 0", run_cli(executable, "--parallel 0 listfiles"), 2, "E_INVALID_VALUE")) {
            return 1;
        }
        if (!check("--timeout missing value", run_cli(executable, "--timeout"), 2, "E_MISSING_VALUE")) {
            return 1;
        }
        if (!check("bad coordinator", run_cli(executable, "--coordinator nowhere listfiles"), 2,
                   "E_INVALID_COORDINATOR")) {
            return 1;
        }
        if (!check("unreachable coordinator",
                   run_cli(executable, "--coordinator 127.0.0.1:1 --timeout 2 listfiles"), 1,
                   "COORDINATOR_UNREACHABLE")) {
            return 1;
        }

        // Against a live cluster.
        using namespace chunkfs;
        test::quiet_logs();
        test::TempDir dir("cli");
        const auto base = test::local_config(dir);
        Coordinator coordinator(base);
        coordinator.start();
        const auto endpoint = "--coordinator 127.0.0.1:" + std::to_string(coordinator.port()) + " ";

        if (!check("listfiles on empty store", run_cli(executable, endpoint + "listfiles"), 0, "No files stored")) {
            return 1;
        }
        if (!check("nodes on empty registry", run_cli(executable, endpoint + "nodes"), 0,
                   "No storage nodes registered")) {
            return 1;
        }

        const auto source = dir / "payload.bin";
        test::write_file(source, test::random_bytes(base.chunk_size * 2 + 10, 11));
        if (!check("upload without nodes", run_cli(executable, endpoint + "upload \"" + source.string() + "\""), 1,
                   "NO_ACTIVE_NODES")) {
            return 1;
        }

        std::vector<std::unique_ptr<storage::StorageNode>> nodes;
        for (int i = 0; i < 2; ++i) {
            auto config = base;
            config.node_id = "cli-node-" + std::to_string(i);
            config.coordinator_port = coordinator.port();
            config.storage_directory = (dir / ("node" + std::to_string(i))).string();
            nodes.push_back(std::make_unique<storage::StorageNode>(config));
            nodes.back()->start();
        }
        if (!test::wait_until([&]() { return coordinator.store().active_nodes().size() == 2; })) {
            std::cerr << "Storage nodes never registered" << std::endl;
            return 1;
        }

        if (!check("upload", run_cli(executable, endpoint + "upload \"" + source.string() + "\" --name cli.bin"), 0,
                   "complete")) {
            return 1;
        }
        if (!check("duplicate upload", run_cli(executable, endpoint + "upload \"" + source.string() + "\" --name cli.bin"),
                   1, "DUPLICATE_FILE")) {
            return 1;
        }
        if (!check("listfiles", run_cli(executable, endpoint + "listfiles"), 0, "cli.bin")) {
            return 1;
        }
        if (!check("info", run_cli(executable, endpoint + "info cli.bin"), 0, "Distribution:")) {
            return 1;
        }
        if (!check("info on unknown file", run_cli(executable, endpoint + "info missing.bin"), 1, "NOT_FOUND")) {
            return 1;
        }
        if (!check("nodes", run_cli(executable, endpoint + "nodes"), 0, "cli-node-1")) {
            return 1;
        }

        const auto destination = dir / "out.bin";
        if (!check("download", run_cli(executable, endpoint + "download cli.bin \"" + destination.string() + "\""), 0,
                   "complete")) {
            return 1;
        }
        if (test::read_file(destination) != test::read_file(source)) {
            std::cerr << "Downloaded bytes differ from the upload" << std::endl;
            return 1;
        }

        for (auto& node : nodes) {
            node->stop();
        }
        coordinator.stop();
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
