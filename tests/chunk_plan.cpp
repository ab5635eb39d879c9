#include "chunkfs/Error.hpp"
#include "chunkfs/core/ChunkPlanner.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace chunkfs;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

std::vector<NodeRecord> make_nodes(std::size_t count) {
    std::vector<NodeRecord> nodes;
    for (std::size_t i = 0; i < count; ++i) {
        NodeRecord node{};
        node.id = "node-" + std::to_string(i);
        node.address = "127.0.0.1:" + std::to_string(9000 + i);
        nodes.push_back(node);
    }
    return nodes;
}

}  // namespace

int main() {
    assert(chunk_count(0, 4 * kMiB) == 0);
    assert(chunk_count(1, 4 * kMiB) == 1);
    assert(chunk_count(4 * kMiB, 4 * kMiB) == 1);
    assert(chunk_count(4 * kMiB + 1, 4 * kMiB) == 2);

    // 17 MiB over 4 MiB chunks on three nodes.
    {
        const auto nodes = make_nodes(3);
        const auto plan = plan_chunks("1700000000000", 17 * kMiB, 4 * kMiB, nodes);
        assert(plan.size() == 5);
        const std::uint64_t sizes[] = {4 * kMiB, 4 * kMiB, 4 * kMiB, 4 * kMiB, 1 * kMiB};
        const std::size_t owners[] = {0, 1, 2, 0, 1};
        for (std::size_t i = 0; i < plan.size(); ++i) {
            assert(plan[i].index == i);
            assert(plan[i].size == sizes[i]);
            assert(plan[i].start == i * 4 * kMiB);
            assert(plan[i].node_id == nodes[owners[i]].id);
            assert(plan[i].node_address == nodes[owners[i]].address);
            assert(plan[i].chunk_id == "1700000000000_" + std::to_string(i));
        }
        assert(plan_covers_file(plan, 17 * kMiB));
    }

    // Coverage holds across a spread of sizes and node counts.
    for (const std::uint64_t chunk : {std::uint64_t{1}, std::uint64_t{7}, std::uint64_t{4096}}) {
        for (const std::uint64_t size : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{4095},
                                         std::uint64_t{4096}, std::uint64_t{10000}}) {
            for (std::size_t n = 1; n <= 4; ++n) {
                if (size / chunk > 20000) {
                    continue;
                }
                const auto plan = plan_chunks("42", size, chunk, make_nodes(n));
                assert(plan.size() == chunk_count(size, chunk));
                std::uint64_t total = 0;
                for (const auto& descriptor : plan) {
                    total += descriptor.size;
                    assert(descriptor.size <= chunk);
                }
                assert(total == size);
                assert(plan_covers_file(plan, size));
            }
        }
    }

    // Tampered plans are rejected.
    {
        auto plan = plan_chunks("7", 10, 4, make_nodes(2));
        assert(plan_covers_file(plan, 10));
        assert(!plan_covers_file(plan, 11));
        auto gap = plan;
        gap[1].start += 1;
        assert(!plan_covers_file(gap, 10));
        auto reordered = plan;
        std::swap(reordered[0], reordered[1]);
        assert(!plan_covers_file(reordered, 10));
        assert(plan_covers_file({}, 0));
        assert(!plan_covers_file({}, 1));
    }

    try {
        plan_chunks("1", 100, 10, {});
        assert(false && "empty snapshot must be rejected");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::NoActiveNodes);
    }

    try {
        chunk_count(10, 0);
        assert(false && "zero chunk size must be rejected");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::InvalidArgument);
    }

    return 0;
}
