#include "chunkfs/Error.hpp"
#include "chunkfs/storage/ChunkStore.hpp"

#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace chunkfs;

int main() {
    test::TempDir dir("chunk_store");
    storage::ChunkStore store(dir / "chunks");
    store.open();
    assert(std::filesystem::is_directory(dir / "chunks"));
    assert(store.size() == 0);

    assert(storage::ChunkStore::valid_chunk_id("1700000000000_0"));
    assert(storage::ChunkStore::valid_chunk_id("a-b.c_d"));
    assert(!storage::ChunkStore::valid_chunk_id(""));
    assert(!storage::ChunkStore::valid_chunk_id("."));
    assert(!storage::ChunkStore::valid_chunk_id(".."));
    assert(!storage::ChunkStore::valid_chunk_id("../escape"));
    assert(!storage::ChunkStore::valid_chunk_id("a/b"));
    assert(!storage::ChunkStore::valid_chunk_id("with space"));

    const auto payload = test::random_bytes(10000, 7);
    assert(store.put("f_0", payload) == payload.size());
    assert(store.contains("f_0"));
    const auto loaded = store.get("f_0");
    assert(loaded.has_value() && *loaded == payload);
    assert(!store.get("f_1").has_value());
    assert(!store.contains("f_1"));

    // Overwrite replaces the bytes.
    const auto replacement = test::random_bytes(10, 8);
    store.put("f_0", replacement);
    assert(*store.get("f_0") == replacement);

    // Empty chunks are legal on disk.
    store.put("empty", {});
    assert(store.get("empty")->empty());

    try {
        store.put("../escape", payload);
        assert(false && "path traversal must be rejected");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::InvalidArgument);
    }
    assert(!std::filesystem::exists(dir / "escape"));

    // Leftover temporaries and foreign names are not chunks.
    std::ofstream(dir / "chunks" / "f_9.3.tmp") << "partial";
    std::filesystem::create_directories(dir / "chunks" / "subdir");
    const auto entries = store.snapshot();
    assert(entries.size() == 2);
    for (const auto& entry : entries) {
        assert(entry.id == "f_0" || entry.id == "empty");
        if (entry.id == "f_0") {
            assert(entry.size == replacement.size());
        }
    }

    // Concurrent writers on distinct ids.
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&store, t]() {
            for (int i = 0; i < 10; ++i) {
                const auto id = "c" + std::to_string(t) + "_" + std::to_string(i);
                store.put(id, test::random_bytes(512, static_cast<std::uint32_t>(t * 100 + i)));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    assert(store.size() == 82);
    assert(*store.get("c3_4") == test::random_bytes(512, 304));

    // A file where the root should be is a storage failure.
    std::ofstream(dir / "not_a_dir") << "x";
    storage::ChunkStore broken(dir / "not_a_dir");
    try {
        broken.open();
        assert(false && "file root must be rejected");
    } catch (const Error& error) {
        assert(error.code() == ErrorCode::StorageFailure);
    }

    return 0;
}
