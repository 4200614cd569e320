#include "chunknet/Types.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <cassert>
#include <filesystem>
#include <stdexcept>
#include <string>

int main() {
    chunknet::daemon::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / ("chunknet_store_" + chunknet::random_hex(8));
    {
        chunknet::storage::ChunkStore store(root / "node-a");
        assert(std::filesystem::is_directory(store.root()));
        assert(store.size() == 0);

        const chunknet::ChunkData first{1, 2, 3, 4};
        const chunknet::ChunkData second{9, 9};
        assert(store.put("file-abc123_chunk_00000", first));
        assert(store.put("file-abc123_chunk_00001", second));
        assert(store.contains("file-abc123_chunk_00000"));
        assert(store.get("file-abc123_chunk_00000") == first);
        assert(!store.get("file-abc123_chunk_00009").has_value());

        // Overwrite replaces the content.
        assert(store.put("file-abc123_chunk_00001", first));
        assert(store.get("file-abc123_chunk_00001") == first);

        const auto entries = store.snapshot();
        assert(entries.size() == 2);
        assert(entries[0].id == "file-abc123_chunk_00000");
        assert(entries[0].size == 4);
        assert(store.total_bytes() == 8);

        // No leftover temporary files.
        std::size_t files = 0;
        for (const auto& entry : std::filesystem::directory_iterator(store.root())) {
            (void)entry;
            ++files;
        }
        assert(files == 2);

        assert(store.remove("file-abc123_chunk_00000"));
        assert(!store.remove("file-abc123_chunk_00000"));
        assert(!store.contains("file-abc123_chunk_00000"));
        assert(store.size() == 1);

        // Path traversal attempts never touch the filesystem.
        bool threw = false;
        try {
            (void)store.put("../escape", first);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(!std::filesystem::exists(root / "escape"));
        assert(!store.get("..").has_value());
        assert(!store.contains("a/b"));
        assert(!store.remove(""));
    }

    {
        chunknet::storage::ChunkStore wiping(root / "node-b", true);
        assert(wiping.put("secret_chunk_00000", chunknet::ChunkData(4096, 0xAB)));
        assert(wiping.remove("secret_chunk_00000"));
        assert(!wiping.contains("secret_chunk_00000"));
        assert(wiping.size() == 0);
    }

    // A second store over the same folder sees earlier chunks.
    {
        chunknet::storage::ChunkStore reopened(root / "node-a");
        assert(reopened.contains("file-abc123_chunk_00001"));
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
