#include "chunknet/Types.hpp"
#include "chunknet/crypto/TokenCipher.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/manifest/ManifestStore.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {

chunknet::manifest::FileManifest make_manifest(std::size_t chunk_count) {
    chunknet::manifest::FileManifest manifest;
    manifest.original_filename = "dataset-with-a-long-name.csv";
    manifest.encryption_key = "per-file-key";
    for (std::size_t i = 0; i < chunk_count; ++i) {
        manifest.chunks.push_back({chunknet::make_chunk_id("file-123abc", i), {"node-a", "node-b", "node-c"}});
    }
    return manifest;
}

std::size_t count_files(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

}  // namespace

int main() {
    using chunknet::crypto::TokenCipher;
    using chunknet::manifest::ManifestCorrupt;
    using chunknet::manifest::ManifestNotFound;
    using chunknet::manifest::ManifestStore;

    chunknet::daemon::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / ("chunknet_manifests_" + chunknet::random_hex(8));
    const auto key = TokenCipher::generate_key();
    ManifestStore store(root, 128, key);
    assert(std::filesystem::is_directory(root));

    assert(store.piece_path("file-123abc", 7).filename() == "file-123abc_manifest_chunk_0007.bin");

    // Large manifest spans several encrypted pieces.
    const auto big = make_manifest(20);
    store.save("file-123abc", big);
    const auto pieces = count_files(root);
    assert(pieces > 3);
    assert(store.contains("file-123abc"));

    const auto loaded = store.load("file-123abc");
    assert(loaded.original_filename == big.original_filename);
    assert(loaded.chunks.size() == 20);
    assert(loaded.chunks[19].chunk_id == "file-123abc_chunk_00019");

    // Pieces are not plaintext.
    {
        std::ifstream in(store.piece_path("file-123abc", 0), std::ios::binary);
        const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(raw.find("original_filename") == std::string::npos);
    }

    // A shorter revision drops stale trailing pieces.
    store.update("file-123abc", make_manifest(1));
    assert(count_files(root) < pieces);
    assert(store.load("file-123abc").chunks.size() == 1);

    store.save("file-456def", make_manifest(2));
    const auto ids = store.list();
    assert(ids.size() == 2);
    assert(ids[0] == "file-123abc");
    assert(ids[1] == "file-456def");

    bool not_found = false;
    try {
        (void)store.load("file-000000");
    } catch (const ManifestNotFound&) {
        not_found = true;
    }
    assert(not_found);

    // Another key cannot read the pieces.
    ManifestStore foreign(root, 128, TokenCipher::generate_key());
    bool corrupt = false;
    try {
        (void)foreign.load("file-456def");
    } catch (const ManifestCorrupt&) {
        corrupt = true;
    }
    assert(corrupt);

    // Tampered piece.
    {
        std::fstream piece(store.piece_path("file-456def", 0), std::ios::in | std::ios::out | std::ios::binary);
        piece.seekg(30);
        const auto original = static_cast<char>(piece.get());
        piece.seekp(30);
        piece.put(static_cast<char>(original ^ 0x5a));
    }
    corrupt = false;
    try {
        (void)store.load("file-456def");
    } catch (const ManifestCorrupt&) {
        corrupt = true;
    }
    assert(corrupt);

    assert(store.remove("file-456def") >= 1);
    assert(store.remove("file-456def") == 0);
    assert(!store.contains("file-456def"));
    assert(store.list().size() == 1);

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
