#pragma once

#include "chunknet/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunknet::storage {

// Flat directory of chunk files named by chunk id, owned by one storage node.
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path root, bool wipe_on_delete = false);

    struct SnapshotEntry {
        ChunkId id;
        std::uintmax_t size{0};
    };

    // Throws std::invalid_argument for ids that are not safe file names.
    bool put(const ChunkId& id, std::span<const std::uint8_t> data);
    std::optional<ChunkData> get(const ChunkId& id) const;
    bool contains(const ChunkId& id) const;
    bool remove(const ChunkId& id);

    std::vector<SnapshotEntry> snapshot() const;
    std::size_t size() const;
    std::uintmax_t total_bytes() const;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path path_for(const ChunkId& id) const;
    bool ensure_root() const;
    bool secure_wipe_file(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    bool wipe_on_delete_{false};
    mutable std::mutex mutex_;
};

}  // namespace chunknet::storage
