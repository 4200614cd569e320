#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/crypto/TokenCipher.hpp"
#include "chunknet/manifest/FileManifest.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunknet::manifest {

class ManifestNotFound : public std::runtime_error {
public:
    explicit ManifestNotFound(const FileId& file_id)
        : std::runtime_error("Manifest " + file_id + " not found") {}
};

class ManifestCorrupt : public std::runtime_error {
public:
    ManifestCorrupt(const FileId& file_id, const std::string& reason)
        : std::runtime_error("Manifest " + file_id + " is unreadable: " + reason) {}
};

// Stores each manifest as encrypted pieces <file_id>_manifest_chunk_<idx:04d>.bin.
class ManifestStore {
public:
    ManifestStore(std::filesystem::path directory, std::size_t piece_size, const crypto::Key& master_key);

    void save(const FileId& file_id, const FileManifest& manifest);
    FileManifest load(const FileId& file_id) const;
    void update(const FileId& file_id, const FileManifest& manifest);
    std::size_t remove(const FileId& file_id);
    std::vector<FileId> list() const;
    bool contains(const FileId& file_id) const;

    const std::filesystem::path& directory() const noexcept { return directory_; }
    std::size_t piece_size() const noexcept { return piece_size_; }

    std::filesystem::path piece_path(const FileId& file_id, std::size_t index) const;

private:
    void write_locked(const FileId& file_id, const FileManifest& manifest);
    std::size_t remove_from_locked(const FileId& file_id, std::size_t first_index);

    std::filesystem::path directory_;
    std::size_t piece_size_;
    crypto::TokenCipher cipher_;
    mutable std::mutex mutex_;
};

}  // namespace chunknet::manifest
