#include "chunknet/manifest/ManifestStore.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/json/Value.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <set>

namespace chunknet::manifest {

namespace {

constexpr std::string_view kPieceMarker = "_manifest_chunk_";
constexpr std::string_view kPieceExtension = ".bin";
constexpr std::string_view kTempSuffix = ".tmp";

using daemon::StructuredLogger;

void require_valid(const FileId& file_id) {
    if (!is_valid_identifier(file_id)) {
        throw std::invalid_argument("invalid file id: " + file_id);
    }
}

}  // namespace

ManifestStore::ManifestStore(std::filesystem::path directory, std::size_t piece_size, const crypto::Key& master_key)
    : directory_(std::move(directory)),
      piece_size_(piece_size),
      cipher_(master_key) {
    if (piece_size_ == 0) {
        throw std::invalid_argument("manifest piece size must be positive");
    }
    std::filesystem::create_directories(directory_);
}

std::filesystem::path ManifestStore::piece_path(const FileId& file_id, std::size_t index) const {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "%04zu", index);
    return directory_ / (file_id + std::string(kPieceMarker) + suffix + std::string(kPieceExtension));
}

void ManifestStore::save(const FileId& file_id, const FileManifest& manifest) {
    require_valid(file_id);
    std::scoped_lock lock(mutex_);
    write_locked(file_id, manifest);
}

void ManifestStore::write_locked(const FileId& file_id, const FileManifest& manifest) {
    const std::string serialized = json::serialize(manifest.to_json());
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(serialized.data());

    std::size_t index = 0;
    for (std::size_t offset = 0; offset < serialized.size(); offset += piece_size_, ++index) {
        const auto length = std::min(piece_size_, serialized.size() - offset);
        const auto token = cipher_.encrypt(std::span<const std::uint8_t>(bytes + offset, length));
        const auto path = piece_path(file_id, index);
        auto temp_path = path;
        temp_path += kTempSuffix;
        {
            std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
            stream.write(reinterpret_cast<const char*>(token.data()), static_cast<std::streamsize>(token.size()));
            stream.flush();
            if (!stream) {
                stream.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw std::runtime_error("Failed to write manifest piece " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw std::runtime_error("Failed to replace manifest piece " + path.string() + ": " + ec.message());
        }
    }
    const auto stale = remove_from_locked(file_id, index);

    log_event(StructuredLogger::Level::Info, "manifest.saved",
              {{"file_id", file_id},
               {"pieces", std::to_string(index)},
               {"stale_removed", std::to_string(stale)}});
}

FileManifest ManifestStore::load(const FileId& file_id) const {
    if (!is_valid_identifier(file_id)) {
        throw ManifestNotFound(file_id);
    }
    std::string serialized;
    std::size_t pieces = 0;
    {
        std::scoped_lock lock(mutex_);
        for (;; ++pieces) {
            const auto path = piece_path(file_id, pieces);
            std::ifstream stream(path, std::ios::binary);
            if (!stream) {
                break;
            }
            const ChunkData token((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
            const auto plain = cipher_.decrypt(token);
            if (!plain) {
                throw ManifestCorrupt(file_id, "piece " + std::to_string(pieces) + " failed authentication");
            }
            serialized.append(plain->begin(), plain->end());
        }
    }
    if (pieces == 0) {
        throw ManifestNotFound(file_id);
    }

    try {
        return FileManifest::from_json(json::parse(serialized));
    } catch (const json::ParseError& error) {
        throw ManifestCorrupt(file_id, error.what());
    } catch (const ManifestFormatError& error) {
        throw ManifestCorrupt(file_id, error.what());
    }
}

void ManifestStore::update(const FileId& file_id, const FileManifest& manifest) {
    save(file_id, manifest);
    log_event(StructuredLogger::Level::Debug, "manifest.revised", {{"file_id", file_id}});
}

std::size_t ManifestStore::remove(const FileId& file_id) {
    if (!is_valid_identifier(file_id)) {
        return 0;
    }
    std::scoped_lock lock(mutex_);
    const auto removed = remove_from_locked(file_id, 0);
    if (removed > 0) {
        log_event(StructuredLogger::Level::Info, "manifest.deleted",
                  {{"file_id", file_id}, {"pieces", std::to_string(removed)}});
    }
    return removed;
}

std::size_t ManifestStore::remove_from_locked(const FileId& file_id, std::size_t first_index) {
    std::size_t removed = 0;
    for (std::size_t index = first_index;; ++index) {
        std::error_code ec;
        if (!std::filesystem::remove(piece_path(file_id, index), ec) || ec) {
            break;
        }
        ++removed;
    }
    return removed;
}

std::vector<FileId> ManifestStore::list() const {
    std::set<FileId> ids;
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!name.ends_with(kPieceExtension)) {
            continue;
        }
        const auto marker = name.rfind(kPieceMarker);
        if (marker == std::string::npos || marker == 0) {
            continue;
        }
        ids.insert(name.substr(0, marker));
    }
    return {ids.begin(), ids.end()};
}

bool ManifestStore::contains(const FileId& file_id) const {
    if (!is_valid_identifier(file_id)) {
        return false;
    }
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    return std::filesystem::exists(piece_path(file_id, 0), ec);
}

}  // namespace chunknet::manifest
