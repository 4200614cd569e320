#include "chunknet/storage/ChunkStore.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace chunknet::storage {

namespace {

constexpr std::string_view kTempSuffix = ".partial";

using daemon::StructuredLogger;

void require_valid(const ChunkId& id) {
    if (!is_valid_identifier(id)) {
        throw std::invalid_argument("invalid chunk id: " + id);
    }
}

}  // namespace

ChunkStore::ChunkStore(std::filesystem::path root, bool wipe_on_delete)
    : root_(root.empty() ? std::filesystem::path("chunks") : std::move(root)),
      wipe_on_delete_(wipe_on_delete) {
    if (!ensure_root()) {
        throw std::runtime_error("Cannot create chunk directory: " + root_.string());
    }
}

bool ChunkStore::put(const ChunkId& id, std::span<const std::uint8_t> data) {
    require_valid(id);
    std::scoped_lock lock(mutex_);
    if (!ensure_root()) {
        return false;
    }

    const auto final_path = path_for(id);
    auto temp_path = final_path;
    temp_path += kTempSuffix;
    {
        std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!stream) {
            log_event(StructuredLogger::Level::Error, "storage.chunk.write_failed",
                      {{"chunk_id", id}, {"path", temp_path.string()}});
            return false;
        }
        stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        stream.flush();
        if (!stream) {
            stream.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            log_event(StructuredLogger::Level::Error, "storage.chunk.write_failed",
                      {{"chunk_id", id}, {"path", temp_path.string()}});
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        log_event(StructuredLogger::Level::Error, "storage.chunk.rename_failed",
                  {{"chunk_id", id}, {"error", ec.message()}});
        return false;
    }
    return true;
}

std::optional<ChunkData> ChunkStore::get(const ChunkId& id) const {
    if (!is_valid_identifier(id)) {
        return std::nullopt;
    }
    std::scoped_lock lock(mutex_);
    const auto path = path_for(id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    ChunkData data(static_cast<std::size_t>(std::filesystem::file_size(path, ec)));
    if (ec) {
        return std::nullopt;
    }
    stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (stream.gcount() != static_cast<std::streamsize>(data.size())) {
        return std::nullopt;
    }
    return data;
}

bool ChunkStore::contains(const ChunkId& id) const {
    if (!is_valid_identifier(id)) {
        return false;
    }
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(id), ec);
}

bool ChunkStore::remove(const ChunkId& id) {
    if (!is_valid_identifier(id)) {
        return false;
    }
    std::scoped_lock lock(mutex_);
    const auto path = path_for(id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    if (wipe_on_delete_) {
        return secure_wipe_file(path);
    }
    return std::filesystem::remove(path, ec) && !ec;
}

std::vector<ChunkStore::SnapshotEntry> ChunkStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<SnapshotEntry> entries;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (name.ends_with(kTempSuffix) || !is_valid_identifier(name)) {
            continue;
        }
        std::error_code size_ec;
        const auto size = it->file_size(size_ec);
        entries.push_back(SnapshotEntry{name, size_ec ? 0 : size});
    }
    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.id < rhs.id;
    });
    return entries;
}

std::size_t ChunkStore::size() const {
    return snapshot().size();
}

std::uintmax_t ChunkStore::total_bytes() const {
    std::uintmax_t total = 0;
    for (const auto& entry : snapshot()) {
        total += entry.size;
    }
    return total;
}

std::filesystem::path ChunkStore::path_for(const ChunkId& id) const {
    return root_ / id;
}

bool ChunkStore::ensure_root() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return std::filesystem::is_directory(root_, ec);
    }
    return std::filesystem::create_directories(root_, ec) || std::filesystem::is_directory(root_, ec);
}

bool ChunkStore::secure_wipe_file(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        std::fstream stream(path, std::ios::binary | std::ios::in | std::ios::out);
        if (stream) {
            const std::vector<char> zeros(4096, 0);
            std::uintmax_t remaining = size;
            while (remaining > 0 && stream) {
                const auto step = static_cast<std::streamsize>(std::min<std::uintmax_t>(zeros.size(), remaining));
                stream.write(zeros.data(), step);
                remaining -= static_cast<std::uintmax_t>(step);
            }
            stream.flush();
        }
    }
    std::filesystem::remove(path, ec);
    return !std::filesystem::exists(path, ec);
}

}  // namespace chunknet::storage
