#include "chunknet/storage/ChunkSplitter.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace chunknet::storage {

namespace {

constexpr std::string_view kChunkPrefix = "chunk_";

using daemon::StructuredLogger;

}  // namespace

std::string chunk_file_name(std::size_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "chunk_%05zu", index);
    return buffer;
}

std::vector<std::filesystem::path> split_file(const std::filesystem::path& input,
                                              std::size_t chunk_size,
                                              const std::filesystem::path& output_dir) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::ifstream stream(input, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Cannot open file for splitting: " + input.string());
    }
    std::filesystem::create_directories(output_dir);

    std::vector<std::filesystem::path> written;
    std::vector<char> buffer(chunk_size);
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = stream.gcount();
        if (count <= 0) {
            break;
        }
        auto path = output_dir / chunk_file_name(written.size());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(buffer.data(), count);
        if (!out) {
            throw std::runtime_error("Failed to write chunk file: " + path.string());
        }
        written.push_back(std::move(path));
    }

    log_event(StructuredLogger::Level::Info, "storage.split.completed",
              {{"input", input.string()},
               {"chunks", std::to_string(written.size())},
               {"output_dir", output_dir.string()}});
    return written;
}

std::vector<ChunkData> split_bytes(std::span<const std::uint8_t> data, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::vector<ChunkData> pieces;
    pieces.reserve((data.size() + chunk_size - 1) / chunk_size);
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto length = std::min(chunk_size, data.size() - offset);
        const auto piece = data.subspan(offset, length);
        pieces.emplace_back(piece.begin(), piece.end());
    }
    return pieces;
}

std::uintmax_t reassemble_file(const std::filesystem::path& output_path,
                               const std::filesystem::path& chunk_folder) {
    std::vector<std::filesystem::path> chunks;
    for (const auto& entry : std::filesystem::directory_iterator(chunk_folder)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (entry.path().filename().string().starts_with(kChunkPrefix)) {
            chunks.push_back(entry.path());
        }
    }
    std::sort(chunks.begin(), chunks.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });

    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path());
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + output_path.string());
    }

    std::uintmax_t total = 0;
    for (const auto& chunk : chunks) {
        const auto size = std::filesystem::file_size(chunk);
        if (size == 0) {
            continue;
        }
        std::ifstream in(chunk, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot read chunk file: " + chunk.string());
        }
        out << in.rdbuf();
        total += size;
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + output_path.string());
    }

    log_event(StructuredLogger::Level::Info, "storage.reassemble.completed",
              {{"output", output_path.string()},
               {"chunks", std::to_string(chunks.size())},
               {"bytes", std::to_string(total)}});
    return total;
}

ChunkData reassemble_bytes(const std::vector<ChunkData>& pieces) {
    std::size_t total = 0;
    for (const auto& piece : pieces) {
        total += piece.size();
    }
    ChunkData joined;
    joined.reserve(total);
    for (const auto& piece : pieces) {
        joined.insert(joined.end(), piece.begin(), piece.end());
    }
    return joined;
}

}  // namespace chunknet::storage
