#pragma once

#include "chunknet/Types.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace chunknet::storage {

// Writes <output_dir>/chunk_00000, chunk_00001, ... and returns the paths in order.
std::vector<std::filesystem::path> split_file(const std::filesystem::path& input,
                                              std::size_t chunk_size,
                                              const std::filesystem::path& output_dir);

std::vector<ChunkData> split_bytes(std::span<const std::uint8_t> data, std::size_t chunk_size);

// Concatenates every "chunk_*" file of chunk_folder in name order. Returns the byte count written.
std::uintmax_t reassemble_file(const std::filesystem::path& output_path,
                               const std::filesystem::path& chunk_folder);

ChunkData reassemble_bytes(const std::vector<ChunkData>& pieces);

std::string chunk_file_name(std::size_t index);

}  // namespace chunknet::storage
