#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet {

using NodeId = std::string;
using FileId = std::string;
using ChunkId = std::string;
using ChunkData = std::vector<std::uint8_t>;

// Random "node-xxxxxx" / "file-xxxxxx" identifiers (6 lowercase hex digits).
NodeId generate_node_id();
FileId generate_file_id();

// "<file_id>_chunk_<index:05d>"; unique across files so storage nodes and the
// healer never confuse pieces of different uploads.
ChunkId make_chunk_id(const FileId& file_id, std::size_t index);

// Accepts [A-Za-z0-9_.-]{1,128}, excluding "." and "..".
bool is_valid_identifier(std::string_view text);

std::string random_hex(std::size_t digits);

}  // namespace chunknet
