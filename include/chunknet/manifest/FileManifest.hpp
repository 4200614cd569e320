#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/json/Value.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunknet::manifest {

class ManifestFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChunkPlacement {
    ChunkId chunk_id;
    std::vector<NodeId> node_ids;

    bool held_by(const NodeId& node_id) const;
};

struct FileManifest {
    std::string original_filename;
    std::vector<ChunkPlacement> chunks;
    // Per-file TokenCipher key in its encoded text form; empty when unknown.
    std::string encryption_key;
    std::uint64_t file_size{0};
    std::uint64_t chunk_size{0};
    std::int64_t created_at{0};

    ChunkPlacement* find_chunk(const ChunkId& chunk_id);
    const ChunkPlacement* find_chunk(const ChunkId& chunk_id) const;

    // Drops node_id from every holder list; returns the chunks that lost it.
    std::vector<ChunkId> remove_node(const NodeId& node_id);

    json::Value to_json() const;
    static FileManifest from_json(const json::Value& value);
};

}  // namespace chunknet::manifest
