#include "chunknet/manifest/FileManifest.hpp"

#include <algorithm>

namespace chunknet::manifest {

bool ChunkPlacement::held_by(const NodeId& node_id) const {
    return std::find(node_ids.begin(), node_ids.end(), node_id) != node_ids.end();
}

ChunkPlacement* FileManifest::find_chunk(const ChunkId& chunk_id) {
    const auto it = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkPlacement& chunk) {
        return chunk.chunk_id == chunk_id;
    });
    return it == chunks.end() ? nullptr : &*it;
}

const ChunkPlacement* FileManifest::find_chunk(const ChunkId& chunk_id) const {
    return const_cast<FileManifest*>(this)->find_chunk(chunk_id);
}

std::vector<ChunkId> FileManifest::remove_node(const NodeId& node_id) {
    std::vector<ChunkId> affected;
    for (auto& chunk : chunks) {
        const auto before = chunk.node_ids.size();
        std::erase(chunk.node_ids, node_id);
        if (chunk.node_ids.size() != before) {
            affected.push_back(chunk.chunk_id);
        }
    }
    return affected;
}

json::Value FileManifest::to_json() const {
    json::Value root = json::Value::make_object();
    root.set("original_filename", json::Value(original_filename));
    root.set("encryption_key", json::Value(encryption_key));
    root.set("file_size", json::Value(file_size));
    root.set("chunk_size", json::Value(chunk_size));
    root.set("created_at", json::Value(created_at));

    json::Value list = json::Value::make_array();
    for (const auto& chunk : chunks) {
        json::Value holders = json::Value::make_array();
        for (const auto& node_id : chunk.node_ids) {
            holders.push_back(json::Value(node_id));
        }
        json::Value entry = json::Value::make_object();
        entry.set("chunk_id", json::Value(chunk.chunk_id));
        entry.set("node_ids", std::move(holders));
        list.push_back(std::move(entry));
    }
    root.set("chunks", std::move(list));
    return root;
}

FileManifest FileManifest::from_json(const json::Value& value) {
    if (!value.is_object()) {
        throw ManifestFormatError("manifest must be a JSON object");
    }
    FileManifest manifest;
    const auto name = value.get_string("original_filename");
    if (!name) {
        throw ManifestFormatError("manifest is missing 'original_filename'");
    }
    manifest.original_filename = *name;

    const auto* list = value.find("chunks");
    if (!list || !list->is_array()) {
        throw ManifestFormatError("manifest is missing 'chunks' array");
    }
    for (const auto& entry : list->as_array()) {
        ChunkPlacement chunk;
        const auto id = entry.get_string("chunk_id");
        if (!id) {
            throw ManifestFormatError("chunk entry is missing 'chunk_id'");
        }
        chunk.chunk_id = *id;
        const auto* holders = entry.find("node_ids");
        if (!holders || !holders->is_array()) {
            throw ManifestFormatError("chunk " + chunk.chunk_id + " is missing 'node_ids'");
        }
        for (const auto& holder : holders->as_array()) {
            if (!holder.is_string()) {
                throw ManifestFormatError("chunk " + chunk.chunk_id + " has a non-string node id");
            }
            chunk.node_ids.push_back(holder.string_value);
        }
        manifest.chunks.push_back(std::move(chunk));
    }

    if (const auto* key = value.find("encryption_key"); key && !key->is_null()) {
        if (!key->is_string()) {
            throw ManifestFormatError("'encryption_key' must be a string");
        }
        manifest.encryption_key = key->string_value;
    }
    if (auto size = value.get_int64("file_size"); size && *size >= 0) {
        manifest.file_size = static_cast<std::uint64_t>(*size);
    }
    if (auto size = value.get_int64("chunk_size"); size && *size >= 0) {
        manifest.chunk_size = static_cast<std::uint64_t>(*size);
    }
    if (auto created = value.get_int64("created_at")) {
        manifest.created_at = *created;
    }
    return manifest;
}

}  // namespace chunknet::manifest
