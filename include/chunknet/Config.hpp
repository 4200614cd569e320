#pragma once

#include "chunknet/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunknet {

struct Config {
    // Coordinator
    std::string coordinator_host{"127.0.0.1"};
    std::uint16_t coordinator_port{8000};
    std::size_t chunk_size_bytes{100 * 1024};
    std::size_t manifest_chunk_size{4096};
    std::uint16_t chunk_redundancy{3};
    std::chrono::seconds heartbeat_timeout{std::chrono::seconds(30)};
    std::chrono::seconds heal_idle_interval{std::chrono::seconds(5)};
    std::optional<std::string> manifest_key{};
    std::optional<std::uint32_t> placement_seed{};

    // Shared work directory layout
    std::string work_directory{"work_dir"};

    // Storage node
    std::optional<NodeId> node_id{};
    std::string node_host{"127.0.0.1"};
    std::uint16_t node_port{5001};
    std::string chunk_directory{"chunks"};
    std::uint64_t storage_available{1024};
    std::chrono::seconds heartbeat_interval{std::chrono::seconds(5)};
    bool wipe_on_delete{false};

    // HTTP plumbing
    std::chrono::seconds http_timeout{std::chrono::seconds(10)};
    std::chrono::seconds http_connect_timeout{std::chrono::seconds(5)};
    // Total limit for CLI upload/download; zero means no limit.
    std::chrono::seconds http_transfer_timeout{std::chrono::seconds(0)};
    std::size_t max_request_bytes{64ull * 1024ull * 1024ull};

    std::string log_level{"info"};

    std::filesystem::path manifest_directory() const {
        return std::filesystem::path(work_directory) / "manifests";
    }
    std::filesystem::path temp_chunk_directory() const {
        return std::filesystem::path(work_directory) / "temp_chunks";
    }
    std::filesystem::path temp_upload_directory() const {
        return std::filesystem::path(work_directory) / "temp_uploads";
    }

    std::string coordinator_url() const {
        return "http://" + coordinator_host + ":" + std::to_string(coordinator_port);
    }
};

}  // namespace chunknet
