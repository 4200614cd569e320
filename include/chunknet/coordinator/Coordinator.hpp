#pragma once

#include "chunknet/Config.hpp"
#include "chunknet/Types.hpp"
#include "chunknet/coordinator/HealingQueue.hpp"
#include "chunknet/coordinator/NodeRegistry.hpp"
#include "chunknet/coordinator/ReplicaPlanner.hpp"
#include "chunknet/json/Value.hpp"
#include "chunknet/manifest/ManifestStore.hpp"
#include "chunknet/net/NodeTransport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace chunknet::coordinator {

struct ApiResult {
    int status{200};
    json::Value body;

    static ApiResult ok(json::Value body);
    static ApiResult error(int status, std::string_view code, std::string_view message);

    bool succeeded() const { return status >= 200 && status < 300; }
};

struct DownloadResult {
    ApiResult result;
    std::string filename;
    ChunkData data;
};

enum class HealOutcome {
    Healed,
    Partial,
    AlreadyHealthy,
    Unhealable,
    NoLiveDonor,
    UnknownChunk
};

std::string_view heal_outcome_to_string(HealOutcome outcome);

class Coordinator {
public:
    Coordinator(Config config, net::NodeTransport& transport);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    ApiResult register_node(const NodeId& node_id,
                            std::uint64_t storage_available,
                            const std::string& host,
                            std::uint16_t port);
    // Unknown nodes get 404; afterwards every node past the heartbeat timeout is declared dead.
    ApiResult heartbeat(const NodeId& node_id);
    // Removes the node from all manifests and queues chunks that fell below redundancy.
    std::size_t mark_node_dead(const NodeId& node_id);
    std::vector<NodeId> sweep_expired(Clock::time_point now = Clock::now());

    ApiResult nodes() const;
    ApiResult locate_chunk(const ChunkId& chunk_id) const;
    ApiResult assign_chunk(const ChunkId& chunk_id, const NodeId& node_id);
    ApiResult key_count() const;
    ApiResult get_manifest(const FileId& file_id) const;
    ApiResult upload_file(const std::string& filename, std::span<const std::uint8_t> data);
    DownloadResult download_file(const FileId& file_id) const;
    ApiResult status() const;
    ApiResult heal_now();

    HealOutcome heal_chunk(const ChunkId& chunk_id);
    // Pops one queued chunk (waiting up to timeout) and heals it; false when nothing was queued.
    bool heal_next(std::chrono::milliseconds timeout);

    // Background healing and liveness thread.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept;

    // Replaces the random file id generator; ids already stored or in flight are still skipped.
    void set_file_id_source(std::function<FileId()> source);

    const Config& config() const noexcept { return config_; }
    NodeRegistry& registry() noexcept { return registry_; }
    HealingQueue& healing_queue() noexcept { return queue_; }
    manifest::ManifestStore& manifests() noexcept { return *manifests_; }

private:
    struct LocatedChunk {
        FileId file_id;
        manifest::FileManifest manifest;
    };

    std::optional<LocatedChunk> find_chunk_owner(const ChunkId& chunk_id) const;
    std::optional<net::NodeEndpoint> endpoint_for(const NodeId& node_id) const;
    FileId reserve_file_id();
    void release_file_id(const FileId& file_id);
    std::size_t queue_if_degraded(const manifest::ChunkPlacement& chunk);
    void healing_loop();

    Config config_;
    net::NodeTransport& transport_;
    NodeRegistry registry_;
    ReplicaPlanner planner_;
    HealingQueue queue_;
    std::unique_ptr<manifest::ManifestStore> manifests_;

    // Serializes read-modify-write cycles on manifests.
    std::mutex manifest_update_mutex_;

    std::function<FileId()> file_id_source_{generate_file_id};
    std::set<FileId> pending_uploads_;
    std::mutex pending_uploads_mutex_;

    std::map<ChunkId, std::vector<NodeId>> assignments_;
    mutable std::mutex assignments_mutex_;

    std::atomic<bool> running_{false};
    std::thread healer_;
};

}  // namespace chunknet::coordinator
