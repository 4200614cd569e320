#include "chunknet/Config.hpp"
#include "chunknet/Types.hpp"
#include "chunknet/coordinator/Coordinator.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/net/NodeTransport.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Storage nodes simulated in memory, keyed by node id.
class FakeTransport : public chunknet::net::NodeTransport {
public:
    chunknet::net::TransferOutcome store_chunk(const chunknet::net::NodeEndpoint& node,
                                               const chunknet::ChunkId& chunk_id,
                                               std::span<const std::uint8_t> data) override {
        std::scoped_lock lock(mutex_);
        if (offline_.contains(node.node_id)) {
            return {false, 0, "connection refused"};
        }
        disks_[node.node_id][chunk_id] = chunknet::ChunkData(data.begin(), data.end());
        ++stores_;
        return {true, 200, {}};
    }

    std::optional<chunknet::ChunkData> fetch_chunk(const chunknet::net::NodeEndpoint& node,
                                                   const chunknet::ChunkId& chunk_id) override {
        std::scoped_lock lock(mutex_);
        if (offline_.contains(node.node_id)) {
            return std::nullopt;
        }
        const auto disk = disks_.find(node.node_id);
        if (disk == disks_.end()) {
            return std::nullopt;
        }
        const auto chunk = disk->second.find(chunk_id);
        if (chunk == disk->second.end()) {
            return std::nullopt;
        }
        auto data = chunk->second;
        if (tampering_.contains(node.node_id) && !data.empty()) {
            data.back() ^= 0x01;
        }
        return data;
    }

    void set_offline(const chunknet::NodeId& node_id, bool offline) {
        std::scoped_lock lock(mutex_);
        if (offline) {
            offline_.insert(node_id);
        } else {
            offline_.erase(node_id);
        }
    }

    void set_tampering(const chunknet::NodeId& node_id) {
        std::scoped_lock lock(mutex_);
        tampering_.insert(node_id);
    }

    bool holds(const chunknet::NodeId& node_id, const chunknet::ChunkId& chunk_id) {
        std::scoped_lock lock(mutex_);
        const auto disk = disks_.find(node_id);
        return disk != disks_.end() && disk->second.contains(chunk_id);
    }

    std::size_t stores() {
        std::scoped_lock lock(mutex_);
        return stores_;
    }

private:
    std::mutex mutex_;
    std::map<chunknet::NodeId, std::map<chunknet::ChunkId, chunknet::ChunkData>> disks_;
    std::set<chunknet::NodeId> offline_;
    std::set<chunknet::NodeId> tampering_;
    std::size_t stores_{0};
};

chunknet::Config make_config(const std::filesystem::path& work_dir) {
    chunknet::Config config{};
    config.work_directory = work_dir.string();
    config.chunk_size_bytes = 300;
    config.chunk_redundancy = 3;
    config.manifest_chunk_size = 256;
    config.placement_seed = 11;
    config.heartbeat_timeout = 30s;
    config.heal_idle_interval = 1s;
    return config;
}

chunknet::ChunkData make_payload(std::size_t size) {
    chunknet::ChunkData data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 13) ^ (i >> 3));
    }
    return data;
}

std::string error_code(const chunknet::coordinator::ApiResult& result) {
    return result.body.get_string("code").value_or("");
}

void register_nodes(chunknet::coordinator::Coordinator& coordinator, int count) {
    for (int i = 1; i <= count; ++i) {
        const auto result = coordinator.register_node("node-" + std::to_string(i),
                                                      1024,
                                                      "127.0.0.1",
                                                      static_cast<std::uint16_t>(5000 + i));
        assert(result.status == 200);
        assert(result.body.get_string("status") == std::optional<std::string>("registered"));
    }
}

chunknet::manifest::FileManifest load_manifest(chunknet::coordinator::Coordinator& coordinator,
                                               const chunknet::FileId& file_id) {
    return coordinator.manifests().load(file_id);
}

void drain_healing(chunknet::coordinator::Coordinator& coordinator) {
    while (coordinator.heal_next(0ms)) {
    }
}

void test_upload_download_and_lookup(const std::filesystem::path& root) {
    FakeTransport transport;
    chunknet::coordinator::Coordinator coordinator(make_config(root / "flows"), transport);

    const auto payload = make_payload(1000);

    // No nodes: rejected before any work.
    const auto rejected = coordinator.upload_file("report.bin", payload);
    assert(rejected.status == 503);
    assert(error_code(rejected) == "ERR_NO_NODES");
    assert(transport.stores() == 0);
    assert(coordinator.manifests().list().empty());

    assert(coordinator.register_node("bad/id", 1, "127.0.0.1", 5000).status == 400);
    assert(coordinator.register_node("node-x", 1, "127.0.0.1", 0).status == 400);
    assert(coordinator.register_node("node-x", 1, "", 5000).status == 400);
    register_nodes(coordinator, 4);

    assert(coordinator.upload_file("", payload).status == 400);

    const auto uploaded = coordinator.upload_file("report.bin", payload);
    assert(uploaded.status == 200);
    const auto file_id = *uploaded.body.get_string("file_id");
    assert(file_id.rfind("file-", 0) == 0);
    assert(uploaded.body.get_int64("chunks_total") == std::optional<std::int64_t>(4));
    assert(uploaded.body.get_int64("chunks_stored") == std::optional<std::int64_t>(4));

    // Scratch space is cleaned.
    assert(std::filesystem::is_empty(coordinator.config().temp_upload_directory()));
    assert(std::filesystem::is_empty(coordinator.config().temp_chunk_directory()));

    const auto manifest = load_manifest(coordinator, file_id);
    assert(manifest.original_filename == "report.bin");
    assert(manifest.file_size == 1000);
    assert(manifest.chunks.size() == 4);
    for (std::size_t i = 0; i < manifest.chunks.size(); ++i) {
        const auto& chunk = manifest.chunks[i];
        assert(chunk.chunk_id == chunknet::make_chunk_id(file_id, i));
        assert(chunk.node_ids.size() == 3);
        assert(std::set<chunknet::NodeId>(chunk.node_ids.begin(), chunk.node_ids.end()).size() == 3);
        for (const auto& node_id : chunk.node_ids) {
            assert(transport.holds(node_id, chunk.chunk_id));
        }
    }

    const auto manifest_result = coordinator.get_manifest(file_id);
    assert(manifest_result.status == 200);
    assert(manifest_result.body.get_string("original_filename") == std::optional<std::string>("report.bin"));
    assert(coordinator.get_manifest("file-zzzzzz").status == 404);
    assert(error_code(coordinator.get_manifest("file-zzzzzz")) == "ERR_FILE_NOT_FOUND");

    const auto download = coordinator.download_file(file_id);
    assert(download.result.status == 200);
    assert(download.filename == "report.bin");
    assert(download.data == payload);
    assert(coordinator.download_file("file-zzzzzz").result.status == 404);

    // An unreachable first holder and a tampering second one are skipped.
    const auto& first_chunk = manifest.chunks[0];
    transport.set_offline(first_chunk.node_ids[0], true);
    transport.set_tampering(first_chunk.node_ids[1]);
    assert(coordinator.download_file(file_id).data == payload);
    transport.set_offline(first_chunk.node_ids[0], false);

    assert(coordinator.key_count().body.get_int64("stored_keys") == std::optional<std::int64_t>(1));

    const auto located = coordinator.locate_chunk(first_chunk.chunk_id);
    assert(located.status == 200);
    assert(located.body.find("nodes")->as_array().size() == 3);
    assert(coordinator.locate_chunk("file-zzzzzz_chunk_00000").status == 404);

    // Manual assignments take precedence and stay idempotent.
    assert(coordinator.assign_chunk("manual_chunk", "node-2").status == 200);
    assert(coordinator.assign_chunk("manual_chunk", "node-2").status == 200);
    assert(coordinator.assign_chunk("", "node-2").status == 400);
    const auto assigned = coordinator.locate_chunk("manual_chunk");
    assert(assigned.status == 200);
    assert(assigned.body.find("nodes")->as_array().size() == 1);

    const auto nodes = coordinator.nodes();
    assert(nodes.body.as_object().size() == 4);
    assert(nodes.body.find("node-1")->get_string("ip") == std::optional<std::string>("127.0.0.1"));
    assert(nodes.body.find("node-1")->get_int64("port") == std::optional<std::int64_t>(5001));

    const auto ghost = coordinator.heartbeat("node-ghost");
    assert(ghost.status == 404);
    assert(error_code(ghost) == "ERR_NODE_NOT_REGISTERED");
    const auto alive = coordinator.heartbeat("node-1");
    assert(alive.status == 200);
    assert(alive.body.get_string("status") == std::optional<std::string>("alive"));

    const auto status = coordinator.status();
    assert(status.status == 200);
    assert(status.body.get_int64("node_count") == std::optional<std::int64_t>(4));
    assert(status.body.get_int64("file_count") == std::optional<std::int64_t>(1));
    assert(status.body.get_int64("total_chunks") == std::optional<std::int64_t>(4));
    assert(status.body.find("files")->find(file_id)->get_int64("chunk_count") == std::optional<std::int64_t>(4));
    assert(status.body.find("manifest_errors")->as_array().empty());
    assert(status.body.get_int64("healing_queue") == std::optional<std::int64_t>(0));
}

void test_node_death_and_healing(const std::filesystem::path& root) {
    FakeTransport transport;
    chunknet::coordinator::Coordinator coordinator(make_config(root / "healing"), transport);
    register_nodes(coordinator, 4);

    const auto payload = make_payload(900);
    const auto file_id = *coordinator.upload_file("photo.raw", payload).body.get_string("file_id");
    const auto before = load_manifest(coordinator, file_id);

    std::size_t chunks_on_node = 0;
    for (const auto& chunk : before.chunks) {
        chunks_on_node += chunk.held_by("node-1") ? 1 : 0;
    }
    assert(chunks_on_node > 0);

    const auto queued = coordinator.mark_node_dead("node-1");
    assert(queued == chunks_on_node);
    assert(!coordinator.registry().contains("node-1"));
    assert(coordinator.healing_queue().size() == chunks_on_node);

    const auto degraded = load_manifest(coordinator, file_id);
    for (const auto& chunk : degraded.chunks) {
        assert(!chunk.held_by("node-1"));
    }

    // heal_now re-queues the same chunks without duplicates.
    while (coordinator.healing_queue().try_pop()) {
    }
    const auto heal_request = coordinator.heal_now();
    assert(heal_request.status == 200);
    assert(heal_request.body.get_string("status") == std::optional<std::string>("Healing started in background"));
    assert(heal_request.body.get_int64("queued") == std::optional<std::int64_t>(static_cast<std::int64_t>(chunks_on_node)));
    assert(coordinator.heal_now().body.get_int64("queued") == std::optional<std::int64_t>(0));

    drain_healing(coordinator);
    assert(coordinator.healing_queue().size() == 0);

    const auto healed = load_manifest(coordinator, file_id);
    for (const auto& chunk : healed.chunks) {
        assert(chunk.node_ids.size() == 3);
        assert(!chunk.held_by("node-1"));
        for (const auto& node_id : chunk.node_ids) {
            assert(transport.holds(node_id, chunk.chunk_id));
        }
    }
    assert(coordinator.heal_chunk(healed.chunks[0].chunk_id) == chunknet::coordinator::HealOutcome::AlreadyHealthy);
    assert(coordinator.heal_chunk("file-zzzzzz_chunk_00000") == chunknet::coordinator::HealOutcome::UnknownChunk);
    assert(coordinator.download_file(file_id).data == payload);

    // Holders that vanished from the registry cannot donate.
    for (const auto& node_id : healed.chunks[0].node_ids) {
        coordinator.registry().remove(node_id);
    }
    coordinator.register_node("node-9", 1, "127.0.0.1", 5009);
    auto manifest = load_manifest(coordinator, file_id);
    manifest.chunks[0].node_ids.pop_back();
    coordinator.manifests().update(file_id, manifest);
    assert(coordinator.heal_chunk(manifest.chunks[0].chunk_id) == chunknet::coordinator::HealOutcome::NoLiveDonor);
}

void test_unhealable_and_expiry(const std::filesystem::path& root) {
    FakeTransport transport;
    auto config = make_config(root / "unhealable");
    chunknet::coordinator::Coordinator coordinator(config, transport);
    register_nodes(coordinator, 3);

    const auto payload = make_payload(500);
    const auto file_id = *coordinator.upload_file("notes.txt", payload).body.get_string("file_id");

    // Every copy lives on all three nodes; losing them all leaves nothing to copy from.
    coordinator.mark_node_dead("node-1");
    coordinator.mark_node_dead("node-2");
    coordinator.mark_node_dead("node-3");
    const auto manifest = load_manifest(coordinator, file_id);
    for (const auto& chunk : manifest.chunks) {
        assert(chunk.node_ids.empty());
    }
    assert(coordinator.heal_chunk(manifest.chunks[0].chunk_id) == chunknet::coordinator::HealOutcome::Unhealable);
    drain_healing(coordinator);

    register_nodes(coordinator, 1);
    const auto download = coordinator.download_file(file_id);
    assert(download.result.status == 502);
    assert(error_code(download.result) == "ERR_CHUNK_UNAVAILABLE");

    // Chunks that no node accepts are recorded without holders.
    transport.set_offline("node-1", true);
    const auto partial = coordinator.upload_file("offline.bin", payload);
    assert(partial.status == 200);
    assert(partial.body.get_int64("chunks_stored") == std::optional<std::int64_t>(0));
    assert(partial.body.get_int64("chunks_total") == std::optional<std::int64_t>(2));
    transport.set_offline("node-1", false);

    // Liveness sweep.
    const auto expired = coordinator.sweep_expired(chunknet::coordinator::Clock::now() + config.heartbeat_timeout + 5s);
    assert(expired.size() == 1);
    assert(coordinator.registry().empty());
    assert(coordinator.upload_file("late.bin", payload).status == 503);

    // A broken manifest never fails status.
    {
        std::ofstream garbage(coordinator.manifests().piece_path("file-bad000", 0), std::ios::binary);
        garbage << "definitely not a token";
    }
    const auto status = coordinator.status();
    assert(status.status == 200);
    assert(status.body.get_int64("file_count") == std::optional<std::int64_t>(3));
    const auto& errors = status.body.find("manifest_errors")->as_array();
    assert(errors.size() == 1);
    assert(errors[0].get_string("file_id") == std::optional<std::string>("file-bad000"));
    assert(coordinator.get_manifest("file-bad000").status == 500);
    assert(error_code(coordinator.get_manifest("file-bad000")) == "ERR_MANIFEST_CORRUPT");
    assert(coordinator.download_file("file-bad000").result.status == 500);
}

// Hands out the given ids in order, then falls back to random ones.
std::function<chunknet::FileId()> scripted_ids(std::vector<chunknet::FileId> ids) {
    auto next = std::make_shared<std::size_t>(0);
    return [ids = std::move(ids), next]() {
        if (*next < ids.size()) {
            return ids[(*next)++];
        }
        return chunknet::generate_file_id();
    };
}

void test_file_ids_never_reused(const std::filesystem::path& root) {
    FakeTransport transport;
    chunknet::coordinator::Coordinator coordinator(make_config(root / "file_ids"), transport);
    register_nodes(coordinator, 3);
    coordinator.set_file_id_source(scripted_ids({"file-aaaaaa", "file-aaaaaa", "file-aaaaaa", "file-bbbbbb"}));

    const auto first_payload = make_payload(700);
    const auto first = coordinator.upload_file("first.bin", first_payload);
    assert(first.body.get_string("file_id") == std::optional<std::string>("file-aaaaaa"));

    // The generator repeats an id that is already stored; the upload must move on.
    const auto second_payload = make_payload(450);
    const auto second = coordinator.upload_file("second.bin", second_payload);
    assert(second.status == 200);
    assert(second.body.get_string("file_id") == std::optional<std::string>("file-bbbbbb"));

    assert(load_manifest(coordinator, "file-aaaaaa").original_filename == "first.bin");
    const auto first_back = coordinator.download_file("file-aaaaaa");
    assert(first_back.result.status == 200);
    assert(first_back.data == first_payload);
    assert(coordinator.download_file("file-bbbbbb").data == second_payload);
}

void test_sweep_survives_manifest_write_failure(const std::filesystem::path& root) {
    FakeTransport transport;
    auto config = make_config(root / "sweep_failure");
    chunknet::coordinator::Coordinator coordinator(config, transport);
    register_nodes(coordinator, 4);
    coordinator.set_file_id_source(scripted_ids({"file-aaaaaa", "file-bbbbbb"}));
    assert(coordinator.upload_file("stuck.bin", make_payload(500)).status == 200);
    assert(coordinator.upload_file("free.bin", make_payload(500)).status == 200);

    // A non-empty directory where the piece is staged makes every rewrite of file-aaaaaa fail.
    auto blocker = coordinator.manifests().piece_path("file-aaaaaa", 0);
    blocker += ".tmp";
    std::filesystem::create_directories(blocker);
    std::ofstream(blocker / "keep") << "x";

    const auto expired = coordinator.sweep_expired(chunknet::coordinator::Clock::now() + config.heartbeat_timeout + 5s);
    assert(expired.size() == 4);
    assert(coordinator.registry().empty());

    // Every expired node was still stripped from the manifest that could be written.
    for (const auto& chunk : load_manifest(coordinator, "file-bbbbbb").chunks) {
        assert(chunk.node_ids.empty());
    }
    const auto stuck = load_manifest(coordinator, "file-aaaaaa");
    assert(std::any_of(stuck.chunks.begin(), stuck.chunks.end(), [](const auto& chunk) {
        return !chunk.node_ids.empty();
    }));

    std::filesystem::remove_all(blocker);
    for (int i = 1; i <= 4; ++i) {
        coordinator.mark_node_dead("node-" + std::to_string(i));
    }
    for (const auto& chunk : load_manifest(coordinator, "file-aaaaaa").chunks) {
        assert(chunk.node_ids.empty());
    }
}

void test_background_healer(const std::filesystem::path& root) {
    FakeTransport transport;
    auto config = make_config(root / "background");
    config.heal_idle_interval = 1s;
    chunknet::coordinator::Coordinator coordinator(config, transport);
    register_nodes(coordinator, 4);
    const auto file_id = *coordinator.upload_file("a.bin", make_payload(400)).body.get_string("file_id");

    coordinator.start();
    assert(coordinator.running());
    coordinator.mark_node_dead("node-2");

    bool healthy = false;
    for (int attempt = 0; attempt < 100 && !healthy; ++attempt) {
        std::this_thread::sleep_for(50ms);
        const auto manifest = load_manifest(coordinator, file_id);
        healthy = std::all_of(manifest.chunks.begin(), manifest.chunks.end(), [](const auto& chunk) {
            return chunk.node_ids.size() == 3;
        });
    }
    assert(healthy);

    coordinator.stop();
    assert(!coordinator.running());
}

}  // namespace

int main() {
    chunknet::daemon::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / ("chunknet_coordinator_" + chunknet::random_hex(8));
    test_upload_download_and_lookup(root);
    test_node_death_and_healing(root);
    test_unhealable_and_expiry(root);
    test_file_ids_never_reused(root);
    test_sweep_survives_manifest_write_failure(root);
    test_background_healer(root);

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
