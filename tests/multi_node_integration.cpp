#include "chunknet/Config.hpp"
#include "chunknet/Types.hpp"
#include "chunknet/coordinator/Coordinator.hpp"
#include "chunknet/daemon/CoordinatorApi.hpp"
#include "chunknet/daemon/NodeApi.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/json/Value.hpp"
#include "chunknet/net/HttpClient.hpp"
#include "chunknet/net/NodeTransport.hpp"
#include "chunknet/node/HeartbeatClient.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct StorageNode {
    chunknet::NodeId id;
    std::unique_ptr<chunknet::storage::ChunkStore> store;
    std::unique_ptr<chunknet::daemon::NodeApi> api;
    std::unique_ptr<chunknet::node::HeartbeatClient> heartbeat;

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(api->port());
    }

    void shutdown() {
        heartbeat->stop();
        api->stop();
    }
};

StorageNode launch_node(const std::string& id,
                        const std::filesystem::path& root,
                        const chunknet::Config& config,
                        const std::string& coordinator_url) {
    StorageNode node;
    node.id = id;
    node.store = std::make_unique<chunknet::storage::ChunkStore>(root / id);
    node.api = std::make_unique<chunknet::daemon::NodeApi>(id, *node.store, config);
    node.api->start("127.0.0.1", 0);
    node.heartbeat = std::make_unique<chunknet::node::HeartbeatClient>(
        coordinator_url,
        chunknet::node::NodeRegistration{id, 1000, "127.0.0.1", node.api->port()},
        1s,
        chunknet::net::HttpClient(5s, 2s));
    assert(node.heartbeat->register_node());
    assert(node.heartbeat->registered());
    node.heartbeat->start();
    return node;
}

chunknet::ChunkData make_payload(std::size_t size) {
    chunknet::ChunkData data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 7 + i / 251) & 0xFF);
    }
    return data;
}

}  // namespace

int main() {
    chunknet::daemon::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / ("chunknet_integration_" + chunknet::random_hex(8));

    chunknet::Config config{};
    config.work_directory = (root / "coordinator").string();
    config.chunk_size_bytes = 4 * 1024;
    config.chunk_redundancy = 3;
    config.heartbeat_timeout = 30s;
    config.heal_idle_interval = 1s;

    chunknet::net::HttpNodeTransport transport(chunknet::net::HttpClient(5s, 2s));
    chunknet::coordinator::Coordinator coordinator(config, transport);
    chunknet::daemon::CoordinatorApi api(coordinator, config);
    api.start("127.0.0.1", 0);
    const std::string base = "http://127.0.0.1:" + std::to_string(api.port());

    const chunknet::net::HttpClient client(10s, 2s);
    assert(client.get(base + "/ping").ok());

    // Upload before any node registered.
    const auto early = client.post(base + "/upload_file?filename=early.bin", make_payload(10));
    assert(early.status == 503);

    std::vector<StorageNode> nodes;
    for (int i = 1; i <= 4; ++i) {
        nodes.push_back(launch_node("node-" + std::to_string(i), root / "nodes", config, base));
    }

    const auto listed = client.get(base + "/nodes").json_body();
    assert(listed.has_value());
    assert(listed->as_object().size() == 4);
    assert(listed->find("node-3")->get_int64("port") ==
           std::optional<std::int64_t>(static_cast<std::int64_t>(nodes[2].api->port())));

    // Storage node surface.
    {
        const auto health = client.get(nodes[0].url() + "/health").json_body();
        assert(health->get_string("status") == std::optional<std::string>("ok"));
        assert(health->get_string("node") == std::optional<std::string>("node-1"));
        assert(client.post(nodes[0].url() + "/store_chunk", make_payload(4)).status == 400);
        assert(client.post(nodes[0].url() + "/store_chunk?chunk_id=sample", chunknet::ChunkData{}).status == 400);
        assert(client.post(nodes[0].url() + "/store_chunk?chunk_id=..", make_payload(4)).status == 400);
        assert(client.post(nodes[0].url() + "/store_chunk?chunk_id=sample", make_payload(4)).ok());
        assert(client.get(nodes[0].url() + "/chunk/sample").body == make_payload(4));
        assert(client.get(nodes[0].url() + "/chunks").json_body()->find("chunks")->as_array().size() == 1);
        assert(client.del(nodes[0].url() + "/chunk/sample").ok());
        assert(client.get(nodes[0].url() + "/chunk/sample").status == 404);
        assert(client.del(nodes[0].url() + "/chunk/sample").status == 404);
    }

    const auto payload = make_payload(10 * 1024 + 123);
    const auto uploaded = client.post(base + "/upload_file?filename=smoke%20test.bin", payload);
    assert(uploaded.ok());
    const auto upload_body = uploaded.json_body();
    const auto file_id = *upload_body->get_string("file_id");
    assert(upload_body->get_int64("chunks_total") == std::optional<std::int64_t>(3));
    assert(upload_body->get_int64("chunks_stored") == std::optional<std::int64_t>(3));

    assert(client.post(base + "/upload_file", payload).status == 400);

    const auto manifest = client.get(base + "/manifest/" + file_id).json_body();
    assert(manifest.has_value());
    assert(manifest->get_string("original_filename") == std::optional<std::string>("smoke test.bin"));
    const auto& chunks = manifest->find("chunks")->as_array();
    assert(chunks.size() == 3);
    for (const auto& chunk : chunks) {
        assert(chunk.find("node_ids")->as_array().size() == 3);
    }
    assert(client.get(base + "/manifest/file-000000").status == 404);

    const auto first_chunk = *chunks[0].get_string("chunk_id");
    const auto located = client.get(base + "/chunk/" + first_chunk).json_body();
    assert(located->find("nodes")->as_array().size() == 3);
    assert(client.get(base + "/chunk/nope").status == 404);

    // Nodes only ever see ciphertext.
    {
        const auto holder = located->find("nodes")->as_array()[0].string_value;
        for (const auto& node : nodes) {
            if (node.id == holder) {
                const auto stored = node.store->get(first_chunk);
                assert(stored.has_value());
                assert(stored->size() > 4096);
                assert(!std::equal(payload.begin(), payload.begin() + 64, stored->begin()));
            }
        }
    }

    const auto status = client.get(base + "/status").json_body();
    assert(status->get_int64("node_count") == std::optional<std::int64_t>(4));
    assert(status->get_int64("file_count") == std::optional<std::int64_t>(1));
    assert(status->get_int64("total_chunks") == std::optional<std::int64_t>(3));
    assert(client.get(base + "/keys").json_body()->get_int64("stored_keys") == std::optional<std::int64_t>(1));

    const auto downloaded = client.get(base + "/download_file/" + file_id);
    assert(downloaded.ok());
    assert(downloaded.body == payload);
    assert(client.get(base + "/download_file/file-000000").status == 404);

    // Heartbeats: known node stays alive, ghosts are told to register.
    {
        auto beat = chunknet::json::Value::make_object();
        beat.set("node_id", chunknet::json::Value("node-2"));
        assert(client.post_json(base + "/heartbeat", beat).ok());
        beat.set("node_id", chunknet::json::Value("node-ghost"));
        assert(client.post_json(base + "/heartbeat", beat).status == 404);
    }

    // Lose a node, heal, and download again.
    nodes[0].shutdown();
    coordinator.mark_node_dead("node-1");
    while (coordinator.heal_next(0ms)) {
    }
    const auto healed = client.get(base + "/manifest/" + file_id).json_body();
    for (const auto& chunk : healed->find("chunks")->as_array()) {
        const auto& holders = chunk.find("node_ids")->as_array();
        assert(holders.size() == 3);
        for (const auto& holder : holders) {
            assert(holder.string_value != "node-1");
        }
    }
    const auto heal_request = client.post(base + "/heal_now", chunknet::ChunkData{}, "application/json");
    assert(heal_request.ok());
    assert(heal_request.json_body()->get_int64("queued") == std::optional<std::int64_t>(0));
    assert(client.get(base + "/download_file/" + file_id).body == payload);

    // Manual assignment endpoint.
    {
        auto assignment = chunknet::json::Value::make_object();
        assignment.set("chunk_id", chunknet::json::Value("manual"));
        assignment.set("node_id", chunknet::json::Value("node-2"));
        assert(client.post_json(base + "/chunk", assignment).ok());
        assert(client.get(base + "/chunk/manual").json_body()->find("nodes")->as_array().size() == 1);
    }

    // A forgotten node registers again on its next beat. Without a host the request source is recorded.
    {
        chunknet::node::HeartbeatClient spare(base,
                                              chunknet::node::NodeRegistration{"node-spare", 500, "", nodes[1].api->port()},
                                              1s,
                                              chunknet::net::HttpClient(5s, 2s));
        assert(spare.register_node());
        const auto recorded = coordinator.registry().find("node-spare");
        assert(recorded.has_value());
        assert(recorded->host == "127.0.0.1");

        coordinator.registry().remove("node-spare");
        assert(!coordinator.registry().contains("node-spare"));
        assert(spare.beat() == chunknet::node::HeartbeatClient::BeatResult::Reregistered);
        assert(coordinator.registry().contains("node-spare"));
        assert(spare.registered());
        assert(spare.beat() == chunknet::node::HeartbeatClient::BeatResult::Alive);
        coordinator.mark_node_dead("node-spare");
    }

    for (std::size_t i = 1; i < nodes.size(); ++i) {
        nodes[i].shutdown();
    }
    api.stop();

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
