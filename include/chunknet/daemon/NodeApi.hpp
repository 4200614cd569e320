#pragma once

#include "chunknet/Config.hpp"
#include "chunknet/Types.hpp"
#include "chunknet/net/HttpServer.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <cstdint>
#include <string>

namespace chunknet::daemon {

// HTTP front of a storage node's chunk folder.
class NodeApi {
public:
    NodeApi(NodeId node_id, storage::ChunkStore& store, const Config& config);

    void start(const std::string& host, std::uint16_t port);
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

    const NodeId& node_id() const noexcept { return node_id_; }
    net::HttpServer& server() noexcept { return server_; }

private:
    void install_routes();

    NodeId node_id_;
    storage::ChunkStore& store_;
    net::HttpServer server_;
};

}  // namespace chunknet::daemon
