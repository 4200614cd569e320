#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/net/HttpClient.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace chunknet::net {

struct NodeEndpoint {
    NodeId node_id;
    std::string host;
    std::uint16_t port{0};
};

struct TransferOutcome {
    bool ok{false};
    int status{0};
    std::string error;
};

// How the coordinator reaches storage nodes.
class NodeTransport {
public:
    virtual ~NodeTransport() = default;

    virtual TransferOutcome store_chunk(const NodeEndpoint& node,
                                        const ChunkId& chunk_id,
                                        std::span<const std::uint8_t> data) = 0;

    // nullopt unless the node answered 200 with the chunk bytes.
    virtual std::optional<ChunkData> fetch_chunk(const NodeEndpoint& node, const ChunkId& chunk_id) = 0;
};

class HttpNodeTransport : public NodeTransport {
public:
    explicit HttpNodeTransport(HttpClient client = HttpClient{});

    TransferOutcome store_chunk(const NodeEndpoint& node,
                                const ChunkId& chunk_id,
                                std::span<const std::uint8_t> data) override;
    std::optional<ChunkData> fetch_chunk(const NodeEndpoint& node, const ChunkId& chunk_id) override;

    static std::string base_url(const NodeEndpoint& node);

private:
    HttpClient client_;
};

}  // namespace chunknet::net
