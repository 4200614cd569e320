#include "chunknet/net/NodeTransport.hpp"

#include "chunknet/net/Url.hpp"

namespace chunknet::net {

HttpNodeTransport::HttpNodeTransport(HttpClient client)
    : client_(std::move(client)) {}

std::string HttpNodeTransport::base_url(const NodeEndpoint& node) {
    if (node.host.find(':') != std::string::npos) {
        return "http://[" + node.host + "]:" + std::to_string(node.port);
    }
    return "http://" + node.host + ":" + std::to_string(node.port);
}

TransferOutcome HttpNodeTransport::store_chunk(const NodeEndpoint& node,
                                               const ChunkId& chunk_id,
                                               std::span<const std::uint8_t> data) {
    const auto url = base_url(node) + "/store_chunk?chunk_id=" + url_encode(chunk_id);
    const auto result = client_.post(url, data);
    TransferOutcome outcome;
    outcome.status = static_cast<int>(result.status);
    outcome.ok = result.status == 200;
    if (!outcome.ok) {
        outcome.error = result.error_message();
    }
    return outcome;
}

std::optional<ChunkData> HttpNodeTransport::fetch_chunk(const NodeEndpoint& node, const ChunkId& chunk_id) {
    auto result = client_.get(base_url(node) + "/chunk/" + url_encode(chunk_id));
    if (result.status != 200) {
        return std::nullopt;
    }
    return std::move(result.body);
}

}  // namespace chunknet::net
