#include "chunknet/daemon/NodeApi.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"

namespace chunknet::daemon {

namespace {

using net::HttpRequest;
using net::HttpResponse;

}  // namespace

NodeApi::NodeApi(NodeId node_id, storage::ChunkStore& store, const Config& config)
    : node_id_(std::move(node_id)),
      store_(store),
      server_("node", config.max_request_bytes) {
    install_routes();
}

void NodeApi::start(const std::string& host, std::uint16_t port) {
    server_.start(host, port);
}

void NodeApi::stop() {
    server_.stop();
}

bool NodeApi::running() const noexcept {
    return server_.running();
}

std::uint16_t NodeApi::port() const noexcept {
    return server_.port();
}

void NodeApi::install_routes() {
    server_.route("POST", "/store_chunk", [this](const HttpRequest& request) {
        const auto chunk_id = request.query_param("chunk_id");
        if (!chunk_id || chunk_id->empty() || request.body.empty()) {
            return HttpResponse::error(400, "ERR_MISSING_CHUNK", "Missing chunk or chunk_id");
        }
        if (!is_valid_identifier(*chunk_id)) {
            return HttpResponse::error(400, "ERR_INVALID_CHUNK_ID", "Invalid chunk_id");
        }
        if (!store_.put(*chunk_id, request.body)) {
            return HttpResponse::error(500, "ERR_STORAGE", "Failed to persist chunk");
        }
        log_event(StructuredLogger::Level::Info, "node.chunk.stored",
                  {{"node_id", node_id_}, {"chunk_id", *chunk_id}, {"bytes", std::to_string(request.body.size())}});

        json::Value body = json::Value::make_object();
        body.set("status", json::Value("chunk stored"));
        body.set("node", json::Value(node_id_));
        body.set("chunk_id", json::Value(*chunk_id));
        return HttpResponse::json(200, body);
    });

    server_.route("GET", "/chunk/{chunk_id}", [this](const HttpRequest& request) {
        auto data = store_.get(request.param("chunk_id"));
        if (!data) {
            return HttpResponse::error(404, "ERR_CHUNK_NOT_FOUND", "Chunk not found");
        }
        return HttpResponse::bytes(200, std::move(*data));
    });

    server_.route("DELETE", "/chunk/{chunk_id}", [this](const HttpRequest& request) {
        const auto chunk_id = request.param("chunk_id");
        if (!store_.remove(chunk_id)) {
            return HttpResponse::error(404, "ERR_CHUNK_NOT_FOUND", "Chunk not found");
        }
        log_event(StructuredLogger::Level::Info, "node.chunk.deleted", {{"node_id", node_id_}, {"chunk_id", chunk_id}});
        json::Value body = json::Value::make_object();
        body.set("status", json::Value("chunk deleted"));
        body.set("chunk_id", json::Value(chunk_id));
        return HttpResponse::json(200, body);
    });

    server_.route("GET", "/chunks", [this](const HttpRequest&) {
        json::Value chunks = json::Value::make_array();
        for (const auto& entry : store_.snapshot()) {
            json::Value item = json::Value::make_object();
            item.set("chunk_id", json::Value(entry.id));
            item.set("size", json::Value(static_cast<std::uint64_t>(entry.size)));
            chunks.push_back(std::move(item));
        }
        json::Value body = json::Value::make_object();
        body.set("node", json::Value(node_id_));
        body.set("chunks", std::move(chunks));
        return HttpResponse::json(200, body);
    });

    server_.route("GET", "/health", [this](const HttpRequest&) {
        json::Value body = json::Value::make_object();
        body.set("node", json::Value(node_id_));
        body.set("status", json::Value("ok"));
        body.set("chunks", json::Value(store_.size()));
        return HttpResponse::json(200, body);
    });
}

}  // namespace chunknet::daemon
