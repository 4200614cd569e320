#include "chunknet/daemon/CoordinatorApi.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"

#include <limits>
#include <optional>

namespace chunknet::daemon {

namespace {

using net::HttpRequest;
using net::HttpResponse;

std::optional<json::Value> parse_json_body(const HttpRequest& request) {
    json::Value value;
    try {
        value = json::parse(request.body_text());
    } catch (const json::ParseError&) {
        return std::nullopt;
    }
    if (!value.is_object()) {
        return std::nullopt;
    }
    return value;
}

HttpResponse invalid_body(std::string_view message) {
    return HttpResponse::error(400, "ERR_INVALID_REQUEST", message);
}

std::string content_disposition(const std::string& filename) {
    std::string sanitized;
    for (const char ch : filename) {
        if (ch == '"' || ch == '\\' || static_cast<unsigned char>(ch) < 0x20) {
            sanitized.push_back('_');
        } else {
            sanitized.push_back(ch);
        }
    }
    return "attachment; filename=\"" + sanitized + "\"";
}

}  // namespace

HttpResponse to_http_response(const coordinator::ApiResult& result) {
    return HttpResponse::json(result.status, result.body);
}

CoordinatorApi::CoordinatorApi(coordinator::Coordinator& coordinator, const Config& config)
    : coordinator_(coordinator),
      server_("coordinator", config.max_request_bytes) {
    install_routes();
}

void CoordinatorApi::start(const std::string& host, std::uint16_t port) {
    server_.start(host, port);
}

void CoordinatorApi::stop() {
    server_.stop();
}

bool CoordinatorApi::running() const noexcept {
    return server_.running();
}

std::uint16_t CoordinatorApi::port() const noexcept {
    return server_.port();
}

void CoordinatorApi::install_routes() {
    server_.route("GET", "/ping", [](const HttpRequest&) {
        json::Value body = json::Value::make_object();
        body.set("status", json::Value("ok"));
        return HttpResponse::json(200, body);
    });

    server_.route("POST", "/register", [this](const HttpRequest& request) {
        const auto body = parse_json_body(request);
        if (!body) {
            return invalid_body("Request body must be a JSON object");
        }
        const auto node_id = body->get_string("node_id");
        const auto storage = body->get_int64("storage_available");
        const auto port = body->get_int64("port");
        if (!node_id || !storage || !port) {
            return invalid_body("node_id, storage_available and port are required");
        }
        if (*storage < 0 || *port <= 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
            return invalid_body("storage_available or port out of range");
        }
        auto host = body->get_string("ip");
        if (!host) {
            host = body->get_string("host");
        }
        if (!host || host->empty()) {
            host = request.remote_address;
        }
        return to_http_response(coordinator_.register_node(*node_id, static_cast<std::uint64_t>(*storage), *host,
                                                           static_cast<std::uint16_t>(*port)));
    });

    server_.route("POST", "/heartbeat", [this](const HttpRequest& request) {
        const auto body = parse_json_body(request);
        const auto node_id = body ? body->get_string("node_id") : std::nullopt;
        if (!node_id) {
            return invalid_body("node_id is required");
        }
        return to_http_response(coordinator_.heartbeat(*node_id));
    });

    server_.route("GET", "/nodes", [this](const HttpRequest&) {
        return to_http_response(coordinator_.nodes());
    });

    server_.route("GET", "/chunk/{chunk_id}", [this](const HttpRequest& request) {
        return to_http_response(coordinator_.locate_chunk(request.param("chunk_id")));
    });

    server_.route("POST", "/chunk", [this](const HttpRequest& request) {
        const auto body = parse_json_body(request);
        const auto chunk_id = body ? body->get_string("chunk_id") : std::nullopt;
        const auto node_id = body ? body->get_string("node_id") : std::nullopt;
        if (!chunk_id || !node_id) {
            return invalid_body("chunk_id and node_id are required");
        }
        return to_http_response(coordinator_.assign_chunk(*chunk_id, *node_id));
    });

    server_.route("GET", "/keys", [this](const HttpRequest&) {
        return to_http_response(coordinator_.key_count());
    });

    server_.route("GET", "/manifest/{file_id}", [this](const HttpRequest& request) {
        return to_http_response(coordinator_.get_manifest(request.param("file_id")));
    });

    server_.route("POST", "/upload_file", [this](const HttpRequest& request) {
        const auto filename = request.query_param("filename");
        if (!filename || filename->empty()) {
            return HttpResponse::error(400, "ERR_MISSING_FILENAME", "filename query parameter is required");
        }
        return to_http_response(coordinator_.upload_file(*filename, request.body));
    });

    server_.route("GET", "/download_file/{file_id}", [this](const HttpRequest& request) {
        auto download = coordinator_.download_file(request.param("file_id"));
        if (!download.result.succeeded()) {
            return to_http_response(download.result);
        }
        auto response = HttpResponse::bytes(200, std::move(download.data));
        response.headers.emplace_back("Content-Disposition", content_disposition(download.filename));
        return response;
    });

    server_.route("GET", "/status", [this](const HttpRequest&) {
        return to_http_response(coordinator_.status());
    });

    server_.route("POST", "/heal_now", [this](const HttpRequest&) {
        return to_http_response(coordinator_.heal_now());
    });
}

}  // namespace chunknet::daemon
