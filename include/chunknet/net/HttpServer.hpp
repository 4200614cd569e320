#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/json/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunknet::net {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    // Values captured by "{name}" segments of the matched route.
    std::map<std::string, std::string> params;
    ChunkData body;
    std::string remote_address;

    std::optional<std::string> query_param(const std::string& name) const;
    std::optional<std::string> header(const std::string& name) const;
    std::string param(const std::string& name) const;
    std::string body_text() const;
};

struct HttpResponse {
    int status{200};
    std::string content_type{"application/json"};
    std::vector<std::pair<std::string, std::string>> headers;
    ChunkData body;

    static HttpResponse json(int status, const chunknet::json::Value& value);
    static HttpResponse bytes(int status, ChunkData body, std::string content_type = "application/octet-stream");
    static HttpResponse error(int status, std::string_view code, std::string_view message);

    std::string body_text() const;
};

std::string_view reason_phrase(int status);

// Minimal HTTP/1.1 server: one request per connection, handled on the accept thread.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit HttpServer(std::string name, std::size_t max_body_bytes = 64ull * 1024ull * 1024ull);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Pattern segments written as "{name}" capture one path segment.
    void route(std::string method, std::string pattern, Handler handler);

    // Port 0 binds an ephemeral port; port() reports the bound one afterwards.
    void start(const std::string& host, std::uint16_t port);
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

    // Routes a parsed request without touching the network.
    HttpResponse dispatch(HttpRequest request) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunknet::net
