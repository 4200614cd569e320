#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/json/Value.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace chunknet::net {

struct HttpResult {
    // 0 when the request never produced an HTTP answer; see error.
    long status{0};
    ChunkData body;
    std::string content_type;
    std::string error;

    bool transport_ok() const { return status != 0; }
    bool ok() const { return status >= 200 && status < 300; }
    std::string body_text() const;
    // nullopt when the body is not valid JSON.
    std::optional<json::Value> json_body() const;
    // The "error" member of a JSON error body, else the transport error or raw text.
    std::string error_message() const;
};

class HttpClient {
public:
    // A zero timeout leaves the whole transfer unbounded; connect_timeout still applies.
    HttpClient(std::chrono::seconds timeout = std::chrono::seconds(10),
               std::chrono::seconds connect_timeout = std::chrono::seconds(5));

    using Headers = std::vector<std::pair<std::string, std::string>>;

    HttpResult get(const std::string& url) const;
    HttpResult post(const std::string& url,
                    std::span<const std::uint8_t> body,
                    const std::string& content_type = "application/octet-stream") const;
    HttpResult post_json(const std::string& url, const json::Value& body) const;
    HttpResult del(const std::string& url) const;

    HttpResult request(const std::string& method,
                       const std::string& url,
                       std::span<const std::uint8_t> body = {},
                       const Headers& headers = {}) const;

private:
    std::chrono::seconds timeout_;
    std::chrono::seconds connect_timeout_;
};

}  // namespace chunknet::net
