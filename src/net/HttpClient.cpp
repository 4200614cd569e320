#include "chunknet/net/HttpClient.hpp"

#include <curl/curl.h>

#include <algorithm>

namespace chunknet::net {

namespace {

constexpr const char* kUserAgent = "chunknet/1.0";

bool ensure_curl_initialized() {
    static const bool ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    return ready;
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<ChunkData*>(userdata);
    const auto total = size * nmemb;
    body->insert(body->end(), reinterpret_cast<const std::uint8_t*>(ptr),
                 reinterpret_cast<const std::uint8_t*>(ptr) + total);
    return total;
}

class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const noexcept { return handle_; }

private:
    CURL* handle_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    bool append(const std::string& line) {
        auto* next = curl_slist_append(list_, line.c_str());
        if (!next) {
            return false;
        }
        list_ = next;
        return true;
    }

    curl_slist* get() const noexcept { return list_; }

private:
    curl_slist* list_{nullptr};
};

}  // namespace

std::string HttpResult::body_text() const {
    return std::string(body.begin(), body.end());
}

std::optional<json::Value> HttpResult::json_body() const {
    try {
        return json::parse(body_text());
    } catch (const json::ParseError&) {
        return std::nullopt;
    }
}

std::string HttpResult::error_message() const {
    if (!transport_ok()) {
        return error.empty() ? std::string("request failed") : error;
    }
    if (const auto parsed = json_body()) {
        if (auto message = parsed->get_string("error")) {
            return *message;
        }
    }
    if (!body.empty()) {
        return body_text();
    }
    return "HTTP status " + std::to_string(status);
}

HttpClient::HttpClient(std::chrono::seconds timeout, std::chrono::seconds connect_timeout)
    : timeout_(timeout), connect_timeout_(connect_timeout) {}

HttpResult HttpClient::get(const std::string& url) const {
    return request("GET", url);
}

HttpResult HttpClient::post(const std::string& url,
                            std::span<const std::uint8_t> body,
                            const std::string& content_type) const {
    return request("POST", url, body, {{"Content-Type", content_type}});
}

HttpResult HttpClient::post_json(const std::string& url, const json::Value& body) const {
    const auto text = json::serialize(body);
    return request("POST", url,
                   std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()),
                   {{"Content-Type", "application/json"}});
}

HttpResult HttpClient::del(const std::string& url) const {
    return request("DELETE", url);
}

HttpResult HttpClient::request(const std::string& method,
                               const std::string& url,
                               std::span<const std::uint8_t> body,
                               const Headers& headers) const {
    HttpResult result;
    if (!ensure_curl_initialized()) {
        result.error = "Unable to initialize libcurl";
        return result;
    }
    CurlHandle curl;
    if (!curl.get()) {
        result.error = "Unable to allocate curl handle";
        return result;
    }

    HeaderList header_list;
    for (const auto& [name, value] : headers) {
        if (!header_list.append(name + ": " + value)) {
            result.error = "Unable to build request headers";
            return result;
        }
    }
    // An empty "Expect:" keeps curl from waiting on 100-continue for large bodies.
    if (!header_list.append("Expect:")) {
        result.error = "Unable to build request headers";
        return result;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);

    if (method == "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.empty() ? "" : reinterpret_cast<const char*>(body.data()));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!body.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body.data()));
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        }
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        result.error = curl_easy_strerror(rc);
        result.body.clear();
        return result;
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        result.content_type = content_type;
    }
    return result;
}

}  // namespace chunknet::net
