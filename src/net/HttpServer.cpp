#include "chunknet/net/HttpServer.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/net/Url.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace chunknet::net {

namespace {

using daemon::StructuredLogger;

using NativeSocket = int;
constexpr NativeSocket kInvalidSocket = -1;

constexpr std::size_t kMaxLineLength = 16 * 1024;
constexpr std::size_t kMaxHeaderCount = 100;
constexpr std::chrono::seconds kClientReadTimeout{std::chrono::seconds(30)};
constexpr std::size_t kMaxDrainBytes = 8 * 1024 * 1024;
constexpr std::size_t kMaxActiveConnections = 64;

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

void close_socket(NativeSocket socket) {
    if (socket != kInvalidSocket) {
        ::close(socket);
    }
}

bool send_all(NativeSocket socket, const char* data, std::size_t length) {
    std::size_t total_sent = 0;
    while (total_sent < length) {
        const auto sent = ::send(socket, data + total_sent, length - total_sent, kSendFlags);
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return true;
}

// Buffered reader so header parsing does not cost one syscall per byte.
class SocketReader {
public:
    explicit SocketReader(NativeSocket socket) : socket_(socket) {}

    enum class LineStatus {
        Ok,
        Closed,
        TooLong
    };

    LineStatus read_line(std::string& line) {
        line.clear();
        while (true) {
            if (offset_ == size_ && !fill()) {
                return LineStatus::Closed;
            }
            const char ch = buffer_[offset_++];
            if (ch == '\n') {
                return LineStatus::Ok;
            }
            if (ch != '\r') {
                line.push_back(ch);
                if (line.size() > kMaxLineLength) {
                    return LineStatus::TooLong;
                }
            }
        }
    }

    bool read_exact(std::uint8_t* out, std::size_t length) {
        std::size_t copied = 0;
        const auto buffered = std::min(length, size_ - offset_);
        std::copy_n(buffer_ + offset_, buffered, out);
        offset_ += buffered;
        copied += buffered;
        while (copied < length) {
            const auto received = ::recv(socket_, reinterpret_cast<char*>(out) + copied, length - copied, 0);
            if (received <= 0) {
                return false;
            }
            copied += static_cast<std::size_t>(received);
        }
        return true;
    }

private:
    bool fill() {
        const auto received = ::recv(socket_, buffer_, sizeof(buffer_), 0);
        if (received <= 0) {
            return false;
        }
        offset_ = 0;
        size_ = static_cast<std::size_t>(received);
        return true;
    }

    NativeSocket socket_;
    char buffer_[8192]{};
    std::size_t offset_{0};
    std::size_t size_{0};
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    while (!path.empty()) {
        if (path.front() == '/') {
            path.remove_prefix(1);
            continue;
        }
        const auto slash = path.find('/');
        segments.emplace_back(path.substr(0, slash));
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    return segments;
}

struct ParseFailure {
    int status;
    std::string code;
    std::string message;
};

struct ParseResult {
    bool connection_closed{false};
    std::optional<ParseFailure> failure;
    HttpRequest request;
};

ParseFailure bad_request(std::string code, std::string message) {
    return ParseFailure{400, std::move(code), std::move(message)};
}

ParseResult parse_request(NativeSocket client, SocketReader& reader, std::size_t max_body_bytes) {
    ParseResult result;
    std::string line;

    auto status = reader.read_line(line);
    while (status == SocketReader::LineStatus::Ok && line.empty()) {
        status = reader.read_line(line);
    }
    if (status == SocketReader::LineStatus::Closed) {
        result.connection_closed = true;
        return result;
    }
    if (status == SocketReader::LineStatus::TooLong) {
        result.failure = ParseFailure{414, "ERR_HTTP_URI_TOO_LONG", "Request line too long"};
        return result;
    }

    std::istringstream request_line(line);
    std::string target;
    std::string version;
    request_line >> result.request.method >> target >> version;
    if (result.request.method.empty() || target.empty() || !version.starts_with("HTTP/1.")) {
        result.failure = bad_request("ERR_HTTP_REQUEST_LINE", "Malformed request line");
        return result;
    }

    const auto question = target.find('?');
    const auto raw_path = std::string_view(target).substr(0, question);
    auto decoded_path = url_decode(raw_path);
    if (!decoded_path || decoded_path->empty() || decoded_path->front() != '/') {
        result.failure = bad_request("ERR_HTTP_PATH", "Malformed request path");
        return result;
    }
    result.request.path = *decoded_path;
    if (question != std::string::npos) {
        result.request.query = parse_query(std::string_view(target).substr(question + 1));
    }

    std::size_t header_count = 0;
    while (true) {
        status = reader.read_line(line);
        if (status == SocketReader::LineStatus::Closed) {
            result.failure = bad_request("ERR_HTTP_HEADERS", "Connection closed inside headers");
            return result;
        }
        if (status == SocketReader::LineStatus::TooLong || ++header_count > kMaxHeaderCount) {
            result.failure = ParseFailure{431, "ERR_HTTP_HEADERS_TOO_LARGE", "Request headers too large"};
            return result;
        }
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            result.failure = bad_request("ERR_HTTP_HEADERS", "Malformed header line");
            return result;
        }
        result.request.headers[to_lower(trim(std::string_view(line).substr(0, colon)))] =
            trim(std::string_view(line).substr(colon + 1));
    }

    if (const auto encoding = result.request.header("transfer-encoding");
        encoding && to_lower(*encoding) != "identity") {
        result.failure = ParseFailure{411, "ERR_HTTP_LENGTH_REQUIRED", "Chunked request bodies are not supported"};
        return result;
    }

    std::size_t content_length = 0;
    if (const auto length_text = result.request.header("content-length")) {
        std::uint64_t parsed{};
        const auto* begin = length_text->data();
        const auto* end = begin + length_text->size();
        const auto conversion = std::from_chars(begin, end, parsed);
        if (conversion.ec != std::errc{} || conversion.ptr != end) {
            result.failure = bad_request("ERR_HTTP_CONTENT_LENGTH", "Invalid Content-Length");
            return result;
        }
        if (parsed > max_body_bytes) {
            result.failure = ParseFailure{413, "ERR_HTTP_PAYLOAD_TOO_LARGE", "Request body exceeds server allowance"};
            return result;
        }
        content_length = static_cast<std::size_t>(parsed);
    }

    if (content_length > 0) {
        if (const auto expect = result.request.header("expect"); expect && to_lower(*expect) == "100-continue") {
            static constexpr std::string_view kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
            send_all(client, kContinue.data(), kContinue.size());
        }
        result.request.body.resize(content_length);
        if (!reader.read_exact(result.request.body.data(), content_length)) {
            result.failure = bad_request("ERR_HTTP_BODY_TRUNCATED", "Truncated request body");
            return result;
        }
    }
    return result;
}

bool write_response(NativeSocket client, const HttpResponse& response) {
    std::ostringstream head;
    head << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n";
    head << "Content-Type: " << response.content_type << "\r\n";
    head << "Content-Length: " << response.body.size() << "\r\n";
    for (const auto& [name, value] : response.headers) {
        head << name << ": " << value << "\r\n";
    }
    head << "Connection: close\r\n\r\n";
    const auto text = head.str();
    if (!send_all(client, text.data(), text.size())) {
        return false;
    }
    return response.body.empty() ||
           send_all(client, reinterpret_cast<const char*>(response.body.data()), response.body.size());
}

}  // namespace

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
    const auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    const auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string HttpRequest::param(const std::string& name) const {
    const auto it = params.find(name);
    return it == params.end() ? std::string{} : it->second;
}

std::string HttpRequest::body_text() const {
    return std::string(body.begin(), body.end());
}

HttpResponse HttpResponse::json(int status, const chunknet::json::Value& value) {
    HttpResponse response;
    response.status = status;
    const auto text = chunknet::json::serialize(value);
    response.body.assign(text.begin(), text.end());
    return response;
}

HttpResponse HttpResponse::bytes(int status, ChunkData body, std::string content_type) {
    HttpResponse response;
    response.status = status;
    response.content_type = std::move(content_type);
    response.body = std::move(body);
    return response;
}

HttpResponse HttpResponse::error(int status, std::string_view code, std::string_view message) {
    chunknet::json::Value body = chunknet::json::Value::make_object();
    body.set("error", chunknet::json::Value(std::string(message)));
    body.set("code", chunknet::json::Value(std::string(code)));
    return json(status, body);
}

std::string HttpResponse::body_text() const {
    return std::string(body.begin(), body.end());
}

std::string_view reason_phrase(int status) {
    switch (status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 414: return "URI Too Long";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    default: return "Unknown";
    }
}

class HttpServer::Impl {
public:
    Impl(std::string name, std::size_t max_body_bytes)
        : name_(std::move(name)), max_body_bytes_(max_body_bytes) {}

    ~Impl() {
        stop();
    }

    void route(std::string method, std::string pattern, Handler handler) {
        Route entry;
        entry.method = std::move(method);
        entry.segments = split_path(pattern);
        entry.pattern = std::move(pattern);
        entry.handler = std::move(handler);
        routes_.push_back(std::move(entry));
    }

    void start(const std::string& host, std::uint16_t port) {
        if (running_) {
            return;
        }

        NativeSocket server = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (server == kInvalidSocket) {
            throw std::runtime_error("Failed to create " + name_ + " socket");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        const std::string bind_host = host == "localhost" ? std::string("127.0.0.1") : host;
        if (bind_host.empty() || bind_host == "0.0.0.0") {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        } else if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
            close_socket(server);
            throw std::runtime_error("Invalid " + name_ + " host: " + host);
        }

        const int opt = 1;
        setsockopt(server, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

        if (::bind(server, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            close_socket(server);
            throw std::runtime_error("Failed to bind " + name_ + " socket on " + host + ":" + std::to_string(port));
        }
        if (::listen(server, SOMAXCONN) < 0) {
            close_socket(server);
            throw std::runtime_error("Failed to listen on " + name_ + " socket");
        }

        sockaddr_in bound{};
        socklen_t bound_len = sizeof(bound);
        if (::getsockname(server, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
            port_.store(ntohs(bound.sin_port), std::memory_order_release);
        } else {
            port_.store(port, std::memory_order_release);
        }

        listen_socket_ = server;
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this, server);

        log_event(StructuredLogger::Level::Info, "http.server.started",
                  {{"server", name_}, {"host", host}, {"port", std::to_string(port_.load())}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        const auto socket = listen_socket_;
        listen_socket_ = kInvalidSocket;
        if (socket != kInvalidSocket) {
            ::shutdown(socket, SHUT_RDWR);
        }
        close_socket(socket);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        std::list<std::unique_ptr<Connection>> connections;
        {
            std::scoped_lock lock(connections_mutex_);
            for (const auto& connection : connections_) {
                if (!connection->finished) {
                    ::shutdown(connection->socket, SHUT_RDWR);
                }
            }
            connections.swap(connections_);
        }
        for (auto& connection : connections) {
            if (connection->worker.joinable()) {
                connection->worker.join();
            }
        }
        log_event(StructuredLogger::Level::Info, "http.server.stopped", {{"server", name_}});
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return port_.load(std::memory_order_acquire);
    }

    HttpResponse dispatch(HttpRequest request) const {
        const auto segments = split_path(request.path);
        bool path_matched = false;
        for (const auto& route : routes_) {
            std::map<std::string, std::string> params;
            if (!match(route, segments, params)) {
                continue;
            }
            path_matched = true;
            if (route.method != request.method) {
                continue;
            }
            request.params = std::move(params);
            try {
                return route.handler(request);
            } catch (const std::exception& error) {
                log_event(StructuredLogger::Level::Error, "http.handler.failed",
                          {{"server", name_}, {"route", route.pattern}, {"error", error.what()}});
                return HttpResponse::error(500, "ERR_INTERNAL", error.what());
            }
        }
        if (path_matched) {
            return HttpResponse::error(405, "ERR_METHOD_NOT_ALLOWED", "Method not allowed");
        }
        return HttpResponse::error(404, "ERR_NOT_FOUND", "Not found");
    }

private:
    // One worker thread per accepted connection. The socket is closed by the
    // worker under connections_mutex_ so stop() never touches a reused descriptor.
    struct Connection {
        NativeSocket socket{kInvalidSocket};
        bool finished{false};
        std::thread worker;
    };

    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        Handler handler;
    };

    static bool match(const Route& route,
                      const std::vector<std::string>& segments,
                      std::map<std::string, std::string>& params) {
        if (route.segments.size() != segments.size()) {
            return false;
        }
        for (std::size_t i = 0; i < segments.size(); ++i) {
            const auto& expected = route.segments[i];
            if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
                params[expected.substr(1, expected.size() - 2)] = segments[i];
            } else if (expected != segments[i]) {
                return false;
            }
        }
        return true;
    }

    void accept_loop(NativeSocket listen_socket) {
        while (running_.load(std::memory_order_acquire)) {
            sockaddr_in client_addr{};
            socklen_t addr_len = sizeof(client_addr);
            const auto client = ::accept(listen_socket, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
            if (client == kInvalidSocket) {
                if (running_.load(std::memory_order_acquire)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }

            timeval timeout{};
            timeout.tv_sec = static_cast<decltype(timeout.tv_sec)>(kClientReadTimeout.count());
            setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout));

            std::string remote_address{"unknown"};
            char buffer[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, &client_addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
                remote_address = buffer;
            }
            serve_async(client, std::move(remote_address));
        }
    }

    void serve_async(NativeSocket client, std::string remote_address) {
        std::scoped_lock lock(connections_mutex_);
        reap_finished_locked();
        if (connections_.size() >= kMaxActiveConnections) {
            log_event(StructuredLogger::Level::Warning, "http.server.busy",
                      {{"server", name_}, {"remote", remote_address}});
            write_response(client, HttpResponse::error(503, "ERR_SERVER_BUSY", "Too many concurrent requests"));
            close_socket(client);
            return;
        }
        auto connection = std::make_unique<Connection>();
        connection->socket = client;
        auto* raw = connection.get();
        connection->worker = std::thread([this, raw, remote_address = std::move(remote_address)] {
            handle_client(raw->socket, remote_address);
            std::scoped_lock done_lock(connections_mutex_);
            close_socket(raw->socket);
            raw->finished = true;
        });
        connections_.push_back(std::move(connection));
    }

    void reap_finished_locked() {
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->finished) {
                if ((*it)->worker.joinable()) {
                    (*it)->worker.join();
                }
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Half-closes and swallows what the peer is still sending so the rejection
    // is read before the connection resets.
    static void drain_after_reject(NativeSocket client) {
        ::shutdown(client, SHUT_WR);
        timeval timeout{};
        timeout.tv_sec = 1;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout));
        char sink[4096];
        std::size_t drained = 0;
        while (drained < kMaxDrainBytes) {
            const auto received = ::recv(client, sink, sizeof(sink), 0);
            if (received <= 0) {
                break;
            }
            drained += static_cast<std::size_t>(received);
        }
    }

    void handle_client(NativeSocket client, const std::string& remote_address) {
        SocketReader reader(client);
        auto parsed = parse_request(client, reader, max_body_bytes_);
        if (parsed.connection_closed) {
            return;
        }
        if (parsed.failure) {
            log_event(StructuredLogger::Level::Warning, "http.request.parse_error",
                      {{"server", name_}, {"remote", remote_address}, {"code", parsed.failure->code}});
            write_response(client, HttpResponse::error(parsed.failure->status, parsed.failure->code,
                                                       parsed.failure->message));
            drain_after_reject(client);
            return;
        }

        parsed.request.remote_address = remote_address;
        const auto method = parsed.request.method;
        const auto path = parsed.request.path;
        const auto started = std::chrono::steady_clock::now();
        const auto response = dispatch(std::move(parsed.request));
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (!write_response(client, response)) {
            log_event(StructuredLogger::Level::Warning, "http.response.send_failed",
                      {{"server", name_}, {"remote", remote_address}, {"path", path}});
        }
        log_event(response.status >= 500 ? StructuredLogger::Level::Warning : StructuredLogger::Level::Debug,
                  "http.request",
                  {{"server", name_},
                   {"remote", remote_address},
                   {"method", method},
                   {"path", path},
                   {"status", std::to_string(response.status)},
                   {"elapsed_ms", std::to_string(elapsed.count())}});
    }

    std::string name_;
    std::size_t max_body_bytes_;
    std::vector<Route> routes_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    NativeSocket listen_socket_{kInvalidSocket};
    std::thread accept_thread_;
    std::list<std::unique_ptr<Connection>> connections_;
    std::mutex connections_mutex_;
};

HttpServer::HttpServer(std::string name, std::size_t max_body_bytes)
    : impl_(std::make_unique<Impl>(std::move(name), max_body_bytes)) {}

HttpServer::~HttpServer() = default;

void HttpServer::route(std::string method, std::string pattern, Handler handler) {
    impl_->route(std::move(method), std::move(pattern), std::move(handler));
}

void HttpServer::start(const std::string& host, std::uint16_t port) {
    impl_->start(host, port);
}

void HttpServer::stop() {
    impl_->stop();
}

bool HttpServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t HttpServer::port() const noexcept {
    return impl_->port();
}

HttpResponse HttpServer::dispatch(HttpRequest request) const {
    return impl_->dispatch(std::move(request));
}

}  // namespace chunknet::net
