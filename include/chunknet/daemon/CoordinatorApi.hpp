#pragma once

#include "chunknet/Config.hpp"
#include "chunknet/coordinator/Coordinator.hpp"
#include "chunknet/net/HttpServer.hpp"

#include <cstdint>
#include <string>

namespace chunknet::daemon {

net::HttpResponse to_http_response(const coordinator::ApiResult& result);

// HTTP front of the coordinator service.
class CoordinatorApi {
public:
    CoordinatorApi(coordinator::Coordinator& coordinator, const Config& config);

    void start(const std::string& host, std::uint16_t port);
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t port() const noexcept;

    net::HttpServer& server() noexcept { return server_; }

private:
    void install_routes();

    coordinator::Coordinator& coordinator_;
    net::HttpServer server_;
};

}  // namespace chunknet::daemon
