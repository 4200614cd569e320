#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/net/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace chunknet::node {

struct NodeRegistration {
    NodeId node_id;
    std::uint64_t storage_available{0};
    // Empty lets the coordinator use the address the registration came from.
    std::string host;
    std::uint16_t port{0};
};

// Keeps a storage node known to the coordinator: registers once, then beats periodically.
class HeartbeatClient {
public:
    enum class BeatResult {
        Alive,
        Reregistered,
        Failed
    };

    HeartbeatClient(std::string coordinator_url,
                    NodeRegistration registration,
                    std::chrono::seconds interval,
                    net::HttpClient client = net::HttpClient{});
    ~HeartbeatClient();

    HeartbeatClient(const HeartbeatClient&) = delete;
    HeartbeatClient& operator=(const HeartbeatClient&) = delete;

    bool register_node();
    // A 404 means the coordinator forgot us (restart or expiry); re-register on the spot.
    BeatResult beat();

    void start();
    void stop();

    [[nodiscard]] bool registered() const noexcept;
    [[nodiscard]] std::uint64_t beats_sent() const noexcept;

private:
    void run();

    std::string coordinator_url_;
    NodeRegistration registration_;
    std::chrono::seconds interval_;
    net::HttpClient client_;

    std::atomic<bool> registered_{false};
    std::atomic<std::uint64_t> beats_sent_{0};
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread worker_;
};

}  // namespace chunknet::node
