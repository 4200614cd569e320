#include "chunknet/node/HeartbeatClient.hpp"

#include "chunknet/daemon/StructuredLogger.hpp"

namespace chunknet::node {

namespace {

using daemon::StructuredLogger;

}  // namespace

HeartbeatClient::HeartbeatClient(std::string coordinator_url,
                                 NodeRegistration registration,
                                 std::chrono::seconds interval,
                                 net::HttpClient client)
    : coordinator_url_(std::move(coordinator_url)),
      registration_(std::move(registration)),
      interval_(interval),
      client_(std::move(client)) {}

HeartbeatClient::~HeartbeatClient() {
    stop();
}

bool HeartbeatClient::register_node() {
    json::Value body = json::Value::make_object();
    body.set("node_id", json::Value(registration_.node_id));
    body.set("storage_available", json::Value(registration_.storage_available));
    // Without an ip the coordinator records the address the request came from.
    if (!registration_.host.empty()) {
        body.set("ip", json::Value(registration_.host));
    }
    body.set("port", json::Value(static_cast<std::int64_t>(registration_.port)));

    const auto result = client_.post_json(coordinator_url_ + "/register", body);
    if (!result.ok()) {
        log_event(StructuredLogger::Level::Warning, "node.register.failed",
                  {{"node_id", registration_.node_id},
                   {"status", std::to_string(result.status)},
                   {"error", result.error_message()}});
        registered_.store(false);
        return false;
    }
    registered_.store(true);
    log_event(StructuredLogger::Level::Info, "node.register.completed",
              {{"node_id", registration_.node_id}, {"coordinator", coordinator_url_}});
    return true;
}

HeartbeatClient::BeatResult HeartbeatClient::beat() {
    json::Value body = json::Value::make_object();
    body.set("node_id", json::Value(registration_.node_id));

    const auto result = client_.post_json(coordinator_url_ + "/heartbeat", body);
    if (result.ok()) {
        beats_sent_.fetch_add(1);
        log_event(StructuredLogger::Level::Debug, "node.heartbeat.sent", {{"node_id", registration_.node_id}});
        return BeatResult::Alive;
    }
    if (result.status == 404) {
        log_event(StructuredLogger::Level::Warning, "node.heartbeat.forgotten", {{"node_id", registration_.node_id}});
        registered_.store(false);
        return register_node() ? BeatResult::Reregistered : BeatResult::Failed;
    }
    log_event(StructuredLogger::Level::Warning, "node.heartbeat.failed",
              {{"node_id", registration_.node_id},
               {"status", std::to_string(result.status)},
               {"error", result.error_message()}});
    return BeatResult::Failed;
}

void HeartbeatClient::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&HeartbeatClient::run, this);
}

void HeartbeatClient::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool HeartbeatClient::registered() const noexcept {
    return registered_.load();
}

std::uint64_t HeartbeatClient::beats_sent() const noexcept {
    return beats_sent_.load();
}

void HeartbeatClient::run() {
    while (running_.load()) {
        if (registered_.load()) {
            beat();
        } else {
            register_node();
        }
        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

}  // namespace chunknet::node
