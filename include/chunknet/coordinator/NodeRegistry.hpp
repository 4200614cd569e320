#pragma once

#include "chunknet/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunknet::coordinator {

using Clock = std::chrono::system_clock;

struct NodeInfo {
    NodeId node_id;
    std::uint64_t storage_available{0};
    std::string host;
    std::uint16_t port{0};
    Clock::time_point last_seen{};
};

// In-memory view of live storage nodes; rebuilt from registrations after a restart.
class NodeRegistry {
public:
    void register_node(NodeInfo info, Clock::time_point now = Clock::now());
    bool heartbeat(const NodeId& node_id, Clock::time_point now = Clock::now());
    bool remove(const NodeId& node_id);

    // Removes and returns nodes silent for longer than timeout.
    std::vector<NodeId> expire(Clock::time_point now, std::chrono::seconds timeout);

    std::optional<NodeInfo> find(const NodeId& node_id) const;
    bool contains(const NodeId& node_id) const;
    std::vector<NodeInfo> snapshot() const;
    std::vector<NodeId> ids() const;
    std::size_t size() const;
    bool empty() const;

private:
    std::map<NodeId, NodeInfo> nodes_;
    mutable std::mutex mutex_;
};

}  // namespace chunknet::coordinator
