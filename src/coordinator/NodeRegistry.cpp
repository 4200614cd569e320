#include "chunknet/coordinator/NodeRegistry.hpp"

namespace chunknet::coordinator {

void NodeRegistry::register_node(NodeInfo info, Clock::time_point now) {
    info.last_seen = now;
    std::scoped_lock lock(mutex_);
    auto key = info.node_id;
    nodes_.insert_or_assign(std::move(key), std::move(info));
}

bool NodeRegistry::heartbeat(const NodeId& node_id, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    const auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.last_seen = now;
    return true;
}

bool NodeRegistry::remove(const NodeId& node_id) {
    std::scoped_lock lock(mutex_);
    return nodes_.erase(node_id) > 0;
}

std::vector<NodeId> NodeRegistry::expire(Clock::time_point now, std::chrono::seconds timeout) {
    std::scoped_lock lock(mutex_);
    std::vector<NodeId> expired;
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (now - it->second.last_seen > timeout) {
            expired.push_back(it->first);
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::optional<NodeInfo> NodeRegistry::find(const NodeId& node_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool NodeRegistry::contains(const NodeId& node_id) const {
    std::scoped_lock lock(mutex_);
    return nodes_.contains(node_id);
}

std::vector<NodeInfo> NodeRegistry::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<NodeInfo> result;
    result.reserve(nodes_.size());
    for (const auto& [_, info] : nodes_) {
        result.push_back(info);
    }
    return result;
}

std::vector<NodeId> NodeRegistry::ids() const {
    std::scoped_lock lock(mutex_);
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        result.push_back(id);
    }
    return result;
}

std::size_t NodeRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return nodes_.size();
}

bool NodeRegistry::empty() const {
    return size() == 0;
}

}  // namespace chunknet::coordinator
