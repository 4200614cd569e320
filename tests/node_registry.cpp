#include "chunknet/coordinator/NodeRegistry.hpp"

#include <cassert>
#include <chrono>
#include <vector>

using namespace std::chrono_literals;

int main() {
    using chunknet::coordinator::Clock;
    using chunknet::coordinator::NodeInfo;
    using chunknet::coordinator::NodeRegistry;

    NodeRegistry registry;
    assert(registry.empty());

    const auto t0 = Clock::now();
    registry.register_node(NodeInfo{"node-a", 100, "127.0.0.1", 5001, {}}, t0);
    registry.register_node(NodeInfo{"node-b", 200, "127.0.0.1", 5002, {}}, t0);
    assert(registry.size() == 2);
    assert(registry.contains("node-a"));

    const auto found = registry.find("node-b");
    assert(found.has_value());
    assert(found->port == 5002);
    assert(found->storage_available == 200);
    assert(found->last_seen == t0);

    // Re-registration replaces the record.
    registry.register_node(NodeInfo{"node-b", 300, "10.0.0.2", 6000, {}}, t0 + 1s);
    assert(registry.size() == 2);
    assert(registry.find("node-b")->host == "10.0.0.2");
    assert(registry.find("node-b")->storage_available == 300);

    assert(!registry.heartbeat("node-ghost", t0));
    assert(registry.heartbeat("node-a", t0 + 20s));

    // node-b last seen at t0+1s: silent for 34s at t0+35s; node-a for 15s.
    const auto expired = registry.expire(t0 + 35s, 30s);
    assert(expired.size() == 1);
    assert(expired[0] == "node-b");
    assert(!registry.contains("node-b"));

    // Exactly at the timeout still counts as alive.
    assert(registry.expire(t0 + 50s, 30s).empty());
    assert(registry.expire(t0 + 51s, 30s).size() == 1);
    assert(registry.empty());

    registry.register_node(NodeInfo{"node-c", 1, "h", 1, {}});
    registry.register_node(NodeInfo{"node-a", 1, "h", 2, {}});
    const auto ids = registry.ids();
    assert(ids.size() == 2);
    assert(ids[0] == "node-a" && ids[1] == "node-c");
    assert(registry.snapshot().size() == 2);
    assert(registry.remove("node-a"));
    assert(!registry.remove("node-a"));
    assert(registry.ids() == std::vector<chunknet::NodeId>{"node-c"});

    return 0;
}
