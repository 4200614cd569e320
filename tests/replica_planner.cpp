#include "chunknet/coordinator/ReplicaPlanner.hpp"

#include <algorithm>
#include <cassert>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

int main() {
    using chunknet::NodeId;
    using chunknet::coordinator::ReplicaPlanner;

    const std::vector<NodeId> nodes{"node-1", "node-2", "node-3", "node-4", "node-5"};

    ReplicaPlanner planner(7u);
    const auto chosen = planner.select_targets(nodes, 3);
    assert(chosen.size() == 3);
    assert(std::set<NodeId>(chosen.begin(), chosen.end()).size() == 3);
    for (const auto& id : chosen) {
        assert(std::find(nodes.begin(), nodes.end(), id) != nodes.end());
    }

    // Fewer candidates than requested copies.
    assert(planner.select_targets({"node-1", "node-2"}, 3).size() == 2);
    assert(planner.select_targets({}, 3).empty());
    // Duplicates collapse.
    assert(planner.select_targets({"node-1", "node-1", "node-1"}, 3).size() == 1);

    // Same seed, same sequence.
    ReplicaPlanner left(99u);
    ReplicaPlanner right(99u);
    for (int i = 0; i < 10; ++i) {
        assert(left.select_targets(nodes, 2) == right.select_targets(nodes, 2));
    }

    // Every node gets picked eventually.
    std::map<NodeId, int> hits;
    ReplicaPlanner spread(1u);
    for (int i = 0; i < 200; ++i) {
        for (const auto& id : spread.select_targets(nodes, 2)) {
            ++hits[id];
        }
    }
    assert(hits.size() == nodes.size());
    for (const auto& [id, count] : hits) {
        assert(count > 20);
    }

    const auto targets = planner.select_heal_targets(nodes, {"node-2", "node-4"});
    assert(targets.size() == 3);
    for (const auto& id : targets) {
        assert(id != "node-2" && id != "node-4");
    }
    assert(planner.select_heal_targets({"node-1"}, {"node-1"}).empty());

    assert(!planner.pick_donor({}).has_value());
    const auto donor = planner.pick_donor({"node-4", "node-5"});
    assert(donor == std::optional<NodeId>("node-4") || donor == std::optional<NodeId>("node-5"));

    return 0;
}
