#include "chunknet/coordinator/ReplicaPlanner.hpp"

#include <algorithm>
#include <iterator>

namespace chunknet::coordinator {

namespace {

std::mt19937::result_type initial_seed(std::optional<std::uint32_t> seed) {
    if (seed) {
        return static_cast<std::mt19937::result_type>(*seed ^ 0x1F2E3D4Cu);
    }
    std::random_device rd;
    return static_cast<std::mt19937::result_type>(rd());
}

}  // namespace

ReplicaPlanner::ReplicaPlanner(std::optional<std::uint32_t> seed)
    : rng_(initial_seed(seed)) {}

std::vector<NodeId> ReplicaPlanner::select_targets(std::vector<NodeId> candidates, std::size_t count) {
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    std::scoped_lock lock(mutex_);
    std::vector<NodeId> chosen;
    const auto take = std::min(count, candidates.size());
    chosen.reserve(take);
    std::sample(candidates.begin(), candidates.end(), std::back_inserter(chosen), take, rng_);
    std::shuffle(chosen.begin(), chosen.end(), rng_);
    return chosen;
}

std::vector<NodeId> ReplicaPlanner::select_heal_targets(const std::vector<NodeId>& registered,
                                                        const std::vector<NodeId>& holders) {
    std::vector<NodeId> targets;
    for (const auto& node_id : registered) {
        if (std::find(holders.begin(), holders.end(), node_id) == holders.end() &&
            std::find(targets.begin(), targets.end(), node_id) == targets.end()) {
            targets.push_back(node_id);
        }
    }
    std::scoped_lock lock(mutex_);
    std::shuffle(targets.begin(), targets.end(), rng_);
    return targets;
}

std::optional<NodeId> ReplicaPlanner::pick_donor(const std::vector<NodeId>& holders) {
    if (holders.empty()) {
        return std::nullopt;
    }
    std::scoped_lock lock(mutex_);
    std::uniform_int_distribution<std::size_t> dist(0, holders.size() - 1);
    return holders[dist(rng_)];
}

}  // namespace chunknet::coordinator
