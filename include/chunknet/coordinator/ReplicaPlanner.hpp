#pragma once

#include "chunknet/Types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace chunknet::coordinator {

// Random replica placement. A fixed seed makes choices reproducible in tests.
class ReplicaPlanner {
public:
    explicit ReplicaPlanner(std::optional<std::uint32_t> seed = std::nullopt);

    // Uniform sample without replacement of min(count, candidates.size()) ids.
    std::vector<NodeId> select_targets(std::vector<NodeId> candidates, std::size_t count);

    // Registered nodes that do not already hold the chunk, in random order.
    std::vector<NodeId> select_heal_targets(const std::vector<NodeId>& registered,
                                            const std::vector<NodeId>& holders);

    std::optional<NodeId> pick_donor(const std::vector<NodeId>& holders);

private:
    std::mt19937 rng_;
    std::mutex mutex_;
};

}  // namespace chunknet::coordinator
