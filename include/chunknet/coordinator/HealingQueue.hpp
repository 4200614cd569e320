#pragma once

#include "chunknet/Types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace chunknet::coordinator {

// FIFO of chunk ids awaiting re-replication. An id is queued at most once.
class HealingQueue {
public:
    bool push(const ChunkId& chunk_id);
    std::optional<ChunkId> try_pop();
    std::optional<ChunkId> pop_wait(std::chrono::milliseconds timeout);

    // Wakes a waiter without queueing anything.
    void notify();

    std::size_t size() const;
    std::vector<ChunkId> snapshot() const;

private:
    std::optional<ChunkId> pop_locked();

    std::deque<ChunkId> queue_;
    std::set<ChunkId> queued_;
    bool poked_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace chunknet::coordinator
