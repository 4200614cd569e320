#include "chunknet/coordinator/HealingQueue.hpp"

namespace chunknet::coordinator {

bool HealingQueue::push(const ChunkId& chunk_id) {
    {
        std::scoped_lock lock(mutex_);
        if (!queued_.insert(chunk_id).second) {
            return false;
        }
        queue_.push_back(chunk_id);
    }
    cv_.notify_one();
    return true;
}

std::optional<ChunkId> HealingQueue::try_pop() {
    std::scoped_lock lock(mutex_);
    return pop_locked();
}

std::optional<ChunkId> HealingQueue::pop_wait(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return poked_ || !queue_.empty(); });
    poked_ = false;
    return pop_locked();
}

void HealingQueue::notify() {
    {
        std::scoped_lock lock(mutex_);
        poked_ = true;
    }
    cv_.notify_all();
}

std::size_t HealingQueue::size() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

std::vector<ChunkId> HealingQueue::snapshot() const {
    std::scoped_lock lock(mutex_);
    return {queue_.begin(), queue_.end()};
}

std::optional<ChunkId> HealingQueue::pop_locked() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    ChunkId front = std::move(queue_.front());
    queue_.pop_front();
    queued_.erase(front);
    return front;
}

}  // namespace chunknet::coordinator
