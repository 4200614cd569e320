#include "chunknet/coordinator/HealingQueue.hpp"

#include <cassert>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main() {
    using chunknet::coordinator::HealingQueue;

    HealingQueue queue;
    assert(queue.size() == 0);
    assert(!queue.try_pop().has_value());

    assert(queue.push("c1"));
    assert(queue.push("c2"));
    assert(!queue.push("c1"));
    assert(queue.size() == 2);
    assert((queue.snapshot() == std::vector<chunknet::ChunkId>{"c1", "c2"}));

    assert(queue.try_pop() == std::optional<chunknet::ChunkId>("c1"));
    // Popped ids may be queued again.
    assert(queue.push("c1"));
    assert(queue.try_pop() == std::optional<chunknet::ChunkId>("c2"));
    assert(queue.pop_wait(10ms) == std::optional<chunknet::ChunkId>("c1"));

    // Empty queue times out.
    const auto started = std::chrono::steady_clock::now();
    assert(!queue.pop_wait(50ms).has_value());
    assert(std::chrono::steady_clock::now() - started >= 40ms);

    // A push from another thread wakes a waiter.
    std::thread producer([&queue] {
        std::this_thread::sleep_for(30ms);
        queue.push("late");
    });
    assert(queue.pop_wait(5s) == std::optional<chunknet::ChunkId>("late"));
    producer.join();

    // notify() wakes a waiter without an item.
    std::thread poker([&queue] {
        std::this_thread::sleep_for(30ms);
        queue.notify();
    });
    const auto poke_start = std::chrono::steady_clock::now();
    assert(!queue.pop_wait(5s).has_value());
    assert(std::chrono::steady_clock::now() - poke_start < 4s);
    poker.join();

    // A notify with items queued still hands out the oldest one.
    assert(queue.push("pending"));
    queue.notify();
    assert(queue.pop_wait(1s) == std::optional<chunknet::ChunkId>("pending"));
    assert(queue.size() == 0);

    return 0;
}
