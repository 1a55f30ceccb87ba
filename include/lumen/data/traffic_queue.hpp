#pragma once

#include "lumen/net/endpoint.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lumen::data {

/// Bounded single-producer single-consumer ring.
/// The client receive thread pushes, the panel's frame loop drains. A push into a
/// full ring is dropped and counted rather than blocking the receive thread.
template <typename T> class SPSCQueue {
  public:
    explicit SPSCQueue(size_t capacity) : capacity_(capacity + 1), buffer_(capacity + 1) {}

    /// Producer only. Returns false (and counts a drop) if full.
    bool try_push(T &&item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) % capacity_;
        if (next == head_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        buffer_[tail] = std::move(item);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Consumer only. Returns false if empty.
    bool try_pop(T &item) {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = std::move(buffer_[head]);
        head_.store((head + 1) % capacity_, std::memory_order_release);
        return true;
    }

    /// Consumer only. Pops at most max_items, handing each to fn. Returns the count.
    template <typename Fn> size_t drain(Fn &&fn, size_t max_items) {
        size_t count = 0;
        T item;
        while (count < max_items && try_pop(item)) {
            fn(std::move(item));
            ++count;
        }
        return count;
    }

    /// Not exact under concurrency.
    [[nodiscard]] size_t size_approx() const {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_relaxed);
        return (tail + capacity_ - head) % capacity_;
    }

    [[nodiscard]] size_t capacity() const { return capacity_ - 1; }

    /// Pushes rejected because the ring was full.
    [[nodiscard]] uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

  private:
    size_t capacity_;
    std::vector<T> buffer_;

    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
    std::atomic<uint64_t> dropped_{0};
};

/// One inbound message as seen by the receive loop, flattened for display.
struct TrafficEvent {
    net::Endpoint from;
    uint64_t target = 0;
    uint16_t type = 0;
    uint8_t sequence = 0;
    std::string summary;
};

using TrafficQueue = SPSCQueue<TrafficEvent>;

} // namespace lumen::data
