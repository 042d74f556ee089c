#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>

namespace gestify {

/**
 * Lock-free single-producer/single-consumer ring buffer.
 *
 * One slot is kept free to tell "full" from "empty", so the queue holds
 * Capacity - 1 items. Head and tail sit on separate cache lines.
 *
 * @tparam T element type, must be default-constructible and movable
 * @tparam Capacity number of slots, power of two
 */
template<typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0, "Capacity must be a power of two");

public:
    SpscQueue() : head_(0), tail_(0) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Producer side. Returns false (item untouched) if the queue is full.
     */
    bool try_push(T&& item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) & MASK;
        if (next == head_.load(std::memory_order_acquire)) {
            return false;
        }
        buffer_[tail] = std::move(item);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    bool try_push(const T& item) {
        T copy = item;
        return try_push(std::move(copy));
    }

    /**
     * Consumer side. std::nullopt if empty.
     */
    std::optional<T> try_pop() {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(buffer_[head]));
        buffer_[head] = T{};
        head_.store((head + 1) & MASK, std::memory_order_release);
        return item;
    }

    // Consumer side
    bool pop_front(T& item) {
        auto value = try_pop();
        if (!value) {
            return false;
        }
        item = std::move(*value);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return (tail - head) & MASK;
    }

    static constexpr size_t capacity() { return Capacity - 1; }

private:
    static constexpr size_t MASK = Capacity - 1;
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;

    std::array<T, Capacity> buffer_;
};

} // namespace gestify
