#pragma once

#include <neo/assert.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace sluice {

/**
 * @brief A bounded, blocking FIFO for handing values from one producer thread to one consumer
 * thread.
 *
 * - push() blocks while the queue is full, until the consumer makes room or closes the queue.
 * - pop() blocks until a value arrives, the producer calls finish(), or the consumer calls close().
 * - finish() is the producer's end-of-data signal. Values already queued are still delivered.
 * - close() is the consumer's "stop" signal. Queued values are dropped, and every pending and
 *   future push() fails.
 *
 * Because pop() waits on "has a value, or is finished" as a single condition, the consumer can
 * never miss a value that was queued just before the producer finished.
 */
template <typename T>
class handoff_queue {
    mutable std::mutex      _mutex;
    std::condition_variable _not_empty;
    std::condition_variable _not_full;
    std::deque<T>           _items;
    std::size_t             _capacity;
    bool                    _finished = false;
    bool                    _closed   = false;

public:
    /// Create a queue that holds at most `capacity` values
    explicit handoff_queue(std::size_t capacity)
        : _capacity(capacity) {
        neo_assert(expects, capacity > 0, "A handoff_queue must have a non-zero capacity");
    }

    handoff_queue(const handoff_queue&) = delete;
    handoff_queue& operator=(const handoff_queue&) = delete;

    /**
     * @brief Enqueue a value, waiting for room if the queue is full.
     *
     * @return true if the value was enqueued. false if the queue was closed (the value is
     * discarded)
     */
    bool push(T value) {
        {
            std::unique_lock lock{_mutex};
            neo_assert(expects,
                       !_finished,
                       "handoff_queue::push() was called after the producer finished");
            _not_full.wait(lock, [&] { return _closed || _items.size() < _capacity; });
            if (_closed) {
                return false;
            }
            _items.push_back(std::move(value));
            neo_assert(invariant,
                       _items.size() <= _capacity,
                       "handoff_queue exceeded its capacity",
                       _items.size(),
                       _capacity);
        }
        _not_empty.notify_one();
        return true;
    }

    /**
     * @brief Dequeue the next value, waiting for one to arrive.
     *
     * @return std::optional<T> The value, or nullopt once the queue is finished (or closed) and
     * empty
     */
    std::optional<T> pop() {
        std::optional<T> ret;
        {
            std::unique_lock lock{_mutex};
            _not_empty.wait(lock, [&] { return _closed || _finished || !_items.empty(); });
            if (_items.empty()) {
                return std::nullopt;
            }
            ret.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _not_full.notify_one();
        return ret;
    }

    /**
     * @brief Dequeue the next value if one is available, without waiting
     */
    std::optional<T> try_pop() {
        std::optional<T> ret;
        {
            std::lock_guard lock{_mutex};
            if (_items.empty()) {
                return std::nullopt;
            }
            ret.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _not_full.notify_one();
        return ret;
    }

    /// Signal that no more values will be pushed. Wakes a waiting consumer.
    void finish() noexcept {
        {
            std::lock_guard lock{_mutex};
            _finished = true;
        }
        _not_empty.notify_all();
    }

    /// Reject all further pushes, drop queued values, and wake every waiting thread.
    void close() noexcept {
        std::deque<T> dropped;
        {
            std::lock_guard lock{_mutex};
            _closed = true;
            dropped.swap(_items);
        }
        _not_full.notify_all();
        _not_empty.notify_all();
    }

    /// The number of values currently queued
    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard lock{_mutex};
        return _items.size();
    }

    /// The maximum number of values that may be queued
    [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

    /// Whether the queue is currently at capacity
    [[nodiscard]] bool full() const noexcept { return size() >= _capacity; }

    /// Whether finish() has been called
    [[nodiscard]] bool finished() const noexcept {
        std::lock_guard lock{_mutex};
        return _finished;
    }

    /// Whether close() has been called
    [[nodiscard]] bool closed() const noexcept {
        std::lock_guard lock{_mutex};
        return _closed;
    }
};

}  // namespace sluice
