#pragma once

/**
 * EventBus - unbounded multi-producer / single-consumer FIFO
 *
 * Producers call publish() from their own threads; the controller blocks in
 * consume(). Events published by one producer come out in the order that
 * producer published them. Across producers, first arrival wins.
 *
 * Usage:
 *   EventBus bus;
 *   bus.publish(LineEvent::line("hello"));   // any thread
 *   Event e = bus.consume();                 // controller thread only
 */

#include "event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace pipeview {
namespace events {

class EventBus {
public:
    EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Enqueue an event. Never blocks beyond the internal lock, never drops.
     */
    void publish(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(event));
            ++published_;
        }
        ready_.notify_one();
    }

    /**
     * Block until an event is available and return it.
     */
    Event consume() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return !queue_.empty(); });
        return pop_front_locked();
    }

    /**
     * Wait at most `timeout` for an event.
     * Returns std::nullopt if nothing arrived in time.
     */
    template <typename Rep, typename Period>
    std::optional<Event> try_consume_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
            return std::nullopt;
        }
        return pop_front_locked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

    uint64_t published_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> queue_;
    uint64_t published_ = 0;

    Event pop_front_locked() {
        Event e = std::move(queue_.front());
        queue_.pop_front();
        return e;
    }
};

}  // namespace events
}  // namespace pipeview
