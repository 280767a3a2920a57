#pragma once

/**
 * @file event_channel.hpp
 * @brief Bounded multi-producer channel feeding one consumer
 *
 * All device event tasks started by the controller forward into one shared
 * channel. Unlike the per-device broadcast, nothing is dropped: a producer
 * facing a full channel waits until the consumer makes room (backpressure).
 * A waiting producer gives up when its task is cancelled or the receiver
 * is gone.
 */

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "cancellation_token.hpp"
#include "event_types.hpp"

namespace hearth {
namespace events {

class EventChannel {
public:
    explicit EventChannel(size_t capacity);

    EventChannel(const EventChannel &) = delete;
    EventChannel &operator=(const EventChannel &) = delete;

    /**
     * @brief Enqueue a payload, waiting while the channel is full.
     *
     * @return false if the channel was closed or the token cancelled before
     *         the payload could be enqueued
     */
    bool push(EventPayload payload, const CancellationToken &token);

    /**
     * @brief Dequeue the oldest payload.
     *
     * @param timeout_ms Max time to wait (0 = non-blocking)
     */
    std::optional<EventPayload> pop(int timeout_ms);

    void close();
    bool is_closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<EventPayload> queue_;
    bool closed_ = false;
};

/**
 * @brief Consumer end of the shared event channel
 *
 * RAII: destroying the receiver closes the channel, which makes every
 * forwarding task terminate.
 */
class EventReceiver {
public:
    explicit EventReceiver(std::shared_ptr<EventChannel> channel);
    ~EventReceiver();

    EventReceiver(const EventReceiver &) = delete;
    EventReceiver &operator=(const EventReceiver &) = delete;
    EventReceiver(EventReceiver &&other) noexcept = default;
    EventReceiver &operator=(EventReceiver &&other) noexcept;

    // Blocks up to timeout_ms
    std::optional<EventPayload> recv(int timeout_ms = 100);
    std::optional<EventPayload> try_recv();

    size_t pending() const;
    void close();

private:
    std::shared_ptr<EventChannel> channel_;
};

}  // namespace events
}  // namespace hearth
