#pragma once

/**
 * @file event_broadcast.hpp
 * @brief Single-producer, multi-receiver ring of event snapshots
 *
 * The device event task publishes into a fixed-capacity ring shared by all
 * receivers. Each receiver keeps its own read position. Publishing never
 * waits: once a slot is reused, receivers that had not read it yet skip
 * ahead to the oldest retained snapshot and count what they missed.
 *
 * When the last receiver is released the idle callback fires; the device
 * uses it to cancel its event task.
 */

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_types.hpp"

namespace hearth {
namespace events {

class BroadcastReceiver;

class EventBroadcast : public std::enable_shared_from_this<EventBroadcast> {
public:
    // capacity 0 is treated as 1
    explicit EventBroadcast(size_t capacity, std::string name = "");

    /**
     * @brief New receiver positioned after the latest published snapshot.
     */
    std::unique_ptr<BroadcastReceiver> subscribe();

    /**
     * @brief Store a snapshot and wake waiting receivers.
     *
     * @return number of receivers at the time of publishing
     */
    size_t publish(const Events &events);

    // Receivers drain what is retained, then report closed
    void close();

    // Invoked once, outside the lock, when the receiver count drops to zero
    void on_idle(std::function<void()> callback);

    size_t receiver_count() const;
    uint64_t published_count() const;
    size_t capacity() const { return slots_.size(); }
    const std::string &name() const { return name_; }

private:
    friend class BroadcastReceiver;

    enum class Read { SNAPSHOT, EMPTY, CLOSED };

    // Caller holds mutex_; advances cursor past overwritten slots
    Read read_locked(uint64_t &cursor, uint64_t &lagged, Events &out);
    void release();

    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable published_;
    std::vector<Events> slots_;
    uint64_t tail_;  // sequence number of the next snapshot
    size_t receivers_;
    bool closed_;
    std::function<void()> idle_callback_;
};

/**
 * @brief Read side of an EventBroadcast.
 *
 * Keeps the broadcast alive. Destroying it unregisters the receiver.
 */
class BroadcastReceiver {
public:
    BroadcastReceiver(std::shared_ptr<EventBroadcast> broadcast, uint64_t cursor);
    ~BroadcastReceiver();

    BroadcastReceiver(const BroadcastReceiver &) = delete;
    BroadcastReceiver &operator=(const BroadcastReceiver &) = delete;

    /**
     * @brief Next unread snapshot, waiting up to timeout_ms (0 = don't wait).
     *
     * @return std::nullopt on timeout, or once closed and drained
     */
    std::optional<Events> recv(int timeout_ms = 100);
    std::optional<Events> try_recv() { return recv(0); }

    // Snapshots published but not read yet (lagged ones excluded)
    size_t pending() const;

    // Total snapshots skipped because the ring overwrote them
    uint64_t lagged_count() const;

    bool is_closed() const;

private:
    std::shared_ptr<EventBroadcast> broadcast_;
    uint64_t cursor_;
    uint64_t lagged_;
};

}  // namespace events
}  // namespace hearth
