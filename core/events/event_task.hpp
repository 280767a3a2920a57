#pragma once

/**
 * @file event_task.hpp
 * @brief Background task subscribing to one device's broker topic
 *
 * Lifecycle:
 * - start(): connect + subscribe synchronously (failures reported to the caller),
 *   then hand the session to a worker thread
 * - worker loop: poll broker -> decode Events -> forward to sink, until
 *   cancelled or the sink reports that nobody listens anymore
 * - broker failures are logged and the session is re-established after a
 *   backoff, checking cancellation while waiting
 * - cancel() + join() (or destruction) stop the worker deterministically
 */

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "cancellation_token.hpp"
#include "event_types.hpp"
#include "mqtt/i_broker_client.hpp"

namespace hearth {
namespace events {

struct EventTaskConfig {
    int poll_interval_ms = 100;     // broker wait between cancellation checks
    int reconnect_backoff_ms = 1000;
    uint16_t keep_alive_s = 30;
    int connect_timeout_ms = 5000;
    std::string client_id_prefix = "hearth";
};

/**
 * @brief Destination of decoded snapshots.
 *
 * Returns false when the snapshot can no longer be delivered (receiver gone,
 * task cancelled); the task then terminates.
 */
using EventSink = std::function<bool(Events &&events, const CancellationToken &token)>;

class EventTask {
    // Restricts construction to start()
    struct Key {
        explicit Key() = default;
    };

public:
    EventTask(Key, size_t device_id, EventsDescription description, std::unique_ptr<mqtt::IBrokerClient> client,
              mqtt::BrokerConnectOptions options, EventSink sink, const EventTaskConfig &config);
    ~EventTask();

    EventTask(const EventTask &) = delete;
    EventTask &operator=(const EventTask &) = delete;

    /**
     * @brief Connect to the device broker, subscribe and spawn the worker.
     *
     * @return nullptr with error set if connecting or subscribing failed
     */
    static std::unique_ptr<EventTask> start(size_t device_id, const EventsDescription &description,
                                            const mqtt::BrokerClientFactory &factory, EventSink sink,
                                            const EventTaskConfig &config, std::string &error);

    void cancel();

    // Waits for the worker thread to exit
    void join();

    bool is_finished() const { return finished_.load(); }
    bool is_cancelled() const { return token_->is_cancelled(); }
    std::shared_ptr<CancellationToken> cancellation_token() const { return token_; }
    size_t device_id() const { return device_id_; }
    uint64_t forwarded_count() const { return forwarded_.load(); }

private:
    void run();
    bool reconnect();

    const size_t device_id_;
    const EventsDescription description_;
    std::unique_ptr<mqtt::IBrokerClient> client_;
    const mqtt::BrokerConnectOptions options_;
    EventSink sink_;
    const EventTaskConfig config_;

    std::shared_ptr<CancellationToken> token_;
    std::atomic<bool> finished_;
    std::atomic<uint64_t> forwarded_;
    std::thread thread_;
};

}  // namespace events
}  // namespace hearth
