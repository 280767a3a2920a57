#include "event_task.hpp"

#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace events {

EventTask::EventTask(Key, size_t device_id, EventsDescription description, std::unique_ptr<mqtt::IBrokerClient> client,
                     mqtt::BrokerConnectOptions options, EventSink sink, const EventTaskConfig &config)
    : device_id_(device_id),
      description_(std::move(description)),
      client_(std::move(client)),
      options_(std::move(options)),
      sink_(std::move(sink)),
      config_(config),
      token_(std::make_shared<CancellationToken>()),
      finished_(false),
      forwarded_(0) {}

EventTask::~EventTask() {
    cancel();
    join();
}

std::unique_ptr<EventTask> EventTask::start(size_t device_id, const EventsDescription &description,
                                            const mqtt::BrokerClientFactory &factory, EventSink sink,
                                            const EventTaskConfig &config, std::string &error) {
    if (!factory) {
        error = "No broker client factory configured";
        return nullptr;
    }

    auto client = factory();
    if (!client) {
        error = "Broker client factory returned no client";
        return nullptr;
    }

    mqtt::BrokerConnectOptions options;
    options.host = description.broker.address;
    options.port = description.broker.port;
    options.client_id = config.client_id_prefix + "-" + std::to_string(device_id);
    options.keep_alive_s = config.keep_alive_s;
    options.timeout_ms = config.connect_timeout_ms;

    if (!client->connect(options, error)) {
        error = "Cannot connect to broker " + options.host + ":" + std::to_string(options.port) + ": " + error;
        return nullptr;
    }

    if (!client->subscribe(description.topic, error)) {
        error = "Cannot subscribe to topic `" + description.topic + "`: " + error;
        client->disconnect();
        return nullptr;
    }

    auto task = std::make_unique<EventTask>(Key{}, device_id, description, std::move(client), std::move(options),
                                            std::move(sink), config);
    task->thread_ = std::thread(&EventTask::run, task.get());

    LOG_INFO("[EventTask] Device " << device_id << " subscribed to `" << description.topic << "` on "
                                   << description.broker.address << ":" << description.broker.port);
    return task;
}

void EventTask::cancel() { token_->cancel(); }

void EventTask::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void EventTask::run() {
    while (!token_->is_cancelled()) {
        mqtt::BrokerMessage message;
        std::string error;
        auto result = client_->poll(config_.poll_interval_ms, message, error);

        if (result == mqtt::PollResult::TIMEOUT) {
            continue;
        }

        if (result == mqtt::PollResult::FAILED) {
            LOG_WARN("[EventTask] Device " << device_id_ << " broker session lost: " << error);
            if (!reconnect()) {
                break;
            }
            continue;
        }

        if (message.topic != description_.topic) {
            LOG_DEBUG("[EventTask] Device " << device_id_ << " ignoring message on `" << message.topic << "`");
            continue;
        }

        Events events;
        if (!parse_events(message.payload, events, error)) {
            LOG_WARN("[EventTask] Device " << device_id_ << " sent undecodable events: " << error);
            continue;
        }

        if (!sink_(std::move(events), *token_)) {
            LOG_INFO("[EventTask] Device " << device_id_ << " has no more event receivers, stopping");
            break;
        }
        forwarded_.fetch_add(1);
    }

    client_->disconnect();
    finished_.store(true);
    LOG_DEBUG("[EventTask] Device " << device_id_ << " task finished");
}

bool EventTask::reconnect() {
    while (!token_->is_cancelled()) {
        // Sleep in poll-sized slices so cancellation stays responsive
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.reconnect_backoff_ms);
        while (!token_->is_cancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
        }
        if (token_->is_cancelled()) {
            return false;
        }

        std::string error;
        if (client_->connect(options_, error) && client_->subscribe(description_.topic, error)) {
            LOG_INFO("[EventTask] Device " << device_id_ << " resubscribed to `" << description_.topic << "`");
            return true;
        }
        LOG_WARN("[EventTask] Device " << device_id_ << " reconnect failed: " << error);
    }
    return false;
}

}  // namespace events
}  // namespace hearth
