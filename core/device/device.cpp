#include "device.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace device {

Device::Device(NetworkInformation network_info, Description description, Requests requests,
               std::optional<events::EventsDescription> events)
    : network_info_(std::move(network_info)),
      description_(std::move(description)),
      requests_(std::move(requests)),
      events_(std::move(events)) {}

const Request *Device::request(const std::string &route) const {
    auto it = requests_.find(route);
    return it != requests_.end() ? &it->second : nullptr;
}

std::vector<RequestInfo> Device::requests_info() const {
    std::vector<RequestInfo> infos;
    infos.reserve(requests_.size());
    for (const auto &[route, request] : requests_) {
        static_cast<void>(route);
        infos.push_back(request.info());
    }
    return infos;
}

bool Device::is_event_receiver_running() const { return event_task_ != nullptr && !event_task_->is_finished(); }

std::unique_ptr<events::BroadcastReceiver> Device::start_event_receiver(size_t id, size_t buffer_size,
                                                                        const mqtt::BrokerClientFactory &factory,
                                                                        const events::EventTaskConfig &config,
                                                                        Error &error) {
    reap_finished_event_task();
    if (event_task_) {
        error = Error(ErrorKind::EVENTS, "Event receiver already started for device with id `" + std::to_string(id) + "`");
        return nullptr;
    }

    if (!events_) {
        error = Error(ErrorKind::EVENTS, "The device with `" + std::to_string(id) + "` does not support events");
        return nullptr;
    }

    auto broadcast = std::make_shared<events::EventBroadcast>(buffer_size, "device-" + std::to_string(id));
    // Subscribe before the task runs so no snapshot is published to an empty audience
    auto subscription = broadcast->subscribe();

    auto sink = [broadcast](events::Events &&snapshot, const events::CancellationToken &token) {
        return !token.is_cancelled() && broadcast->publish(snapshot) > 0;
    };

    std::string task_error;
    auto task = events::EventTask::start(id, *events_, factory, std::move(sink), config, task_error);
    if (!task) {
        error = Error(ErrorKind::EVENTS, task_error);
        return nullptr;
    }

    // The task stops as soon as the last receiver goes away
    std::weak_ptr<events::CancellationToken> weak_token = task->cancellation_token();
    broadcast->on_idle([weak_token] {
        if (auto token = weak_token.lock()) {
            token->cancel();
        }
    });

    event_task_ = std::move(task);
    broadcast_ = std::move(broadcast);
    return subscription;
}

std::unique_ptr<events::BroadcastReceiver> Device::subscribe_events() {
    if (!broadcast_ || !is_event_receiver_running()) {
        return nullptr;
    }
    return broadcast_->subscribe();
}

bool Device::start_shared_event_receiver(size_t id, std::shared_ptr<events::EventChannel> channel,
                                         const mqtt::BrokerClientFactory &factory,
                                         const events::EventTaskConfig &config, Error &error) {
    reap_finished_event_task();
    if (event_task_) {
        error = Error(ErrorKind::EVENTS, "Event receiver already started for device with id `" + std::to_string(id) + "`");
        return false;
    }

    if (!events_) {
        error = Error(ErrorKind::EVENTS, "The device with `" + std::to_string(id) + "` does not support events");
        return false;
    }

    auto sink = [channel, id](events::Events &&snapshot, const events::CancellationToken &token) {
        return channel->push(events::EventPayload{id, std::move(snapshot)}, token);
    };

    std::string task_error;
    auto task = events::EventTask::start(id, *events_, factory, std::move(sink), config, task_error);
    if (!task) {
        error = Error(ErrorKind::EVENTS, task_error);
        return false;
    }

    event_task_ = std::move(task);
    broadcast_.reset();
    return true;
}

void Device::stop_event_receiver() {
    if (!event_task_) {
        return;
    }
    event_task_->cancel();
    event_task_->join();
    LOG_DEBUG("[Device] Event receiver of '" << network_info_.name << "' stopped after "
                                             << event_task_->forwarded_count() << " snapshots");
    event_task_.reset();
    if (broadcast_) {
        broadcast_->close();
        broadcast_.reset();
    }
}

void Device::reap_finished_event_task() {
    // A task whose audience went away ends on its own; forget it so it can be restarted
    if (event_task_ && event_task_->is_finished()) {
        event_task_->join();
        event_task_.reset();
        if (broadcast_) {
            broadcast_->close();
            broadcast_.reset();
        }
    }
}

void Device::cancel_event_receiver() {
    if (event_task_) {
        event_task_->cancel();
    }
}

}  // namespace device
}  // namespace hearth
