#ifndef HEARTH_DEVICE_DEVICE_HPP
#define HEARTH_DEVICE_DEVICE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "device/descriptor.hpp"
#include "device/request.hpp"
#include "events/event_broadcast.hpp"
#include "events/event_channel.hpp"
#include "events/event_task.hpp"
#include "events/event_types.hpp"
#include "mqtt/i_broker_client.hpp"

namespace hearth {
namespace device {

// How a device was reached on the network
struct NetworkInformation {
    std::string name;  // advertised full name
    std::set<std::string> addresses;
    std::optional<MacAddress> wifi_mac;
    std::optional<MacAddress> ethernet_mac;
    uint16_t port = 0;
    std::map<std::string, std::string> properties;
    std::string last_reachable_address;  // full base URL
};

struct Description {
    DeviceKind kind = DeviceKind::UNKNOWN;
    DeviceEnvironment environment = DeviceEnvironment::OS;
    std::string main_route;
    std::optional<std::string> description;
};

/**
 * @brief A discovered device with its callable routes.
 *
 * Event state machine: NoEvents (no events description) / Idle / Running.
 * A running event task is cancelled and joined when the device is stopped
 * or destroyed.
 */
class Device {
public:
    Device(NetworkInformation network_info, Description description, Requests requests,
           std::optional<events::EventsDescription> events = std::nullopt);

    Device(Device &&) = default;
    Device &operator=(Device &&) = default;
    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    const NetworkInformation &network_info() const { return network_info_; }
    const Description &description() const { return description_; }
    const Requests &requests() const { return requests_; }

    // nullptr if the device has no such route
    const Request *request(const std::string &route) const;

    std::vector<RequestInfo> requests_info() const;
    size_t requests_count() const { return requests_.size(); }

    bool has_events() const { return events_.has_value(); }
    const events::EventsDescription *events_metadata() const { return events_ ? &*events_ : nullptr; }
    bool is_event_receiver_running() const;

    /**
     * @brief Start this device's event task with a dedicated broadcast.
     *
     * The task stops once every receiver is gone.
     * @return initial receiver, or nullptr with an EVENTS error
     */
    std::unique_ptr<events::BroadcastReceiver> start_event_receiver(size_t id, size_t buffer_size,
                                                                    const mqtt::BrokerClientFactory &factory,
                                                                    const events::EventTaskConfig &config,
                                                                    Error &error);

    // Additional receiver of a running dedicated broadcast (nullptr otherwise)
    std::unique_ptr<events::BroadcastReceiver> subscribe_events();

    /**
     * @brief Start this device's event task forwarding into a shared channel.
     */
    bool start_shared_event_receiver(size_t id, std::shared_ptr<events::EventChannel> channel,
                                     const mqtt::BrokerClientFactory &factory, const events::EventTaskConfig &config,
                                     Error &error);

    // Cancel and join the event task, if any
    void stop_event_receiver();

    // Signal the event task without waiting for it
    void cancel_event_receiver();

private:
    void reap_finished_event_task();

    NetworkInformation network_info_;
    Description description_;
    Requests requests_;
    std::optional<events::EventsDescription> events_;
    std::unique_ptr<events::EventTask> event_task_;
    std::shared_ptr<events::EventBroadcast> broadcast_;
};

/**
 * @brief Ordered collection of devices; the index is the device identifier.
 */
class Devices {
public:
    Devices() = default;

    void add(Device device) { devices_.push_back(std::move(device)); }

    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

    Device *get(size_t id) { return id < devices_.size() ? &devices_[id] : nullptr; }
    const Device *get(size_t id) const { return id < devices_.size() ? &devices_[id] : nullptr; }

    std::vector<Device>::iterator begin() { return devices_.begin(); }
    std::vector<Device>::iterator end() { return devices_.end(); }
    std::vector<Device>::const_iterator begin() const { return devices_.begin(); }
    std::vector<Device>::const_iterator end() const { return devices_.end(); }

private:
    std::vector<Device> devices_;
};

}  // namespace device
}  // namespace hearth

#endif  // HEARTH_DEVICE_DEVICE_HPP
