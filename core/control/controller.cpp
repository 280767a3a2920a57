#include "controller.hpp"

#include <utility>

#include "discovery/avahi_browser.hpp"
#include "logging/logger.hpp"
#include "mqtt/mqtt_client.hpp"
#include "transport/http_transport.hpp"

namespace hearth {
namespace control {

Controller::Controller(discovery::Discovery discovery)
    : Controller(std::move(discovery), std::make_shared<transport::HttpTransport>(),
                 []() -> std::unique_ptr<discovery::IServiceBrowser> {
                     return std::make_unique<discovery::AvahiBrowser>();
                 },
                 []() -> std::unique_ptr<mqtt::IBrokerClient> { return std::make_unique<mqtt::MqttClient>(); }) {}

Controller::Controller(discovery::Discovery discovery, std::shared_ptr<transport::IHttpTransport> transport,
                       discovery::ServiceBrowserFactory browser_factory, mqtt::BrokerClientFactory broker_factory)
    : discovery_(std::move(discovery)),
      transport_(std::move(transport)),
      browser_factory_(std::move(browser_factory)),
      broker_factory_(std::move(broker_factory)),
      policy_(policy::Policy::init()) {}

Controller Controller::from_devices(discovery::Discovery discovery, device::Devices devices,
                                    std::shared_ptr<transport::IHttpTransport> transport,
                                    mqtt::BrokerClientFactory broker_factory) {
    Controller controller(std::move(discovery), std::move(transport), discovery::ServiceBrowserFactory{},
                          std::move(broker_factory));
    controller.devices_ = std::move(devices);
    return controller;
}

Controller::~Controller() { shutdown(); }

Controller &Controller::policy(policy::Policy policy) {
    policy_ = std::move(policy);
    return *this;
}

void Controller::change_policy(policy::Policy policy) {
    LOG_INFO("[Controller] Policy replaced");
    policy_ = std::move(policy);
}

bool Controller::discover(Error &error) {
    if (!browser_factory_) {
        error = Error(ErrorKind::DISCOVERY, "no service browser available");
        return false;
    }

    auto browser = browser_factory_();
    device::Devices discovered;
    if (!discovery_.discover(*browser, *transport_, discovered, error)) {
        return false;
    }

    shutdown();
    devices_ = std::move(discovered);
    return true;
}

std::optional<DeviceSender> Controller::device(size_t id, Error &error) {
    if (devices_.empty()) {
        error = Error(ErrorKind::SENDER, "No devices found.");
        return std::nullopt;
    }

    const device::Device *device = devices_.get(id);
    if (device == nullptr) {
        error = Error(ErrorKind::SENDER, "Error in retrieving the device with identifier " + std::to_string(id) + ".");
        return std::nullopt;
    }

    return DeviceSender(id, *device, policy_, *transport_);
}

std::unique_ptr<events::EventReceiver> Controller::start_event_receivers(size_t buffer_size, Error &error) {
    auto channel = std::make_shared<events::EventChannel>(buffer_size);

    size_t started = 0;
    size_t id = 0;
    for (auto &device : devices_) {
        const size_t device_id = id++;

        if (!device.has_events()) {
            LOG_WARN("[Controller] Device " << device_id << " does not support events, skipping");
            continue;
        }
        if (device.is_event_receiver_running()) {
            LOG_WARN("[Controller] Event receiver of device " << device_id << " already running, skipping");
            continue;
        }

        Error device_error;
        if (device.start_shared_event_receiver(device_id, channel, broker_factory_, event_config_, device_error)) {
            ++started;
        }
    }

    if (started == 0) {
        error = Error(ErrorKind::EVENTS, "No event receiver tasks has started");
        return nullptr;
    }

    LOG_INFO("[Controller] " << started << " event receiver(s) started");
    return std::make_unique<events::EventReceiver>(std::move(channel));
}

std::unique_ptr<events::BroadcastReceiver> Controller::start_device_event_receiver(size_t id,
                                                                                   size_t buffer_size,
                                                                                   Error &error) {
    device::Device *device = devices_.get(id);
    if (device == nullptr) {
        error = Error(ErrorKind::SENDER, "Error in retrieving the device with identifier " + std::to_string(id) + ".");
        return nullptr;
    }
    return device->start_event_receiver(id, buffer_size, broker_factory_, event_config_, error);
}

void Controller::shutdown() {
    // Signal everyone first so the joins below overlap
    for (auto &device : devices_) {
        device.cancel_event_receiver();
    }
    for (auto &device : devices_) {
        device.stop_event_receiver();
    }
    devices_ = device::Devices{};
}

}  // namespace control
}  // namespace hearth
