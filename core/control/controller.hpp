#ifndef HEARTH_CONTROL_CONTROLLER_HPP
#define HEARTH_CONTROL_CONTROLLER_HPP

#include <cstddef>
#include <memory>
#include <optional>

#include "common/error.hpp"
#include "control/sender.hpp"
#include "device/device.hpp"
#include "discovery/discovery.hpp"
#include "discovery/i_service_browser.hpp"
#include "events/event_channel.hpp"
#include "events/event_task.hpp"
#include "mqtt/i_broker_client.hpp"
#include "policy/policy.hpp"
#include "transport/i_http_transport.hpp"

namespace hearth {
namespace control {

/**
 * @brief Entry point of the runtime.
 *
 * Owns the discovery configuration, the discovered devices and the privacy
 * policy, and hands out senders bound to one device. Event workers started
 * through the controller are cancelled and joined by shutdown() or by the
 * destructor.
 */
class Controller {
public:
    // Production collaborators: cpp-httplib transport, mDNS browser, MQTT client
    explicit Controller(discovery::Discovery discovery);

    Controller(discovery::Discovery discovery, std::shared_ptr<transport::IHttpTransport> transport,
               discovery::ServiceBrowserFactory browser_factory, mqtt::BrokerClientFactory broker_factory);

    // Controller over an already known set of devices (no scan needed)
    static Controller from_devices(discovery::Discovery discovery, device::Devices devices,
                                   std::shared_ptr<transport::IHttpTransport> transport,
                                   mqtt::BrokerClientFactory broker_factory);

    ~Controller();

    Controller(Controller &&) = default;
    Controller &operator=(Controller &&) = delete;
    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    // Builder step
    Controller &policy(policy::Policy policy);
    void change_policy(policy::Policy policy);
    const policy::Policy &policy() const { return policy_; }

    void set_event_task_config(const events::EventTaskConfig &config) { event_config_ = config; }
    const discovery::Discovery &discovery() const { return discovery_; }

    /**
     * @brief Scan the network and replace the current devices.
     *
     * Event workers of the previous devices are torn down on success; on
     * failure the current devices are kept.
     */
    bool discover(Error &error);

    const device::Devices &devices() const { return devices_; }

    /**
     * @brief Sender bound to the device with the given identifier.
     *
     * @return nullopt with a SENDER error if there are no devices or id is out of range
     */
    std::optional<DeviceSender> device(size_t id, Error &error);

    /**
     * @brief Start one event worker per idle event-capable device into a shared channel.
     *
     * Destroying the returned receiver stops every worker it feeds.
     * @return nullptr with an EVENTS error if no worker could be started
     */
    std::unique_ptr<events::EventReceiver> start_event_receivers(size_t buffer_size, Error &error);

    // Dedicated broadcast for a single device
    std::unique_ptr<events::BroadcastReceiver> start_device_event_receiver(size_t id, size_t buffer_size, Error &error);

    // Cancel every event worker, then join them all; leaves no devices behind
    void shutdown();

private:
    discovery::Discovery discovery_;
    std::shared_ptr<transport::IHttpTransport> transport_;
    discovery::ServiceBrowserFactory browser_factory_;
    mqtt::BrokerClientFactory broker_factory_;
    events::EventTaskConfig event_config_;
    device::Devices devices_;
    policy::Policy policy_;
};

}  // namespace control
}  // namespace hearth

#endif  // HEARTH_CONTROL_CONTROLLER_HPP
