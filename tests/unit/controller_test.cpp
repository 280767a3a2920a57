#include "control/controller.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "mocks/mock_broker_client.hpp"
#include "mocks/mock_http_transport.hpp"
#include "mocks/mock_service_browser.hpp"
#include "test_devices.hpp"

using namespace hearth;
using namespace hearth::control;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr const char *kOnEvent = R"({"bool_events": [{"name": "on", "value": true}]})";

tests::LightOptions with_events() {
    tests::LightOptions options;
    options.events = true;
    return options;
}

// Waits for a condition flipped by a worker thread
template <typename Predicate>
bool eventually(Predicate predicate, int timeout_ms = 2000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

}  // namespace

class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<NiceMock<tests::MockHttpTransport>>();
        broker = std::make_shared<tests::FakeBroker>();
        config.poll_interval_ms = 10;
        config.reconnect_backoff_ms = 20;
    }

    std::unique_ptr<Controller> controller_with(std::vector<tests::LightOptions> lights) {
        device::Devices devices;
        for (const auto &options : lights) {
            devices.add(tests::make_light(options));
        }
        auto controller = std::make_unique<Controller>(
            Controller::from_devices(discovery::Discovery(), std::move(devices), transport, broker->factory()));
        controller->set_event_task_config(config);
        return controller;
    }

    std::shared_ptr<NiceMock<tests::MockHttpTransport>> transport;
    std::shared_ptr<tests::FakeBroker> broker;
    events::EventTaskConfig config;
};

TEST_F(ControllerTest, DeviceLookupWithoutDevices) {
    auto controller = controller_with({});
    Error error;
    EXPECT_FALSE(controller->device(0, error).has_value());
    EXPECT_EQ(ErrorKind::SENDER, error.kind());
    EXPECT_EQ("No devices found.", error.description());
}

TEST_F(ControllerTest, DeviceLookupOutOfRange) {
    auto controller = controller_with({tests::LightOptions{}});
    Error error;
    ASSERT_TRUE(controller->device(0, error).has_value());
    EXPECT_FALSE(error.is_set());

    EXPECT_FALSE(controller->device(1, error).has_value());
    EXPECT_EQ(ErrorKind::SENDER, error.kind());
    EXPECT_EQ("Error in retrieving the device with identifier 1.", error.description());
}

TEST_F(ControllerTest, PolicyFlowsIntoSenders) {
    auto controller = controller_with({tests::LightOptions{}, tests::LightOptions{}});
    controller->policy(policy::Policy::init().block_device_on_hazards(1, {Hazard::FireHazard}));

    Error error;
    std::optional<RequestSender> request;
    auto first = controller->device(0, error);
    ASSERT_TRUE(first->request("/toggle", request, error));
    EXPECT_FALSE(request->skip());

    auto second = controller->device(1, error);
    ASSERT_TRUE(second->request("/toggle", request, error));
    EXPECT_TRUE(request->skip());

    controller->change_policy(policy::Policy(Hazards{Hazard::ElectricEnergyConsumption}));
    ASSERT_TRUE(controller->device(0, error)->request("/on", request, error));
    EXPECT_TRUE(request->skip());
    ASSERT_TRUE(controller->device(0, error)->request("/off", request, error));
    EXPECT_FALSE(request->skip());
}

TEST_F(ControllerTest, SendsThroughTheSharedTransport) {
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce(tests::RespondWith(200, R"({"action_terminated_correctly": true})"));

    auto controller = controller_with({tests::LightOptions{}});
    Error error;
    std::optional<RequestSender> request;
    ASSERT_TRUE(controller->device(0, error)->request("/on", request, error));

    response::Response response;
    ASSERT_TRUE(request->send(response, error));
    EXPECT_TRUE(std::get<response::OkResponse>(response).parse_body(error));
}

TEST_F(ControllerTest, NoEventCapableDevicesIsAnError) {
    auto controller = controller_with({tests::LightOptions{}});
    Error error;
    EXPECT_EQ(nullptr, controller->start_event_receivers(8, error));
    EXPECT_EQ(ErrorKind::EVENTS, error.kind());
    EXPECT_EQ("No event receiver tasks has started", error.description());
    EXPECT_EQ(0, broker->connects.load());
}

TEST_F(ControllerTest, SharedReceiverTagsPayloadsWithDeviceId) {
    auto controller = controller_with({tests::LightOptions{}, with_events()});
    Error error;
    auto receiver = controller->start_event_receivers(8, error);
    ASSERT_NE(nullptr, receiver);
    EXPECT_EQ(1, broker->connects.load());
    EXPECT_EQ(tests::kLightTopic, broker->subscribed_topic);
    EXPECT_EQ("192.168.1.10", broker->last_options.host);
    EXPECT_EQ("hearth-1", broker->last_options.client_id);

    broker->publish(tests::kLightTopic, kOnEvent);
    auto payload = receiver->recv(2000);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(1u, payload->device_id);
    ASSERT_EQ(1u, payload->events.events.size());
    EXPECT_EQ(events::EventValue{true}, payload->events.events[0].value);
}

TEST_F(ControllerTest, RunningReceiversAreNotStartedTwice) {
    auto controller = controller_with({with_events()});
    Error error;
    auto receiver = controller->start_event_receivers(8, error);
    ASSERT_NE(nullptr, receiver);
    EXPECT_TRUE(controller->devices().get(0)->is_event_receiver_running());

    Error second_error;
    EXPECT_EQ(nullptr, controller->start_event_receivers(8, second_error));
    EXPECT_EQ(ErrorKind::EVENTS, second_error.kind());
    EXPECT_EQ(1, broker->connects.load());
}

TEST_F(ControllerTest, BrokerFailureLeavesNothingRunning) {
    broker->refuse_connect = true;
    auto controller = controller_with({with_events()});
    Error error;
    EXPECT_EQ(nullptr, controller->start_event_receivers(8, error));
    EXPECT_FALSE(controller->devices().get(0)->is_event_receiver_running());

    auto subscription = controller->start_device_event_receiver(0, 4, error);
    EXPECT_EQ(nullptr, subscription);
    EXPECT_EQ(ErrorKind::EVENTS, error.kind());
    EXPECT_NE(error.description().find("Cannot connect to broker 192.168.1.10:1883"), std::string::npos);
}

TEST_F(ControllerTest, DeviceReceiverBroadcastsToSubscribers) {
    auto controller = controller_with({with_events()});
    Error error;
    auto subscription = controller->start_device_event_receiver(0, 4, error);
    ASSERT_NE(nullptr, subscription);

    broker->publish(tests::kLightTopic, kOnEvent);
    auto events = subscription->recv(2000);
    ASSERT_TRUE(events.has_value());
    EXPECT_EQ("on", events->events[0].name);

    Error again;
    EXPECT_EQ(nullptr, controller->start_device_event_receiver(0, 4, again));
    EXPECT_EQ(ErrorKind::EVENTS, again.kind());
    EXPECT_EQ("Event receiver already started for device with id `0`", again.description());
}

TEST_F(ControllerTest, DeviceReceiverStopsWhenLastSubscriberLeaves) {
    auto controller = controller_with({with_events()});
    Error error;
    auto subscription = controller->start_device_event_receiver(0, 4, error);
    ASSERT_NE(nullptr, subscription);

    subscription.reset();
    broker->publish(tests::kLightTopic, kOnEvent);
    ASSERT_TRUE(eventually([&] { return !controller->devices().get(0)->is_event_receiver_running(); }));
    EXPECT_TRUE(eventually([&] { return broker->disconnects.load() == 1; }));

    // A finished receiver can be started again
    auto restarted = controller->start_device_event_receiver(0, 4, error);
    EXPECT_NE(nullptr, restarted);
    EXPECT_EQ(2, broker->connects.load());
}

TEST_F(ControllerTest, DeviceReceiverOnUnknownDevice) {
    auto controller = controller_with({with_events()});
    Error error;
    EXPECT_EQ(nullptr, controller->start_device_event_receiver(3, 4, error));
    EXPECT_EQ(ErrorKind::SENDER, error.kind());
}

TEST_F(ControllerTest, ShutdownJoinsEveryWorker) {
    auto controller = controller_with({with_events(), with_events()});
    Error error;
    auto receiver = controller->start_event_receivers(8, error);
    ASSERT_NE(nullptr, receiver);
    EXPECT_EQ(2, broker->connects.load());

    controller->shutdown();
    EXPECT_EQ(2, broker->disconnects.load());
    EXPECT_TRUE(controller->devices().empty());
    EXPECT_FALSE(receiver->recv(0).has_value());
}

TEST_F(ControllerTest, DiscoverReplacesDevices) {
    auto browser_factory = [] {
        auto browser = std::make_unique<tests::ScriptedServiceBrowser>();
        discovery::ResolvedService service;
        service.fullname = "light._hearth._tcp.local.";
        service.addresses = {"192.168.1.10"};
        service.port = 3000;
        browser->add_resolved(service);
        return std::unique_ptr<discovery::IServiceBrowser>(std::move(browser));
    };
    EXPECT_CALL(*transport, send(_, _, _)).WillOnce(tests::RespondWith(200, tests::light_descriptor()));

    Controller controller(discovery::Discovery().timeout(std::chrono::milliseconds(100)), transport, browser_factory,
                          broker->factory());
    EXPECT_TRUE(controller.devices().empty());

    Error error;
    ASSERT_TRUE(controller.discover(error));
    ASSERT_EQ(1u, controller.devices().size());
    EXPECT_EQ("http://192.168.1.10:3000", controller.devices().get(0)->network_info().last_reachable_address);
}

TEST_F(ControllerTest, FailedDiscoveryKeepsCurrentDevices) {
    // No browser behind a controller built from known devices
    auto controller = controller_with({tests::LightOptions{}});
    Error error;
    EXPECT_FALSE(controller->discover(error));
    EXPECT_EQ(ErrorKind::DISCOVERY, error.kind());
    EXPECT_EQ(1u, controller->devices().size());
}

TEST_F(ControllerTest, BrowserOpenFailureIsDiscoveryError) {
    auto browser_factory = [] {
        auto browser = std::make_unique<NiceMock<tests::MockServiceBrowser>>();
        ON_CALL(*browser, open(_, _)).WillByDefault(Return(false));
        return std::unique_ptr<discovery::IServiceBrowser>(std::move(browser));
    };
    Controller controller(discovery::Discovery(), transport, browser_factory, broker->factory());

    Error error;
    EXPECT_FALSE(controller.discover(error));
    EXPECT_EQ(ErrorKind::DISCOVERY, error.kind());
    EXPECT_TRUE(controller.devices().empty());
}
