#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "mqtt/i_broker_client.hpp"

namespace hearth::tests {

class MockBrokerClient : public mqtt::IBrokerClient {
public:
    MOCK_METHOD(bool, connect, (const mqtt::BrokerConnectOptions &, std::string &), (override));
    MOCK_METHOD(bool, subscribe, (const std::string &, std::string &), (override));
    MOCK_METHOD(mqtt::PollResult, poll, (int, mqtt::BrokerMessage &, std::string &), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(bool, is_connected, (), (const, override));
};

/**
 * @brief In-memory broker shared by the clients a factory hands out.
 *
 * Tests publish payloads per topic; the client subscribed to a topic
 * delivers its payloads in order.
 */
class FakeBroker : public std::enable_shared_from_this<FakeBroker> {
public:
    void publish(const std::string &topic, const std::string &payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_[topic].push_back({topic, payload});
        }
        cv_.notify_all();
    }

    bool pop(const std::string &topic, int timeout_ms, mqtt::BrokerMessage &out) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto &queue = messages_[topic];
        if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&queue] { return !queue.empty(); })) {
            return false;
        }
        out = queue.front();
        queue.pop_front();
        return true;
    }

    mqtt::BrokerClientFactory factory();

    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    std::atomic<bool> refuse_connect{false};
    std::atomic<bool> refuse_subscribe{false};
    std::string subscribed_topic;
    mqtt::BrokerConnectOptions last_options;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::deque<mqtt::BrokerMessage>> messages_;
};

class FakeBrokerClient : public mqtt::IBrokerClient {
public:
    explicit FakeBrokerClient(std::shared_ptr<FakeBroker> broker) : broker_(std::move(broker)) {}

    bool connect(const mqtt::BrokerConnectOptions &options, std::string &error) override {
        if (broker_->refuse_connect) {
            error = "connection refused";
            return false;
        }
        broker_->last_options = options;
        ++broker_->connects;
        connected_ = true;
        return true;
    }

    bool subscribe(const std::string &topic, std::string &error) override {
        if (broker_->refuse_subscribe) {
            error = "subscription rejected";
            return false;
        }
        broker_->subscribed_topic = topic;
        topic_ = topic;
        return true;
    }

    mqtt::PollResult poll(int timeout_ms, mqtt::BrokerMessage &message, std::string &) override {
        return broker_->pop(topic_, timeout_ms, message) ? mqtt::PollResult::MESSAGE : mqtt::PollResult::TIMEOUT;
    }

    void disconnect() override {
        if (connected_) {
            ++broker_->disconnects;
        }
        connected_ = false;
    }

    bool is_connected() const override { return connected_; }

private:
    std::shared_ptr<FakeBroker> broker_;
    std::string topic_;
    bool connected_ = false;
};

inline mqtt::BrokerClientFactory FakeBroker::factory() {
    auto self = shared_from_this();
    return [self]() -> std::unique_ptr<mqtt::IBrokerClient> { return std::make_unique<FakeBrokerClient>(self); };
}

}  // namespace hearth::tests
