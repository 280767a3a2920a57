#pragma once

#include <mosquitto.h>

#include <deque>
#include <string>

#include "i_broker_client.hpp"

namespace hearth {
namespace mqtt {

/**
 * @brief Subscriber session on libmosquitto.
 *
 * The network loop is driven from poll(), so all callbacks run on the
 * caller's thread. Clean session, QoS 0 subscriptions.
 */
class MqttClient : public IBrokerClient {
public:
    MqttClient();
    ~MqttClient() override;

    MqttClient(const MqttClient &) = delete;
    MqttClient &operator=(const MqttClient &) = delete;

    bool connect(const BrokerConnectOptions &options, std::string &error) override;
    bool subscribe(const std::string &topic, std::string &error) override;
    PollResult poll(int timeout_ms, BrokerMessage &message, std::string &error) override;
    void disconnect() override;
    bool is_connected() const override { return mosq_ != nullptr && connected_; }

private:
    static void on_connect(struct mosquitto *mosq, void *userdata, int rc);
    static void on_disconnect(struct mosquitto *mosq, void *userdata, int rc);
    static void on_subscribe(struct mosquitto *mosq, void *userdata, int mid, int qos_count, const int *granted_qos);
    static void on_message(struct mosquitto *mosq, void *userdata, const struct mosquitto_message *message);

    // Run the network loop until done() holds or timeout_ms elapses
    template <typename Done>
    bool run_until(Done done, int timeout_ms, std::string &error);

    void destroy();

    struct mosquitto *mosq_;
    BrokerConnectOptions options_;
    bool connected_;
    int connack_rc_;  // -1 until CONNACK
    int acked_mid_;
    bool granted_;
    std::deque<BrokerMessage> pending_;
};

}  // namespace mqtt
}  // namespace hearth
