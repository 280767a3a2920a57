#include "mqtt_client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace mqtt {

namespace {

// Longest single blocking wait inside mosquitto_loop
constexpr int kLoopSliceMs = 100;

void init_library() {
    static std::once_flag once;
    std::call_once(once, [] { mosquitto_lib_init(); });
}

int elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count());
}

}  // namespace

MqttClient::MqttClient()
    : mosq_(nullptr), connected_(false), connack_rc_(-1), acked_mid_(-1), granted_(false) {
    init_library();
}

MqttClient::~MqttClient() { disconnect(); }

void MqttClient::on_connect(struct mosquitto *, void *userdata, int rc) {
    auto *self = static_cast<MqttClient *>(userdata);
    self->connack_rc_ = rc;
    self->connected_ = (rc == 0);
}

void MqttClient::on_disconnect(struct mosquitto *, void *userdata, int rc) {
    auto *self = static_cast<MqttClient *>(userdata);
    if (rc != 0) {
        LOG_WARN("[MqttClient] Broker connection lost: " << mosquitto_strerror(rc));
    }
    self->connected_ = false;
}

void MqttClient::on_subscribe(struct mosquitto *, void *userdata, int mid, int qos_count, const int *granted_qos) {
    auto *self = static_cast<MqttClient *>(userdata);
    self->acked_mid_ = mid;
    // 0x80 in the SUBACK is a rejection
    self->granted_ = qos_count > 0 && granted_qos != nullptr && granted_qos[0] != 0x80;
}

void MqttClient::on_message(struct mosquitto *, void *userdata, const struct mosquitto_message *message) {
    auto *self = static_cast<MqttClient *>(userdata);
    BrokerMessage msg;
    msg.topic = message->topic != nullptr ? message->topic : "";
    if (message->payload != nullptr && message->payloadlen > 0) {
        msg.payload.assign(static_cast<const char *>(message->payload), static_cast<size_t>(message->payloadlen));
    }
    self->pending_.push_back(std::move(msg));
}

template <typename Done>
bool MqttClient::run_until(Done done, int timeout_ms, std::string &error) {
    auto start = std::chrono::steady_clock::now();
    while (!done()) {
        const int remaining = timeout_ms - elapsed_ms(start);
        if (remaining <= 0) {
            return true;
        }
        int rc = mosquitto_loop(mosq_, std::min(remaining, kLoopSliceMs), 1);
        if (rc != MOSQ_ERR_SUCCESS) {
            error = "Broker connection failed: " + std::string(mosquitto_strerror(rc));
            connected_ = false;
            return false;
        }
    }
    return true;
}

bool MqttClient::connect(const BrokerConnectOptions &options, std::string &error) {
    disconnect();
    options_ = options;
    connack_rc_ = -1;
    pending_.clear();

    mosq_ = mosquitto_new(options.client_id.empty() ? nullptr : options.client_id.c_str(), true, this);
    if (mosq_ == nullptr) {
        error = "Cannot create MQTT session";
        return false;
    }
    mosquitto_connect_callback_set(mosq_, &MqttClient::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MqttClient::on_disconnect);
    mosquitto_subscribe_callback_set(mosq_, &MqttClient::on_subscribe);
    mosquitto_message_callback_set(mosq_, &MqttClient::on_message);

    int rc = mosquitto_connect(mosq_, options.host.c_str(), options.port, options.keep_alive_s);
    if (rc != MOSQ_ERR_SUCCESS) {
        error = "Cannot connect to broker " + options.host + ":" + std::to_string(options.port) + ": " +
                (rc == MOSQ_ERR_ERRNO ? std::string(std::strerror(errno)) : std::string(mosquitto_strerror(rc)));
        destroy();
        return false;
    }

    if (!run_until([this] { return connack_rc_ >= 0; }, options.timeout_ms, error)) {
        destroy();
        return false;
    }
    if (connack_rc_ < 0) {
        error = "Timeout waiting for broker acknowledgement";
        destroy();
        return false;
    }
    if (connack_rc_ != 0) {
        error = "Broker refused connection: " + std::string(mosquitto_connack_string(connack_rc_));
        destroy();
        return false;
    }

    LOG_DEBUG("[MqttClient] Connected to " << options.host << ":" << options.port << " as '" << options.client_id
                                           << "'");
    return true;
}

bool MqttClient::subscribe(const std::string &topic, std::string &error) {
    if (!is_connected()) {
        error = "Not connected";
        return false;
    }

    int mid = 0;
    acked_mid_ = -1;
    int rc = mosquitto_subscribe(mosq_, &mid, topic.c_str(), 0);
    if (rc != MOSQ_ERR_SUCCESS) {
        error = "Cannot subscribe to '" + topic + "': " + mosquitto_strerror(rc);
        return false;
    }

    if (!run_until([this, mid] { return acked_mid_ == mid; }, options_.timeout_ms, error)) {
        return false;
    }
    if (acked_mid_ != mid) {
        error = "Timeout waiting for broker acknowledgement";
        return false;
    }
    if (!granted_) {
        error = "Broker rejected subscription to '" + topic + "'";
        return false;
    }

    LOG_DEBUG("[MqttClient] Subscribed to '" << topic << "'");
    return true;
}

PollResult MqttClient::poll(int timeout_ms, BrokerMessage &message, std::string &error) {
    if (pending_.empty()) {
        if (!is_connected()) {
            error = "Not connected";
            return PollResult::FAILED;
        }
        if (!run_until([this] { return !pending_.empty() || !connected_; }, timeout_ms, error)) {
            return PollResult::FAILED;
        }
        if (pending_.empty() && !connected_) {
            error = "Broker closed the connection";
            return PollResult::FAILED;
        }
    }

    if (pending_.empty()) {
        return PollResult::TIMEOUT;
    }
    message = std::move(pending_.front());
    pending_.pop_front();
    return PollResult::MESSAGE;
}

void MqttClient::disconnect() {
    if (mosq_ != nullptr && connected_) {
        int rc = mosquitto_disconnect(mosq_);
        if (rc != MOSQ_ERR_SUCCESS) {
            LOG_DEBUG("[MqttClient] DISCONNECT not delivered: " << mosquitto_strerror(rc));
        }
    }
    destroy();
}

void MqttClient::destroy() {
    if (mosq_ != nullptr) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }
    connected_ = false;
}

}  // namespace mqtt
}  // namespace hearth
