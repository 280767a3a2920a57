#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hearth {
namespace mqtt {

struct BrokerConnectOptions {
    std::string host;
    uint16_t port = 1883;
    std::string client_id;
    uint16_t keep_alive_s = 30;
    int timeout_ms = 5000;  // connect and acknowledgement timeout
};

struct BrokerMessage {
    std::string topic;
    std::string payload;
};

enum class PollResult { MESSAGE, TIMEOUT, FAILED };

/**
 * @brief Subscriber-side broker session.
 *
 * Not thread-safe: a client is driven by the single event task owning it.
 */
class IBrokerClient {
public:
    virtual ~IBrokerClient() = default;

    virtual bool connect(const BrokerConnectOptions &options, std::string &error) = 0;
    virtual bool subscribe(const std::string &topic, std::string &error) = 0;

    /**
     * @brief Wait up to timeout_ms for the next application message.
     *
     * Keep-alive traffic is handled internally. FAILED means the session
     * is unusable and must be reconnected.
     */
    virtual PollResult poll(int timeout_ms, BrokerMessage &message, std::string &error) = 0;

    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
};

using BrokerClientFactory = std::function<std::unique_ptr<IBrokerClient>()>;

}  // namespace mqtt
}  // namespace hearth
