#pragma once

/**
 * @file event_types.hpp
 * @brief Device events as published on a device's broker topic
 *
 * A device declares its events in the descriptor (EventsDescription) and
 * publishes a full Events snapshot on its topic whenever a value changes.
 * The controller forwards each decoded snapshot:
 * - tagged with the device index (EventPayload) on the shared channel
 * - as-is on a device's dedicated broadcast
 *
 * Events are value types; cheap enough to copy per subscriber.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace hearth {
namespace events {

/**
 * @brief Value carried by an event
 *
 * The alternative in use identifies the event type
 * (bool, u8, i32, f32, f64).
 */
using EventValue = std::variant<bool, uint8_t, int32_t, float, double>;

const char *event_value_type_name(const EventValue &value);

struct Event {
    std::string name;
    std::optional<std::string> description;
    EventValue value = false;

    bool operator==(const Event &other) const {
        return name == other.name && description == other.description && value == other.value;
    }
};

// Event sampled by the device at a fixed interval
struct PeriodicEvent {
    Event event;
    std::chrono::milliseconds interval{0};

    bool operator==(const PeriodicEvent &other) const {
        return event == other.event && interval == other.interval;
    }
};

/**
 * @brief Snapshot of every event a device exposes
 */
struct Events {
    std::vector<Event> events;
    std::vector<PeriodicEvent> periodic_events;

    bool empty() const { return events.empty() && periodic_events.empty(); }
    size_t size() const { return events.size() + periodic_events.size(); }

    bool operator==(const Events &other) const {
        return events == other.events && periodic_events == other.periodic_events;
    }
};

struct BrokerData {
    std::string address;
    uint16_t port = 1883;
};

/**
 * @brief Broker endpoint, topic and declared event schema of a device
 */
struct EventsDescription {
    BrokerData broker;
    std::string topic;
    Events events;
};

/**
 * @brief Events snapshot tagged with the index of the device that sent it
 */
struct EventPayload {
    size_t device_id = 0;
    Events events;
};

// Decoding (wire format documented in DESIGN.md)
bool decode_events(const nlohmann::ordered_json &json, Events &out, std::string &error);
bool parse_events(const std::string &payload, Events &out, std::string &error);
bool decode_events_description(const nlohmann::ordered_json &json, EventsDescription &out, std::string &error);

nlohmann::ordered_json encode_events(const Events &events);
nlohmann::ordered_json encode_events_description(const EventsDescription &description);

}  // namespace events
}  // namespace hearth
