#include "event_types.hpp"

#include <limits>
#include <type_traits>

namespace hearth {
namespace events {

namespace {

using Json = nlohmann::ordered_json;

enum class EventType { BOOL, U8, I32, F32, F64 };

struct EventArray {
    const char *prefix;
    EventType type;
};

constexpr EventArray kEventArrays[] = {
    {"bool", EventType::BOOL}, {"u8", EventType::U8}, {"i32", EventType::I32},
    {"f32", EventType::F32},   {"f64", EventType::F64},
};

bool decode_value(const Json &json, EventType type, EventValue &out, std::string &error) {
    switch (type) {
        case EventType::BOOL:
            if (!json.is_boolean()) {
                error = "expected a boolean value";
                return false;
            }
            out = json.get<bool>();
            return true;
        case EventType::U8:
            if (!json.is_number_unsigned() || json.get<uint64_t>() > std::numeric_limits<uint8_t>::max()) {
                error = "expected an u8 value";
                return false;
            }
            out = static_cast<uint8_t>(json.get<uint64_t>());
            return true;
        case EventType::I32: {
            if (!json.is_number_integer()) {
                error = "expected an i32 value";
                return false;
            }
            const auto value = json.get<int64_t>();
            if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
                error = "i32 value out of range";
                return false;
            }
            out = static_cast<int32_t>(value);
            return true;
        }
        case EventType::F32:
            if (!json.is_number()) {
                error = "expected an f32 value";
                return false;
            }
            out = json.get<float>();
            return true;
        case EventType::F64:
            if (!json.is_number()) {
                error = "expected an f64 value";
                return false;
            }
            out = json.get<double>();
            return true;
        default:
            error = "unknown event type";
            return false;
    }
}

bool decode_event(const Json &json, EventType type, Event &out, std::string &error) {
    if (!json.is_object()) {
        error = "event must be an object";
        return false;
    }
    if (!json.contains("name") || !json["name"].is_string()) {
        error = "event missing 'name'";
        return false;
    }
    out.name = json["name"].get<std::string>();

    if (json.contains("description") && json["description"].is_string()) {
        out.description = json["description"].get<std::string>();
    }

    if (!json.contains("value")) {
        error = "event '" + out.name + "' missing 'value'";
        return false;
    }
    if (!decode_value(json["value"], type, out.value, error)) {
        error = "event '" + out.name + "': " + error;
        return false;
    }
    return true;
}

bool decode_interval(const Json &json, std::chrono::milliseconds &out, std::string &error) {
    if (!json.is_object() || !json.contains("secs")) {
        error = "interval must be an object with 'secs' and 'nanos'";
        return false;
    }
    const auto secs = json["secs"].get<uint64_t>();
    const auto nanos = json.contains("nanos") ? json["nanos"].get<uint64_t>() : 0;
    out = std::chrono::milliseconds(secs * 1000 + nanos / 1000000);
    return true;
}

Json encode_value(const EventValue &value) {
    return std::visit(
        [](const auto &v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint8_t>) {
                return Json(static_cast<unsigned>(v));
            } else {
                return Json(v);
            }
        },
        value);
}

Json encode_event(const Event &event) {
    Json json = Json::object();
    json["name"] = event.name;
    if (event.description) {
        json["description"] = *event.description;
    }
    json["value"] = encode_value(event.value);
    return json;
}

}  // namespace

const char *event_value_type_name(const EventValue &value) {
    if (std::holds_alternative<bool>(value)) return "bool";
    if (std::holds_alternative<uint8_t>(value)) return "u8";
    if (std::holds_alternative<int32_t>(value)) return "i32";
    if (std::holds_alternative<float>(value)) return "f32";
    if (std::holds_alternative<double>(value)) return "f64";
    return "unknown";
}

bool decode_events(const Json &json, Events &out, std::string &error) {
    if (!json.is_object()) {
        error = "events must be a JSON object";
        return false;
    }

    Events events;
    try {
        for (const auto &array : kEventArrays) {
            const std::string key = std::string(array.prefix) + "_events";
            if (json.contains(key) && !json[key].is_null()) {
                for (const auto &item : json[key]) {
                    Event event;
                    if (!decode_event(item, array.type, event, error)) {
                        return false;
                    }
                    events.events.push_back(std::move(event));
                }
            }

            const std::string periodic_key = "periodic_" + key;
            if (json.contains(periodic_key) && !json[periodic_key].is_null()) {
                for (const auto &item : json[periodic_key]) {
                    if (!item.is_object() || !item.contains("event") || !item.contains("interval")) {
                        error = "periodic event must contain 'event' and 'interval'";
                        return false;
                    }
                    PeriodicEvent periodic;
                    if (!decode_event(item["event"], array.type, periodic.event, error)) {
                        return false;
                    }
                    if (!decode_interval(item["interval"], periodic.interval, error)) {
                        return false;
                    }
                    events.periodic_events.push_back(std::move(periodic));
                }
            }
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("invalid events: ") + e.what();
        return false;
    }

    out = std::move(events);
    return true;
}

bool parse_events(const std::string &payload, Events &out, std::string &error) {
    Json json = Json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        error = "events payload is not valid JSON";
        return false;
    }
    return decode_events(json, out, error);
}

bool decode_events_description(const Json &json, EventsDescription &out, std::string &error) {
    if (!json.is_object()) {
        error = "events_description must be a JSON object";
        return false;
    }

    try {
        if (!json.contains("broker_data") || !json["broker_data"].is_object()) {
            error = "events_description missing 'broker_data'";
            return false;
        }
        const auto &broker = json["broker_data"];
        if (!broker.contains("address") || !broker["address"].is_string()) {
            error = "broker_data missing 'address'";
            return false;
        }
        out.broker.address = broker["address"].get<std::string>();
        if (broker.contains("port")) {
            out.broker.port = broker["port"].get<uint16_t>();
        }

        if (!json.contains("topic") || !json["topic"].is_string()) {
            error = "events_description missing 'topic'";
            return false;
        }
        out.topic = json["topic"].get<std::string>();
    } catch (const nlohmann::json::exception &e) {
        error = std::string("invalid events_description: ") + e.what();
        return false;
    }

    if (json.contains("events")) {
        return decode_events(json["events"], out.events, error);
    }
    out.events = Events{};
    return true;
}

Json encode_events(const Events &events) {
    Json json = Json::object();
    for (const auto &array : kEventArrays) {
        const std::string key = std::string(array.prefix) + "_events";
        Json plain = Json::array();
        Json periodic = Json::array();

        for (const auto &event : events.events) {
            if (std::string(event_value_type_name(event.value)) == array.prefix) {
                plain.push_back(encode_event(event));
            }
        }
        for (const auto &entry : events.periodic_events) {
            if (std::string(event_value_type_name(entry.event.value)) == array.prefix) {
                const auto ms = entry.interval.count();
                periodic.push_back(Json{{"event", encode_event(entry.event)},
                                        {"interval", {{"secs", ms / 1000}, {"nanos", (ms % 1000) * 1000000}}}});
            }
        }

        json[key] = std::move(plain);
        json["periodic_" + key] = std::move(periodic);
    }
    return json;
}

Json encode_events_description(const EventsDescription &description) {
    Json json = Json::object();
    json["broker_data"] = {{"address", description.broker.address}, {"port", description.broker.port}};
    json["topic"] = description.topic;
    json["events"] = encode_events(description.events);
    return json;
}

}  // namespace events
}  // namespace hearth
