#include "descriptor.hpp"

#include <cstdio>
#include <limits>
#include <type_traits>

namespace hearth {
namespace device {

namespace {

using Json = nlohmann::ordered_json;

template <typename T>
bool read_unsigned(const Json &body, const char *key, T &out, std::string &error) {
    if (!body.contains(key)) {
        error = std::string("missing '") + key + "'";
        return false;
    }
    const auto &value = body[key];
    if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<T>::max()) {
        error = std::string("'") + key + "' is not a valid unsigned integer";
        return false;
    }
    out = static_cast<T>(value.get<uint64_t>());
    return true;
}

template <typename T>
bool read_float(const Json &body, const char *key, T &out, std::string &error) {
    if (!body.contains(key)) {
        error = std::string("missing '") + key + "'";
        return false;
    }
    const auto &value = body[key];
    if (!value.is_number()) {
        error = std::string("'") + key + "' is not a number";
        return false;
    }
    out = value.get<T>();
    return true;
}

template <typename T>
bool read_number(const Json &body, const char *key, T &out, std::string &error) {
    if constexpr (std::is_floating_point_v<T>) {
        return read_float(body, key, out, error);
    } else {
        return read_unsigned(body, key, out, error);
    }
}

// Missing "default" falls back to "min"
template <typename T>
bool read_default(const Json &body, T min, T &out, std::string &error) {
    if (!body.contains("default")) {
        out = min;
        return true;
    }
    return read_number(body, "default", out, error);
}

template <typename T>
bool decode_bounded(const Json &body, ParameterType type, bool with_step, ParameterKind &out, std::string &error) {
    T min{}, max{}, step{}, def{};
    if (!read_number(body, "min", min, error) || !read_number(body, "max", max, error)) {
        return false;
    }
    if (with_step && !read_number(body, "step", step, error)) {
        return false;
    }
    if (!read_default(body, min, def, error)) {
        return false;
    }

    out = ParameterKind{};
    out.type = type;
    out.default_value = def;
    out.min = min;
    out.max = max;
    if (with_step) {
        out.step = step;
    }
    return true;
}

Json encode_value(const ParameterValue &value) {
    return std::visit(
        [](const auto &v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, uint16_t>) {
                return Json(static_cast<unsigned>(v));
            } else {
                return Json(v);
            }
        },
        value);
}

bool decode_mac(const Json &json, const char *key, std::optional<MacAddress> &out, std::string &error) {
    if (!json.contains(key) || json[key].is_null()) {
        out.reset();
        return true;
    }
    const auto &array = json[key];
    if (!array.is_array() || array.size() != 6) {
        error = std::string("'") + key + "' must be an array of 6 bytes";
        return false;
    }
    MacAddress mac{};
    for (size_t i = 0; i < mac.size(); ++i) {
        if (!array[i].is_number_unsigned() || array[i].get<uint64_t>() > 0xFF) {
            error = std::string("'") + key + "' contains an invalid byte";
            return false;
        }
        mac[i] = static_cast<uint8_t>(array[i].get<uint64_t>());
    }
    out = mac;
    return true;
}

}  // namespace

const char *rest_kind_to_string(RestKind kind) {
    switch (kind) {
        case RestKind::GET:
            return "Get";
        case RestKind::PUT:
            return "Put";
        case RestKind::POST:
            return "Post";
        case RestKind::DELETE:
            return "Delete";
        default:
            return "Unknown";
    }
}

std::optional<RestKind> rest_kind_from_string(std::string_view name) {
    if (name == "Get") return RestKind::GET;
    if (name == "Put") return RestKind::PUT;
    if (name == "Post") return RestKind::POST;
    if (name == "Delete") return RestKind::DELETE;
    return std::nullopt;
}

const char *response_kind_to_string(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::OK:
            return "Ok";
        case ResponseKind::SERIAL:
            return "Serial";
        case ResponseKind::INFO:
            return "Info";
        case ResponseKind::STREAM:
            return "Stream";
        default:
            return "Unknown";
    }
}

std::optional<ResponseKind> response_kind_from_string(std::string_view name) {
    if (name == "Ok") return ResponseKind::OK;
    if (name == "Serial") return ResponseKind::SERIAL;
    if (name == "Info") return ResponseKind::INFO;
    if (name == "Stream") return ResponseKind::STREAM;
    return std::nullopt;
}

const char *device_kind_to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::LIGHT:
            return "Light";
        case DeviceKind::UNKNOWN:
        default:
            return "Unknown";
    }
}

std::optional<DeviceKind> device_kind_from_string(std::string_view name) {
    if (name == "Unknown") return DeviceKind::UNKNOWN;
    if (name == "Light") return DeviceKind::LIGHT;
    return std::nullopt;
}

const char *device_environment_to_string(DeviceEnvironment environment) {
    switch (environment) {
        case DeviceEnvironment::OS:
            return "Os";
        case DeviceEnvironment::ESP32:
            return "Esp32";
        default:
            return "Unknown";
    }
}

std::optional<DeviceEnvironment> device_environment_from_string(std::string_view name) {
    if (name == "Os") return DeviceEnvironment::OS;
    if (name == "Esp32") return DeviceEnvironment::ESP32;
    return std::nullopt;
}

std::string mac_to_string(const MacAddress &mac) {
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X", mac[0], mac[1], mac[2], mac[3], mac[4],
                  mac[5]);
    return std::string(buffer);
}

bool decode_parameter_kind(const Json &json, ParameterKind &out, std::string &error) {
    if (!json.is_object() || json.size() != 1) {
        error = "parameter kind must be an object with a single tag";
        return false;
    }

    const auto &tag = json.begin().key();
    const auto &body = json.begin().value();
    auto type = parameter_type_from_string(tag);
    if (!type) {
        error = "unknown parameter kind '" + tag + "'";
        return false;
    }
    if (!body.is_object()) {
        error = "parameter kind '" + tag + "' must carry an object";
        return false;
    }

    try {
        switch (*type) {
            case ParameterType::BOOL: {
                bool def = false;
                if (body.contains("default")) {
                    if (!body["default"].is_boolean()) {
                        error = "'default' of Bool must be a boolean";
                        return false;
                    }
                    def = body["default"].get<bool>();
                }
                out = ParameterKind::boolean(def);
                return true;
            }
            case ParameterType::U8:
                return decode_bounded<uint8_t>(body, *type, false, out, error);
            case ParameterType::U16:
                return decode_bounded<uint16_t>(body, *type, false, out, error);
            case ParameterType::U32:
                return decode_bounded<uint32_t>(body, *type, false, out, error);
            case ParameterType::U64:
                return decode_bounded<uint64_t>(body, *type, false, out, error);
            case ParameterType::F32:
                return decode_bounded<float>(body, *type, true, out, error);
            case ParameterType::F64:
                return decode_bounded<double>(body, *type, true, out, error);
            case ParameterType::RANGE_U32:
                return decode_bounded<uint32_t>(body, *type, true, out, error);
            case ParameterType::RANGE_U64:
                return decode_bounded<uint64_t>(body, *type, true, out, error);
            case ParameterType::RANGE_F64:
                return decode_bounded<double>(body, *type, true, out, error);
            case ParameterType::CHARS_SEQUENCE: {
                std::string def;
                if (body.contains("default")) {
                    if (!body["default"].is_string()) {
                        error = "'default' of CharsSequence must be a string";
                        return false;
                    }
                    def = body["default"].get<std::string>();
                }
                out = ParameterKind::chars_sequence(def);
                return true;
            }
            default:
                break;
        }
    } catch (const nlohmann::json::exception &e) {
        error = "invalid parameter kind '" + tag + "': " + e.what();
        return false;
    }

    error = "unsupported parameter kind '" + tag + "'";
    return false;
}

Json encode_parameter_value(const ParameterValue &value) { return encode_value(value); }

Json encode_parameter_kind(const ParameterKind &kind) {
    Json body = Json::object();
    switch (kind.type) {
        case ParameterType::RANGE_U32:
        case ParameterType::RANGE_U64:
        case ParameterType::RANGE_F64:
            body["min"] = encode_value(*kind.min);
            body["max"] = encode_value(*kind.max);
            body["step"] = encode_value(*kind.step);
            body["default"] = encode_value(kind.default_value);
            break;
        default:
            body["default"] = encode_value(kind.default_value);
            if (kind.min) body["min"] = encode_value(*kind.min);
            if (kind.max) body["max"] = encode_value(*kind.max);
            if (kind.step) body["step"] = encode_value(*kind.step);
            break;
    }

    Json json = Json::object();
    json[parameter_type_to_string(kind.type)] = std::move(body);
    return json;
}

bool decode_route_config(const Json &json, RouteConfig &out, std::string &error) {
    if (!json.is_object()) {
        error = "route config must be an object";
        return false;
    }

    RouteConfig route;
    try {
        if (!json.contains("name") || !json["name"].is_string()) {
            error = "route config missing 'name'";
            return false;
        }
        route.name = json["name"].get<std::string>();

        if (!json.contains("path") || !json["path"].is_string()) {
            error = "route '" + route.name + "' missing 'path'";
            return false;
        }
        route.path = json["path"].get<std::string>();

        if (json.contains("description") && json["description"].is_string()) {
            route.description = json["description"].get<std::string>();
        }

        if (json.contains("hazards") && !json["hazards"].is_null()) {
            for (const auto &item : json["hazards"]) {
                const auto name = item.get<std::string>();
                auto hazard = hazard_from_string(name);
                if (!hazard) {
                    error = "route '" + route.path + "' declares unknown hazard '" + name + "'";
                    return false;
                }
                route.hazards.insert(*hazard);
            }
        }

        if (json.contains("parameters") && !json["parameters"].is_null()) {
            for (const auto &item : json["parameters"].items()) {
                ParameterEntry entry;
                entry.name = item.key();
                if (!decode_parameter_kind(item.value(), entry.kind, error)) {
                    error = "route '" + route.path + "' parameter '" + entry.name + "': " + error;
                    return false;
                }
                route.parameters.push_back(std::move(entry));
            }
        }

        if (!json.contains("REST kind") || !json["REST kind"].is_string()) {
            error = "route '" + route.path + "' missing 'REST kind'";
            return false;
        }
        auto rest_kind = rest_kind_from_string(json["REST kind"].get<std::string>());
        if (!rest_kind) {
            error = "route '" + route.path + "' has invalid REST kind";
            return false;
        }
        route.rest_kind = *rest_kind;

        if (json.contains("response kind")) {
            auto response_kind = response_kind_from_string(json["response kind"].get<std::string>());
            if (!response_kind) {
                error = "route '" + route.path + "' has invalid response kind";
                return false;
            }
            route.response_kind = *response_kind;
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("invalid route config: ") + e.what();
        return false;
    }

    out = std::move(route);
    return true;
}

bool parse_device_data(const std::string &body, DeviceData &out, std::string &error) {
    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        error = "device descriptor is not valid JSON";
        return false;
    }
    return decode_device_data(json, out, error);
}

bool decode_device_data(const Json &json, DeviceData &out, std::string &error) {
    if (!json.is_object()) {
        error = "device descriptor must be a JSON object";
        return false;
    }

    DeviceData data;
    try {
        if (json.contains("kind")) {
            auto kind = device_kind_from_string(json["kind"].get<std::string>());
            // Unrecognized kinds are tolerated: the set grows on the device side
            data.kind = kind.value_or(DeviceKind::UNKNOWN);
        }

        if (!json.contains("environment") || !json["environment"].is_string()) {
            error = "device descriptor missing 'environment'";
            return false;
        }
        auto environment = device_environment_from_string(json["environment"].get<std::string>());
        if (!environment) {
            error = "invalid device environment '" + json["environment"].get<std::string>() + "'";
            return false;
        }
        data.environment = *environment;

        if (json.contains("description") && json["description"].is_string()) {
            data.description = json["description"].get<std::string>();
        }

        if (!decode_mac(json, "wifi_mac", data.wifi_mac, error) ||
            !decode_mac(json, "ethernet_mac", data.ethernet_mac, error)) {
            return false;
        }

        if (!json.contains("main route") || !json["main route"].is_string()) {
            error = "device descriptor missing 'main route'";
            return false;
        }
        data.main_route = json["main route"].get<std::string>();

        if (json.contains("route_configs") && !json["route_configs"].is_null()) {
            for (const auto &item : json["route_configs"]) {
                RouteConfig route;
                if (!decode_route_config(item, route, error)) {
                    return false;
                }
                data.route_configs.push_back(std::move(route));
            }
        }

        if (json.contains("mandatory_routes")) {
            if (!read_unsigned(json, "mandatory_routes", data.mandatory_routes, error)) {
                return false;
            }
        }

        if (json.contains("events_description") && !json["events_description"].is_null()) {
            events::EventsDescription description;
            if (!events::decode_events_description(json["events_description"], description, error)) {
                return false;
            }
            data.events_description = std::move(description);
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("invalid device descriptor: ") + e.what();
        return false;
    }

    out = std::move(data);
    return true;
}

}  // namespace device
}  // namespace hearth
