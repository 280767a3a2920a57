#include "json.hpp"

#include <utility>

namespace hearth {
namespace device {

nlohmann::ordered_json encode_hazards(const Hazards &hazards) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (Hazard hazard : hazards) {
        nlohmann::ordered_json entry;
        entry["id"] = hazard_id(hazard);
        entry["name"] = hazard_to_string(hazard);
        entry["category"] = hazard_category_to_string(hazard_category(hazard));
        entry["description"] = hazard_description(hazard);
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::ordered_json encode_request_info(const RequestInfo &info) {
    nlohmann::ordered_json out;
    out["route"] = info.route;
    if (info.description) {
        out["description"] = *info.description;
    }
    out["REST kind"] = rest_kind_to_string(info.rest_kind);
    out["response kind"] = response_kind_to_string(info.response_kind);
    out["hazards"] = encode_hazards(info.hazards);

    nlohmann::ordered_json parameters = nlohmann::ordered_json::object();
    for (const auto &entry : info.parameters) {
        parameters[entry.name] = encode_parameter_kind(entry.kind);
    }
    out["parameters"] = std::move(parameters);
    return out;
}

nlohmann::ordered_json encode_network_info(const NetworkInformation &info) {
    nlohmann::ordered_json out;
    out["name"] = info.name;
    out["addresses"] = info.addresses;
    if (info.wifi_mac) {
        out["wifi_mac"] = mac_to_string(*info.wifi_mac);
    }
    if (info.ethernet_mac) {
        out["ethernet_mac"] = mac_to_string(*info.ethernet_mac);
    }
    out["port"] = info.port;
    out["properties"] = info.properties;
    out["last_reachable_address"] = info.last_reachable_address;
    return out;
}

nlohmann::ordered_json encode_device(size_t id, const Device &device) {
    const Description &description = device.description();

    nlohmann::ordered_json out;
    out["id"] = id;
    out["kind"] = device_kind_to_string(description.kind);
    out["environment"] = device_environment_to_string(description.environment);
    out["main route"] = description.main_route;
    if (description.description) {
        out["description"] = *description.description;
    }
    out["network"] = encode_network_info(device.network_info());

    nlohmann::ordered_json routes = nlohmann::ordered_json::array();
    for (const auto &info : device.requests_info()) {
        routes.push_back(encode_request_info(info));
    }
    out["routes"] = std::move(routes);

    if (const events::EventsDescription *events = device.events_metadata()) {
        out["events"] = encode_events_description(*events);
        out["event_receiver_running"] = device.is_event_receiver_running();
    }
    return out;
}

nlohmann::ordered_json encode_devices(const Devices &devices) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    size_t id = 0;
    for (const auto &device : devices) {
        out.push_back(encode_device(id++, device));
    }
    return out;
}

nlohmann::ordered_json encode_event_payload(const events::EventPayload &payload) {
    nlohmann::ordered_json out;
    out["device_id"] = payload.device_id;
    out["events"] = encode_events(payload.events);
    return out;
}

}  // namespace device
}  // namespace hearth
