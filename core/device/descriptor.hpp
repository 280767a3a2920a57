#ifndef HEARTH_DEVICE_DESCRIPTOR_HPP
#define HEARTH_DEVICE_DESCRIPTOR_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/hazards.hpp"
#include "common/parameters.hpp"
#include "events/event_types.hpp"

namespace hearth {
namespace device {

enum class RestKind { GET, PUT, POST, DELETE };

// Shape contract of a route reply
enum class ResponseKind { OK, SERIAL, INFO, STREAM };

enum class DeviceKind { UNKNOWN, LIGHT };

// Runtime class of the device; drives how request parameters are carried
enum class DeviceEnvironment { OS, ESP32 };

using MacAddress = std::array<uint8_t, 6>;

// Route declaration as served by the device
struct RouteConfig {
    std::string name;
    std::string path;
    std::optional<std::string> description;
    Hazards hazards;
    ParametersSchema parameters;
    RestKind rest_kind = RestKind::GET;
    ResponseKind response_kind = ResponseKind::OK;
};

// Decoded device descriptor
struct DeviceData {
    DeviceKind kind = DeviceKind::UNKNOWN;
    DeviceEnvironment environment = DeviceEnvironment::OS;
    std::optional<std::string> description;
    std::optional<MacAddress> wifi_mac;
    std::optional<MacAddress> ethernet_mac;
    std::string main_route;
    std::vector<RouteConfig> route_configs;
    uint8_t mandatory_routes = 0;
    std::optional<events::EventsDescription> events_description;
};

const char *rest_kind_to_string(RestKind kind);
std::optional<RestKind> rest_kind_from_string(std::string_view name);
const char *response_kind_to_string(ResponseKind kind);
std::optional<ResponseKind> response_kind_from_string(std::string_view name);
const char *device_kind_to_string(DeviceKind kind);
std::optional<DeviceKind> device_kind_from_string(std::string_view name);
const char *device_environment_to_string(DeviceEnvironment environment);
std::optional<DeviceEnvironment> device_environment_from_string(std::string_view name);

// "02:11:22:33:44:55"
std::string mac_to_string(const MacAddress &mac);

/**
 * @brief Decode an externally tagged parameter kind, e.g.
 * {"RangeU64": {"min": 0, "max": 20, "step": 1, "default": 5}}
 */
bool decode_parameter_kind(const nlohmann::ordered_json &json, ParameterKind &out, std::string &error);
nlohmann::ordered_json encode_parameter_kind(const ParameterKind &kind);
nlohmann::ordered_json encode_parameter_value(const ParameterValue &value);

bool decode_route_config(const nlohmann::ordered_json &json, RouteConfig &out, std::string &error);

/**
 * @brief Parse a device descriptor body.
 *
 * Parameter schemas keep their declaration order.
 * @return false with error set if the body is not a valid descriptor
 */
bool parse_device_data(const std::string &body, DeviceData &out, std::string &error);
bool decode_device_data(const nlohmann::ordered_json &json, DeviceData &out, std::string &error);

}  // namespace device
}  // namespace hearth

#endif  // HEARTH_DEVICE_DESCRIPTOR_HPP
