#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "common/hazards.hpp"
#include "device/device.hpp"
#include "events/event_types.hpp"

namespace hearth {
namespace device {

/**
 * @brief JSON views of the device model, for listings and logs
 *
 * Enum values use the same names as the descriptor wire format
 * ("Get", "Serial", "Os", ...). MAC addresses are printed as
 * colon-separated hex.
 */

nlohmann::ordered_json encode_hazards(const Hazards &hazards);
nlohmann::ordered_json encode_request_info(const RequestInfo &info);
nlohmann::ordered_json encode_network_info(const NetworkInformation &info);
nlohmann::ordered_json encode_device(size_t id, const Device &device);
nlohmann::ordered_json encode_devices(const Devices &devices);

// {"device_id": n, "events": {...}}
nlohmann::ordered_json encode_event_payload(const events::EventPayload &payload);

}  // namespace device
}  // namespace hearth
