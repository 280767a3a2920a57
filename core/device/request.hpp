#ifndef HEARTH_DEVICE_REQUEST_HPP
#define HEARTH_DEVICE_REQUEST_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "common/hazards.hpp"
#include "common/parameters.hpp"
#include "device/descriptor.hpp"
#include "transport/i_http_transport.hpp"

namespace hearth {
namespace device {

// Header reserved by devices to report a failure while serializing a reply
constexpr const char *kSerializationErrorHeader = "Serialization-Error";

// Outbound URL plus the textual value of every schema parameter
struct RequestData {
    std::string url;
    std::map<std::string, std::string> parameters;

    bool operator==(const RequestData &other) const { return url == other.url && parameters == other.parameters; }
};

// Read-only summary of a request, for listings
struct RequestInfo {
    std::string route;
    std::optional<std::string> description;
    RestKind rest_kind = RestKind::GET;
    Hazards hazards;
    ParametersSchema parameters;
    ResponseKind response_kind = ResponseKind::OK;
};

/**
 * @brief A callable device route, fully resolved against the device address.
 *
 * Immutable once built. The URL is "{address}/{main route}/{path}".
 */
class Request {
public:
    Request(const std::string &address, const std::string &main_route, DeviceEnvironment environment,
            const RouteConfig &route);

    RestKind kind() const { return kind_; }
    const Hazards &hazards() const { return hazards_; }
    const std::string &url() const { return url_; }
    const std::string &route() const { return route_; }
    const std::optional<std::string> &description() const { return description_; }
    const ParametersSchema &parameters() const { return parameters_; }
    ResponseKind response_kind() const { return response_kind_; }
    DeviceEnvironment environment() const { return environment_; }

    bool has_parameters() const { return !parameters_.empty(); }

    RequestInfo info() const;

    // Request data with every parameter at its default value
    RequestData plain_request_data() const;

    /**
     * @brief Validate caller values against the schema and build request data.
     *
     * Unsupplied parameters take their default value.
     * @return false with an INVALID_PARAMETER error on unknown names or type mismatches
     */
    bool request_data(const ParametersValues &values, RequestData &out, Error &error) const;

    /**
     * @brief HTTP exchange for the given request data.
     *
     * Always asks the device to close the connection. Parameters travel as a
     * JSON body only for non-GET verbs.
     */
    transport::HttpRequest to_http_request(const RequestData &data) const;

private:
    RequestData build(const ParametersValues &values) const;

    RestKind kind_;
    Hazards hazards_;
    std::string url_;
    std::string route_;
    std::optional<std::string> description_;
    ParametersSchema parameters_;
    ResponseKind response_kind_;
    DeviceEnvironment environment_;
};

/**
 * @brief Check every supplied value against the schema.
 */
bool validate_parameter_values(const ParametersValues &values, const ParametersSchema &schema, Error &error);

transport::HttpMethod to_http_method(RestKind kind);

// Requests keyed by route path
using Requests = std::map<std::string, Request>;

Requests create_requests(const std::vector<RouteConfig> &route_configs, const std::string &address,
                         const std::string &main_route, DeviceEnvironment environment);

}  // namespace device
}  // namespace hearth

#endif  // HEARTH_DEVICE_REQUEST_HPP
