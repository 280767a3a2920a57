#include "request.hpp"

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"
#include "transport/url.hpp"

namespace hearth {
namespace device {

Request::Request(const std::string &address, const std::string &main_route, DeviceEnvironment environment,
                 const RouteConfig &route)
    : kind_(route.rest_kind),
      hazards_(route.hazards),
      url_(transport::join_route(address, main_route, route.path)),
      route_(route.path),
      description_(route.description),
      parameters_(route.parameters),
      response_kind_(route.response_kind),
      environment_(environment) {}

RequestInfo Request::info() const {
    RequestInfo info;
    info.route = route_;
    info.description = description_;
    info.rest_kind = kind_;
    info.hazards = hazards_;
    info.parameters = parameters_;
    info.response_kind = response_kind_;
    return info;
}

RequestData Request::plain_request_data() const { return build(ParametersValues{}); }

bool Request::request_data(const ParametersValues &values, RequestData &out, Error &error) const {
    if (!validate_parameter_values(values, parameters_, error)) {
        return false;
    }
    out = build(values);
    return true;
}

RequestData Request::build(const ParametersValues &values) const {
    RequestData data;

    // OS-class device servers route GET parameters as path segments
    const bool path_parameters = kind_ == RestKind::GET && environment_ == DeviceEnvironment::OS;
    data.url = url_;

    for (const auto &entry : parameters_) {
        auto it = values.find(entry.name);
        const std::string value = parameter_value_to_string(it != values.end() ? it->second : entry.kind.default_value);
        if (path_parameters) {
            data.url += "/" + value;
        }
        data.parameters[entry.name] = value;
    }

    return data;
}

transport::HttpRequest Request::to_http_request(const RequestData &data) const {
    transport::HttpRequest request;
    request.method = to_http_method(kind_);
    request.url = data.url;
    request.headers.emplace_back("Connection", "close");

    if (kind_ != RestKind::GET && !data.parameters.empty()) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto &[name, value] : data.parameters) {
            body[name] = value;
        }
        request.json_body = body.dump();
    }

    return request;
}

bool validate_parameter_values(const ParametersValues &values, const ParametersSchema &schema, Error &error) {
    for (const auto &[name, value] : values) {
        const ParameterEntry *entry = find_parameter(schema, name);
        if (entry == nullptr) {
            error = Error(ErrorKind::INVALID_PARAMETER, "`" + name + "` does not exist");
            return false;
        }

        if (!parameter_value_matches_kind(entry->kind, value)) {
            error = Error(ErrorKind::INVALID_PARAMETER, "Found type `" + std::string(parameter_value_type_name(value)) +
                                                            "` for `" + name + "`, expected type `" +
                                                            parameter_kind_type_name(entry->kind) + "`");
            return false;
        }
    }
    return true;
}

transport::HttpMethod to_http_method(RestKind kind) {
    switch (kind) {
        case RestKind::PUT:
            return transport::HttpMethod::PUT;
        case RestKind::POST:
            return transport::HttpMethod::POST;
        case RestKind::DELETE:
            return transport::HttpMethod::DELETE;
        case RestKind::GET:
        default:
            return transport::HttpMethod::GET;
    }
}

Requests create_requests(const std::vector<RouteConfig> &route_configs, const std::string &address,
                         const std::string &main_route, DeviceEnvironment environment) {
    Requests requests;
    for (const auto &route : route_configs) {
        auto [it, inserted] = requests.emplace(route.path, Request(address, main_route, environment, route));
        if (!inserted) {
            LOG_WARN("[Request] Duplicate route '" << route.path << "' ignored");
        }
        static_cast<void>(it);
    }
    return requests;
}

}  // namespace device
}  // namespace hearth
