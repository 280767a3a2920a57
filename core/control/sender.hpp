#ifndef HEARTH_CONTROL_SENDER_HPP
#define HEARTH_CONTROL_SENDER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "common/error.hpp"
#include "common/parameters.hpp"
#include "device/device.hpp"
#include "device/request.hpp"
#include "policy/policy.hpp"
#include "response/response.hpp"
#include "transport/i_http_transport.hpp"

namespace hearth {
namespace control {

/**
 * @brief Sends one request of one device, honouring a precomputed skip flag.
 *
 * Borrows the request and the transport from the controller and must not
 * outlive it.
 */
class RequestSender {
public:
    RequestSender(size_t device_id, bool skip, const device::Request &request, transport::IHttpTransport &transport);

    size_t device_id() const { return device_id_; }
    bool skip() const { return skip_; }
    const device::Request &request() const { return request_; }

    /**
     * @brief Send the request with every parameter at its default value.
     *
     * A skipped request yields a Skipped response without any network I/O.
     */
    bool send(response::Response &out, Error &error) const;

    /**
     * @brief Validate the given values and send the request.
     *
     * Falls back to send() when the request declares no parameters.
     * @return false with INVALID_PARAMETER, REQUEST errors
     */
    bool send_with_parameters(const ParametersValues &values, response::Response &out, Error &error) const;

private:
    bool dispatch(const device::RequestData &data, response::Response &out, Error &error) const;
    bool dispatch_stream(const transport::HttpRequest &http_request, response::Response &out, Error &error) const;

    size_t device_id_;
    bool skip_;
    const device::Request &request_;
    transport::IHttpTransport &transport_;
};

/**
 * @brief Scoped handle on one device, obtained from the controller.
 */
class DeviceSender {
public:
    DeviceSender(size_t id, const device::Device &device, const policy::Policy &policy,
                 transport::IHttpTransport &transport);

    size_t id() const { return id_; }
    const device::Device &device() const { return device_; }

    /**
     * @brief Look up a route and evaluate the policy against its hazards.
     *
     * @return false with a SENDER error if the route does not exist
     */
    bool request(const std::string &route, std::optional<RequestSender> &out, Error &error) const;

private:
    size_t id_;
    const device::Device &device_;
    const policy::Policy &policy_;
    transport::IHttpTransport &transport_;
};

}  // namespace control
}  // namespace hearth

#endif  // HEARTH_CONTROL_SENDER_HPP
