#include "sender.hpp"

#include <memory>
#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace control {

RequestSender::RequestSender(size_t device_id, bool skip, const device::Request &request,
                             transport::IHttpTransport &transport)
    : device_id_(device_id), skip_(skip), request_(request), transport_(transport) {}

bool RequestSender::send(response::Response &out, Error &error) const {
    if (skip_) {
        out = response::SkippedResponse{};
        return true;
    }
    return dispatch(request_.plain_request_data(), out, error);
}

bool RequestSender::send_with_parameters(const ParametersValues &values, response::Response &out,
                                         Error &error) const {
    if (skip_) {
        out = response::SkippedResponse{};
        return true;
    }

    if (!request_.has_parameters()) {
        LOG_WARN("[Sender] Route '" << request_.route() << "' has no parameters, sending it without them");
        return send(out, error);
    }

    device::RequestData data;
    if (!request_.request_data(values, data, error)) {
        return false;
    }

    if (request_.kind() == device::RestKind::GET && request_.environment() != device::DeviceEnvironment::OS) {
        LOG_WARN("[Sender] GET route '" << request_.route() << "' on a "
                                        << device::device_environment_to_string(request_.environment())
                                        << " device cannot carry parameters");
    }

    return dispatch(data, out, error);
}

bool RequestSender::dispatch(const device::RequestData &data, response::Response &out, Error &error) const {
    const transport::HttpRequest http_request = request_.to_http_request(data);
    LOG_DEBUG("[Sender] " << transport::http_method_to_string(http_request.method) << " " << http_request.url);

    if (request_.response_kind() == device::ResponseKind::STREAM) {
        return dispatch_stream(http_request, out, error);
    }

    transport::HttpResponse http_response;
    std::string transport_error;
    if (!transport_.send(http_request, http_response, transport_error)) {
        error = Error(ErrorKind::REQUEST, transport_error);
        return false;
    }

    if (http_response.has_header(device::kSerializationErrorHeader)) {
        error = Error(ErrorKind::REQUEST, http_response.body);
        return false;
    }

    out = response::make_response(request_.response_kind(), std::move(http_response));
    return true;
}

bool RequestSender::dispatch_stream(const transport::HttpRequest &http_request, response::Response &out,
                                    Error &error) const {
    transport::HttpResponse head;
    std::unique_ptr<transport::IBodyStream> body;
    std::string transport_error;
    if (!transport_.open_stream(http_request, head, body, transport_error)) {
        error = Error(ErrorKind::REQUEST, transport_error);
        return false;
    }

    if (head.has_header(device::kSerializationErrorHeader)) {
        // The error description is the (short) body
        std::string message;
        std::string fragment;
        while (body->next(fragment, transport_error)) {
            message += fragment;
        }
        error = Error(ErrorKind::REQUEST, message.empty() ? transport_error : message);
        return false;
    }

    out = response::StreamResponse(std::move(head), std::move(body));
    return true;
}

DeviceSender::DeviceSender(size_t id, const device::Device &device, const policy::Policy &policy,
                           transport::IHttpTransport &transport)
    : id_(id), device_(device), policy_(policy), transport_(transport) {}

bool DeviceSender::request(const std::string &route, std::optional<RequestSender> &out, Error &error) const {
    const device::Request *request = device_.request(route);
    if (request == nullptr) {
        error = Error(ErrorKind::SENDER, "Error in retrieving the request with route `" + route + "`.");
        return false;
    }

    const bool skip = policy_.should_skip(id_, route, request->hazards());
    out.emplace(id_, skip, *request, transport_);
    return true;
}

}  // namespace control
}  // namespace hearth
