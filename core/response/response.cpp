#include "response.hpp"

#include <algorithm>
#include <exception>

namespace hearth {
namespace response {

namespace {

bool is_success(int status) { return status >= 200 && status < 300; }

bool parse_json(const std::string &body, int status, const char *what, nlohmann::json &out, Error &error) {
    try {
        out = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        error = Error(ErrorKind::JSON_RESPONSE,
                      std::string(what) + " response (status " + std::to_string(status) + "): " + e.what());
        return false;
    }
    return true;
}

}  // namespace

bool OkResponse::parse_body(Error &error) const {
    nlohmann::json json;
    if (!parse_json(http_.body, http_.status, "Ok", json, error)) {
        return false;
    }

    if (!json.is_object() || !json.contains(kOkMarkerKey) || !json[kOkMarkerKey].is_boolean()) {
        error = Error(ErrorKind::JSON_RESPONSE, std::string("Ok response: missing `") + kOkMarkerKey + "` marker");
        return false;
    }
    if (!json[kOkMarkerKey].get<bool>()) {
        error = Error(ErrorKind::JSON_RESPONSE, "Ok response: device reported an unsuccessful action");
        return false;
    }
    return true;
}

bool SerialResponse::parse_body_json(nlohmann::json &out, Error &error) const {
    return parse_json(http_.body, http_.status, "Serial", out, error);
}

bool InfoResponse::parse_body(DeviceInfo &out, Error &error) const {
    nlohmann::json json;
    if (!parse_json(http_.body, http_.status, "Info", json, error)) {
        return false;
    }
    try {
        out = json.get<DeviceInfo>();
    } catch (const std::exception &e) {
        error = Error(ErrorKind::JSON_RESPONSE, std::string("Info response: ") + e.what());
        return false;
    }
    return true;
}

bool StreamResponse::for_each_chunk(size_t chunk_size, const ChunkHandler &handler, Error &error) {
    if (!is_success(head_.status)) {
        error = Error(ErrorKind::STREAM_RESPONSE, "Stream failed with status " + std::to_string(head_.status));
        return false;
    }
    if (chunk_size == 0) {
        error = Error(ErrorKind::STREAM_RESPONSE, "Chunk size must be greater than zero");
        return false;
    }
    if (!body_) {
        error = Error(ErrorKind::STREAM_RESPONSE, "Stream body was already consumed");
        return false;
    }

    // Released on return so an early stop aborts the transfer
    const std::shared_ptr<transport::IBodyStream> body = std::move(body_);
    std::string fragment;
    std::string transfer_error;
    while (body->next(fragment, transfer_error)) {
        for (size_t offset = 0; offset < fragment.size(); offset += chunk_size) {
            const size_t length = std::min(chunk_size, fragment.size() - offset);
            if (!handler(fragment.data() + offset, length)) {
                return true;
            }
        }
    }

    if (!transfer_error.empty()) {
        error = Error(ErrorKind::STREAM_RESPONSE, transfer_error);
        return false;
    }
    return true;
}

Response make_response(device::ResponseKind kind, transport::HttpResponse http) {
    switch (kind) {
        case device::ResponseKind::SERIAL:
            return SerialResponse(std::move(http));
        case device::ResponseKind::INFO:
            return InfoResponse(std::move(http));
        case device::ResponseKind::STREAM: {
            std::string body = std::move(http.body);
            http.body.clear();
            return StreamResponse(std::move(http), std::make_unique<transport::BufferedBodyStream>(std::move(body)));
        }
        case device::ResponseKind::OK:
        default:
            return OkResponse(std::move(http));
    }
}

bool is_skipped(const Response &response) { return std::holds_alternative<SkippedResponse>(response); }

const char *response_type_name(const Response &response) {
    switch (response.index()) {
        case 0:
            return "Skipped";
        case 1:
            return "Ok";
        case 2:
            return "Serial";
        case 3:
            return "Info";
        case 4:
            return "Stream";
        default:
            return "Unknown";
    }
}

}  // namespace response
}  // namespace hearth
