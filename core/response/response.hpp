#ifndef HEARTH_RESPONSE_RESPONSE_HPP
#define HEARTH_RESPONSE_RESPONSE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "common/error.hpp"
#include "device/descriptor.hpp"
#include "response/device_info.hpp"
#include "transport/i_http_transport.hpp"

namespace hearth {
namespace response {

// Key a device sets to true when an Ok route completed
constexpr const char *kOkMarkerKey = "action_terminated_correctly";

// Common holder for the still-undecoded HTTP reply
class BodyResponse {
public:
    explicit BodyResponse(transport::HttpResponse http) : http_(std::move(http)) {}

    int status() const { return http_.status; }
    const std::string &raw_body() const { return http_.body; }
    const transport::HttpHeaders &headers() const { return http_.headers; }

protected:
    transport::HttpResponse http_;
};

class OkResponse : public BodyResponse {
public:
    using BodyResponse::BodyResponse;

    // true iff the body carries the success marker
    bool parse_body(Error &error) const;
};

class SerialResponse : public BodyResponse {
public:
    using BodyResponse::BodyResponse;

    bool parse_body_json(nlohmann::json &out, Error &error) const;

    /**
     * @brief Deserialize the body into any type nlohmann::json can convert to.
     */
    template <typename T>
    bool parse_body(T &out, Error &error) const {
        nlohmann::json json;
        if (!parse_body_json(json, error)) {
            return false;
        }
        try {
            out = json.get<T>();
        } catch (const nlohmann::json::exception &e) {
            error = Error(ErrorKind::JSON_RESPONSE, std::string("Serial response: ") + e.what());
            return false;
        }
        return true;
    }
};

class InfoResponse : public BodyResponse {
public:
    using BodyResponse::BodyResponse;

    bool parse_body(DeviceInfo &out, Error &error) const;
};

/**
 * @brief Reply whose body is consumed while it is still being received.
 *
 * Holds the status line and headers plus the open body stream. The body
 * is read once; copies share the same stream.
 */
class StreamResponse {
public:
    StreamResponse(transport::HttpResponse head, std::unique_ptr<transport::IBodyStream> body)
        : head_(std::move(head)), body_(std::move(body)) {}

    int status() const { return head_.status; }
    const transport::HttpHeaders &headers() const { return head_.headers; }

    // Return false to stop early
    using ChunkHandler = std::function<bool(const char *data, size_t size)>;

    /**
     * @brief Hand each received fragment to the handler, split to at most chunk_size bytes.
     *
     * @return false with a STREAM_RESPONSE error on a non-success status, a zero
     *         chunk size, a failed transfer or a second read
     */
    bool for_each_chunk(size_t chunk_size, const ChunkHandler &handler, Error &error);

private:
    transport::HttpResponse head_;
    std::shared_ptr<transport::IBodyStream> body_;
};

// Policy suppressed the request; no network I/O took place
struct SkippedResponse {};

using Response = std::variant<SkippedResponse, OkResponse, SerialResponse, InfoResponse, StreamResponse>;

// A STREAM kind wraps the already received body
Response make_response(device::ResponseKind kind, transport::HttpResponse http);

bool is_skipped(const Response &response);

// "Skipped", "Ok", "Serial", "Info" or "Stream"
const char *response_type_name(const Response &response);

}  // namespace response
}  // namespace hearth

#endif  // HEARTH_RESPONSE_RESPONSE_HPP
