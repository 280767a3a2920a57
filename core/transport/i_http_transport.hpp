#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hearth {
namespace transport {

enum class HttpMethod { GET, PUT, POST, DELETE };

const char *http_method_to_string(HttpMethod method);

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;                       // absolute URL
    HttpHeaders headers;
    std::optional<std::string> json_body;  // sent as application/json when set
};

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    // Header names compare case-insensitively
    bool has_header(const std::string &name) const;
    std::string header_value(const std::string &name) const;
};

/**
 * @brief Reply body consumed incrementally, in the order the bytes arrive.
 */
class IBodyStream {
public:
    virtual ~IBodyStream() = default;

    /**
     * @brief Take the next received fragment.
     *
     * Blocks until a fragment is available. Returns false at the end of the
     * body; error is non-empty when the transfer failed instead.
     */
    virtual bool next(std::string &fragment, std::string &error) = 0;
};

// Body already held in memory, handed out as a single fragment
class BufferedBodyStream : public IBodyStream {
public:
    explicit BufferedBodyStream(std::string body) : body_(std::move(body)) {}

    bool next(std::string &fragment, std::string &) override {
        if (consumed_ || body_.empty()) {
            return false;
        }
        consumed_ = true;
        fragment = std::move(body_);
        return true;
    }

private:
    std::string body_;
    bool consumed_ = false;
};

/**
 * @brief Blocking HTTP client seam used for descriptor fetches and route calls.
 *
 * Implementations return false and set error on transport failures
 * (connection refused, timeout, malformed URL). Any HTTP status is a
 * successful exchange.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual bool send(const HttpRequest &request, HttpResponse &response, std::string &error) = 0;

    /**
     * @brief Issue the request and return once the status line and headers are in.
     *
     * head.body stays empty; the body is read through the returned stream.
     * Dropping the stream aborts the transfer.
     */
    virtual bool open_stream(const HttpRequest &request, HttpResponse &head, std::unique_ptr<IBodyStream> &body,
                             std::string &error) = 0;
};

}  // namespace transport
}  // namespace hearth
