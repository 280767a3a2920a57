#pragma once

/**
 * @file http_transport.hpp
 * @brief IHttpTransport backed by cpp-httplib
 */

#include <memory>
#include <string>

#include "i_http_transport.hpp"

namespace hearth {
namespace transport {

struct HttpTransportConfig {
    int connection_timeout_ms = 5000;
    int read_timeout_ms = 5000;
    int write_timeout_ms = 5000;
};

class HttpTransport : public IHttpTransport {
public:
    explicit HttpTransport(const HttpTransportConfig &config = HttpTransportConfig{});

    bool send(const HttpRequest &request, HttpResponse &response, std::string &error) override;

    /**
     * @brief Stream a reply through httplib's content receiver.
     *
     * A worker thread runs the request; received fragments queue up to a
     * small bound, after which the socket is not read until the consumer
     * catches up.
     */
    bool open_stream(const HttpRequest &request, HttpResponse &head, std::unique_ptr<IBodyStream> &body,
                     std::string &error) override;

    const HttpTransportConfig &config() const { return config_; }

private:
    HttpTransportConfig config_;
};

}  // namespace transport
}  // namespace hearth
