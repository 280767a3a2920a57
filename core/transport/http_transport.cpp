/**
 * @file http_transport.cpp
 * @brief cpp-httplib implementation of the controller HTTP transport
 */

#include "http_transport.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"
#include "url.hpp"

namespace hearth {
namespace transport {

namespace {

bool iequals(const std::string &a, const std::string &b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

constexpr const char *kJsonContentType = "application/json";

// Received fragments waiting for the consumer before the socket read pauses
constexpr size_t kMaxPendingFragments = 16;

void copy_head(const httplib::Response &from, HttpResponse &to) {
    to.status = from.status;
    to.headers.clear();
    for (const auto &h : from.headers) {
        to.headers.emplace_back(h.first, h.second);
    }
}

// Shared between the consumer and the thread running the request
struct StreamState {
    std::mutex mutex;
    std::condition_variable cv;
    HttpResponse head;
    bool head_ready = false;
    std::deque<std::string> fragments;
    bool done = false;
    bool cancelled = false;
    std::string error;
};

// Client for the URL's origin plus the request translated to httplib
std::shared_ptr<httplib::Client> make_client(const HttpTransportConfig &config, const HttpRequest &request,
                                             httplib::Request &out, std::string &error) {
    std::string base;
    std::string path;
    if (!split_url(request.url, base, path)) {
        error = "Malformed URL: " + request.url;
        return nullptr;
    }

    auto client = std::make_shared<httplib::Client>(base);
    if (!client->is_valid()) {
        error = "Unsupported URL: " + request.url;
        return nullptr;
    }

    client->set_connection_timeout(std::chrono::milliseconds(config.connection_timeout_ms));
    client->set_read_timeout(std::chrono::milliseconds(config.read_timeout_ms));
    client->set_write_timeout(std::chrono::milliseconds(config.write_timeout_ms));

    out.method = http_method_to_string(request.method);
    out.path = path;
    for (const auto &h : request.headers) {
        out.headers.emplace(h.first, h.second);
    }
    // Calls without parameters carry no body at all
    if (request.json_body) {
        out.body = *request.json_body;
        out.set_header("Content-Type", kJsonContentType);
    }

    LOG_DEBUG("[HttpTransport] " << out.method << " " << request.url
                                 << (request.json_body ? " body=" + out.body : ""));
    return client;
}

class StreamingBody : public IBodyStream {
public:
    StreamingBody(std::shared_ptr<StreamState> state, std::thread worker)
        : state_(std::move(state)), worker_(std::move(worker)) {}

    ~StreamingBody() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    StreamingBody(const StreamingBody &) = delete;
    StreamingBody &operator=(const StreamingBody &) = delete;

    bool next(std::string &fragment, std::string &error) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return !state_->fragments.empty() || state_->done; });
        if (!state_->fragments.empty()) {
            fragment = std::move(state_->fragments.front());
            state_->fragments.pop_front();
            state_->cv.notify_all();
            return true;
        }
        error = state_->error;
        return false;
    }

private:
    std::shared_ptr<StreamState> state_;
    std::thread worker_;
};

}  // namespace

const char *http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:
            return "GET";
        case HttpMethod::PUT:
            return "PUT";
        case HttpMethod::POST:
            return "POST";
        case HttpMethod::DELETE:
            return "DELETE";
        default:
            return "UNKNOWN";
    }
}

bool HttpResponse::has_header(const std::string &name) const {
    return std::any_of(headers.begin(), headers.end(), [&name](const auto &h) { return iequals(h.first, name); });
}

std::string HttpResponse::header_value(const std::string &name) const {
    for (const auto &h : headers) {
        if (iequals(h.first, name)) {
            return h.second;
        }
    }
    return {};
}

HttpTransport::HttpTransport(const HttpTransportConfig &config) : config_(config) {}

bool HttpTransport::send(const HttpRequest &request, HttpResponse &response, std::string &error) {
    httplib::Request http_request;
    auto client = make_client(config_, request, http_request, error);
    if (!client) {
        return false;
    }

    auto result = client->send(http_request);
    if (!result) {
        error = "HTTP " + http_request.method + " " + request.url + " failed: " + httplib::to_string(result.error());
        return false;
    }

    copy_head(*result, response);
    response.body = result->body;
    return true;
}

bool HttpTransport::open_stream(const HttpRequest &request, HttpResponse &head, std::unique_ptr<IBodyStream> &body,
                                std::string &error) {
    httplib::Request http_request;
    auto client = make_client(config_, request, http_request, error);
    if (!client) {
        return false;
    }

    auto state = std::make_shared<StreamState>();
    http_request.response_handler = [state](const httplib::Response &response) {
        std::lock_guard<std::mutex> lock(state->mutex);
        copy_head(response, state->head);
        state->head_ready = true;
        state->cv.notify_all();
        return !state->cancelled;
    };
    http_request.content_receiver = [state](const char *data, size_t size, uint64_t, uint64_t) {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state] { return state->cancelled || state->fragments.size() < kMaxPendingFragments; });
        if (state->cancelled) {
            return false;
        }
        state->fragments.emplace_back(data, size);
        state->cv.notify_all();
        return true;
    };

    const std::string description = http_request.method + " " + request.url;
    std::thread worker([client, state, http_request = std::move(http_request), description]() {
        auto result = client->send(http_request);
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!result && !state->cancelled) {
            state->error = "HTTP " + description + " failed: " + httplib::to_string(result.error());
        }
        state->done = true;
        state->cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state] { return state->head_ready || state->done; });
        if (!state->head_ready) {
            error = state->error.empty() ? "HTTP " + description + " closed before a response" : state->error;
            lock.unlock();
            worker.join();
            return false;
        }
        head = state->head;
    }

    body = std::make_unique<StreamingBody>(state, std::move(worker));
    return true;
}

}  // namespace transport
}  // namespace hearth
