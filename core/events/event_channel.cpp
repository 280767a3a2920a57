#include "event_channel.hpp"

#include <chrono>
#include <utility>

namespace hearth {
namespace events {

namespace {
// Producers re-check cancellation at this period while the channel is full
constexpr std::chrono::milliseconds kCancellationCheckPeriod{50};
}  // namespace

EventChannel::EventChannel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

bool EventChannel::push(EventPayload payload, const CancellationToken &token) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!closed_ && queue_.size() >= capacity_) {
            if (token.is_cancelled()) {
                return false;
            }
            not_full_.wait_for(lock, kCancellationCheckPeriod);
        }

        if (closed_ || token.is_cancelled()) {
            return false;
        }
        queue_.push_back(std::move(payload));
    }

    not_empty_.notify_one();
    return true;
}

std::optional<EventPayload> EventChannel::pop(int timeout_ms) {
    std::optional<EventPayload> payload;

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (timeout_ms > 0) {
            not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this] { return !queue_.empty() || closed_; });
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        payload = std::move(queue_.front());
        queue_.pop_front();
    }

    not_full_.notify_one();
    return payload;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    not_empty_.notify_all();
    not_full_.notify_all();
}

bool EventChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventReceiver::EventReceiver(std::shared_ptr<EventChannel> channel) : channel_(std::move(channel)) {}

EventReceiver::~EventReceiver() { close(); }

EventReceiver &EventReceiver::operator=(EventReceiver &&other) noexcept {
    if (this != &other) {
        close();
        channel_ = std::move(other.channel_);
    }
    return *this;
}

std::optional<EventPayload> EventReceiver::recv(int timeout_ms) {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->pop(timeout_ms);
}

std::optional<EventPayload> EventReceiver::try_recv() { return recv(0); }

size_t EventReceiver::pending() const { return channel_ ? channel_->size() : 0; }

void EventReceiver::close() {
    if (channel_) {
        channel_->close();
    }
}

}  // namespace events
}  // namespace hearth
