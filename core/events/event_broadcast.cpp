#include "event_broadcast.hpp"

#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace events {

EventBroadcast::EventBroadcast(size_t capacity, std::string name)
    : name_(std::move(name)), slots_(capacity > 0 ? capacity : 1), tail_(0), receivers_(0), closed_(false) {}

std::unique_ptr<BroadcastReceiver> EventBroadcast::subscribe() {
    uint64_t cursor = 0;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor = tail_;
        count = ++receivers_;
    }
    LOG_DEBUG("[EventBroadcast] '" << name_ << "' receivers: " << count);
    return std::make_unique<BroadcastReceiver>(shared_from_this(), cursor);
}

size_t EventBroadcast::publish(const Events &events) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        slots_[tail_ % slots_.size()] = events;
        ++tail_;
        count = receivers_;
    }
    published_.notify_all();
    return count;
}

void EventBroadcast::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    published_.notify_all();
}

void EventBroadcast::on_idle(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_callback_ = std::move(callback);
}

size_t EventBroadcast::receiver_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receivers_;
}

uint64_t EventBroadcast::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tail_;
}

EventBroadcast::Read EventBroadcast::read_locked(uint64_t &cursor, uint64_t &lagged, Events &out) {
    const uint64_t oldest = tail_ > slots_.size() ? tail_ - slots_.size() : 0;
    if (cursor < oldest) {
        const uint64_t missed = oldest - cursor;
        lagged += missed;
        cursor = oldest;
        LOG_WARN("[EventBroadcast] Receiver of '" << name_ << "' lagged behind, skipped " << missed << " snapshot(s)");
    }
    if (cursor < tail_) {
        out = slots_[cursor % slots_.size()];
        ++cursor;
        return Read::SNAPSHOT;
    }
    return closed_ ? Read::CLOSED : Read::EMPTY;
}

void EventBroadcast::release() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (receivers_ > 0 && --receivers_ == 0) {
            callback = std::move(idle_callback_);
            idle_callback_ = nullptr;
        }
    }
    if (callback) {
        LOG_DEBUG("[EventBroadcast] Last receiver of '" << name_ << "' released");
        callback();
    }
}

BroadcastReceiver::BroadcastReceiver(std::shared_ptr<EventBroadcast> broadcast, uint64_t cursor)
    : broadcast_(std::move(broadcast)), cursor_(cursor), lagged_(0) {}

BroadcastReceiver::~BroadcastReceiver() { broadcast_->release(); }

std::optional<Events> BroadcastReceiver::recv(int timeout_ms) {
    Events out;
    std::unique_lock<std::mutex> lock(broadcast_->mutex_);

    auto read = broadcast_->read_locked(cursor_, lagged_, out);
    if (read == EventBroadcast::Read::EMPTY && timeout_ms > 0) {
        broadcast_->published_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return cursor_ < broadcast_->tail_ || broadcast_->closed_;
        });
        read = broadcast_->read_locked(cursor_, lagged_, out);
    }

    if (read != EventBroadcast::Read::SNAPSHOT) {
        return std::nullopt;
    }
    return out;
}

size_t BroadcastReceiver::pending() const {
    std::lock_guard<std::mutex> lock(broadcast_->mutex_);
    const uint64_t tail = broadcast_->tail_;
    const uint64_t oldest = tail > broadcast_->slots_.size() ? tail - broadcast_->slots_.size() : 0;
    const uint64_t from = cursor_ > oldest ? cursor_ : oldest;
    return static_cast<size_t>(tail - from);
}

uint64_t BroadcastReceiver::lagged_count() const {
    std::lock_guard<std::mutex> lock(broadcast_->mutex_);
    return lagged_;
}

bool BroadcastReceiver::is_closed() const {
    std::lock_guard<std::mutex> lock(broadcast_->mutex_);
    return broadcast_->closed_ && cursor_ >= broadcast_->tail_;
}

}  // namespace events
}  // namespace hearth
