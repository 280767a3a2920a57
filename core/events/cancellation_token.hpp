#pragma once

#include <atomic>

namespace hearth {
namespace events {

// Cooperative stop flag shared between an event task and its owner
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace events
}  // namespace hearth
