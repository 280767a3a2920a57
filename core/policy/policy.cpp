#include "policy.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace policy {

Policy::Policy(Hazards global_blocked) : global_(std::move(global_blocked)) {}

Policy Policy::block_device_on_hazards(size_t device_id, const Hazards &hazards) && {
    local_[device_id].insert(hazards.begin(), hazards.end());
    return std::move(*this);
}

Policy Policy::block_device_on_hazards(size_t device_id, const Hazards &hazards) const & {
    Policy copy = *this;
    return std::move(copy).block_device_on_hazards(device_id, hazards);
}

Hazards Policy::global_blocked_hazards(const Hazards &request_hazards) const {
    return intersect_hazards(request_hazards, global_);
}

Hazards Policy::local_blocked_hazards(size_t device_id, const Hazards &request_hazards) const {
    auto it = local_.find(device_id);
    if (it == local_.end()) {
        return {};
    }
    return intersect_hazards(request_hazards, it->second);
}

bool Policy::should_skip(size_t device_id, const std::string &route, const Hazards &request_hazards) const {
    if (request_hazards.empty()) {
        return false;
    }

    const Hazards global = global_blocked_hazards(request_hazards);
    const Hazards local = local_blocked_hazards(device_id, request_hazards);

    if (!global.empty()) {
        LOG_WARN("[Policy] Route `" << route << "` of device " << device_id
                                    << " blocked by global policy: " << hazards_to_string(global));
    }
    if (!local.empty()) {
        LOG_WARN("[Policy] Route `" << route << "` of device " << device_id
                                    << " blocked by device policy: " << hazards_to_string(local));
    }

    return !global.empty() || !local.empty();
}

}  // namespace policy
}  // namespace hearth
