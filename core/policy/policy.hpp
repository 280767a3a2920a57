#ifndef HEARTH_POLICY_POLICY_HPP
#define HEARTH_POLICY_POLICY_HPP

#include <cstddef>
#include <map>
#include <string>

#include "common/hazards.hpp"

namespace hearth {
namespace policy {

/**
 * @brief Privacy policy gating device requests by hazard.
 *
 * A request is suppressed when any of its hazards is denied globally or
 * for the device it targets. Requests without hazards are never suppressed.
 */
class Policy {
public:
    // Empty policy: nothing is blocked
    static Policy init() { return Policy(Hazards{}); }

    explicit Policy(Hazards global_blocked);

    // Builder step: deny hazards for one device index
    Policy block_device_on_hazards(size_t device_id, const Hazards &hazards) &&;
    Policy block_device_on_hazards(size_t device_id, const Hazards &hazards) const &;

    Hazards global_blocked_hazards(const Hazards &request_hazards) const;
    Hazards local_blocked_hazards(size_t device_id, const Hazards &request_hazards) const;

    /**
     * @brief Decide whether a request must be skipped.
     *
     * Both intersections are computed and logged independently.
     */
    bool should_skip(size_t device_id, const std::string &route, const Hazards &request_hazards) const;

    const Hazards &global_hazards() const { return global_; }
    const std::map<size_t, Hazards> &local_hazards() const { return local_; }

    bool operator==(const Policy &other) const { return global_ == other.global_ && local_ == other.local_; }

private:
    Hazards global_;
    std::map<size_t, Hazards> local_;
};

}  // namespace policy
}  // namespace hearth

#endif  // HEARTH_POLICY_POLICY_HPP
