#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace hearth {

/**
 * @brief Risk a device operation may pose when invoked.
 *
 * Declaration order defines the numeric identifier of each hazard.
 */
enum class Hazard : uint16_t {
    AirPoisoning,
    Asphyxia,
    AudioVideoDisplay,
    AudioVideoRecordAndStore,
    ElectricEnergyConsumption,
    Explosion,
    FireHazard,
    GasConsumption,
    LogEnergyConsumption,
    LogUsageTime,
    PaySubscriptionFee,
    PowerOutage,
    PowerSurge,
    RecordIssuedCommands,
    RecordUserPreferences,
    SpendMoney,
    SpoiledFood,
    TakeDeviceScreenshots,
    TakePictures,
    UnauthorisedPhysicalAccess,
    VideoDisplay,
    VideoRecordAndStore,
    WaterConsumption,
    WaterFlooding,
};

enum class HazardCategory { SAFETY, PRIVACY, FINANCIAL };

// Unordered in meaning; std::set keeps iteration (and logs) deterministic.
using Hazards = std::set<Hazard>;

const char *hazard_to_string(Hazard hazard);
std::optional<Hazard> hazard_from_string(std::string_view name);
uint16_t hazard_id(Hazard hazard);
std::optional<Hazard> hazard_from_id(uint16_t id);
const char *hazard_description(Hazard hazard);
HazardCategory hazard_category(Hazard hazard);
const char *hazard_category_to_string(HazardCategory category);

// Every known hazard, in identifier order
const Hazards &all_hazards();

Hazards intersect_hazards(const Hazards &a, const Hazards &b);

// "{FireHazard, LogEnergyConsumption}"
std::string hazards_to_string(const Hazards &hazards);

}  // namespace hearth
