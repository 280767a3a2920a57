#include "hazards.hpp"

#include <algorithm>
#include <iterator>

namespace hearth {

namespace {

struct HazardInfo {
    Hazard hazard;
    const char *name;
    HazardCategory category;
    const char *description;
};

constexpr HazardInfo kHazardTable[] = {
    {Hazard::AirPoisoning, "AirPoisoning", HazardCategory::SAFETY,
     "The execution may release toxic gases."},
    {Hazard::Asphyxia, "Asphyxia", HazardCategory::SAFETY,
     "The execution may cause oxygen deficiency by gaseous substances."},
    {Hazard::AudioVideoDisplay, "AudioVideoDisplay", HazardCategory::PRIVACY,
     "The execution authorises the app to display a video with audio coming from the device."},
    {Hazard::AudioVideoRecordAndStore, "AudioVideoRecordAndStore", HazardCategory::PRIVACY,
     "The execution authorises the app to record and save a video with audio on persistent storage."},
    {Hazard::ElectricEnergyConsumption, "ElectricEnergyConsumption", HazardCategory::FINANCIAL,
     "The execution enables a device that consumes electricity."},
    {Hazard::Explosion, "Explosion", HazardCategory::SAFETY,
     "The execution may cause an explosion."},
    {Hazard::FireHazard, "FireHazard", HazardCategory::SAFETY,
     "The execution may cause fire."},
    {Hazard::GasConsumption, "GasConsumption", HazardCategory::FINANCIAL,
     "The execution enables a device that consumes gas."},
    {Hazard::LogEnergyConsumption, "LogEnergyConsumption", HazardCategory::PRIVACY,
     "The execution authorises the app to get and save information about the app's energy impact on the device the app runs on."},
    {Hazard::LogUsageTime, "LogUsageTime", HazardCategory::PRIVACY,
     "The execution authorises the app to get and save information about the app's duration of use."},
    {Hazard::PaySubscriptionFee, "PaySubscriptionFee", HazardCategory::FINANCIAL,
     "The execution authorises the app to use payment information and make a periodic payment."},
    {Hazard::PowerOutage, "PowerOutage", HazardCategory::SAFETY,
     "The execution may cause an interruption in the supply of electricity."},
    {Hazard::PowerSurge, "PowerSurge", HazardCategory::SAFETY,
     "The execution may lead to exposure to high voltages."},
    {Hazard::RecordIssuedCommands, "RecordIssuedCommands", HazardCategory::PRIVACY,
     "The execution authorises the app to get and save user inputs."},
    {Hazard::RecordUserPreferences, "RecordUserPreferences", HazardCategory::PRIVACY,
     "The execution authorises the app to get and save information about the user's preferences."},
    {Hazard::SpendMoney, "SpendMoney", HazardCategory::FINANCIAL,
     "The execution authorises the app to use payment information and make a payment transaction."},
    {Hazard::SpoiledFood, "SpoiledFood", HazardCategory::SAFETY,
     "The execution may lead to rotten food."},
    {Hazard::TakeDeviceScreenshots, "TakeDeviceScreenshots", HazardCategory::PRIVACY,
     "The execution authorises the app to read the display output and take screenshots of it."},
    {Hazard::TakePictures, "TakePictures", HazardCategory::PRIVACY,
     "The execution authorises the app to use a camera and take photos."},
    {Hazard::UnauthorisedPhysicalAccess, "UnauthorisedPhysicalAccess", HazardCategory::SAFETY,
     "The execution disables a protection mechanism and unauthorised individuals may physically enter home."},
    {Hazard::VideoDisplay, "VideoDisplay", HazardCategory::PRIVACY,
     "The execution authorises the app to display a video coming from the device."},
    {Hazard::VideoRecordAndStore, "VideoRecordAndStore", HazardCategory::PRIVACY,
     "The execution authorises the app to record and save a video on persistent storage."},
    {Hazard::WaterConsumption, "WaterConsumption", HazardCategory::FINANCIAL,
     "The execution enables a device that consumes water."},
    {Hazard::WaterFlooding, "WaterFlooding", HazardCategory::SAFETY,
     "The execution allows water usage which may lead to flood."},
};

constexpr size_t kHazardCount = sizeof(kHazardTable) / sizeof(kHazardTable[0]);

const HazardInfo &info(Hazard hazard) { return kHazardTable[static_cast<size_t>(hazard)]; }

}  // namespace

const char *hazard_to_string(Hazard hazard) { return info(hazard).name; }

std::optional<Hazard> hazard_from_string(std::string_view name) {
    for (const auto &entry : kHazardTable) {
        if (name == entry.name) {
            return entry.hazard;
        }
    }
    return std::nullopt;
}

uint16_t hazard_id(Hazard hazard) { return static_cast<uint16_t>(hazard); }

std::optional<Hazard> hazard_from_id(uint16_t id) {
    if (id >= kHazardCount) {
        return std::nullopt;
    }
    return kHazardTable[id].hazard;
}

const char *hazard_description(Hazard hazard) { return info(hazard).description; }

HazardCategory hazard_category(Hazard hazard) { return info(hazard).category; }

const char *hazard_category_to_string(HazardCategory category) {
    switch (category) {
        case HazardCategory::SAFETY:
            return "Safety";
        case HazardCategory::PRIVACY:
            return "Privacy";
        case HazardCategory::FINANCIAL:
            return "Financial";
        default:
            return "Unknown";
    }
}

const Hazards &all_hazards() {
    static const Hazards hazards = [] {
        Hazards all;
        for (const auto &entry : kHazardTable) {
            all.insert(entry.hazard);
        }
        return all;
    }();
    return hazards;
}

Hazards intersect_hazards(const Hazards &a, const Hazards &b) {
    Hazards out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::inserter(out, out.end()));
    return out;
}

std::string hazards_to_string(const Hazards &hazards) {
    std::string out = "{";
    bool first = true;
    for (Hazard hazard : hazards) {
        if (!first) {
            out += ", ";
        }
        out += hazard_to_string(hazard);
        first = false;
    }
    out += "}";
    return out;
}

}  // namespace hearth
