#pragma once

/**
 * @file device_info.hpp
 * @brief Energy and economy information returned by Info routes
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace hearth {
namespace response {

enum class EnergyClass { A_PLUS_PLUS_PLUS, A_PLUS_PLUS, A_PLUS, A, B, C, D, E, F, G };

const char *energy_class_to_string(EnergyClass energy_class);
std::optional<EnergyClass> energy_class_from_string(std::string_view name);

enum class CostTimespan { WEEK, MONTH, YEAR };

const char *cost_timespan_to_string(CostTimespan timespan);
std::optional<CostTimespan> cost_timespan_from_string(std::string_view name);

struct EnergyEfficiency {
    int8_t savings = 0;  // percentage
    EnergyClass energy_class = EnergyClass::A;
};

struct CarbonFootprint {
    int8_t decimal_percentage = 0;
    EnergyClass energy_class = EnergyClass::A;
};

struct WaterUseEfficiency {
    std::optional<float> gpp;
    std::optional<float> penman_monteith_equation;
    std::optional<float> wer;
};

struct Energy {
    std::vector<EnergyEfficiency> energy_efficiencies;
    std::vector<CarbonFootprint> carbon_footprints;
    std::optional<WaterUseEfficiency> water_use_efficiency;

    bool empty() const {
        return energy_efficiencies.empty() && carbon_footprints.empty() && !water_use_efficiency.has_value();
    }
};

struct Cost {
    int64_t usd = 0;
    CostTimespan timespan = CostTimespan::YEAR;
};

struct Roi {
    uint8_t years = 0;
    EnergyClass energy_class = EnergyClass::A;
};

struct Economy {
    std::vector<Cost> costs;
    std::vector<Roi> roi;

    bool empty() const { return costs.empty() && roi.empty(); }
};

struct DeviceInfo {
    Energy energy;
    Economy economy;
};

// nlohmann::json conversions (found through ADL); missing sections default to empty.
// Unknown enum names throw std::invalid_argument.
void from_json(const nlohmann::json &json, EnergyEfficiency &out);
void from_json(const nlohmann::json &json, CarbonFootprint &out);
void from_json(const nlohmann::json &json, WaterUseEfficiency &out);
void from_json(const nlohmann::json &json, Energy &out);
void from_json(const nlohmann::json &json, Cost &out);
void from_json(const nlohmann::json &json, Roi &out);
void from_json(const nlohmann::json &json, Economy &out);
void from_json(const nlohmann::json &json, DeviceInfo &out);

void to_json(nlohmann::json &json, const DeviceInfo &info);

}  // namespace response
}  // namespace hearth
