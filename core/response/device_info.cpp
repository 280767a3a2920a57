#include "device_info.hpp"

#include <stdexcept>

namespace hearth {
namespace response {

namespace {

constexpr const char *kEnergyClassNames[] = {"A+++", "A++", "A+", "A", "B", "C", "D", "E", "F", "G"};

EnergyClass read_energy_class(const nlohmann::json &json) {
    const auto name = json.at("energy_class").get<std::string>();
    auto energy_class = energy_class_from_string(name);
    if (!energy_class) {
        throw std::invalid_argument("unknown energy class '" + name + "'");
    }
    return *energy_class;
}

template <typename T>
void read_list(const nlohmann::json &json, const char *key, std::vector<T> &out) {
    out.clear();
    if (json.contains(key) && !json[key].is_null()) {
        out = json[key].get<std::vector<T>>();
    }
}

template <typename T>
void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &out) {
    out.reset();
    if (json.contains(key) && !json[key].is_null()) {
        out = json[key].get<T>();
    }
}

}  // namespace

const char *energy_class_to_string(EnergyClass energy_class) {
    return kEnergyClassNames[static_cast<size_t>(energy_class)];
}

std::optional<EnergyClass> energy_class_from_string(std::string_view name) {
    for (size_t i = 0; i < sizeof(kEnergyClassNames) / sizeof(kEnergyClassNames[0]); ++i) {
        if (name == kEnergyClassNames[i]) {
            return static_cast<EnergyClass>(i);
        }
    }
    return std::nullopt;
}

const char *cost_timespan_to_string(CostTimespan timespan) {
    switch (timespan) {
        case CostTimespan::WEEK:
            return "Week";
        case CostTimespan::MONTH:
            return "Month";
        case CostTimespan::YEAR:
            return "Year";
        default:
            return "Unknown";
    }
}

std::optional<CostTimespan> cost_timespan_from_string(std::string_view name) {
    if (name == "Week") return CostTimespan::WEEK;
    if (name == "Month") return CostTimespan::MONTH;
    if (name == "Year") return CostTimespan::YEAR;
    return std::nullopt;
}

void from_json(const nlohmann::json &json, EnergyEfficiency &out) {
    out.savings = json.at("savings").get<int8_t>();
    out.energy_class = read_energy_class(json);
}

void from_json(const nlohmann::json &json, CarbonFootprint &out) {
    out.decimal_percentage = json.at("decimal_percentage").get<int8_t>();
    out.energy_class = read_energy_class(json);
}

void from_json(const nlohmann::json &json, WaterUseEfficiency &out) {
    read_optional(json, "gpp", out.gpp);
    read_optional(json, "penman_monteith_equation", out.penman_monteith_equation);
    read_optional(json, "wer", out.wer);
}

void from_json(const nlohmann::json &json, Energy &out) {
    read_list(json, "energy_efficiencies", out.energy_efficiencies);
    read_list(json, "carbon_footprints", out.carbon_footprints);
    read_optional(json, "water_use_efficiency", out.water_use_efficiency);
}

void from_json(const nlohmann::json &json, Cost &out) {
    out.usd = json.at("usd").get<int64_t>();
    const auto name = json.at("timespan").get<std::string>();
    auto timespan = cost_timespan_from_string(name);
    if (!timespan) {
        throw std::invalid_argument("unknown cost timespan '" + name + "'");
    }
    out.timespan = *timespan;
}

void from_json(const nlohmann::json &json, Roi &out) {
    out.years = json.at("years").get<uint8_t>();
    out.energy_class = read_energy_class(json);
}

void from_json(const nlohmann::json &json, Economy &out) {
    read_list(json, "costs", out.costs);
    read_list(json, "roi", out.roi);
}

void from_json(const nlohmann::json &json, DeviceInfo &out) {
    out = DeviceInfo{};
    if (json.contains("energy") && !json["energy"].is_null()) {
        out.energy = json["energy"].get<Energy>();
    }
    if (json.contains("economy") && !json["economy"].is_null()) {
        out.economy = json["economy"].get<Economy>();
    }
}

void to_json(nlohmann::json &json, const DeviceInfo &info) {
    nlohmann::json energy = nlohmann::json::object();
    energy["energy_efficiencies"] = nlohmann::json::array();
    for (const auto &e : info.energy.energy_efficiencies) {
        energy["energy_efficiencies"].push_back(
            {{"savings", e.savings}, {"energy_class", energy_class_to_string(e.energy_class)}});
    }
    energy["carbon_footprints"] = nlohmann::json::array();
    for (const auto &c : info.energy.carbon_footprints) {
        energy["carbon_footprints"].push_back(
            {{"decimal_percentage", c.decimal_percentage}, {"energy_class", energy_class_to_string(c.energy_class)}});
    }
    if (info.energy.water_use_efficiency) {
        const auto &w = *info.energy.water_use_efficiency;
        nlohmann::json water = nlohmann::json::object();
        if (w.gpp) water["gpp"] = *w.gpp;
        if (w.penman_monteith_equation) water["penman_monteith_equation"] = *w.penman_monteith_equation;
        if (w.wer) water["wer"] = *w.wer;
        energy["water_use_efficiency"] = std::move(water);
    }

    nlohmann::json economy = nlohmann::json::object();
    economy["costs"] = nlohmann::json::array();
    for (const auto &c : info.economy.costs) {
        economy["costs"].push_back({{"usd", c.usd}, {"timespan", cost_timespan_to_string(c.timespan)}});
    }
    economy["roi"] = nlohmann::json::array();
    for (const auto &r : info.economy.roi) {
        economy["roi"].push_back({{"years", r.years}, {"energy_class", energy_class_to_string(r.energy_class)}});
    }

    json = nlohmann::json{{"energy", std::move(energy)}, {"economy", std::move(economy)}};
}

}  // namespace response
}  // namespace hearth
