#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "common/hazards.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace runtime {

namespace {

// Scalar or sequence of strings
std::vector<std::string> read_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

bool check_hazard_names(const std::vector<std::string> &names, const std::string &where, std::string &error) {
    for (const auto &name : names) {
        if (!hazard_from_string(name)) {
            error = "Unknown hazard '" + name + "' in " + where;
            return false;
        }
    }
    return true;
}

bool parse_config(const YAML::Node &yaml, ControllerConfig &config, std::string &error) {
    if (yaml.IsNull()) {
        return validate_config(config, error);
    }
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"discovery", "http", "policy", "events", "logging"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    if (yaml["discovery"]) {
        const auto &node = yaml["discovery"];
        if (node["domain"]) {
            config.discovery.domain = node["domain"].as<std::string>();
        }
        if (node["transport"]) {
            config.discovery.transport = node["transport"].as<std::string>();
        }
        if (node["tld"]) {
            config.discovery.tld = node["tld"].as<std::string>();
        }
        if (node["timeout_ms"]) {
            config.discovery.timeout_ms = node["timeout_ms"].as<int>();
        }
        if (node["disable_ipv6"]) {
            config.discovery.disable_ipv6 = node["disable_ipv6"].as<bool>();
        }
        if (node["disable_ip"]) {
            config.discovery.disable_ip = read_string_list(node["disable_ip"]);
        }
        if (node["disable_interface"]) {
            config.discovery.disable_interface = read_string_list(node["disable_interface"]);
        }
    }

    if (yaml["http"]) {
        if (yaml["http"]["timeout_ms"]) {
            config.http.timeout_ms = yaml["http"]["timeout_ms"].as<int>();
        }
    }

    if (yaml["policy"]) {
        const auto &node = yaml["policy"];
        if (node["global"]) {
            config.policy.global = read_string_list(node["global"]);
        }
        if (node["devices"]) {
            config.policy.devices.clear();  // Ensure idempotent parsing
            for (const auto &device_node : node["devices"]) {
                if (!device_node["id"]) {
                    error = "policy.devices entry missing 'id' field";
                    return false;
                }
                DevicePolicyConfig device;
                device.id = device_node["id"].as<size_t>();
                if (device_node["hazards"]) {
                    device.hazards = read_string_list(device_node["hazards"]);
                }
                config.policy.devices.push_back(device);
            }
        }
    }

    if (yaml["events"]) {
        const auto &node = yaml["events"];
        if (node["enabled"]) {
            config.events.enabled = node["enabled"].as<bool>();
        }
        if (node["buffer_size"]) {
            config.events.buffer_size = node["buffer_size"].as<size_t>();
        }
        if (node["poll_interval_ms"]) {
            config.events.poll_interval_ms = node["poll_interval_ms"].as<int>();
        }
    }

    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Discovery: _" << config.discovery.domain << "._" << config.discovery.transport << "."
                                     << config.discovery.tld << ". (quiet period " << config.discovery.timeout_ms
                                     << "ms)");
    LOG_INFO("[Config] Policy: " << config.policy.global.size() << " global hazard(s), "
                                 << config.policy.devices.size() << " device rule(s)");

    std::stringstream events_msg;
    events_msg << "[Config] Events: " << (config.events.enabled ? "enabled" : "disabled");
    if (config.events.enabled) {
        events_msg << " (buffer " << config.events.buffer_size << ")";
    }
    LOG_INFO(events_msg.str());
    LOG_INFO("[Config] Log level: " << config.logging.level);
    return true;
}

}  // namespace

bool validate_config(const ControllerConfig &config, std::string &error) {
    if (config.discovery.domain.empty()) {
        error = "discovery.domain must not be empty";
        return false;
    }
    if (!discovery::transport_protocol_from_string(config.discovery.transport)) {
        error = "Invalid discovery transport: " + config.discovery.transport + " (expected tcp or udp)";
        return false;
    }
    if (config.discovery.tld.empty()) {
        error = "discovery.tld must not be empty";
        return false;
    }
    if (config.discovery.timeout_ms < 100) {
        error = "discovery timeout must be >= 100ms";
        return false;
    }

    if (config.http.timeout_ms < 100) {
        error = "http timeout must be >= 100ms";
        return false;
    }

    if (!check_hazard_names(config.policy.global, "policy.global", error)) {
        return false;
    }
    for (const auto &device : config.policy.devices) {
        if (!check_hazard_names(device.hazards, "policy.devices[" + std::to_string(device.id) + "]", error)) {
            return false;
        }
    }

    if (config.events.buffer_size < 1) {
        error = "events.buffer_size must be at least 1";
        return false;
    }
    if (config.events.poll_interval_ms < 10 || config.events.poll_interval_ms > 10000) {
        error = "events.poll_interval_ms must be between 10 and 10000";
        return false;
    }

    const std::string &level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error" && level != "none") {
        error = "Invalid log level: " + level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ControllerConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        return parse_config(yaml, config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_string(const std::string &yaml_text, ControllerConfig &config, std::string &error) {
    try {
        return parse_config(YAML::Load(yaml_text), config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool build_policy(const PolicyConfig &config, policy::Policy &out, std::string &error) {
    Hazards global;
    for (const auto &name : config.global) {
        auto hazard = hazard_from_string(name);
        if (!hazard) {
            error = "Unknown hazard '" + name + "' in policy.global";
            return false;
        }
        global.insert(*hazard);
    }

    policy::Policy result(std::move(global));
    for (const auto &device : config.devices) {
        Hazards hazards;
        for (const auto &name : device.hazards) {
            auto hazard = hazard_from_string(name);
            if (!hazard) {
                error = "Unknown hazard '" + name + "' for device " + std::to_string(device.id);
                return false;
            }
            hazards.insert(*hazard);
        }
        result = std::move(result).block_device_on_hazards(device.id, hazards);
    }

    out = std::move(result);
    return true;
}

discovery::Discovery build_discovery(const DiscoveryConfig &config) {
    discovery::Discovery result(config.domain);
    result.transport(discovery::transport_protocol_from_string(config.transport).value_or(discovery::TransportProtocol::TCP))
        .top_level_domain(config.tld)
        .timeout(std::chrono::milliseconds(config.timeout_ms));
    if (config.disable_ipv6) {
        result.disable_ipv6();
    }
    for (const auto &ip : config.disable_ip) {
        result.disable_ip(ip);
    }
    for (const auto &name : config.disable_interface) {
        result.disable_network_interface(name);
    }
    return result;
}

transport::HttpTransportConfig build_http_config(const HttpConfig &config) {
    transport::HttpTransportConfig result;
    result.connection_timeout_ms = config.timeout_ms;
    result.read_timeout_ms = config.timeout_ms;
    result.write_timeout_ms = config.timeout_ms;
    return result;
}

events::EventTaskConfig build_event_task_config(const EventsConfig &config) {
    events::EventTaskConfig result;
    result.poll_interval_ms = config.poll_interval_ms;
    return result;
}

}  // namespace runtime
}  // namespace hearth
