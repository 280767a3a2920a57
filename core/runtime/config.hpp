#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "discovery/discovery.hpp"
#include "events/event_task.hpp"
#include "policy/policy.hpp"
#include "transport/http_transport.hpp"

namespace hearth {
namespace runtime {

struct DiscoveryConfig {
    std::string domain = discovery::kDefaultDomain;
    std::string transport = "tcp";  // tcp or udp
    std::string tld = discovery::kDefaultTopLevelDomain;
    int timeout_ms = 2000;          // quiet period
    bool disable_ipv6 = false;
    std::vector<std::string> disable_ip;
    std::vector<std::string> disable_interface;
};

struct HttpConfig {
    int timeout_ms = 5000;  // connect, read and write
};

struct DevicePolicyConfig {
    size_t id = 0;
    std::vector<std::string> hazards;
};

struct PolicyConfig {
    std::vector<std::string> global;  // hazard names
    std::vector<DevicePolicyConfig> devices;
};

struct EventsConfig {
    bool enabled = false;
    size_t buffer_size = 32;
    int poll_interval_ms = 100;
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct ControllerConfig {
    DiscoveryConfig discovery;
    HttpConfig http;
    PolicyConfig policy;
    EventsConfig events;
    LoggingConfig logging;
};

// Loads configuration from a YAML file, then validates it
bool load_config(const std::string &config_path, ControllerConfig &config, std::string &error);

// Same as load_config, from YAML text
bool load_config_string(const std::string &yaml_text, ControllerConfig &config, std::string &error);

bool validate_config(const ControllerConfig &config, std::string &error);

// Policy described by the policy section; fails on unknown hazard names
bool build_policy(const PolicyConfig &config, policy::Policy &out, std::string &error);

discovery::Discovery build_discovery(const DiscoveryConfig &config);
transport::HttpTransportConfig build_http_config(const HttpConfig &config);
events::EventTaskConfig build_event_task_config(const EventsConfig &config);

}  // namespace runtime
}  // namespace hearth
