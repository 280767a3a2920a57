#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace hearth {
namespace discovery {

struct BrowseOptions {
    bool disable_ipv6 = false;
    std::set<std::string> disabled_ips;
    std::set<std::string> disabled_interfaces;
};

// A fully resolved service instance (SRV + TXT + addresses)
struct ResolvedService {
    std::string fullname;  // e.g. "light._hearth._tcp.local."
    std::string hostname;
    std::vector<std::string> addresses;  // in resolution order, no duplicates
    uint16_t port = 0;
    std::map<std::string, std::string> properties;
};

enum class ServiceEventType { SEARCH_STARTED, SERVICE_FOUND, SERVICE_RESOLVED, SERVICE_REMOVED, SEARCH_STOPPED };

struct ServiceEvent {
    ServiceEventType type = ServiceEventType::SEARCH_STARTED;
    std::string fullname;
    ResolvedService service;  // set for SERVICE_RESOLVED
};

enum class WaitResult { EVENT, TIMEOUT, DISCONNECTED };

/**
 * @brief Service-advertisement browse session.
 *
 * Lifecycle: open() -> browse() -> next_event()* -> stop_browse().
 */
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    virtual bool open(const BrowseOptions &options, std::string &error) = 0;
    virtual bool browse(const std::string &service_type, std::string &error) = 0;

    // Blocks for at most timeout waiting for the next event
    virtual WaitResult next_event(std::chrono::milliseconds timeout, ServiceEvent &event) = 0;

    virtual bool stop_browse(const std::string &service_type, std::string &error) = 0;
};

using ServiceBrowserFactory = std::function<std::unique_ptr<IServiceBrowser>()>;

}  // namespace discovery
}  // namespace hearth
