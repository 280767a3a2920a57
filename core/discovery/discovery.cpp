#include "discovery.hpp"

#include <algorithm>
#include <utility>

#include "device/descriptor.hpp"
#include "device/request.hpp"
#include "logging/logger.hpp"
#include "transport/url.hpp"

namespace hearth {
namespace discovery {

namespace {

std::string scheme_of(const ResolvedService &service) {
    auto it = service.properties.find("scheme");
    return it != service.properties.end() && !it->second.empty() ? it->second : "http";
}

}  // namespace

const char *transport_protocol_to_string(TransportProtocol protocol) {
    return protocol == TransportProtocol::UDP ? "udp" : "tcp";
}

std::optional<TransportProtocol> transport_protocol_from_string(const std::string &name) {
    if (name == "tcp" || name == "TCP") return TransportProtocol::TCP;
    if (name == "udp" || name == "UDP") return TransportProtocol::UDP;
    return std::nullopt;
}

Discovery::Discovery(std::string domain)
    : domain_(std::move(domain)), transport_(TransportProtocol::TCP), tld_(kDefaultTopLevelDomain), timeout_(kDefaultTimeout) {}

Discovery &Discovery::domain(std::string domain) {
    domain_ = std::move(domain);
    return *this;
}

Discovery &Discovery::transport(TransportProtocol protocol) {
    transport_ = protocol;
    return *this;
}

Discovery &Discovery::top_level_domain(std::string tld) {
    tld_ = std::move(tld);
    return *this;
}

Discovery &Discovery::timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    return *this;
}

Discovery &Discovery::disable_ipv6() {
    browse_options_.disable_ipv6 = true;
    return *this;
}

Discovery &Discovery::disable_ip(std::string ip) {
    browse_options_.disabled_ips.insert(std::move(ip));
    return *this;
}

Discovery &Discovery::disable_network_interface(std::string name) {
    browse_options_.disabled_interfaces.insert(std::move(name));
    return *this;
}

std::string Discovery::service_type() const {
    return "_" + domain_ + "._" + transport_protocol_to_string(transport_) + "." + tld_ + ".";
}

bool Discovery::collect_services(IServiceBrowser &browser, std::vector<ResolvedService> &out, Error &error) const {
    const std::string type = service_type();
    std::string browser_error;

    if (!browser.open(browse_options_, browser_error)) {
        error = Error(ErrorKind::DISCOVERY, "cannot open browse session: " + browser_error);
        return false;
    }
    if (!browser.browse(type, browser_error)) {
        error = Error(ErrorKind::DISCOVERY, "cannot browse " + type + ": " + browser_error);
        return false;
    }

    out.clear();
    while (true) {
        ServiceEvent event;
        const WaitResult result = browser.next_event(timeout_, event);
        if (result == WaitResult::TIMEOUT) {
            LOG_DEBUG("[Discovery] Quiet period elapsed");
            break;
        }
        if (result == WaitResult::DISCONNECTED) {
            LOG_DEBUG("[Discovery] Browse session disconnected");
            break;
        }
        if (event.type != ServiceEventType::SERVICE_RESOLVED) {
            continue;
        }

        const ResolvedService &service = event.service;
        if (service.addresses.empty()) {
            LOG_WARN("[Discovery] Service " << service.fullname << " has no addresses, skipping");
            continue;
        }

        const bool duplicate = std::any_of(out.begin(), out.end(),
                                           [&service](const ResolvedService &other) { return is_duplicate(other, service); });
        if (duplicate) {
            LOG_DEBUG("[Discovery] Dropping duplicate " << service.fullname);
            continue;
        }

        LOG_INFO("[Discovery] Found " << service.fullname << " on port " << service.port);
        out.push_back(service);
    }

    if (!browser.stop_browse(type, browser_error)) {
        error = Error(ErrorKind::DISCOVERY, "cannot stop browsing " + type + ": " + browser_error);
        return false;
    }
    return true;
}

bool Discovery::discover(IServiceBrowser &browser, transport::IHttpTransport &http, device::Devices &out,
                         Error &error) const {
    std::vector<ResolvedService> services;
    if (!collect_services(browser, services, error)) {
        return false;
    }

    device::Devices devices;
    for (const auto &service : services) {
        auto device = materialize_device(service, http);
        if (device) {
            devices.add(std::move(*device));
        }
    }

    LOG_INFO("[Discovery] " << devices.size() << " device(s) discovered");
    out = std::move(devices);
    return true;
}

bool is_duplicate(const ResolvedService &a, const ResolvedService &b) {
    if (a.port != b.port) {
        return false;
    }
    if (a.fullname == b.fullname) {
        return true;
    }
    for (const auto &address : a.addresses) {
        if (std::find(b.addresses.begin(), b.addresses.end(), address) != b.addresses.end()) {
            return true;
        }
    }
    return false;
}

std::optional<device::Device> materialize_device(const ResolvedService &service, transport::IHttpTransport &http) {
    const std::string scheme = scheme_of(service);

    for (const auto &address : service.addresses) {
        const std::string base_url = transport::make_base_url(scheme, address, service.port);

        transport::HttpRequest request;
        request.method = transport::HttpMethod::GET;
        request.url = base_url;
        request.headers.emplace_back("Connection", "close");

        transport::HttpResponse response;
        std::string error;
        if (!http.send(request, response, error)) {
            LOG_WARN("[Discovery] " << base_url << " unreachable: " << error);
            continue;
        }
        if (response.status < 200 || response.status >= 300) {
            LOG_WARN("[Discovery] " << base_url << " answered status " << response.status);
            continue;
        }

        device::DeviceData data;
        if (!device::parse_device_data(response.body, data, error)) {
            LOG_WARN("[Discovery] Invalid descriptor from " << base_url << ": " << error);
            continue;
        }

        if (!data.wifi_mac && !data.ethernet_mac) {
            LOG_WARN("[Discovery] Descriptor from " << base_url << " has no MAC address, rejecting device");
            continue;
        }
        if (data.route_configs.size() < data.mandatory_routes) {
            LOG_WARN("[Discovery] Descriptor from " << base_url << " declares " << data.route_configs.size()
                                                   << " routes, fewer than its "
                                                   << static_cast<int>(data.mandatory_routes) << " mandatory ones");
        }

        device::Requests requests =
            device::create_requests(data.route_configs, base_url, data.main_route, data.environment);

        device::NetworkInformation network_info;
        network_info.name = service.fullname;
        network_info.addresses.insert(service.addresses.begin(), service.addresses.end());
        network_info.wifi_mac = data.wifi_mac;
        network_info.ethernet_mac = data.ethernet_mac;
        network_info.port = service.port;
        network_info.properties = service.properties;
        network_info.last_reachable_address = base_url;

        device::Description description;
        description.kind = data.kind;
        description.environment = data.environment;
        description.main_route = data.main_route;
        description.description = data.description;

        LOG_INFO("[Discovery] Device " << service.fullname << " (" << device::device_kind_to_string(data.kind)
                                       << ") ready at " << base_url);
        return device::Device(std::move(network_info), std::move(description), std::move(requests),
                              std::move(data.events_description));
    }

    LOG_WARN("[Discovery] No reachable address for " << service.fullname);
    return std::nullopt;
}

}  // namespace discovery
}  // namespace hearth
