#ifndef HEARTH_DISCOVERY_DISCOVERY_HPP
#define HEARTH_DISCOVERY_DISCOVERY_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/error.hpp"
#include "device/device.hpp"
#include "discovery/i_service_browser.hpp"
#include "transport/i_http_transport.hpp"

namespace hearth {
namespace discovery {

enum class TransportProtocol { TCP, UDP };

const char *transport_protocol_to_string(TransportProtocol protocol);
std::optional<TransportProtocol> transport_protocol_from_string(const std::string &name);

constexpr const char *kDefaultDomain = "hearth";
constexpr const char *kDefaultTopLevelDomain = "local";
constexpr std::chrono::milliseconds kDefaultTimeout{2000};

/**
 * @brief Network scan configuration and algorithm.
 *
 * Setters return *this so a configuration reads as one chain:
 *   Discovery("hearth").timeout(std::chrono::seconds(1)).disable_ipv6();
 */
class Discovery {
public:
    explicit Discovery(std::string domain = kDefaultDomain);

    Discovery &domain(std::string domain);
    Discovery &transport(TransportProtocol protocol);
    Discovery &top_level_domain(std::string tld);
    Discovery &timeout(std::chrono::milliseconds timeout);
    Discovery &disable_ipv6();
    Discovery &disable_ip(std::string ip);
    Discovery &disable_network_interface(std::string name);

    const std::string &domain() const { return domain_; }
    TransportProtocol transport() const { return transport_; }
    const std::string &top_level_domain() const { return tld_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const BrowseOptions &browse_options() const { return browse_options_; }

    // "_{domain}._{tcp|udp}.{tld}."
    std::string service_type() const;

    /**
     * @brief Scan the network and materialize every reachable device.
     *
     * @return false with a DISCOVERY error if the browse session cannot be
     *         opened, started or stopped; per-device failures only drop that device
     */
    bool discover(IServiceBrowser &browser, transport::IHttpTransport &http, device::Devices &out,
                  Error &error) const;

    /**
     * @brief Collect resolved services until the quiet period elapses.
     *
     * Services without addresses and duplicates are dropped.
     */
    bool collect_services(IServiceBrowser &browser, std::vector<ResolvedService> &out, Error &error) const;

private:
    std::string domain_;
    TransportProtocol transport_;
    std::string tld_;
    std::chrono::milliseconds timeout_;
    BrowseOptions browse_options_;
};

/**
 * @brief Same physical device advertised twice.
 *
 * Requires an equal port, then either a shared address or an equal full name.
 */
bool is_duplicate(const ResolvedService &a, const ResolvedService &b);

/**
 * @brief Fetch the descriptor from each address in turn; first success wins.
 *
 * A descriptor without any MAC rejects that address. Fewer routes than
 * the declared mandatory count only logs a warning.
 */
std::optional<device::Device> materialize_device(const ResolvedService &service, transport::IHttpTransport &http);

}  // namespace discovery
}  // namespace hearth

#endif  // HEARTH_DISCOVERY_DISCOVERY_HPP
