#pragma once

/**
 * @file avahi_browser.hpp
 * @brief DNS-SD service browser backed by the Avahi client library
 *
 * Browsing and resolution run on an AvahiThreadedPoll. Every browse hit
 * (one per interface and protocol) starts a resolver; the resolved
 * addresses of an instance are merged and reported as a single
 * SERVICE_RESOLVED event once all of its resolvers have finished.
 */

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "i_service_browser.hpp"

namespace hearth {
namespace discovery {

/**
 * @brief Split "_hearth._tcp.local." into the DNS-SD type and browse domain.
 *
 * @return false unless the name has at least service, protocol and domain labels
 */
bool split_service_type(const std::string &service_type, std::string &type, std::string &domain);

// "light" + "_hearth._tcp" + "local" -> "light._hearth._tcp.local."
std::string make_fullname(const std::string &name, const std::string &type, const std::string &domain);

// TXT pairs; the first occurrence of a key wins, keys without '=' map to ""
std::map<std::string, std::string> txt_to_properties(AvahiStringList *txt);

/**
 * @brief Merges per-interface resolver results of service instances.
 */
class ResolutionTracker {
public:
    // A resolver was started for the instance
    void expect(const std::string &fullname);

    /**
     * @brief Record a finished resolver.
     *
     * @param partial the resolver's result, or nullptr when it failed
     * @return true with the merged service once no resolver of the instance is
     *         outstanding and at least one address is known
     */
    bool finish(const std::string &fullname, const ResolvedService *partial, ResolvedService &out);

    void forget(const std::string &fullname);
    void clear() { entries_.clear(); }

    size_t pending(const std::string &fullname) const;

private:
    struct Entry {
        size_t pending = 0;
        ResolvedService service;
    };

    std::map<std::string, Entry> entries_;
};

class AvahiBrowser : public IServiceBrowser {
public:
    AvahiBrowser();
    ~AvahiBrowser() override;

    AvahiBrowser(const AvahiBrowser &) = delete;
    AvahiBrowser &operator=(const AvahiBrowser &) = delete;

    bool open(const BrowseOptions &options, std::string &error) override;
    bool browse(const std::string &service_type, std::string &error) override;
    WaitResult next_event(std::chrono::milliseconds timeout, ServiceEvent &event) override;
    bool stop_browse(const std::string &service_type, std::string &error) override;

private:
    static void on_client(AvahiClient *client, AvahiClientState state, void *userdata);
    static void on_browse(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                          AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
                          AvahiLookupResultFlags flags, void *userdata);
    static void on_resolve(AvahiServiceResolver *resolver, AvahiIfIndex interface, AvahiProtocol protocol,
                           AvahiResolverEvent event, const char *name, const char *type, const char *domain,
                           const char *host_name, const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                           AvahiLookupResultFlags flags, void *userdata);

    bool interface_disabled(AvahiIfIndex interface) const;

    // Caller holds the poll lock, or the poll is stopped
    void free_lookups();

    void push_event(ServiceEvent event);
    void mark_disconnected();

    BrowseOptions options_;
    AvahiThreadedPoll *poll_;
    AvahiClient *client_;
    AvahiServiceBrowser *browser_;
    std::set<AvahiServiceResolver *> resolvers_;
    ResolutionTracker tracker_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ServiceEvent> events_;
    bool disconnected_;
};

}  // namespace discovery
}  // namespace hearth
