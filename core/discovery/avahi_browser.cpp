#include "avahi_browser.hpp"

#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <net/if.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace hearth {
namespace discovery {

namespace {

std::vector<std::string> split_labels(const std::string &name) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (start < name.size()) {
        const size_t dot = name.find('.', start);
        const size_t end = dot == std::string::npos ? name.size() : dot;
        labels.push_back(name.substr(start, end - start));
        start = end + 1;
    }
    return labels;
}

std::string strip_trailing_dot(std::string name) {
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    return name;
}

std::string client_error(AvahiClient *client) { return avahi_strerror(avahi_client_errno(client)); }

}  // namespace

bool split_service_type(const std::string &service_type, std::string &type, std::string &domain) {
    const auto labels = split_labels(strip_trailing_dot(service_type));
    if (labels.size() < 3) {
        return false;
    }
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].empty() || (i < 2 && labels[i][0] != '_')) {
            return false;
        }
    }

    type = labels[0] + "." + labels[1];
    domain = labels[2];
    for (size_t i = 3; i < labels.size(); ++i) {
        domain += "." + labels[i];
    }
    return true;
}

std::string make_fullname(const std::string &name, const std::string &type, const std::string &domain) {
    return name + "." + type + "." + strip_trailing_dot(domain) + ".";
}

std::map<std::string, std::string> txt_to_properties(AvahiStringList *txt) {
    std::map<std::string, std::string> properties;
    for (AvahiStringList *item = txt; item != nullptr; item = avahi_string_list_get_next(item)) {
        char *key = nullptr;
        char *value = nullptr;
        if (avahi_string_list_get_pair(item, &key, &value, nullptr) != 0) {
            continue;
        }
        properties.emplace(key, value != nullptr ? value : "");
        avahi_free(key);
        avahi_free(value);
    }
    return properties;
}

void ResolutionTracker::expect(const std::string &fullname) { ++entries_[fullname].pending; }

bool ResolutionTracker::finish(const std::string &fullname, const ResolvedService *partial, ResolvedService &out) {
    Entry &entry = entries_[fullname];
    if (entry.pending > 0) {
        --entry.pending;
    }

    ResolvedService &service = entry.service;
    service.fullname = fullname;
    if (partial != nullptr) {
        if (service.hostname.empty()) {
            service.hostname = partial->hostname;
        }
        if (service.port == 0) {
            service.port = partial->port;
        }
        service.properties.insert(partial->properties.begin(), partial->properties.end());
        for (const auto &address : partial->addresses) {
            if (std::find(service.addresses.begin(), service.addresses.end(), address) == service.addresses.end()) {
                service.addresses.push_back(address);
            }
        }
    }

    if (entry.pending > 0 || service.addresses.empty()) {
        return false;
    }
    out = service;
    return true;
}

void ResolutionTracker::forget(const std::string &fullname) { entries_.erase(fullname); }

size_t ResolutionTracker::pending(const std::string &fullname) const {
    auto it = entries_.find(fullname);
    return it == entries_.end() ? 0 : it->second.pending;
}

AvahiBrowser::AvahiBrowser() : poll_(nullptr), client_(nullptr), browser_(nullptr), disconnected_(false) {}

AvahiBrowser::~AvahiBrowser() {
    if (poll_ != nullptr) {
        avahi_threaded_poll_stop(poll_);
    }
    free_lookups();
    if (client_ != nullptr) {
        avahi_client_free(client_);
    }
    if (poll_ != nullptr) {
        avahi_threaded_poll_free(poll_);
    }
}

bool AvahiBrowser::open(const BrowseOptions &options, std::string &error) {
    if (client_ != nullptr) {
        error = "Avahi browser already open";
        return false;
    }
    options_ = options;

    poll_ = avahi_threaded_poll_new();
    if (poll_ == nullptr) {
        error = "cannot create Avahi event loop";
        return false;
    }

    int avahi_error = 0;
    client_ = avahi_client_new(avahi_threaded_poll_get(poll_), static_cast<AvahiClientFlags>(0),
                               &AvahiBrowser::on_client, this, &avahi_error);
    if (client_ == nullptr) {
        error = std::string("cannot connect to the Avahi daemon: ") + avahi_strerror(avahi_error);
        avahi_threaded_poll_free(poll_);
        poll_ = nullptr;
        return false;
    }

    if (avahi_threaded_poll_start(poll_) < 0) {
        error = "cannot start Avahi event loop";
        avahi_client_free(client_);
        client_ = nullptr;
        avahi_threaded_poll_free(poll_);
        poll_ = nullptr;
        return false;
    }

    LOG_DEBUG("[Avahi] Connected to daemon " << avahi_client_get_version_string(client_));
    return true;
}

bool AvahiBrowser::browse(const std::string &service_type, std::string &error) {
    if (client_ == nullptr) {
        error = "Avahi browser not open";
        return false;
    }

    std::string type;
    std::string domain;
    if (!split_service_type(service_type, type, domain)) {
        error = "invalid service type `" + service_type + "`";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        disconnected_ = false;
        ServiceEvent started;
        started.type = ServiceEventType::SEARCH_STARTED;
        started.fullname = service_type;
        events_.push_back(std::move(started));
    }

    avahi_threaded_poll_lock(poll_);
    if (browser_ != nullptr) {
        avahi_threaded_poll_unlock(poll_);
        error = "a browse is already running";
        return false;
    }
    const AvahiProtocol protocol = options_.disable_ipv6 ? AVAHI_PROTO_INET : AVAHI_PROTO_UNSPEC;
    browser_ = avahi_service_browser_new(client_, AVAHI_IF_UNSPEC, protocol, type.c_str(), domain.c_str(),
                                         static_cast<AvahiLookupFlags>(0), &AvahiBrowser::on_browse, this);
    if (browser_ == nullptr) {
        error = "cannot browse " + service_type + ": " + client_error(client_);
    }
    avahi_threaded_poll_unlock(poll_);

    if (browser_ == nullptr) {
        return false;
    }
    LOG_INFO("[Avahi] Browsing " << type << " in " << domain);
    return true;
}

WaitResult AvahiBrowser::next_event(std::chrono::milliseconds timeout, ServiceEvent &event) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || disconnected_; });

    if (!events_.empty()) {
        event = std::move(events_.front());
        events_.pop_front();
        return WaitResult::EVENT;
    }
    return disconnected_ ? WaitResult::DISCONNECTED : WaitResult::TIMEOUT;
}

bool AvahiBrowser::stop_browse(const std::string &service_type, std::string &error) {
    if (poll_ == nullptr) {
        error = "no browse running for " + service_type;
        return false;
    }

    avahi_threaded_poll_lock(poll_);
    const bool running = browser_ != nullptr;
    free_lookups();
    avahi_threaded_poll_unlock(poll_);

    if (!running) {
        error = "no browse running for " + service_type;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ServiceEvent stopped;
        stopped.type = ServiceEventType::SEARCH_STOPPED;
        stopped.fullname = service_type;
        events_.push_back(std::move(stopped));
        disconnected_ = true;
    }
    cv_.notify_all();
    LOG_DEBUG("[Avahi] Stopped browsing " << service_type);
    return true;
}

void AvahiBrowser::on_client(AvahiClient *client, AvahiClientState state, void *userdata) {
    auto *self = static_cast<AvahiBrowser *>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
        LOG_ERROR("[Avahi] Daemon connection failed: " << client_error(client));
        self->mark_disconnected();
    }
}

void AvahiBrowser::on_browse(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                             AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
                             AvahiLookupResultFlags, void *userdata) {
    auto *self = static_cast<AvahiBrowser *>(userdata);
    AvahiClient *client = avahi_service_browser_get_client(browser);

    switch (event) {
        case AVAHI_BROWSER_NEW: {
            if (self->interface_disabled(interface)) {
                return;
            }
            const std::string fullname = make_fullname(name, type, domain);

            ServiceEvent found;
            found.type = ServiceEventType::SERVICE_FOUND;
            found.fullname = fullname;
            self->push_event(std::move(found));

            AvahiServiceResolver *resolver =
                avahi_service_resolver_new(client, interface, protocol, name, type, domain, protocol,
                                           static_cast<AvahiLookupFlags>(0), &AvahiBrowser::on_resolve, self);
            if (resolver == nullptr) {
                LOG_WARN("[Avahi] Cannot resolve " << fullname << ": " << client_error(client));
                return;
            }
            self->resolvers_.insert(resolver);
            self->tracker_.expect(fullname);
            break;
        }
        case AVAHI_BROWSER_REMOVE: {
            ServiceEvent removed;
            removed.type = ServiceEventType::SERVICE_REMOVED;
            removed.fullname = make_fullname(name, type, domain);
            if (self->tracker_.pending(removed.fullname) == 0) {
                self->tracker_.forget(removed.fullname);
            }
            self->push_event(std::move(removed));
            break;
        }
        case AVAHI_BROWSER_FAILURE:
            LOG_ERROR("[Avahi] Browse failed: " << client_error(client));
            self->mark_disconnected();
            break;
        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
        default:
            break;
    }
}

void AvahiBrowser::on_resolve(AvahiServiceResolver *resolver, AvahiIfIndex, AvahiProtocol, AvahiResolverEvent event,
                              const char *name, const char *type, const char *domain, const char *host_name,
                              const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                              AvahiLookupResultFlags, void *userdata) {
    auto *self = static_cast<AvahiBrowser *>(userdata);
    const std::string fullname = make_fullname(name, type, domain);

    ResolvedService merged;
    bool complete = false;
    if (event == AVAHI_RESOLVER_FOUND) {
        ResolvedService partial;
        partial.fullname = fullname;
        partial.hostname = host_name != nullptr ? strip_trailing_dot(host_name) + "." : "";
        partial.port = port;
        partial.properties = txt_to_properties(txt);

        char text[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(text, sizeof(text), address);
        const bool ipv6 = address->proto == AVAHI_PROTO_INET6;
        if (ipv6 && self->options_.disable_ipv6) {
            LOG_DEBUG("[Avahi] Ignoring IPv6 address " << text << " of " << fullname);
        } else if (self->options_.disabled_ips.count(text) > 0) {
            LOG_DEBUG("[Avahi] Ignoring disabled address " << text << " of " << fullname);
        } else {
            partial.addresses.emplace_back(text);
        }
        complete = self->tracker_.finish(fullname, &partial, merged);
    } else {
        LOG_DEBUG("[Avahi] Resolving " << fullname << " failed: "
                                       << client_error(avahi_service_resolver_get_client(resolver)));
        complete = self->tracker_.finish(fullname, nullptr, merged);
    }

    self->resolvers_.erase(resolver);
    avahi_service_resolver_free(resolver);

    if (complete) {
        LOG_DEBUG("[Avahi] Resolved " << fullname << " -> " << merged.hostname << ":" << merged.port);
        ServiceEvent resolved;
        resolved.type = ServiceEventType::SERVICE_RESOLVED;
        resolved.fullname = fullname;
        resolved.service = std::move(merged);
        self->push_event(std::move(resolved));
    }
}

bool AvahiBrowser::interface_disabled(AvahiIfIndex interface) const {
    if (interface < 0 || options_.disabled_interfaces.empty()) {
        return false;
    }
    char name[IF_NAMESIZE] = {};
    if (if_indextoname(static_cast<unsigned int>(interface), name) == nullptr) {
        return false;
    }
    return options_.disabled_interfaces.count(name) > 0;
}

void AvahiBrowser::free_lookups() {
    for (AvahiServiceResolver *resolver : resolvers_) {
        avahi_service_resolver_free(resolver);
    }
    resolvers_.clear();
    tracker_.clear();
    if (browser_ != nullptr) {
        avahi_service_browser_free(browser_);
        browser_ = nullptr;
    }
}

void AvahiBrowser::push_event(ServiceEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void AvahiBrowser::mark_disconnected() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected_ = true;
    }
    cv_.notify_all();
}

}  // namespace discovery
}  // namespace hearth
