#include "url.hpp"

namespace hearth {
namespace transport {

std::string_view slash_end(std::string_view s) {
    if (s.size() > 1 && s.back() == '/') {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view slash_start(std::string_view s) {
    if (s.size() > 1 && s.front() == '/') {
        s.remove_prefix(1);
    }
    return s;
}

std::string_view slash_start_end(std::string_view s) { return slash_start(slash_end(s)); }

std::string join_route(std::string_view address, std::string_view main_route, std::string_view path) {
    std::string route(slash_end(address));
    route += '/';
    route += slash_start_end(main_route);
    route += '/';
    route += slash_start_end(path);
    return route;
}

std::string format_host(const std::string &ip) {
    if (ip.find(':') != std::string::npos && (ip.empty() || ip.front() != '[')) {
        return "[" + ip + "]";
    }
    return ip;
}

std::string make_base_url(const std::string &scheme, const std::string &ip, uint16_t port) {
    return scheme + "://" + format_host(ip) + ":" + std::to_string(port);
}

bool split_url(const std::string &url, std::string &base, std::string &path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }

    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        base = url;
        path = "/";
    } else {
        base = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return base.size() > scheme_end + 3;
}

}  // namespace transport
}  // namespace hearth
