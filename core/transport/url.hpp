#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace hearth {
namespace transport {

// Drop one trailing '/' when the string is longer than one character
std::string_view slash_end(std::string_view s);

// Drop one leading '/' when the string is longer than one character
std::string_view slash_start(std::string_view s);

std::string_view slash_start_end(std::string_view s);

/**
 * @brief Join "{address}/{main_route}/{path}" with single separators.
 *
 * join_route("http://host:80/", "light/", "/on") == "http://host:80/light/on"
 */
std::string join_route(std::string_view address, std::string_view main_route, std::string_view path);

// Bracket IPv6 literals for use in an authority ("[fe80::1]")
std::string format_host(const std::string &ip);

// "{scheme}://{host}:{port}"
std::string make_base_url(const std::string &scheme, const std::string &ip, uint16_t port);

/**
 * @brief Split an absolute URL into "scheme://authority" and the path part.
 *
 * The path defaults to "/" when absent.
 * @return false if the URL has no scheme separator
 */
bool split_url(const std::string &url, std::string &base, std::string &path);

}  // namespace transport
}  // namespace hearth
