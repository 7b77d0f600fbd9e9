#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace browser_interface {
namespace utils {

// Components of an absolute URI (RFC 3986 generic syntax)
struct UriComponents {
    std::string scheme;     // lower-cased
    std::string userinfo;
    std::string host;
    std::optional<std::uint16_t> port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    [[nodiscard]] bool has_authority() const { return !host.empty(); }
};

// URL utilities
class UrlUtils {
public:
    static std::optional<UriComponents> parse(std::string_view url);
    static std::optional<std::string> get_scheme(std::string_view url);
    static bool is_http_url(std::string_view url);

private:
    static bool is_valid_scheme(std::string_view scheme);
    static bool parse_authority(std::string_view authority, UriComponents& components);
};

} // namespace utils
} // namespace browser_interface
