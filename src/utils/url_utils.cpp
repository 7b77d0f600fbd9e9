#include "browser_interface/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace browser_interface {
namespace utils {

namespace {
    bool is_space_or_control(char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isspace(uc) || std::iscntrl(uc);
    }

    bool is_host_char(char c) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || uc >= 0x80) {
            return true;
        }
        switch (c) {
            case '-': case '.': case '_': case '~': case '%':
            case '!': case '$': case '&': case '\'': case '(': case ')':
            case '*': case '+': case ',': case ';': case '=':
                return true;
            default:
                return false;
        }
    }

    std::string to_lower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

std::optional<UriComponents> UrlUtils::parse(std::string_view url) {
    if (url.empty()) {
        return std::nullopt;
    }

    size_t scheme_end = url.find(':');
    if (scheme_end == std::string_view::npos || !is_valid_scheme(url.substr(0, scheme_end))) {
        return std::nullopt;
    }

    UriComponents components;
    components.scheme = to_lower(url.substr(0, scheme_end));

    std::string_view rest = url.substr(scheme_end + 1);

    // Fragment and query are opaque; split them off before validating the rest
    if (size_t hash = rest.find('#'); hash != std::string_view::npos) {
        components.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (size_t question = rest.find('?'); question != std::string_view::npos) {
        components.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (std::any_of(rest.begin(), rest.end(), is_space_or_control)) {
        return std::nullopt;
    }

    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        size_t authority_end = rest.find('/');
        std::string_view authority = rest.substr(0, authority_end);
        if (!parse_authority(authority, components)) {
            return std::nullopt;
        }
        rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
    }

    components.path = std::string(rest);

    const bool is_http = components.scheme == "http" || components.scheme == "https";
    if (is_http && !components.has_authority()) {
        return std::nullopt;
    }

    return components;
}

std::optional<std::string> UrlUtils::get_scheme(std::string_view url) {
    auto components = parse(url);
    if (!components) {
        return std::nullopt;
    }
    return components->scheme;
}

bool UrlUtils::is_http_url(std::string_view url) {
    auto scheme = get_scheme(url);
    return scheme && (*scheme == "http" || *scheme == "https");
}

bool UrlUtils::is_valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

bool UrlUtils::parse_authority(std::string_view authority, UriComponents& components) {
    if (size_t at = authority.rfind('@'); at != std::string_view::npos) {
        components.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;

    if (authority.starts_with('[')) {
        // IP literal
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = authority.substr(0, close + 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return false;
            }
            port = after.substr(1);
        }
    } else if (size_t colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
        if (!std::all_of(host.begin(), host.end(), is_host_char)) {
            return false;
        }
    } else if (!std::all_of(host.begin(), host.end(), is_host_char)) {
        return false;
    }

    if (host.empty() || host == "[]") {
        return false;
    }

    if (!port.empty()) {
        std::uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size()) {
            return false;
        }
        components.port = value;
    }

    components.host = std::string(host);
    return true;
}

} // namespace utils
} // namespace browser_interface
