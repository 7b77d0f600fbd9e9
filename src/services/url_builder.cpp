#include "browser_interface/services/url_builder.hpp"
#include "browser_interface/utils/logger.hpp"
#include "browser_interface/utils/url_utils.hpp"

#include <unordered_set>

namespace browser_interface {
namespace services {

namespace {
    bool is_http_scheme(const std::string& scheme) {
        return scheme == "http" || scheme == "https";
    }
}

UrlBuilder::UrlBuilder(utils::ForbiddenCharacters forbidden, std::string separator)
    : m_forbidden(std::move(forbidden)), m_separator(std::move(separator)) {}

std::expected<std::string, core::BrowserError>
UrlBuilder::build(std::string_view base, const QueryParameters& params) const {
    auto url = validate_base(base);
    if (!url) {
        return url;
    }

    auto query = build_query(params);
    if (!query) {
        return query;
    }

    if (query->empty()) {
        return url;
    }

    // Keep a fragment at the very end
    std::string fragment;
    if (size_t hash = url->find('#'); hash != std::string::npos) {
        fragment = url->substr(hash);
        url->erase(hash);
    }

    if (url->find('?') == std::string::npos) {
        url->push_back('?');
    } else if (url->back() != '?') {
        url->append(m_separator);
    }

    url->append(*query);
    url->append(fragment);
    return url;
}

std::expected<std::string, core::BrowserError>
UrlBuilder::validate_base(std::string_view base) const {
    if (base.empty()) {
        BI_LOG_WARNING("UrlBuilder", "Empty url");
        return std::unexpected(core::BrowserError::MalformedUrl);
    }

    auto components = utils::UrlUtils::parse(base);
    if (!components) {
        BI_LOG_WARNING("UrlBuilder", "Malformed url: " + std::string(base));
        return std::unexpected(core::BrowserError::MalformedUrl);
    }

    if (!is_http_scheme(components->scheme)) {
        BI_LOG_WARNING("UrlBuilder", "Expected http(s) url, got " + components->scheme);
        return std::unexpected(core::BrowserError::MalformedUrl);
    }

    std::string filtered = utils::filter(base, m_forbidden);
    if (filtered.size() != base.size()) {
        BI_LOG_DEBUG("UrlBuilder", "Removed " + std::to_string(base.size() - filtered.size()) +
                     " forbidden character(s) from url");

        // Removal must not have broken the url
        auto reparsed = utils::UrlUtils::parse(filtered);
        if (!reparsed || !is_http_scheme(reparsed->scheme)) {
            BI_LOG_WARNING("UrlBuilder", "Url is malformed after filtering: " + filtered);
            return std::unexpected(core::BrowserError::MalformedUrl);
        }
    }

    return filtered;
}

std::expected<std::string, core::BrowserError>
UrlBuilder::build_query(const QueryParameters& params) const {
    std::string query;
    std::unordered_set<std::string> seen_keys;

    for (const auto& [raw_key, raw_value] : params) {
        std::string key = utils::filter(raw_key.to_text(), m_forbidden);
        if (key.empty()) {
            BI_LOG_DEBUG("UrlBuilder", "Dropping query parameter with empty key");
            continue;
        }

        if (!seen_keys.insert(key).second) {
            BI_LOG_WARNING("UrlBuilder", "Query key collision on '" + key + "'");
            return std::unexpected(core::BrowserError::KeyCollision);
        }

        query.append(key)
             .append("=")
             .append(utils::filter(raw_value.to_text(), m_forbidden))
             .append(m_separator);
    }

    if (!query.empty()) {
        query.resize(query.size() - m_separator.size());
    }

    return query;
}

} // namespace services
} // namespace browser_interface
