#pragma once

#include "browser_interface/core/models.hpp"
#include "browser_interface/services/query_parameters.hpp"
#include "browser_interface/utils/string_filter.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace browser_interface {
namespace services {

/**
 * @brief Assembles a launchable http(s) url from a base url and query parameters
 *
 * The base is validated before anything is removed from it. Forbidden
 * characters are then stripped from the base and from every key and value.
 * Two keys that end up with the same text are rejected instead of one
 * silently overwriting the other.
 */
class UrlBuilder {
public:
    UrlBuilder(utils::ForbiddenCharacters forbidden, std::string separator = "&");

    /**
     * @brief Build the final url
     * @return the url, MalformedUrl if the base is not an http(s) url,
     *         KeyCollision if two filtered keys coincide
     */
    std::expected<std::string, core::BrowserError>
    build(std::string_view base, const QueryParameters& params = {}) const;

private:
    std::expected<std::string, core::BrowserError> validate_base(std::string_view base) const;
    std::expected<std::string, core::BrowserError> build_query(const QueryParameters& params) const;

    utils::ForbiddenCharacters m_forbidden;
    std::string m_separator;
};

} // namespace services
} // namespace browser_interface
