#include "browser_interface/services/browser_handler.hpp"
#include "browser_interface/services/url_builder.hpp"
#include "browser_interface/utils/logger.hpp"

namespace browser_interface {
namespace services {

HandlerOptions HandlerOptions::from_config(const core::LauncherConfig& config) {
    HandlerOptions options;
    options.mechanism = config.mechanism;
    options.warn_on_failure = config.warn_on_failure;
    return options;
}

BrowserHandler::BrowserHandler(HandlerOptions options)
    : m_platform(options.platform)
    , m_mechanism(options.mechanism)
    , m_warn_on_failure(options.warn_on_failure)
    , m_runner(options.runner ? std::move(options.runner) : platform::create_process_runner()) {
}

BrowserHandler::~BrowserHandler() {
    dispose();
}

BrowserHandler::BrowserHandler(BrowserHandler&& other) noexcept
    : m_platform(other.m_platform)
    , m_mechanism(other.m_mechanism)
    , m_warn_on_failure(other.m_warn_on_failure)
    , m_runner(std::move(other.m_runner))
    , m_disposed(other.m_disposed) {
    other.m_disposed = true;
}

BrowserHandler& BrowserHandler::operator=(BrowserHandler&& other) noexcept {
    if (this != &other) {
        dispose();
        m_platform = other.m_platform;
        m_mechanism = other.m_mechanism;
        m_warn_on_failure = other.m_warn_on_failure;
        m_runner = std::move(other.m_runner);
        m_disposed = other.m_disposed;
        other.m_disposed = true;
    }
    return *this;
}

std::expected<bool, core::BrowserError>
BrowserHandler::open_url(std::string_view url, const QueryParameters& params) {
    if (m_disposed) {
        BI_LOG_ERROR("BrowserHandler", "open_url called on a disposed handler");
        return std::unexpected(core::BrowserError::Disposed);
    }

    auto profile = platform::platform_profile(m_platform, m_mechanism);
    if (!profile) {
        BI_LOG_ERROR("BrowserHandler", "Opening urls with mechanism '" + core::to_string(m_mechanism) +
                     "' is not supported on " + platform::to_string(m_platform));
        return std::unexpected(core::BrowserError::UnsupportedPlatform);
    }

    UrlBuilder builder(profile->forbidden, profile->query_separator);
    auto full_url = builder.build(url, params);
    if (!full_url) {
        return std::unexpected(full_url.error());
    }

    auto launcher = platform::create_browser_launcher(*profile, *m_runner);
    if (!launcher) {
        BI_LOG_ERROR("BrowserHandler", "No " + core::to_string(profile->mechanism) +
                     " launcher available in this build");
        return std::unexpected(core::BrowserError::UnsupportedPlatform);
    }

    BI_LOG_INFO("BrowserHandler", "Opening URL: " + *full_url);

    auto exit_code = launcher->launch(*full_url);
    if (!exit_code) {
        return std::unexpected(exit_code.error());
    }

    if (*exit_code != 0) {
        if (m_warn_on_failure) {
            BI_LOG_WARNING("BrowserHandler", "opening [" + *full_url + "] failed with non-zero exit code [" +
                           std::to_string(*exit_code) + "]");
        }
        return false;
    }

    return true;
}

void BrowserHandler::dispose() {
    if (!m_disposed) {
        m_runner.reset();
        m_disposed = true;
    }
}

} // namespace services
} // namespace browser_interface
