#pragma once

#include "browser_interface/core/models.hpp"
#include "browser_interface/platform/browser_launcher.hpp"
#include "browser_interface/platform/platform_profile.hpp"
#include "browser_interface/platform/process_runner.hpp"
#include "browser_interface/services/query_parameters.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace browser_interface {
namespace services {

struct HandlerOptions {
    core::Platform platform = platform::current_platform();
    core::LaunchMechanism mechanism = core::LaunchMechanism::Automatic;
    bool warn_on_failure = true;
    // Process runner to use; the platform default when null
    std::unique_ptr<platform::ProcessRunner> runner;

    static HandlerOptions from_config(const core::LauncherConfig& config);
};

/**
 * @brief Opens http(s) urls in the user's default browser
 *
 * Owns the process runner used to spawn the browser. The runner is released
 * by dispose() or the destructor; any open_url() after that fails with
 * BrowserError::Disposed.
 *
 * Not thread-safe. One call completes before the next begins.
 */
class BrowserHandler {
public:
    explicit BrowserHandler(HandlerOptions options = {});
    ~BrowserHandler();

    BrowserHandler(const BrowserHandler&) = delete;
    BrowserHandler& operator=(const BrowserHandler&) = delete;
    BrowserHandler(BrowserHandler&&) noexcept;
    BrowserHandler& operator=(BrowserHandler&&) noexcept;

    /**
     * @brief Open a url with optional query parameters
     * @return true if the browser was launched, false if the launch exited
     *         with a non-zero code; an error if nothing was launched
     */
    std::expected<bool, core::BrowserError>
    open_url(std::string_view url, const QueryParameters& params = {});

    // Release the process runner; safe to call more than once
    void dispose();

    bool is_disposed() const { return m_disposed; }

    core::Platform platform() const { return m_platform; }
    core::LaunchMechanism mechanism() const { return m_mechanism; }

private:
    core::Platform m_platform;
    core::LaunchMechanism m_mechanism;
    bool m_warn_on_failure;
    std::unique_ptr<platform::ProcessRunner> m_runner;
    bool m_disposed = false;
};

} // namespace services
} // namespace browser_interface
