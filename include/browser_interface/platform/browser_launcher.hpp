#pragma once

#include "browser_interface/core/models.hpp"
#include "browser_interface/platform/platform_profile.hpp"
#include "browser_interface/platform/process_runner.hpp"
#include <expected>
#include <memory>
#include <string>

namespace browser_interface::platform {

// Interface for launching URLs in the system browser
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    // Open a URL in the default system browser and wait for the launch to finish.
    // Returns the exit status of the launch; 0 means success.
    virtual std::expected<int, core::BrowserError> launch(const std::string& url) = 0;

    virtual core::LaunchMechanism mechanism() const = 0;
};

// Spawns the opener program with the url as its only argument
class DirectBrowserLauncher : public BrowserLauncher {
public:
    DirectBrowserLauncher(std::string program, ProcessRunner& runner);

    std::expected<int, core::BrowserError> launch(const std::string& url) override;
    core::LaunchMechanism mechanism() const override { return core::LaunchMechanism::Direct; }

private:
    std::string m_program;
    ProcessRunner& m_runner;
};

// Types "<verb> <url>" into a spawned command shell. Characters in
// `escaped` are typed with a backslash in front of them.
class ShellBrowserLauncher : public BrowserLauncher {
public:
    ShellBrowserLauncher(std::string shell, std::string verb, std::string escaped, ProcessRunner& runner);

    std::expected<int, core::BrowserError> launch(const std::string& url) override;
    core::LaunchMechanism mechanism() const override { return core::LaunchMechanism::Shell; }

private:
    std::string m_shell;
    std::string m_verb;
    std::string m_escaped;
    ProcessRunner& m_runner;
};

// Selects the launcher variant for a profile. Returns nullptr when the
// profile needs an API that this build does not have.
std::unique_ptr<BrowserLauncher> create_browser_launcher(const PlatformProfile& profile,
                                                         ProcessRunner& runner);

} // namespace browser_interface::platform
