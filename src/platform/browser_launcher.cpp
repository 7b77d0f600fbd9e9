#include "browser_interface/platform/browser_launcher.hpp"
#include "browser_interface/utils/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#endif

namespace browser_interface::platform {

DirectBrowserLauncher::DirectBrowserLauncher(std::string program, ProcessRunner& runner)
    : m_program(std::move(program)), m_runner(runner) {}

std::expected<int, core::BrowserError> DirectBrowserLauncher::launch(const std::string& url) {
    BI_LOG_DEBUG("DirectBrowserLauncher", "Running " + m_program);
    return m_runner.run(ProcessRequest{
        .program = m_program,
        .arguments = {url},
        .standard_input = std::nullopt
    });
}

ShellBrowserLauncher::ShellBrowserLauncher(std::string shell, std::string verb, std::string escaped,
                                           ProcessRunner& runner)
    : m_shell(std::move(shell)), m_verb(std::move(verb)), m_escaped(std::move(escaped)), m_runner(runner) {}

std::expected<int, core::BrowserError> ShellBrowserLauncher::launch(const std::string& url) {
    std::string line = m_verb + " ";
    for (char c : url) {
        if (m_escaped.find(c) != std::string::npos) {
            line.push_back('\\');
        }
        line.push_back(c);
    }
    line.push_back('\n');

    BI_LOG_DEBUG("ShellBrowserLauncher", "Typing '" + m_verb + "' into " + m_shell);
    return m_runner.run(ProcessRequest{
        .program = m_shell,
        .arguments = {},
        .standard_input = std::move(line)
    });
}

#ifdef _WIN32
namespace {

// Calls ShellExecuteW directly, no shell is involved
class ShellExecuteBrowserLauncher : public BrowserLauncher {
public:
    std::expected<int, core::BrowserError> launch(const std::string& url) override {
        int size = MultiByteToWideChar(CP_UTF8, 0, url.data(), static_cast<int>(url.size()), nullptr, 0);
        std::wstring wurl(static_cast<size_t>(size), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, url.data(), static_cast<int>(url.size()), wurl.data(), size);

        HINSTANCE result = ShellExecuteW(NULL, L"open", wurl.c_str(), NULL, NULL, SW_SHOWNORMAL);
        if ((INT_PTR)result <= 32) {
            BI_LOG_ERROR("ShellExecuteBrowserLauncher",
                         "ShellExecuteW failed with code " + std::to_string((INT_PTR)result));
            return 1;
        }
        return 0;
    }

    core::LaunchMechanism mechanism() const override { return core::LaunchMechanism::Native; }
};

} // namespace
#endif

std::unique_ptr<BrowserLauncher> create_browser_launcher(const PlatformProfile& profile,
                                                         ProcessRunner& runner) {
    switch (profile.mechanism) {
        case core::LaunchMechanism::Direct:
            return std::make_unique<DirectBrowserLauncher>(profile.program, runner);
        case core::LaunchMechanism::Shell:
            return std::make_unique<ShellBrowserLauncher>(profile.program, profile.shell_verb,
                                                          profile.shell_escaped, runner);
        case core::LaunchMechanism::Native:
#ifdef _WIN32
            return std::make_unique<ShellExecuteBrowserLauncher>();
#else
            return nullptr;
#endif
        default:
            return nullptr;
    }
}

} // namespace browser_interface::platform
