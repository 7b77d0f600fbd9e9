#include "browser_interface/platform/platform_profile.hpp"

namespace browser_interface::platform {

using core::LaunchMechanism;
using core::Platform;

core::Platform current_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__) && defined(__MACH__)
    return Platform::MacOS;
#elif defined(__FreeBSD__)
    return Platform::FreeBSD;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::string to_string(core::Platform platform) {
    switch (platform) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        case Platform::FreeBSD: return "FreeBSD";
        case Platform::MacOS: return "macOS";
        default: return "unknown";
    }
}

namespace {
    // Left over by the POSIX forbidden set but still special to sh
    constexpr const char* SH_WORD_BREAKERS = " \t()*?[]~#!{}";

    std::optional<PlatformProfile> windows_profile(LaunchMechanism mechanism) {
        switch (mechanism) {
            case LaunchMechanism::Automatic:
            case LaunchMechanism::Native:
                return PlatformProfile{
                    .platform = Platform::Windows,
                    .mechanism = LaunchMechanism::Native,
                    .forbidden = utils::ForbiddenCharacters::windows(),
                    .query_separator = "&",
                    .program = {},
                    .shell_verb = {},
                    .shell_escaped = {}
                };
            case LaunchMechanism::Shell:
                return PlatformProfile{
                    .platform = Platform::Windows,
                    .mechanism = LaunchMechanism::Shell,
                    .forbidden = utils::ForbiddenCharacters::windows(),
                    .query_separator = "^&",
                    .program = "cmd.exe",
                    .shell_verb = "start",
                    .shell_escaped = {}
                };
            default:
                // "start" is a cmd.exe builtin, there is no executable to spawn
                return std::nullopt;
        }
    }

    std::optional<PlatformProfile> posix_profile(Platform platform, LaunchMechanism mechanism,
                                                 utils::ForbiddenCharacters forbidden,
                                                 const std::string& opener) {
        switch (mechanism) {
            case LaunchMechanism::Automatic:
            case LaunchMechanism::Direct:
                return PlatformProfile{
                    .platform = platform,
                    .mechanism = LaunchMechanism::Direct,
                    .forbidden = std::move(forbidden),
                    .query_separator = "&",
                    .program = opener,
                    .shell_verb = {},
                    .shell_escaped = {}
                };
            case LaunchMechanism::Shell:
                return PlatformProfile{
                    .platform = platform,
                    .mechanism = LaunchMechanism::Shell,
                    .forbidden = std::move(forbidden),
                    .query_separator = "\\&",
                    .program = "sh",
                    .shell_verb = opener,
                    .shell_escaped = SH_WORD_BREAKERS
                };
            default:
                return std::nullopt;
        }
    }
}

std::optional<PlatformProfile> platform_profile(core::Platform platform,
                                                core::LaunchMechanism mechanism) {
    switch (platform) {
        case Platform::Windows:
            return windows_profile(mechanism);
        case Platform::Linux:
        case Platform::FreeBSD:
            return posix_profile(platform, mechanism, utils::ForbiddenCharacters::posix(), "xdg-open");
        case Platform::MacOS:
            return posix_profile(platform, mechanism, utils::ForbiddenCharacters::macos(), "open");
        default:
            return std::nullopt;
    }
}

} // namespace browser_interface::platform
