#pragma once

#include "browser_interface/core/models.hpp"
#include "browser_interface/utils/string_filter.hpp"
#include <optional>
#include <string>

namespace browser_interface::platform {

// Everything the pipeline needs to know about one operating system
struct PlatformProfile {
    core::Platform platform = core::Platform::Unknown;
    core::LaunchMechanism mechanism = core::LaunchMechanism::Direct;
    utils::ForbiddenCharacters forbidden;
    std::string query_separator = "&";

    // Program spawned for Direct, or the shell for Shell
    std::string program;
    // Command typed into the shell before the url (Shell only)
    std::string shell_verb;
    // Characters the shell would still interpret; typed with a backslash in front (Shell only)
    std::string shell_escaped;
};

// Platform this binary is running on
core::Platform current_platform();

std::string to_string(core::Platform platform);

// Pure lookup; std::nullopt when the platform or the mechanism is not supported
std::optional<PlatformProfile> platform_profile(core::Platform platform,
                                                core::LaunchMechanism mechanism = core::LaunchMechanism::Automatic);

} // namespace browser_interface::platform
