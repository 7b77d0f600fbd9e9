#pragma once

#include "browser_interface/utils/logger.hpp"
#include <cstdint>
#include <string>

namespace browser_interface {
namespace core {

// ============================================================================
// Error types
// ============================================================================

enum class BrowserError {
    MalformedUrl,
    KeyCollision,
    UnsupportedPlatform,
    Disposed,
    LaunchFailed
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

inline std::string to_string(BrowserError error) {
    switch (error) {
        case BrowserError::MalformedUrl: return "malformed url";
        case BrowserError::KeyCollision: return "query key collision";
        case BrowserError::UnsupportedPlatform: return "unsupported platform";
        case BrowserError::Disposed: return "handler disposed";
        case BrowserError::LaunchFailed: return "launch failed";
        default: return "unknown error";
    }
}

inline std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation error";
        case ConfigError::PermissionDenied: return "permission denied";
        default: return "unknown error";
    }
}

// ============================================================================
// Platform types
// ============================================================================

enum class Platform : std::uint8_t {
    Windows,
    Linux,
    FreeBSD,
    MacOS,
    Unknown
};

// How the browser process is started
enum class LaunchMechanism : std::uint8_t {
    Automatic,  // platform default
    Direct,     // spawn the open program with the url as its only argument
    Native,     // operating system call (ShellExecuteW)
    Shell       // type "<verb> <url>" into a spawned command shell
};

inline std::string to_string(LaunchMechanism mechanism) {
    switch (mechanism) {
        case LaunchMechanism::Automatic: return "automatic";
        case LaunchMechanism::Direct: return "direct";
        case LaunchMechanism::Native: return "native";
        case LaunchMechanism::Shell: return "shell";
        default: return "automatic";
    }
}

// ============================================================================
// Configuration
// ============================================================================

struct LauncherConfig {
    LaunchMechanism mechanism = LaunchMechanism::Automatic;
    bool warn_on_failure = true;
};

struct ApplicationConfig {
    utils::LogLevel log_level = utils::LogLevel::Info;
    bool log_to_file = false;
    LauncherConfig launcher;
};

} // namespace core
} // namespace browser_interface
