#pragma once

#include "browser_interface/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

namespace browser_interface {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Save configuration to YAML file
    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path);

    // Convert between YAML nodes and config structures
    static std::expected<core::ApplicationConfig, core::ConfigError> from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

    static std::optional<core::LaunchMechanism> parse_mechanism(std::string_view text);

private:
    static std::expected<core::LauncherConfig, core::ConfigError> parse_launcher_config(const YAML::Node& node);
};

} // namespace utils
} // namespace browser_interface
