#include "browser_interface/utils/yaml_config.hpp"
#include "browser_interface/utils/logger.hpp"
#include <fstream>

namespace browser_interface {
namespace utils {

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        BI_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        BI_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Node node = to_yaml(config);
        std::ofstream file(path);
        if (!file) {
            BI_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }

        file << node << '\n';
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        BI_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const YAML::Exception& e) {
        BI_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    // An empty document means defaults
    if (!node || node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        BI_LOG_ERROR("YamlConfig", "Top level of the configuration must be a map");
        return std::unexpected(core::ConfigError::InvalidFormat);
    }

    try {
        if (node["log_level"]) {
            auto text = node["log_level"].as<std::string>();
            auto level = parse_log_level(text);
            if (!level) {
                BI_LOG_ERROR("YamlConfig", "Unknown log_level: " + text);
                return std::unexpected(core::ConfigError::ValidationError);
            }
            config.log_level = *level;
        }
        if (node["log_to_file"]) {
            config.log_to_file = node["log_to_file"].as<bool>();
        }
    } catch (const YAML::BadConversion& e) {
        BI_LOG_ERROR("YamlConfig", "Invalid value: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::ValidationError);
    }

    if (node["launcher"]) {
        auto launcher = parse_launcher_config(node["launcher"]);
        if (!launcher) {
            return std::unexpected(launcher.error());
        }
        config.launcher = *launcher;
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);
    node["log_to_file"] = config.log_to_file;

    node["launcher"]["mechanism"] = core::to_string(config.launcher.mechanism);
    node["launcher"]["warn_on_failure"] = config.launcher.warn_on_failure;

    return node;
}

std::optional<core::LaunchMechanism> YamlConfigHelper::parse_mechanism(std::string_view text) {
    if (text == "automatic" || text == "auto") return core::LaunchMechanism::Automatic;
    if (text == "direct") return core::LaunchMechanism::Direct;
    if (text == "native") return core::LaunchMechanism::Native;
    if (text == "shell") return core::LaunchMechanism::Shell;
    return std::nullopt;
}

std::expected<core::LauncherConfig, core::ConfigError>
YamlConfigHelper::parse_launcher_config(const YAML::Node& node) {
    core::LauncherConfig config;

    if (!node.IsMap()) {
        BI_LOG_ERROR("YamlConfig", "'launcher' must be a map");
        return std::unexpected(core::ConfigError::InvalidFormat);
    }

    try {
        if (node["mechanism"]) {
            auto text = node["mechanism"].as<std::string>();
            auto mechanism = parse_mechanism(text);
            if (!mechanism) {
                BI_LOG_ERROR("YamlConfig", "Unknown launcher.mechanism: " + text);
                return std::unexpected(core::ConfigError::ValidationError);
            }
            config.mechanism = *mechanism;
        }
        if (node["warn_on_failure"]) {
            config.warn_on_failure = node["warn_on_failure"].as<bool>();
        }
    } catch (const YAML::BadConversion& e) {
        BI_LOG_ERROR("YamlConfig", "Invalid launcher value: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::ValidationError);
    }

    return config;
}

} // namespace utils
} // namespace browser_interface
