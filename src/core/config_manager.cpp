#include "browser_interface/core/config_manager.hpp"
#include "browser_interface/utils/logger.hpp"
#include "browser_interface/utils/yaml_config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace browser_interface {
namespace core {

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_path() : config_path) {
        BI_LOG_DEBUG("ConfigManager", "Using configuration path: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        std::error_code ec;
        if (!std::filesystem::exists(m_config_path, ec)) {
            BI_LOG_INFO("ConfigManager", "Using default configuration");
            m_config = ApplicationConfig{};
            auto result = save();
            if (result) {
                (void)add_documentation_comments();
            }
            return result;
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return std::unexpected(result.error());
        }

        m_config = *result;
        BI_LOG_DEBUG("ConfigManager", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() const {
        BI_LOG_DEBUG("ConfigManager", "Saving configuration");
        return utils::YamlConfigHelper::save_to_file(m_config, m_config_path);
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) {
        m_config = config;
        return save();
    }

    const ApplicationConfig& get() const { return m_config; }
    const std::filesystem::path& path() const { return m_config_path; }

private:
    std::expected<void, ConfigError> add_documentation_comments() const {
        std::ifstream in_file(m_config_path);
        if (!in_file) {
            return std::unexpected(ConfigError::FileNotFound);
        }

        std::stringstream content;
        content << "# Browser Interface Configuration\n";
        content << "# This file was automatically generated on first run\n\n";
        content << "# log_level: debug, info, warning, error or none\n";
        content << "# log_to_file: Also write the log next to this file\n";
        content << "# launcher.mechanism: automatic, direct, native (Windows) or shell\n";
        content << "#   shell types the command into a command shell and is the least safe\n";
        content << "# launcher.warn_on_failure: Log a warning when the browser exits with an error\n\n";
        content << in_file.rdbuf();
        in_file.close();

        std::ofstream out_file(m_config_path, std::ios::trunc);
        if (!out_file) {
            return std::unexpected(ConfigError::PermissionDenied);
        }

        out_file << content.str();
        return {};
    }

    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

std::expected<void, ConfigError> ConfigManager::update(const ApplicationConfig& config) {
    return m_impl->update(config);
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::filesystem::path ConfigManager::default_config_path() {
    std::filesystem::path config_dir;

#ifdef _WIN32
    // Windows: %APPDATA%/Browser Interface
    if (const char* app_data = std::getenv("APPDATA")) {
        config_dir = std::filesystem::path(app_data) / "Browser Interface";
    }
#else
    // Unix/Linux/macOS: $XDG_CONFIG_HOME/browser-interface or ~/.config/browser-interface
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        config_dir = std::filesystem::path(xdg_config) / "browser-interface";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "browser-interface";
    }
#endif

    return config_dir / "config.yaml";
}

} // namespace core
} // namespace browser_interface
