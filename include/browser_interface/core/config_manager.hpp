#pragma once

#include "browser_interface/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>

namespace browser_interface {
namespace core {

// Loads and stores the YAML configuration file
class ConfigManager {
public:
    // An empty path selects the per-user default location
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // Writes defaults when the file does not exist yet
    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    const ApplicationConfig& get() const;
    std::expected<void, ConfigError> update(const ApplicationConfig& config);

    const std::filesystem::path& path() const;

    static std::filesystem::path default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace core
} // namespace browser_interface
