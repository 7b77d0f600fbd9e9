#include "browser_interface/core/config_manager.hpp"
#include "browser_interface/services/browser_handler.hpp"
#include "browser_interface/utils/logger.hpp"
#include "version.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
    constexpr int EXIT_LAUNCH_FAILED = 1;
    constexpr int EXIT_HARD_ERROR = 2;
    constexpr int EXIT_USAGE = 64;

    struct Arguments {
        std::filesystem::path config_path;
        std::string url;
        std::vector<std::string> parameters;
    };

    void print_usage() {
        std::cerr << "browser-open " << BI_VERSION_STRING << "\n"
                  << "Usage: browser-open [--config <path>] <url> [key=value ...]\n";
    }

    std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
        Arguments args;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    return std::nullopt;
                }
                args.config_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                return std::nullopt;
            } else if (args.url.empty()) {
                args.url = std::string(arg);
            } else {
                args.parameters.emplace_back(arg);
            }
        }
        if (args.url.empty()) {
            return std::nullopt;
        }
        return args;
    }

    std::unique_ptr<browser_interface::utils::Logger> setup_logging(
        const browser_interface::core::ApplicationConfig& config,
        const std::filesystem::path& config_path) {
        using namespace browser_interface::utils;

        auto logger = std::make_unique<Logger>(config.log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        if (config.log_to_file && config_path.has_parent_path()) {
            auto file_sink = std::make_unique<FileSink>(config_path.parent_path() / "browser-interface.log");
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
            }
        }

        return logger;
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace browser_interface;

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage();
        return EXIT_USAGE;
    }

    core::ConfigManager config_manager(args->config_path);
    if (auto loaded = config_manager.load(); !loaded) {
        std::cerr << "Using default configuration (" << core::to_string(loaded.error()) << ")\n";
    }

    const auto& config = config_manager.get();
    utils::LoggerManager::set_instance(setup_logging(config, config_manager.path()));

    services::QueryParameters params;
    for (const auto& parameter : args->parameters) {
        auto equals = parameter.find('=');
        if (equals == std::string::npos) {
            params.add(parameter, std::string{});
        } else {
            params.add(parameter.substr(0, equals), parameter.substr(equals + 1));
        }
    }

    services::BrowserHandler handler(services::HandlerOptions::from_config(config.launcher));
    auto result = handler.open_url(args->url, params);
    utils::LoggerManager::get_instance().flush();

    if (!result) {
        std::cerr << "browser-open: " << core::to_string(result.error()) << "\n";
        return EXIT_HARD_ERROR;
    }

    return *result ? 0 : EXIT_LAUNCH_FAILED;
}
