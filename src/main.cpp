#include <iostream>
#include <memory>

#include "harbor/config/config.hpp"
#include "harbor/core/command_line_parser.hpp"
#include "harbor/daemon/daemon.hpp"
#include "harbor/discovery/discovery_config.hpp"
#include "harbor/log/log_config.hpp"
#include "harbor/log/logger.hpp"

int main(int argc, char* argv[]) {
    auto options = harbor::core::CommandLineParser::parse(argc, argv);
    if (options.parse_error) {
        return 2;
    }
    if (options.show_help || options.show_version) {
        return 0;
    }

    auto log_config = std::make_shared<harbor::log::LogConfig>();
    auto discovery_config =
        std::make_shared<harbor::discovery::DiscoveryConfig>();

    harbor::config::ConfigManager config_manager;
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(discovery_config);
    try {
        config_manager.load_config(
            options.config_file,
            harbor::config::format_from_path(options.config_file));
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    if (options.test) {
        std::cout << "Configuration " << options.config_file << " is valid"
                  << std::endl;
        return 0;
    }

    try {
        harbor::log::Logger::init(*log_config);
        int exit_code = 0;
        {
            harbor::daemon::Daemon daemon(*discovery_config);
            exit_code = daemon.run();
        }
        harbor::log::Logger::shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
