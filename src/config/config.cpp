#include "harbor/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "harbor/log/logger.hpp"

namespace harbor::config {

ConfigFormat format_from_path(const std::string& config_file) {
    auto extension = std::filesystem::path(config_file).extension().string();
    if (extension == ".json") {
        return ConfigFormat::JSON;
    }
    if (extension == ".ini") {
        return ConfigFormat::INI;
    }
    return ConfigFormat::YAML;
}

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back({"", yaml_to_ptree(*it)});  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    HARBOR_LOG_INFO << "Loading config file: " << config_file;

    try {
        if (!std::filesystem::exists(config_file)) {
            throw std::runtime_error("file does not exist");
        }
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                config_tree_ = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_json(ifs, config_tree_);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_ini(ifs, config_tree_);
                break;
            }
        }
    } catch (const std::exception& e) {
        HARBOR_LOG_ERROR << "Failed to load config file: " << config_file
                         << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    load_component_configs();
    HARBOR_LOG_INFO << "Successfully loaded config file: " << config_file;
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();

        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            HARBOR_LOG_WARN << "No configuration found for properties: "
                            << properties_name << ", using defaults.";
            config->validate();
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            HARBOR_LOG_DEBUG << "Loaded configuration for properties: "
                             << properties_name;
        } catch (const std::exception& e) {
            HARBOR_LOG_ERROR << "Failed to load configuration for properties "
                             << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace harbor::config
