#include "kiln/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <sstream>

#include "kiln/log/logger.hpp"

namespace kiln::config {

namespace {

boost::property_tree::ptree parse_stream(std::istream& in,
                                         ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML:
            // handled by the caller through yaml-cpp
            break;
        case ConfigFormat::JSON:
            boost::property_tree::read_json(in, tree);
            break;
        case ConfigFormat::INI:
            boost::property_tree::read_ini(in, tree);
            break;
    }
    return tree;
}

}  // namespace

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
            pt.push_back(std::make_pair("", yaml_to_ptree(*it)));
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    KILN_LOG_INFO << "Loading config file: " << config_file;

    try {
        if (format == ConfigFormat::YAML) {
            config_tree_ = yaml_to_ptree(YAML::LoadFile(config_file));
        } else {
            std::ifstream ifs(config_file);
            if (!ifs) {
                throw std::runtime_error("cannot open file");
            }
            config_tree_ = parse_stream(ifs, format);
        }
    } catch (const std::exception& e) {
        KILN_LOG_ERROR << "Failed to load config file: " << config_file
                       << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    load_component_configs();
}

void ConfigManager::load_config_string(const std::string& content,
                                       ConfigFormat format) {
    try {
        if (format == ConfigFormat::YAML) {
            config_tree_ = yaml_to_ptree(YAML::Load(content));
        } else {
            std::istringstream iss(content);
            config_tree_ = parse_stream(iss, format);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") +
                                 e.what());
    }

    load_component_configs();
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();

        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            KILN_LOG_DEBUG << "No configuration found for properties: "
                           << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            KILN_LOG_DEBUG << "Loaded configuration for properties: "
                           << properties_name;
        } catch (const std::exception& e) {
            KILN_LOG_ERROR << "Failed to load configuration for properties "
                           << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace kiln::config
