#include "sprig/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "sprig/log/logger.hpp"

namespace sprig::config {

ConfigFormat format_from_path(const std::string& path) {
    auto extension = std::filesystem::path(path).extension().string();
    if (extension == ".json") return ConfigFormat::JSON;
    if (extension == ".ini") return ConfigFormat::INI;
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
            pt.push_back({"", yaml_to_ptree(*it)});  // Empty key for elements
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    SPRIG_LOG_INFO << "Loading config file: " << config_file;

    boost::property_tree::ptree tree;
    try {
        switch (format) {
            case ConfigFormat::YAML: {
                tree = yaml_to_ptree(YAML::LoadFile(config_file));
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                if (!ifs) throw std::runtime_error("cannot open file");
                boost::property_tree::read_json(ifs, tree);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                if (!ifs) throw std::runtime_error("cannot open file");
                boost::property_tree::read_ini(ifs, tree);
                break;
            }
        }
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Failed to load config file: " << config_file
                        << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    apply_tree(std::move(tree));
    SPRIG_LOG_DEBUG << "Successfully loaded config file: " << config_file;
}

void ConfigManager::load_config_from_string(const std::string& yaml_content) {
    boost::property_tree::ptree tree;
    try {
        tree = yaml_to_ptree(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        SPRIG_LOG_ERROR << "Failed to parse YAML configuration: " << e.what();
        throw std::runtime_error(
            std::string("Failed to parse YAML configuration: ") + e.what());
    }
    apply_tree(std::move(tree));
}

std::shared_ptr<ConfigurationProperties> ConfigManager::get_config_by_name(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = config_by_name_.find(name);
    return (it != config_by_name_.end()) ? it->second : nullptr;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    configs_.clear();
    config_by_name_.clear();
    config_tree_ = boost::property_tree::ptree();
}

boost::property_tree::ptree ConfigManager::merge_ptrees(
    const boost::property_tree::ptree& base,
    const boost::property_tree::ptree& override) {
    boost::property_tree::ptree result = base;

    for (const auto& item : override) {
        if (result.count(item.first) && !item.second.empty() &&
            !result.get_child(item.first).empty()) {
            result.put_child(
                item.first,
                merge_ptrees(result.get_child(item.first), item.second));
        } else {
            result.put_child(item.first, item.second);
        }
    }

    return result;
}

void ConfigManager::apply_tree(boost::property_tree::ptree tree) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = std::move(tree);
    }
    load_component_configs();
}

void ConfigManager::load_component_configs() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto subtree = config_tree_.get_child_optional(properties_name);
        if (!subtree) {
            SPRIG_LOG_DEBUG << "No configuration found for properties: "
                            << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*subtree);
            config->validate();
            SPRIG_LOG_DEBUG << "Loaded configuration for properties: "
                            << properties_name;
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Failed to load configuration for properties "
                            << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace sprig::config
