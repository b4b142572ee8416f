#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace sprig::config {

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from a file extension; YAML when unknown
ConfigFormat format_from_path(const std::string& path);

/**
 * @brief Typed view over one subtree of the configuration
 *
 * Subclasses name their subtree with properties_name() and are populated by
 * ConfigManager after every load.
 */
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }

    template <typename T>
    void load_vector(const boost::property_tree::ptree& pt,
                     const std::string& path, std::vector<T>& vec) {
        vec.clear();
        if (auto child_pt = pt.get_child_optional(path)) {
            for (const auto& v : *child_pt) {
                vec.push_back(v.second.get_value<T>());
            }
        }
    }
};

class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);
    // Same as load_config for YAML text already in memory
    void load_config_from_string(const std::string& yaml_content);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(config_mutex_);
        // Late registrations still see an already loaded tree
        if (auto subtree =
                config_tree_.get_child_optional(config->properties_name())) {
            config->from_ptree(*subtree);
            config->validate();
        }
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    // Registers a default-constructed T unless one is already present
    template <typename T>
    std::shared_ptr<T> ensure_configuration_properties() {
        if (auto existing = get_configuration_properties<T>()) {
            return existing;
        }
        auto config = std::make_shared<T>();
        register_configuration_properties(config);
        return config;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const;

    void reset();

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

    static boost::property_tree::ptree merge_ptrees(
        const boost::property_tree::ptree& base,
        const boost::property_tree::ptree& override);

private:
    ConfigManager() = default;

    void apply_tree(boost::property_tree::ptree tree);
    void load_component_configs();
    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

    mutable std::mutex config_mutex_;
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;
};

}  // namespace sprig::config
