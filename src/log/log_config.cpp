#include "sprig/log/log_config.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>
#include <utility>

namespace sprig::log {

namespace {

using LogLevel = LogConfig::LogLevel;

constexpr std::pair<const char*, LogLevel> LEVEL_NAMES[] = {
    {"trace", LogLevel::TRACE},   {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},     {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},  {"error", LogLevel::ERROR},
    {"fatal", LogLevel::FATAL},   {"critical", LogLevel::FATAL},
};

}  // namespace

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level = get_optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level);
    }

    if (auto node = pt.get_child_optional("console")) {
        console.enabled = get_value(*node, "enabled", console.enabled);
        console.pattern = get_value(*node, "pattern", console.pattern);
    }

    if (auto node = pt.get_child_optional("file")) {
        file.enabled = get_value(*node, "enabled", file.enabled);
        file.log_file = get_value(*node, "log_file", file.log_file);
        file.max_file_size =
            get_value(*node, "max_file_size", file.max_file_size);
        file.max_files = get_value(*node, "max_files", file.max_files);
        file.pattern = get_value(*node, "pattern", file.pattern);
    }
}

void LogConfig::validate() const {
    if (console.enabled && console.pattern.empty()) {
        throw std::invalid_argument("log.console.pattern must not be empty");
    }
    if (!file.enabled) {
        return;
    }
    if (file.log_file.empty()) {
        throw std::invalid_argument(
            "log.file.log_file is required when the file sink is enabled");
    }
    if (file.max_file_size <= 0 || file.max_files <= 0) {
        throw std::invalid_argument(
            "log.file.max_file_size and log.file.max_files must be positive");
    }
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& name) {
    const std::string lowered = boost::algorithm::to_lower_copy(name);
    for (const auto& [level_name, level] : LEVEL_NAMES) {
        if (lowered == level_name) {
            return level;
        }
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

std::string LogConfig::level_to_string(LogLevel level) {
    // first table entry for each level is its canonical name
    for (const auto& [level_name, candidate] : LEVEL_NAMES) {
        if (candidate == level) {
            return level_name;
        }
    }
    return "unknown";
}

}  // namespace sprig::log
