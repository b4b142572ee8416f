#pragma once

#include <cstdint>
#include <string>

#include "sprig/config/config.hpp"

namespace sprig::log {

/**
 * @brief Settings of the "log" configuration subtree.
 *
 * @code
 * log:
 *   global_level: debug
 *   console: { enabled: true }
 *   file: { enabled: true, log_file: logs/aot.log, max_files: 3 }
 * @endcode
 */
class LogConfig : public config::ConfigurationProperties {
public:
    enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

    static constexpr const char* DEFAULT_PATTERN =
        "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";

    struct ConsoleConfig {
        bool enabled = true;
        std::string pattern = DEFAULT_PATTERN;
    };

    /// Rotating file sink; rotates on size and at midnight.
    struct FileConfig {
        bool enabled = false;
        std::string log_file = "logs/sprig.log";
        int64_t max_file_size = 10 * 1024 * 1024;
        int max_files = 5;
        std::string pattern = DEFAULT_PATTERN;
    };

    LogLevel global_level = LogLevel::INFO;
    ConsoleConfig console;
    FileConfig file;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "log"; }

    /// Accepts the level names case-insensitively, plus "warning" and
    /// "critical" as aliases.
    static LogLevel level_from_string(const std::string& name);
    static std::string level_to_string(LogLevel level);
};

}  // namespace sprig::log
