#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "sprig/log/log_config.hpp"

namespace sprig::log {

/**
 * @brief Process-wide Boost.Log setup behind the SPRIG_LOG_* macros
 *
 * init() replaces every installed sink, so it may run more than once (the
 * CLI and the tests do). set_level() only moves the severity filter.
 */
class Logger {
public:
    static void init(const LogConfig& config);
    /// Flushes and removes all sinks.
    static void shutdown();
    /// Same as LogConfig::level_from_string; throws std::invalid_argument.
    static LogConfig::LogLevel level_from_string(const std::string& level_str);
    static void set_level(LogConfig::LogLevel level);
    static LogConfig::LogLevel current_level() { return config_.global_level; }

private:
    static LogConfig config_;
};

}  // namespace sprig::log

#define SPRIG_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define SPRIG_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define SPRIG_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define SPRIG_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define SPRIG_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define SPRIG_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
