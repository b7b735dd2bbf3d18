#pragma once

#include <string>
#include <memory>

namespace callroute {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/// "debug" | "info" | "warn"/"warning" | "error", any case; anything else is INFO
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Process-wide logger with a console sink and an optional file sink
 *
 * Each sink filters on its own threshold, so the CLI can keep the console
 * at WARN while the file still records the configured level. DEBUG and
 * INFO go to stdout, WARN and ERROR to stderr. Lines are stamped in UTC.
 *
 * Before initialize() (and after shutdown()) only WARN and ERROR are
 * printed, unstamped, to stderr.
 */
class Logger {
public:
    static void initialize(LogLevel console_level = LogLevel::INFO,
                           const std::string& output_file = "",
                           LogLevel file_level = LogLevel::INFO);

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) callroute::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) callroute::Logger::info(msg)
#define LOG_WARN(msg) callroute::Logger::warn(msg)
#define LOG_ERROR(msg) callroute::Logger::error(msg)

// Component tags
#define LOG_COMPILER(msg) callroute::Logger::info(std::string("[Compiler] ") + (msg))
#define LOG_LOOKUP(msg) callroute::Logger::debug(std::string("[Lookup] ") + (msg))
#define LOG_FLOW(msg) callroute::Logger::info(std::string("[Flow] ") + (msg))
#define LOG_TRUTH(msg) callroute::Logger::info(std::string("[Truth] ") + (msg))
#define LOG_TRACE_RECORD(scenario_id, data) callroute::Logger::info(std::string("[trace] scenario=") + (scenario_id) + " " + (data))

} // namespace callroute
