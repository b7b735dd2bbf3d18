#include "logger.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace callroute {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::string utc_stamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    const std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    Impl(LogLevel console_level, const std::string& path, LogLevel file_level)
        : console_level_(console_level), file_level_(file_level) {
        if (path.empty()) {
            return;
        }
        file_.open(path, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "[WARN ] could not open log file " << path
                      << ", logging to console only" << std::endl;
        }
    }

    void write(LogLevel level, const std::string& message) {
        const bool to_console = level >= console_level_;
        const bool to_file = file_.is_open() && level >= file_level_;
        if (!to_console && !to_file) {
            return;
        }

        const std::string line = utc_stamp() + " " + level_tag(level) + " " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (to_console) {
            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << line << '\n';
            out.flush();
        }
        if (to_file) {
            file_ << line << '\n';
            file_.flush();
        }
    }

private:
    std::mutex mutex_;
    const LogLevel console_level_;
    const LogLevel file_level_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_;

void Logger::initialize(LogLevel console_level, const std::string& output_file, LogLevel file_level) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(console_level, output_file, file_level);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->write(level, message);
    } else if (level >= LogLevel::WARN) {
        std::cerr << "[" << level_tag(level) << "] " << message << std::endl;
    }
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace callroute
