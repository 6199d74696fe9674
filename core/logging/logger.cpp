#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace wordserve {
namespace logging {

Logger::Logger(Level threshold, std::ostream &out) : threshold_(threshold), out_(&out) {}

void Logger::set_level(Level level) { threshold_.store(level, std::memory_order_relaxed); }

void Logger::log(Level level, const char * /*file*/, int /*line*/, const std::string &message) {
    if (!should_log(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream &out = *out_;

    // Timestamp
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_DEBUG: out << " [DEBUG] "; break;
        case Level::LVL_INFO:  out << " [INFO]  "; break;
        case Level::LVL_WARN:  out << " [WARN]  "; break;
        case Level::LVL_ERROR: out << " [ERROR] "; break;
        default: break;
    }

    out << message << "\n";

    if (level >= Level::LVL_ERROR) {
        out << std::flush;
    }
}

LoggerPtr make_logger(Level threshold) { return std::make_shared<Logger>(threshold); }

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "debug";
        case Level::LVL_INFO: return "info";
        case Level::LVL_WARN: return "warn";
        case Level::LVL_ERROR: return "error";
        case Level::LVL_NONE: return "none";
    }
    return "info";
}

}  // namespace logging
}  // namespace wordserve
