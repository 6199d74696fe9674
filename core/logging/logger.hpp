#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace wordserve {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Leveled logger writing timestamped lines to a stream (stderr by default).
// One instance is created by the host and handed to every component.
class Logger {
public:
    explicit Logger(Level threshold = Level::LVL_INFO, std::ostream &out = std::cerr);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    void log(Level level, const char *file, int line, const std::string &message);
    void set_level(Level level);
    Level level() const { return threshold_.load(std::memory_order_relaxed); }
    bool should_log(Level level) const { return level >= this->level() && level != Level::LVL_NONE; }

private:
    std::atomic<Level> threshold_;
    std::ostream *out_;
    std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<Logger>;

LoggerPtr make_logger(Level threshold = Level::LVL_INFO);

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace wordserve

// Stream-style macros; `logger` is a Logger reference
#define LOG_INTERNAL(logger, level, msg)                                  \
    do {                                                                  \
        if ((logger).should_log(level)) {                                 \
            std::stringstream log_ss_;                                    \
            log_ss_ << msg;                                               \
            (logger).log(level, __FILE__, __LINE__, log_ss_.str());       \
        }                                                                 \
    } while (0)

#define LOG_DEBUG(logger, msg) LOG_INTERNAL(logger, wordserve::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(logger, msg) LOG_INTERNAL(logger, wordserve::logging::Level::LVL_INFO, msg)
#define LOG_WARN(logger, msg) LOG_INTERNAL(logger, wordserve::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(logger, msg) LOG_INTERNAL(logger, wordserve::logging::Level::LVL_ERROR, msg)
