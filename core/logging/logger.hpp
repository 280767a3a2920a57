#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace hearth {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);

    // Redirect output (nullptr restores stderr). Used by tests to capture logs.
    static void set_sink(std::ostream *sink);

private:
    static Level threshold_;
    static std::ostream *sink_;
    static std::mutex mutex_;
};

// Parses "debug" / "info" / "warn" / "error" / "none" (case-insensitive)
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace hearth

#define HEARTH_LOG_INTERNAL(level, msg)                                              \
    do {                                                                             \
        if (hearth::logging::Logger::enabled(level)) {                               \
            std::stringstream hearth_log_ss;                                         \
            hearth_log_ss << msg;                                                    \
            hearth::logging::Logger::log(level, __FILE__, __LINE__, hearth_log_ss.str()); \
        }                                                                            \
    } while (0)

#define LOG_DEBUG(msg) HEARTH_LOG_INTERNAL(hearth::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) HEARTH_LOG_INTERNAL(hearth::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) HEARTH_LOG_INTERNAL(hearth::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) HEARTH_LOG_INTERNAL(hearth::logging::Level::LVL_ERROR, msg)
