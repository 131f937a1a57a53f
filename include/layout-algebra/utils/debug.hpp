/**
 * @file debug.hpp
 * @brief Logging utilities and assertion macros
 */

#ifndef LAYOUT_ALGEBRA_UTILS_DEBUG_HPP
#define LAYOUT_ALGEBRA_UTILS_DEBUG_HPP

#include <iostream>
#include <cassert>
#include <string>
#include <sstream>
#include "../core/config.hpp"

namespace layout_algebra {
namespace debug {

/**
 * @enum LogLevel
 * @brief Log message levels
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Get log level name
 * @param level Log level
 * @return Log level name
 */
inline const char* get_log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Format one log line
 * @param level Log level
 * @param file Source file name
 * @param line Source line number
 * @param message Log message
 * @return "[LEVEL] file:line - message"
 */
inline std::string format_log_line(LogLevel level, const char* file, int line,
                                   const std::string& message) {
    std::ostringstream oss;
    oss << "[" << get_log_level_name(level) << "] " << file << ":" << line << " - " << message;
    return oss.str();
}

/**
 * @brief Print log message
 *
 * Errors are always printed; other levels only in debug builds.
 */
inline void print_log(LogLevel level, const char* file, int line, const std::string& message) {
    if (config::DEBUG_MODE || level == LogLevel::ERROR) {
        std::cerr << format_log_line(level, file, line, message) << std::endl;
    }
}

/**
 * @brief Format log message
 * @param args Arguments to format
 * @return Formatted message
 */
template<typename... Args>
std::string format_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

// Logging macros
#define LAYOUT_DEBUG(...)                                                      \
    do {                                                                       \
        if (layout_algebra::config::DEBUG_MODE) {                              \
            layout_algebra::debug::print_log(layout_algebra::debug::LogLevel::DEBUG, \
                                             __FILE__, __LINE__,               \
                                             layout_algebra::debug::format_message(__VA_ARGS__)); \
        }                                                                      \
    } while (0)

#define LAYOUT_INFO(...)                                                       \
    do {                                                                       \
        if (layout_algebra::config::DEBUG_MODE) {                              \
            layout_algebra::debug::print_log(layout_algebra::debug::LogLevel::INFO, \
                                             __FILE__, __LINE__,               \
                                             layout_algebra::debug::format_message(__VA_ARGS__)); \
        }                                                                      \
    } while (0)

#define LAYOUT_WARNING(...)                                                    \
    do {                                                                       \
        if (layout_algebra::config::DEBUG_MODE) {                              \
            layout_algebra::debug::print_log(layout_algebra::debug::LogLevel::WARNING, \
                                             __FILE__, __LINE__,               \
                                             layout_algebra::debug::format_message(__VA_ARGS__)); \
        }                                                                      \
    } while (0)

#define LAYOUT_ERROR(...)                                                      \
    do {                                                                       \
        layout_algebra::debug::print_log(layout_algebra::debug::LogLevel::ERROR, \
                                         __FILE__, __LINE__,                   \
                                         layout_algebra::debug::format_message(__VA_ARGS__)); \
    } while (0)

// Internal invariant check, active in debug builds only
#define LAYOUT_ASSERT(condition, ...)                                          \
    do {                                                                       \
        if (layout_algebra::config::ENABLE_ASSERTIONS && !(condition)) {       \
            LAYOUT_ERROR("Assertion failed: " #condition " - ",                \
                         layout_algebra::debug::format_message(__VA_ARGS__));  \
            assert(condition);                                                 \
        }                                                                      \
    } while (0)

} // namespace debug
} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_UTILS_DEBUG_HPP
