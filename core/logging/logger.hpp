#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace hostlink {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Mirror every line to a file in addition to stderr. Empty path closes the file.
    static bool set_file(const std::string &path, std::string &error);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
    static std::ofstream file_;
};

// Helpers for config parsing and diagnostics
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace hostlink

#define HOSTLINK_LOG_INTERNAL(lvl, msg)                                        \
    do {                                                                       \
        if ((lvl) >= hostlink::logging::Logger::level()) {                     \
            std::stringstream hostlink_log_ss;                                 \
            hostlink_log_ss << msg;                                            \
            hostlink::logging::Logger::log((lvl), __FILE__, __LINE__, hostlink_log_ss.str()); \
        }                                                                      \
    } while (0)

#define LOG_DEBUG(msg) HOSTLINK_LOG_INTERNAL(hostlink::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) HOSTLINK_LOG_INTERNAL(hostlink::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) HOSTLINK_LOG_INTERNAL(hostlink::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) HOSTLINK_LOG_INTERNAL(hostlink::logging::Level::LVL_ERROR, msg)
