#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace hostlink {
namespace logging {

namespace {
const char *level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return " [DEBUG] ";
        case Level::LVL_INFO:
            return " [INFO]  ";
        case Level::LVL_WARN:
            return " [WARN]  ";
        case Level::LVL_ERROR:
            return " [ERROR] ";
        default:
            return " ";
    }
}
}  // namespace

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::mutex Logger::mutex_;
std::ofstream Logger::file_;

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) { threshold_.store(level); }

Level Logger::level() { return threshold_.load(); }

bool Logger::set_file(const std::string &path, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        error = "Cannot open log file: " + path;
        return false;
    }
    return true;
}

void Logger::log(Level level, const char *, int, const std::string &message) {
    if (level < threshold_.load() || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    line << level_tag(level) << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line.str();
    if (file_.is_open()) {
        file_ << line.str();
    }

    // Flush on error so crash logs are not lost
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
        if (file_.is_open()) {
            file_.flush();
        }
    }
}

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

std::string level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
        default:
            return "info";
    }
}

}  // namespace logging
}  // namespace hostlink
