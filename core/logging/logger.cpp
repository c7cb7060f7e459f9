#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace envkeeper {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::ostream* Logger::stream_ = nullptr;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) {
    threshold_ = threshold;
}

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_;
}

void Logger::set_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = stream_ != nullptr ? *stream_ : std::cerr;

    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

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

bool parse_level(const std::string& level_str, Level& level) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") { level = Level::LVL_DEBUG; return true; }
    if (s == "INFO")  { level = Level::LVL_INFO; return true; }
    if (s == "WARN")  { level = Level::LVL_WARN; return true; }
    if (s == "ERROR") { level = Level::LVL_ERROR; return true; }
    if (s == "NONE")  { level = Level::LVL_NONE; return true; }
    return false;
}

Level string_to_level(const std::string& level_str) {
    Level level = Level::LVL_INFO;
    if (!parse_level(level_str, level)) {
        return Level::LVL_INFO;
    }
    return level;
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "debug";
        case Level::LVL_INFO:  return "info";
        case Level::LVL_WARN:  return "warn";
        case Level::LVL_ERROR: return "error";
        case Level::LVL_NONE:  return "none";
    }
    return "info";
}

} // namespace logging
} // namespace envkeeper
