#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace envkeeper {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Messages go to stderr unless redirected (tests capture through a stringstream)
    static void set_stream(std::ostream* stream);

private:
    static Level threshold_;
    static std::ostream* stream_;
    static std::mutex mutex_;
};

// Config strings: debug, info, warn, error, none (case-insensitive)
bool parse_level(const std::string& level_str, Level& level);
Level string_to_level(const std::string& level_str);
const char* level_to_string(Level level);

} // namespace logging
} // namespace envkeeper

#define LOG_INTERNAL(lvl, msg) \
    do { \
        if ((lvl) >= envkeeper::logging::Logger::level()) { \
            std::stringstream ss; \
            ss << msg; \
            envkeeper::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(envkeeper::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(envkeeper::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(envkeeper::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(envkeeper::logging::Level::LVL_ERROR, msg)
