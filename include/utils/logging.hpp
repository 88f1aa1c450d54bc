#pragma once

#include <mutex>
#include <string>

namespace streamingcore {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /**
     * Parse a level name ("DEBUG", "INFO", "WARN"/"WARNING", "ERROR"),
     * case-insensitive. Unknown names yield INFO.
     */
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    static void write(LogLevel level, const std::string& message);

    static bool initialized_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace streamingcore
