#pragma once

#include <string>

// -------------------------------------------------------------------------
// Logging System
// -------------------------------------------------------------------------
enum class LogLevel
{
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

/**
 * @brief Sink callback type
 * Receives every line that passes the level filter, already formatted.
 */
typedef void (*LogSink)(LogLevel level, const std::string &line);

class Logger
{
private:
    static LogLevel currentLevel;
    static bool consoleEnabled;
    static LogSink sink;

public:
    static void init(LogLevel level = LogLevel::INFO);
    static void setLevel(LogLevel level);
    static LogLevel getLevel() { return currentLevel; }
    static void enableConsole(bool enable);
    static void setSink(LogSink newSink);

    static void debug(const std::string &message);
    static void info(const std::string &message);
    static void warning(const std::string &message);
    static void error(const std::string &message);
    static void critical(const std::string &message);

    static std::string levelToString(LogLevel level);

    // Renders control bytes as [xxh] so raw CLI traffic stays on one line
    static std::string formatRaw(const std::string &data);

private:
    static void log(LogLevel level, const std::string &message);
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::debug(msg)
#define LOG_INFO(msg) Logger::info(msg)
#define LOG_WARNING(msg) Logger::warning(msg)
#define LOG_ERROR(msg) Logger::error(msg)
#define LOG_CRITICAL(msg) Logger::critical(msg)
