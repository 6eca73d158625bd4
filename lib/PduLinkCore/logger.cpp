#include "logger.h"
#include <cstdio>

LogLevel Logger::currentLevel = LogLevel::INFO;
bool Logger::consoleEnabled = true;
LogSink Logger::sink = nullptr;

void Logger::init(LogLevel level)
{
    currentLevel = level;
    consoleEnabled = true;
    sink = nullptr;
}

void Logger::setLevel(LogLevel level)
{
    currentLevel = level;
}

void Logger::enableConsole(bool enable)
{
    consoleEnabled = enable;
}

void Logger::setSink(LogSink newSink)
{
    sink = newSink;
}

void Logger::debug(const std::string &message)
{
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string &message)
{
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string &message)
{
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string &message)
{
    log(LogLevel::ERROR, message);
}

void Logger::critical(const std::string &message)
{
    log(LogLevel::CRITICAL, message);
}

void Logger::log(LogLevel level, const std::string &message)
{
    if (level < currentLevel)
        return;

    std::string logMessage = "[" + levelToString(level) + "] " + message;

    if (consoleEnabled)
    {
        std::printf("%s\n", logMessage.c_str());
    }

    if (sink != nullptr)
    {
        sink(level, logMessage);
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    default:
        return "UNKNOWN";
    }
}

std::string Logger::formatRaw(const std::string &data)
{
    std::string visual;
    visual.reserve(data.size());

    for (unsigned char c : data)
    {
        if (c >= 32 && c <= 126)
        {
            visual += static_cast<char>(c);
        }
        else
        {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "[%02xh]", c);
            visual += hex;
        }
    }
    return visual;
}
