#include "chatraw/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chatraw
{

ServerLogger::ServerLogger() : minLevel(LogLevel::SERVER_INFO), quietMode(false), historyLimit(1000)
{
}

ServerLogger::~ServerLogger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

ServerLogger &ServerLogger::instance()
{
    static ServerLogger instance;
    return instance;
}

void ServerLogger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel ServerLogger::getLevel() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return minLevel;
}

void ServerLogger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

bool ServerLogger::setLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (logFile.is_open())
    {
        logFile.close();
    }

    logFilePath = filePath;
    logFile.open(filePath, std::ios::app);

    if (!logFile.is_open())
    {
        std::cerr << "Failed to open log file: " << filePath << std::endl;
        return false;
    }

    return true;
}

void ServerLogger::setHistoryLimit(size_t limit)
{
    std::lock_guard<std::mutex> lock(logMutex);
    historyLimit = limit;
    while (logs.size() > historyLimit)
    {
        logs.pop_front();
    }
}

void ServerLogger::error(const std::string &message)
{
    log(LogLevel::SERVER_ERROR, message);
}

void ServerLogger::warning(const std::string &message)
{
    log(LogLevel::SERVER_WARNING, message);
}

void ServerLogger::info(const std::string &message)
{
    log(LogLevel::SERVER_INFO, message);
}

void ServerLogger::debug(const std::string &message)
{
    log(LogLevel::SERVER_DEBUG, message);
}

void ServerLogger::error(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_ERROR))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_ERROR, formattedMsg);
}

void ServerLogger::warning(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_WARNING))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_WARNING, formattedMsg);
}

void ServerLogger::info(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_INFO))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_INFO, formattedMsg);
}

void ServerLogger::debug(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_DEBUG))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_DEBUG, formattedMsg);
}

void ServerLogger::logError(const std::string &message)
{
    instance().error(message);
}

void ServerLogger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void ServerLogger::logInfo(const std::string &message)
{
    instance().info(message);
}

void ServerLogger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void ServerLogger::logError(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_ERROR))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_ERROR, formattedMsg);
}

void ServerLogger::logWarning(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_WARNING))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_WARNING, formattedMsg);
}

void ServerLogger::logInfo(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_INFO))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_INFO, formattedMsg);
}

void ServerLogger::logDebug(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_DEBUG))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_DEBUG, formattedMsg);
}

LogLevel ServerLogger::parseLevel(const std::string &name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "ERROR")
        return LogLevel::SERVER_ERROR;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::SERVER_WARNING;
    if (upper == "DEBUG")
        return LogLevel::SERVER_DEBUG;
    return LogLevel::SERVER_INFO;
}

std::vector<LogEntry> ServerLogger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return std::vector<LogEntry>(logs.begin(), logs.end());
}

bool ServerLogger::enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return level <= minLevel;
}

std::string ServerLogger::formatString(const char *format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, format, argsCopy) + 1; // +1 for null terminator
    va_end(argsCopy);

    if (size <= 0)
    {
        return "Error formatting string";
    }

    std::vector<char> buffer(size);
    vsnprintf(buffer.data(), size, format, args);

    return std::string(buffer.data(), buffer.data() + size - 1);
}

void ServerLogger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (level > minLevel)
    {
        return;
    }

    std::string timestamp = getCurrentTimestamp();

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelToString(level) << "] " << message;
    const std::string formattedMessage = logStream.str();

    logs.push_back(LogEntry{level, timestamp, message});
    while (logs.size() > historyLimit)
    {
        logs.pop_front();
    }

    if (level <= LogLevel::SERVER_WARNING)
    {
        std::cerr << formattedMessage << std::endl;
    }
    else if (!(quietMode && level == LogLevel::SERVER_INFO))
    {
        std::cout << formattedMessage << std::endl;
    }

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
    }
}

std::string ServerLogger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::SERVER_ERROR:
        return "ERROR";
    case LogLevel::SERVER_WARNING:
        return "WARNING";
    case LogLevel::SERVER_INFO:
        return "INFO";
    case LogLevel::SERVER_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string ServerLogger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
#ifdef _WIN32
    localtime_s(&localTime, &time);
#else
    localtime_r(&time, &localTime);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace chatraw
