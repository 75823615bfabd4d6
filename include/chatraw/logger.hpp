#pragma once

#include "export.hpp"

#include <cstdarg>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace chatraw
{

enum class LogLevel
{
	SERVER_ERROR,
	SERVER_WARNING,
	SERVER_INFO,
	SERVER_DEBUG
};

struct LogEntry
{
	LogLevel level;
	std::string timestamp;
	std::string message;
};

/**
 * @brief Process-wide logger shared by the server, the routes and the provider clients
 *
 * Messages go to the console (errors and warnings on stderr), to an optional
 * append-mode log file, and into a bounded in-memory ring of recent entries.
 */
class CHATRAW_SERVER_API ServerLogger
{
public:
	static ServerLogger& instance();

	ServerLogger(const ServerLogger&) = delete;
	ServerLogger& operator=(const ServerLogger&) = delete;
	ServerLogger(ServerLogger&&) = delete;
	ServerLogger& operator=(ServerLogger&&) = delete;

	void setLevel(LogLevel level);
	LogLevel getLevel() const;

	// Quiet mode keeps INFO out of the console; the file and the ring still get it
	void setQuietMode(bool enabled);

	bool setLogFile(const std::string& filePath);

	// Number of entries kept by getLogs()
	void setHistoryLimit(size_t limit);

	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	static LogLevel parseLevel(const std::string& name);

	std::vector<LogEntry> getLogs() const;

private:
	ServerLogger();
	~ServerLogger();

	void log(LogLevel level, const std::string& message);
	bool enabled(LogLevel level) const;

	static std::string formatString(const char* format, va_list args);
	static std::string levelToString(LogLevel level);
	static std::string getCurrentTimestamp();

	LogLevel minLevel;
	bool quietMode;
	size_t historyLimit;
	std::deque<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
	mutable std::mutex logMutex;
};

} // namespace chatraw
