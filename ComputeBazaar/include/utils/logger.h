#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace bazaar {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);
    static void logf(LogLevel level, const char* fmt, ...);

    static void flush();
    static void rotate();

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getLogCount();
    static uint64_t getErrorCount();

    static std::string getLogPath();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static bool isInitialized();
    static void setAllowSensitiveLogging(bool allow);

    // Provider and node identifiers are shortened unless sensitive logging is on.
    static std::string redactAddress(const std::string& address);
};

#define LOG_DEBUG(msg) do { if (bazaar::utils::Logger::getLevel() <= bazaar::utils::LogLevel::DEBUG) bazaar::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) bazaar::utils::Logger::info(msg)
#define LOG_WARN(msg) bazaar::utils::Logger::warn(msg)
#define LOG_ERROR(msg) bazaar::utils::Logger::error(msg)
#define LOG_MARKET(level, msg) bazaar::utils::Logger::log(level, "market", msg)

}
}
