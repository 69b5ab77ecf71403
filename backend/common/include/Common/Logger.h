#pragma once

#include "CommonTypes.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <thread>

namespace Common {

/**
 * @brief Process-wide log file writer
 *
 * Callers queue entries; a background thread formats and appends them to the
 * log file. Until initialize() succeeds every call is a no-op, so library code
 * and tests can log without setting anything up.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Open the log file and start the writer thread
     * @param logFilePath File to append to; missing parent directories are created
     * @param minLevel Entries below this level are discarded
     * @param enableConsole Mirror every line to stderr/stdlog
     * @return false if the file could not be opened; the logger stays disabled
     */
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO, bool enableConsole = false);

    // Write out everything queued, then stop the writer thread
    void shutdown();

    void log(LogLevel level, const std::string& component, const std::string& message, const std::string& details = "");

    void debug(const std::string& component, const std::string& message, const std::string& details = "");
    void info(const std::string& component, const std::string& message, const std::string& details = "");
    void warning(const std::string& component, const std::string& message, const std::string& details = "");
    void error(const std::string& component, const std::string& message, const std::string& details = "");

    // "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [Component] message | details"
    static std::string formatLine(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writerLoop();
    void writeLine(const LogEntry& entry);

    std::atomic<bool> m_running{false};
    std::atomic<LogLevel> m_minLevel{LogLevel::INFO};
    bool m_enableConsole = false;
    bool m_stopping = false;

    std::ofstream m_file;

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::deque<LogEntry> m_pending;
    std::thread m_writer;
};

/**
 * @brief Logs the start and the outcome of one operation with its duration
 *
 * If neither success() nor failure() is called, the destructor logs a plain
 * completion at DEBUG level.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& component, const std::string& operation);
    ~ScopedLogger();

    void success(const std::string& details = "");
    void failure(const std::string& error, const std::string& details = "");
    void addContext(const std::string& key, const std::string& value);

private:
    void finish(LogLevel level, const std::string& headline, std::string details);

    std::string m_component;
    std::string m_operation;
    std::chrono::steady_clock::time_point m_startTime;
    bool m_completed = false;
    std::string m_context;
};

} // namespace Common

#define WL_LOG_DEBUG(component, message, ...) \
    Common::Logger::getInstance().debug(component, message, ##__VA_ARGS__)

#define WL_LOG_INFO(component, message, ...) \
    Common::Logger::getInstance().info(component, message, ##__VA_ARGS__)

#define WL_LOG_WARNING(component, message, ...) \
    Common::Logger::getInstance().warning(component, message, ##__VA_ARGS__)

#define WL_LOG_ERROR(component, message, ...) \
    Common::Logger::getInstance().error(component, message, ##__VA_ARGS__)

#define WL_SCOPED_LOG(component, operation) \
    Common::ScopedLogger _scopedLogger(component, operation)
