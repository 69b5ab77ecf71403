#include "../include/Common/Logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Common {

namespace {

const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

long long MillisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace

LogLevel ParseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn")
        return LogLevel::WARNING;
    if (lower == "error")
        return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& logFilePath, LogLevel minLevel, bool enableConsole) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_running) {
        return true;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(logFilePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    m_file.open(logFilePath, std::ios::app);
    if (!m_file.is_open()) {
        return false;
    }

    m_minLevel = minLevel;
    m_enableConsole = enableConsole;
    m_stopping = false;
    m_pending.clear();
    m_writer = std::thread(&Logger::writerLoop, this);
    m_running = true;
    lock.unlock();

    debug("Logger", "Log file opened", logFilePath);
    return true;
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        m_stopping = true;
    }
    m_wakeup.notify_all();

    if (m_writer.joinable()) {
        m_writer.join();
    }
    m_file.close();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& details) {
    if (!m_running || level < m_minLevel) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_pending.emplace_back(level, component, message, details);
    }
    m_wakeup.notify_one();
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::DEBUG, component, message, details);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::INFO, component, message, details);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::WARNING, component, message, details);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::ERROR, component, message, details);
}

void Logger::writerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        m_wakeup.wait(lock, [this] { return m_stopping || !m_pending.empty(); });

        std::deque<LogEntry> batch;
        batch.swap(m_pending);
        const bool stop = m_stopping;

        lock.unlock();
        for (const auto& entry : batch) {
            writeLine(entry);
        }
        m_file.flush();
        lock.lock();

        // Entries queued before the stop request are drained above
        if (stop && m_pending.empty()) {
            return;
        }
    }
}

void Logger::writeLine(const LogEntry& entry) {
    const std::string line = formatLine(entry);
    m_file << line << '\n';

    if (m_enableConsole) {
        std::ostream& out = (entry.level >= LogLevel::ERROR) ? std::cerr : std::clog;
        out << line << std::endl;
    }
}

std::string Logger::formatLine(const LogEntry& entry) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm local = {};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis
         << " [" << LevelTag(entry.level) << "] [" << entry.component << "] " << entry.message;
    if (!entry.details.empty()) {
        line << " | " << entry.details;
    }
    return line.str();
}

ScopedLogger::ScopedLogger(const std::string& component, const std::string& operation)
    : m_component(component), m_operation(operation), m_startTime(std::chrono::steady_clock::now()) {
    Logger::getInstance().debug(m_component, "Starting operation: " + m_operation);
}

ScopedLogger::~ScopedLogger() {
    if (!m_completed) {
        finish(LogLevel::DEBUG, "Completed operation: ", "");
    }
}

void ScopedLogger::success(const std::string& details) {
    if (!m_completed) {
        finish(LogLevel::INFO, "Operation completed: ", "SUCCESS" + (details.empty() ? "" : " | " + details));
    }
}

void ScopedLogger::failure(const std::string& error, const std::string& details) {
    if (!m_completed) {
        finish(LogLevel::ERROR, "Operation failed: ",
               "FAILED | Error: " + error + (details.empty() ? "" : " | " + details));
    }
}

void ScopedLogger::addContext(const std::string& key, const std::string& value) {
    if (!m_context.empty()) {
        m_context += ", ";
    }
    m_context += key + "=" + value;
}

void ScopedLogger::finish(LogLevel level, const std::string& headline, std::string details) {
    m_completed = true;

    std::string duration = "Duration: " + std::to_string(MillisecondsSince(m_startTime)) + "ms";
    details = details.empty() ? duration : details + " | " + duration;
    if (!m_context.empty()) {
        details += " | " + m_context;
    }
    Logger::getInstance().log(level, m_component, headline + m_operation, details);
}

} // namespace Common
