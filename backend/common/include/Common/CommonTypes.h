#pragma once

#include <chrono>
#include <string>

namespace Common {

/**
 * @brief Result wrapper for fallible operations
 */
template<typename T>
struct Result {
    bool success;
    std::string errorMessage;
    T data;
    int errorCode;

    Result() : success(false), data(), errorCode(0) {}
    Result(const T& value) : success(true), data(value), errorCode(0) {}
    Result(const std::string& error, int code = 0)
        : success(false), errorMessage(error), data(), errorCode(code) {}

    operator bool() const { return success; }
    const T& operator*() const { return data; }
    T& operator*() { return data; }
    const T* operator->() const { return &data; }
    T* operator->() { return &data; }

    bool hasValue() const { return success; }
    const std::string& error() const { return errorMessage; }
};

/**
 * @brief Log levels
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string details;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& det = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), details(det) {}
};

// Parses "debug", "info", "warning"/"warn", "error". Unknown names yield INFO.
LogLevel ParseLogLevel(const std::string& name);

} // namespace Common
