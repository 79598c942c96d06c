/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for diagnostics
 *
 * (c) 2026 SecureXfer Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace SecureXfer {

/**
 * @brief Severity attached to each log line
 */
enum class LogLevel {
    Info,
    Warn,
    Error
};

/**
 * @brief Thread-safe logging to debug.log
 *
 * All modules write diagnostics through this class so that concurrent
 * writers (discovery listener, transfer handlers, outgoing workers) never
 * interleave partial lines.
 *
 * Line format: `YYYY-mm-dd HH:MM:SS.mmm - [LEVEL] message`
 *
 * initialize() MUST be called before any worker thread starts. Calling
 * log() before initialize() is a silent no-op, which keeps unit tests quiet.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the log file path
     * @param logPath Path to the log file
     * @param truncate Clear any previous content (done once per process start)
     * @return false if the file could not be created
     */
    static bool initialize(const std::filesystem::path& logPath, bool truncate = true);

    /**
     * @brief Stop logging to file (tests, shutdown)
     */
    static void shutdown();

    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Log an INFO line
     *
     * Kept for call sites that only ever logged informational traces.
     */
    static void log(const std::string& message) { log(LogLevel::Info, message); }
    static void log(const char* message) { log(LogLevel::Info, std::string(message)); }

    static void info(const std::string& message) { log(LogLevel::Info, message); }
    static void warn(const std::string& message) { log(LogLevel::Warn, message); }
    static void error(const std::string& message) { log(LogLevel::Error, message); }

    /**
     * @brief Get the active log path (empty if not initialized)
     */
    static std::filesystem::path path();

    static const char* levelName(LogLevel level);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize())
    static std::filesystem::path s_logPath;
};

} // namespace SecureXfer
