/**
 * @file ThreadSafeLog.cpp
 * @brief Thread-safe file logging implementation
 *
 * (c) 2026 SecureXfer Project
 * Licensed under MIT License
 */

#include "securexfer/ThreadSafeLog.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace SecureXfer {

// Static member definitions
std::mutex ThreadSafeLog::s_mutex;
std::filesystem::path ThreadSafeLog::s_logPath;

bool ThreadSafeLog::initialize(const std::filesystem::path& logPath, bool truncate) {
    std::lock_guard<std::mutex> lock(s_mutex);

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    std::ofstream file(logPath, truncate ? std::ios::trunc : std::ios::app);
    if (!file.is_open()) {
        s_logPath.clear();
        return false;
    }

    s_logPath = logPath;
    return true;
}

void ThreadSafeLog::shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_logPath.clear();
}

std::filesystem::path ThreadSafeLog::path() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_logPath;
}

const char* ThreadSafeLog::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void ThreadSafeLog::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_logPath.empty()) {
        return;  // Not initialized yet - silently skip
    }

    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " - [" << levelName(level) << "] " << message << "\n";

    std::ofstream file(s_logPath, std::ios::app);
    if (file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

} // namespace SecureXfer
