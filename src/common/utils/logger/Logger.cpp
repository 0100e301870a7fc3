// src/common/utils/logger/Logger.cpp
#include "common/utils/logger/Logger.hpp"
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace multisig_engine::utils {

const char* LogLevelToString(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::NONE:  return "NONE ";
        default: return "UNKN ";
    }
}

LogLevel LogLevelFromString(const char* str)
{
    if (!str) return LogLevel::INFO;

    std::string level_str(str);
    if (level_str == "DEBUG" || level_str == "0") return LogLevel::DEBUG;
    if (level_str == "INFO"  || level_str == "1") return LogLevel::INFO;
    if (level_str == "WARN"  || level_str == "2") return LogLevel::WARN;
    if (level_str == "ERROR" || level_str == "3") return LogLevel::ERROR;
    if (level_str == "FATAL" || level_str == "4") return LogLevel::FATAL;
    if (level_str == "NONE"  || level_str == "5") return LogLevel::NONE;

    return LogLevel::INFO;
}

Logger& Logger::Instance()
{
    std::lock_guard<std::mutex> lock(instance_mutex);
    if (!instance) {
        instance.reset(new Logger());
    }
    return *instance;
}

Logger::~Logger()
{
    if (file.is_open()) {
        file.close();
    }
}

void Logger::Initialize(const char* log_file, bool enable_console)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    console_enabled = enable_console;

    if (log_file) {
        file.open(log_file, std::ios::app);
        file_enabled = file.is_open();
        if (!file_enabled) {
            std::cerr << "[Logger] Failed to open log file: " << log_file << std::endl;
        }
    }

    const char* runtime_level = std::getenv("MSIG_LOG_LEVEL");
    if (!runtime_level) {
        runtime_level = std::getenv("LOG_LEVEL");
    }

    LogLevel requested = runtime_level
        ? LogLevelFromString(runtime_level)
        : static_cast<LogLevel>(MSIG_COMPILE_LOG_LEVEL);

    // 컴파일 레벨보다 상세한 레벨은 매크로가 이미 제거했으므로 의미 없음
    if (static_cast<int>(requested) < MSIG_COMPILE_LOG_LEVEL) {
        std::cerr << "[Logger] Warning: runtime level " << static_cast<int>(requested)
                  << " < compile level " << MSIG_COMPILE_LOG_LEVEL
                  << ". Using compile level." << std::endl;
        requested = static_cast<LogLevel>(MSIG_COMPILE_LOG_LEVEL);
    }
    min_level = requested;

    if (console_enabled) {
        std::cout << "[Logger] Initialized (compile=" << MSIG_COMPILE_LOG_LEVEL
                  << ", runtime=" << LogLevelToString(min_level) << ")";
        if (file_enabled) {
            std::cout << " file=" << log_file;
        }
        std::cout << std::endl;
    }
}

void Logger::SetMinLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if (static_cast<int>(level) < MSIG_COMPILE_LOG_LEVEL) {
        level = static_cast<LogLevel>(MSIG_COMPILE_LOG_LEVEL);
    }
    min_level = level;
}

LogLevel Logger::GetMinLevel() const
{
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

bool Logger::IsEnabled(LogLevel level) const
{
    return static_cast<int>(level) >= static_cast<int>(GetMinLevel());
}

std::string Logger::GetTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

void Logger::Log(LogLevel level, const char* category, const char* message)
{
    if (!IsEnabled(level)) return;

    std::string log_line = GetTimestamp() + " [" + LogLevelToString(level) + "] " +
                           "[" + (category ? category : "-") + "] " +
                           (message ? message : "") + "\n";

    std::lock_guard<std::mutex> lock(log_mutex);

    if (console_enabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << log_line;
        } else {
            std::cout << log_line;
        }
    }

    if (file_enabled && file.is_open()) {
        file << log_line;
        if (level >= LogLevel::ERROR) {
            file.flush();
        }
    }
}

void Logger::Logf(LogLevel level, const char* category, const char* format, ...)
{
    if (!IsEnabled(level)) return;

    char buffer[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer);
}

} // namespace multisig_engine::utils
