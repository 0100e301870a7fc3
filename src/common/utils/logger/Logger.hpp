// src/common/utils/logger/Logger.hpp
#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#ifndef MSIG_COMPILE_LOG_LEVEL
    #ifdef NDEBUG
        #define MSIG_COMPILE_LOG_LEVEL 1  // Release: INFO 이상
    #else
        #define MSIG_COMPILE_LOG_LEVEL 0  // Debug: 모든 로그
    #endif
#endif

namespace multisig_engine::utils {

enum class LogLevel : int {
    DEBUG = 0,  // 개발 디버깅
    INFO = 1,   // 라이프사이클 이벤트 (지갑 생성, 서명, 실행)
    WARN = 2,   // 검증 실패, 감사 로그 실패
    ERROR = 3,  // 배포/실행 실패
    FATAL = 4,  // 프로세스 종료 수준
    NONE = 5    // 로그 비활성화
};

const char* LogLevelToString(LogLevel level);
LogLevel LogLevelFromString(const char* str);

/**
 * @brief 프로세스 전역 로거 (싱글톤)
 *
 * - 컴파일 타임 레벨(MSIG_COMPILE_LOG_LEVEL) 미만은 매크로 단계에서 제거
 * - 런타임 레벨은 MSIG_LOG_LEVEL → LOG_LEVEL 환경 변수 순으로 결정
 * - 콘솔(stdout/stderr) + 선택적 파일 출력
 */
class Logger {
public:
    static Logger& Instance();

    void Initialize(const char* log_file = nullptr, bool enable_console = true);

    /**
     * @brief 런타임 레벨 직접 지정 (테스트/CLI 옵션용)
     * 컴파일 레벨보다 낮게 지정해도 컴파일 레벨이 적용됩니다.
     */
    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, const char* category, const char* message);
    void Logf(LogLevel level, const char* category, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static std::string GetTimestamp();

    inline static std::unique_ptr<Logger> instance = nullptr;
    inline static std::mutex instance_mutex;

    LogLevel min_level = static_cast<LogLevel>(MSIG_COMPILE_LOG_LEVEL);
    mutable std::mutex log_mutex;
    std::ofstream file;
    bool console_enabled = true;
    bool file_enabled = false;
};

} // namespace multisig_engine::utils

// ========================================
// 컴파일 타임 로그 제거 매크로
// ========================================

#define MSIG_LOG_IMPL(level, cat, msg) \
    multisig_engine::utils::Logger::Instance().Log(multisig_engine::utils::LogLevel::level, cat, msg)

#define MSIG_LOG_IMPLF(level, cat, fmt, ...) \
    multisig_engine::utils::Logger::Instance().Logf(multisig_engine::utils::LogLevel::level, cat, fmt, ##__VA_ARGS__)

#if MSIG_COMPILE_LOG_LEVEL <= 0
    #define MSIG_LOG_DEBUG(cat, msg) MSIG_LOG_IMPL(DEBUG, cat, msg)
    #define MSIG_LOG_DEBUGF(cat, fmt, ...) MSIG_LOG_IMPLF(DEBUG, cat, fmt, ##__VA_ARGS__)
#else
    #define MSIG_LOG_DEBUG(cat, msg) ((void)0)
    #define MSIG_LOG_DEBUGF(cat, fmt, ...) ((void)0)
#endif

#if MSIG_COMPILE_LOG_LEVEL <= 1
    #define MSIG_LOG_INFO(cat, msg) MSIG_LOG_IMPL(INFO, cat, msg)
    #define MSIG_LOG_INFOF(cat, fmt, ...) MSIG_LOG_IMPLF(INFO, cat, fmt, ##__VA_ARGS__)
#else
    #define MSIG_LOG_INFO(cat, msg) ((void)0)
    #define MSIG_LOG_INFOF(cat, fmt, ...) ((void)0)
#endif

#if MSIG_COMPILE_LOG_LEVEL <= 2
    #define MSIG_LOG_WARN(cat, msg) MSIG_LOG_IMPL(WARN, cat, msg)
    #define MSIG_LOG_WARNF(cat, fmt, ...) MSIG_LOG_IMPLF(WARN, cat, fmt, ##__VA_ARGS__)
#else
    #define MSIG_LOG_WARN(cat, msg) ((void)0)
    #define MSIG_LOG_WARNF(cat, fmt, ...) ((void)0)
#endif

#if MSIG_COMPILE_LOG_LEVEL <= 3
    #define MSIG_LOG_ERROR(cat, msg) MSIG_LOG_IMPL(ERROR, cat, msg)
    #define MSIG_LOG_ERRORF(cat, fmt, ...) MSIG_LOG_IMPLF(ERROR, cat, fmt, ##__VA_ARGS__)
#else
    #define MSIG_LOG_ERROR(cat, msg) ((void)0)
    #define MSIG_LOG_ERRORF(cat, fmt, ...) ((void)0)
#endif

#if MSIG_COMPILE_LOG_LEVEL <= 4
    #define MSIG_LOG_FATAL(cat, msg) MSIG_LOG_IMPL(FATAL, cat, msg)
    #define MSIG_LOG_FATALF(cat, fmt, ...) MSIG_LOG_IMPLF(FATAL, cat, fmt, ##__VA_ARGS__)
#else
    #define MSIG_LOG_FATAL(cat, msg) ((void)0)
    #define MSIG_LOG_FATALF(cat, fmt, ...) ((void)0)
#endif
