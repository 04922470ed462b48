/**
 * @file logger.hpp
 * @brief Process-wide logger for tuning runs and controller diagnostics
 */

#pragma once

#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>

namespace smcpso::utils {

/**
 * @brief Log levels
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal,
    Off
};

/**
 * @brief Logger singleton
 *
 * Messages are printf-formatted into a fixed buffer and handed either to
 * the output callback or to stderr as "[LEVEL] message". Calls are
 * serialised, so OpenMP workers of the batch simulator may log.
 */
class Logger {
public:
    using OutputCallback = std::function<void(LogLevel, const char*)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        minLevel_ = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return minLevel_;
    }

    /**
     * @brief Redirect output; an empty callback restores stderr
     */
    void setOutputCallback(OutputCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(callback);
    }

    bool isEnabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return passes(level);
    }

    void log(LogLevel level, const char* format, ...) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!passes(level)) return;

        char message[512];
        va_list args;
        va_start(args, format);
        std::vsnprintf(message, sizeof(message), format, args);
        va_end(args);

        if (sink_) {
            sink_(level, message);
        } else {
            std::fprintf(stderr, "[%s] %s\n", levelTag(level), message);
        }
    }

    static const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            default:                return "?????";
        }
    }

private:
    Logger() = default;

    bool passes(LogLevel level) const {
        return level != LogLevel::Off && level >= minLevel_;
    }

    mutable std::mutex mutex_;
    LogLevel minLevel_ = LogLevel::Info;
    OutputCallback sink_;
};

}  // namespace smcpso::utils

#define SMCPSO_LOG(level, ...)   smcpso::utils::Logger::instance().log(level, __VA_ARGS__)
#define SMCPSO_LOG_TRACE(...)    SMCPSO_LOG(smcpso::utils::LogLevel::Trace, __VA_ARGS__)
#define SMCPSO_LOG_DEBUG(...)    SMCPSO_LOG(smcpso::utils::LogLevel::Debug, __VA_ARGS__)
#define SMCPSO_LOG_INFO(...)     SMCPSO_LOG(smcpso::utils::LogLevel::Info, __VA_ARGS__)
#define SMCPSO_LOG_WARNING(...)  SMCPSO_LOG(smcpso::utils::LogLevel::Warning, __VA_ARGS__)
#define SMCPSO_LOG_ERROR(...)    SMCPSO_LOG(smcpso::utils::LogLevel::Error, __VA_ARGS__)
#define SMCPSO_LOG_FATAL(...)    SMCPSO_LOG(smcpso::utils::LogLevel::Fatal, __VA_ARGS__)
