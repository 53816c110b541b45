/**
 * @file vg_logger.h
 * @brief VoiceGate - Logger
 *
 * Process-wide logger that can be routed to an external sink (the host
 * application's logging system). Without a sink, messages go to
 * stdout/stderr as "[LEVEL][Category] message".
 *
 * The sink side redacts sensitive words (password, secret, token,
 * voiceprint) unless redaction is switched off. Call sites never filter.
 *
 * Usage:
 *   VG_LOG_INFO("Listener", "Captured %zu frames", frames.size());
 *   VG_LOG_ERROR("ASR", "Remote backend failed: %s", detail);
 */

#ifndef VG_LOGGER_H
#define VG_LOGGER_H

#include <mutex>
#include <string>

namespace voicegate {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

/**
 * Parse "trace" / "debug" / "info" / "warning" / "error" / "fatal".
 * Returns false and leaves out untouched for anything else.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel level);

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Listener")
 * @param message Formatted (and, if enabled, redacted) message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance();

    void setCallback(LogCallback callback, void* user_data = nullptr);
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;
    void setStderrFallback(bool enabled);
    void setRedaction(bool enabled);

    void log(LogLevel level, const char* category, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

    /**
     * Replace sensitive words with "[REDACTED]" (case-insensitive).
     */
    static std::string redact(const std::string& message);

   private:
    Logger() = default;

    void logToStderr(LogLevel level, const char* category, const char* message);

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Debug;
    bool stderr_fallback_ = true;
    bool redact_ = true;
};

}  // namespace voicegate

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define VG_LOG_TRACE(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Trace, category, __VA_ARGS__)

#define VG_LOG_DEBUG(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Debug, category, __VA_ARGS__)

#define VG_LOG_INFO(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Info, category, __VA_ARGS__)

#define VG_LOG_WARNING(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Warning, category, __VA_ARGS__)

#define VG_LOG_ERROR(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Error, category, __VA_ARGS__)

#define VG_LOG_FATAL(category, ...) \
    voicegate::Logger::instance().log(voicegate::LogLevel::Fatal, category, __VA_ARGS__)

#endif  // VG_LOGGER_H
