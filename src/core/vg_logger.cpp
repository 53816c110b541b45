/**
 * @file vg_logger.cpp
 * @brief VoiceGate - Logger Implementation
 */

#include "voicegate/core/vg_logger.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace voicegate {

namespace {

const char* const kRedactedWords[] = {"password", "secret", "token", "voiceprint"};
const char* const kRedaction = "[REDACTED]";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    const std::string n = to_lower(name);
    if (n == "trace") {
        out = LogLevel::Trace;
    } else if (n == "debug") {
        out = LogLevel::Debug;
    } else if (n == "info") {
        out = LogLevel::Info;
    } else if (n == "warning" || n == "warn") {
        out = LogLevel::Warning;
    } else if (n == "error") {
        out = LogLevel::Error;
    } else if (n == "fatal") {
        out = LogLevel::Fatal;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Fatal:
            return "FATAL";
        default:
            return "???";
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setCallback(LogCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    user_data_ = user_data;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setStderrFallback(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_fallback_ = enabled;
}

void Logger::setRedaction(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    redact_ = enabled;
}

void Logger::log(LogLevel level, const char* category, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(minLevel())) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string message = redact_ ? redact(buffer) : std::string(buffer);
    const char* cat = category ? category : "VoiceGate";
    if (callback_) {
        callback_(level, cat, message.c_str(), user_data_);
    } else if (stderr_fallback_) {
        logToStderr(level, cat, message.c_str());
    }
}

std::string Logger::redact(const std::string& message) {
    std::string out = message;
    for (const char* word : kRedactedWords) {
        const std::string needle(word);
        std::string lowered = to_lower(out);
        size_t pos = lowered.find(needle);
        while (pos != std::string::npos) {
            out.replace(pos, needle.size(), kRedaction);
            lowered.replace(pos, needle.size(), kRedaction);
            pos = lowered.find(needle, pos + std::char_traits<char>::length(kRedaction));
        }
    }
    return out;
}

void Logger::logToStderr(LogLevel level, const char* category, const char* message) {
    FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
    fprintf(stream, "[%s][%s] %s\n", log_level_name(level), category, message);
    fflush(stream);
}

}  // namespace voicegate
