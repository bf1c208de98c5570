#include "logger.hpp"

#include <cstdio>

#include <raylib.h>

namespace harvest::core {

static Logger* g_logger = nullptr;

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (file_) {
            SetTraceLogCallback(&Logger::trace_callback);
            callback_installed_ = true;
        } else {
            TraceLog(LOG_WARNING, "[log] cannot open log file %s, logging to stderr only", cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

static const char* level_name(int logLevel) {
    switch (logLevel) {
        case LOG_ALL: return "ALL";
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        case LOG_NONE: return "NONE";
        default: return "INFO";
    }
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level_str = level_name(logLevel);
    const double t = GetTime();

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(sink, "[%.3f][%s] ", t, level_str);
        std::vfprintf(sink, text, args);
        std::fputc('\n', sink);
        std::fflush(sink);

        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args_copy);
        std::fputc('\n', stderr);

        va_end(args_copy);
    } else {
        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args);
        std::fputc('\n', stderr);
    }
}

} // namespace harvest::core
