// src/core/Log.h
#pragma once

#include <cstdarg>
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#if defined(__GNUC__) || defined(__clang__)
  #define DEEPSEA_PRINTF_ATTR(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
  #define DEEPSEA_PRINTF_ATTR(fmtIdx, argIdx)
#endif

namespace deepsea::core {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical };

// Printf-style logging entry point. Forwards to spdlog's default logger.
void LogMessage(LogLevel level, const char* fmt, ...) DEEPSEA_PRINTF_ATTR(2, 3);

// va_list variant to enable adapter wrappers and forwarding
void LogMessageV(LogLevel level, const char* fmt, va_list args);

} // namespace deepsea::core

namespace deepsea::logsys {

struct Options {
    // Empty: console only. Otherwise a rotating file (1 MiB x 4) is added.
    std::filesystem::path logFile;
    spdlog::level::level_enum level = spdlog::level::info;
};

// Installs the "deepsea" logger as spdlog's default logger. Safe to call again;
// the previous logger is replaced.
void init(const Options& options);

// The "deepsea" logger, or spdlog's default logger if init() was never called.
std::shared_ptr<spdlog::logger> get();

} // namespace deepsea::logsys

// Convenience macros (guarded to avoid accidental redefinition)
#ifndef DEEPSEA_LOG_TRACE
  #define DEEPSEA_LOG_TRACE(...)    ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Trace,    __VA_ARGS__)
#endif
#ifndef DEEPSEA_LOG_DEBUG
  #define DEEPSEA_LOG_DEBUG(...)    ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Debug,    __VA_ARGS__)
#endif
#ifndef DEEPSEA_LOG_INFO
  #define DEEPSEA_LOG_INFO(...)     ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Info,     __VA_ARGS__)
#endif
#ifndef DEEPSEA_LOG_WARN
  #define DEEPSEA_LOG_WARN(...)     ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Warn,     __VA_ARGS__)
#endif
#ifndef DEEPSEA_LOG_ERROR
  #define DEEPSEA_LOG_ERROR(...)    ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Error,    __VA_ARGS__)
#endif
#ifndef DEEPSEA_LOG_CRITICAL
  #define DEEPSEA_LOG_CRITICAL(...) ::deepsea::core::LogMessage(::deepsea::core::LogLevel::Critical, __VA_ARGS__)
#endif
