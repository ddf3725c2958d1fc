#include "core/Log.h"

#include <cstdio>
#include <mutex>
#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace deepsea::core {

namespace {

spdlog::level::level_enum ToSpdlog(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:    return spdlog::level::trace;
    case LogLevel::Debug:    return spdlog::level::debug;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warn:     return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

void LogMessageV(LogLevel level, const char* fmt, va_list args)
{
    if (!fmt)
        return;

    auto logger = logsys::get();
    const auto lvl = ToSpdlog(level);
    if (!logger || !logger->should_log(lvl))
        return;

    char buf[2048];
    buf[0] = '\0';

    va_list copy;
    va_copy(copy, args);
    (void)std::vsnprintf(buf, sizeof(buf), fmt, copy);
    va_end(copy);
    buf[sizeof(buf) - 1] = '\0';

    logger->log(lvl, "{}", buf);
}

void LogMessage(LogLevel level, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    LogMessageV(level, fmt, ap);
    va_end(ap);
}

} // namespace deepsea::core

namespace deepsea::logsys {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void init(const Options& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::error_code ec;
    if (!options.logFile.empty())
    {
        if (options.logFile.has_parent_path())
            fs::create_directories(options.logFile.parent_path(), ec);

        if (!ec)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.logFile.string(), 1u << 20, 4)); // 1MB * 4
        }
    }

    auto logger = std::make_shared<spdlog::logger>("deepsea", sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);

    if (ec)
        logger->warn("Log directory {} unavailable ({}); logging to console only",
                     options.logFile.parent_path().string(), ec.message());
    else if (!options.logFile.empty())
        logger->info("Logging started ({})", options.logFile.string());
    else
        logger->info("Logging started");
}

std::shared_ptr<spdlog::logger> get()
{
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_logger)
            return g_logger;
    }
    return spdlog::default_logger();
}

} // namespace deepsea::logsys
