#include "mdns_browser/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include <fmt/core.h>

namespace mdns_browser
{

namespace
{

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_loggerMutex;
LoggerCallback g_logger;

void DefaultSink(LogLevel level, std::string_view string)
{
    auto& stream = level >= LogLevel::Warn ? std::cerr : std::cout;
    stream << fmt::format("[{}] {}\n", ToString(level), string);
}

}

std::string ToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

void SetLogger(LoggerCallback callback)
{
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    g_logger = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return g_level.load(std::memory_order_relaxed);
}

void Log(LogLevel level, std::string_view string)
{
    if (level < GetLogLevel()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (g_logger) {
        g_logger(level, string);
    } else {
        DefaultSink(level, string);
    }
}

}
