#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace mdns_browser
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};
std::string ToString(LogLevel level);

using LoggerCallback = std::function<void(LogLevel, std::string_view)>;

// Replaces the default stdout/stderr sink, an empty callback restores it.
// The callback may be invoked from the discovery worker thread.
void SetLogger(LoggerCallback callback);

// Messages below this level are dropped, default is Info
void SetLogLevel(LogLevel level);
[[nodiscard]] LogLevel GetLogLevel();

void Log(LogLevel level, std::string_view string);

}
