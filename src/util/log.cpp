#include "ctxhost/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace ctxhost::log
{

namespace
{
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mutex;
LogCallback g_sink;
std::mutex g_stderr_mutex;

void default_sink(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::cerr << "[ctxhost] " << to_string(level) << " " << message << std::endl;
}
} // namespace

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_level(LogLevel level)
{
    g_level = level;
}

LogLevel level()
{
    return g_level.load();
}

void set_sink(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(callback);
}

void reset_sink()
{
    set_sink(nullptr);
}

void write(LogLevel level, const std::string& message)
{
    if (static_cast<int>(level) < static_cast<int>(g_level.load()))
        return;

    // The sink runs unlocked so it may log or replace itself.
    LogCallback sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        sink = g_sink;
    }
    if (sink)
        sink(level, message);
    else
        default_sink(level, message);
}

} // namespace ctxhost::log
