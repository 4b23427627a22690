#pragma once
#include <functional>
#include <string>

namespace ctxhost::log
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

/// Parse "debug", "INFO", "warn", "warning", "error" (case-insensitive).
/// Unknown names map to Info.
LogLevel log_level_from_string(const std::string& name);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Messages below this level are dropped before reaching the sink.
void set_level(LogLevel level);
LogLevel level();

/// Replace the sink. The default sink writes "[ctxhost] LEVEL message" to stderr;
/// stdout is reserved for protocol traffic. A custom sink is called without any
/// logger lock held and must serialize its own output.
void set_sink(LogCallback callback);
void reset_sink();

void write(LogLevel level, const std::string& message);

inline void debug(const std::string& message)
{
    write(LogLevel::Debug, message);
}

inline void info(const std::string& message)
{
    write(LogLevel::Info, message);
}

inline void warning(const std::string& message)
{
    write(LogLevel::Warning, message);
}

inline void error(const std::string& message)
{
    write(LogLevel::Error, message);
}

} // namespace ctxhost::log
