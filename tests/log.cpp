#include "ctxhost/util/log.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace ctxhost;

int main()
{
    std::vector<std::pair<log::LogLevel, std::string>> captured;
    log::set_sink([&](log::LogLevel level, const std::string& message)
                  { captured.emplace_back(level, message); });

    // Level parsing
    assert(log::log_level_from_string("debug") == log::LogLevel::Debug);
    assert(log::log_level_from_string("INFO") == log::LogLevel::Info);
    assert(log::log_level_from_string("warn") == log::LogLevel::Warning);
    assert(log::log_level_from_string("Warning") == log::LogLevel::Warning);
    assert(log::log_level_from_string("ERROR") == log::LogLevel::Error);
    assert(log::log_level_from_string("bogus") == log::LogLevel::Info);
    assert(log::to_string(log::LogLevel::Warning) == "WARNING");

    // Default level drops debug
    log::set_level(log::LogLevel::Info);
    log::debug("hidden");
    log::info("shown");
    log::error("also shown");
    assert(captured.size() == 2);
    assert(captured[0].first == log::LogLevel::Info);
    assert(captured[0].second == "shown");
    assert(captured[1].first == log::LogLevel::Error);

    // Raising the threshold
    captured.clear();
    log::set_level(log::LogLevel::Error);
    log::warning("dropped");
    log::error("kept");
    assert(captured.size() == 1);
    assert(captured[0].second == "kept");
    assert(log::level() == log::LogLevel::Error);

    // A sink may log from inside itself
    captured.clear();
    log::set_level(log::LogLevel::Info);
    log::set_sink(
        [&](log::LogLevel level, const std::string& message)
        {
            captured.emplace_back(level, message);
            if (message == "outer")
                log::warning("inner");
        });
    log::info("outer");
    assert(captured.size() == 2);
    assert(captured[0].second == "outer");
    assert(captured[1].first == log::LogLevel::Warning);
    assert(captured[1].second == "inner");

    // A sink may replace itself while running
    std::vector<std::string> second;
    log::set_sink(
        [&](log::LogLevel, const std::string& message)
        {
            log::set_sink([&](log::LogLevel, const std::string& m) { second.push_back(m); });
            captured.emplace_back(log::LogLevel::Info, message);
        });
    captured.clear();
    log::info("first");
    log::info("second");
    assert(captured.size() == 1);
    assert(second.size() == 1 && second[0] == "second");

    log::reset_sink();
    log::set_level(log::LogLevel::Info);
    std::cout << "[PASS] log levels and sinks\n";
    return 0;
}
