#include "ctxhost/capabilities/now.hpp"

#include "ctxhost/exceptions.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctxhost::capabilities
{

namespace
{
// ".250", ".001500" or ".000000001"; empty on a whole second
std::string fraction(long long nanos)
{
    if (nanos == 0)
        return {};
    std::ostringstream oss;
    oss << '.' << std::setfill('0');
    if (nanos % 1000000 == 0)
        oss << std::setw(3) << nanos / 1000000;
    else if (nanos % 1000 == 0)
        oss << std::setw(6) << nanos / 1000;
    else
        oss << std::setw(9) << nanos;
    return oss.str();
}

// strftime's "+0100" as "+01:00"
std::string utc_offset(const std::tm& tm)
{
    char buf[8] = {};
    std::strftime(buf, sizeof(buf), "%z", &tm);
    std::string offset(buf);
    if (offset.size() == 5)
        offset.insert(3, 1, ':');
    return offset;
}
} // namespace

std::string time_info(std::chrono::system_clock::time_point when)
{
    const auto whole = std::chrono::floor<std::chrono::seconds>(when);
    const long long nanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(when - whole).count();

    std::time_t t = std::chrono::system_clock::to_time_t(whole);
    std::tm tm{};
#ifdef _WIN32
    if (localtime_s(&tm, &t) != 0)
        throw InvocationError("cannot convert time to local time");
#else
    if (localtime_r(&t, &tm) == nullptr)
        throw InvocationError("cannot convert time to local time");
#endif

    char week[8] = {};
    std::strftime(week, sizeof(week), "%V", &tm);

    std::ostringstream oss;
    oss << "Current local time: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << fraction(nanos)
        << " " << utc_offset(tm) << "\n"
        << "Week of the year: " << std::atoi(week) << "\n"
        << "Day of the week: " << std::put_time(&tm, "%A") << "\n";
    return oss.str();
}

std::string current_time_info()
{
    return time_info(std::chrono::system_clock::now());
}

std::vector<ContentBlock> NowTool::execute(const std::optional<Json>&) const
{
    return {TextContent{current_time_info()}};
}

tools::Tool NowTool::to_tool() const
{
    return tools::Tool{
        "now",
        std::string("Retrieve the current local time, week of the year, and day of the week."),
        Json{{"type", "object"}, {"properties", Json::object()}}};
}

prompts::ComputedPrompt NowPrompt::compute(const std::optional<Json>&) const
{
    prompts::ComputedPrompt computed;
    computed.description = "Current time information";
    computed.messages.push_back(
        prompts::PromptMessage{prompts::PromptRole::User, TextContent{current_time_info()}});
    return computed;
}

prompts::Prompt NowPrompt::to_prompt() const
{
    return prompts::Prompt{"Now", std::nullopt, {}};
}

} // namespace ctxhost::capabilities
