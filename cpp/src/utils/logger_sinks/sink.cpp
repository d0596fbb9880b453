#include "utils/logger_sinks/sink.hpp"

#include "utils/format_tools.hpp"

#include <array>
#include <string_view>

#include <fmt/format.h>

namespace walkie::utils
{

namespace
{
constexpr std::array<std::string_view, 6> kLevelTags = {"TRACE", "DEBUG", "INFO",
                                                         "WARN",  "ERROR", "SYSTEM"};

std::string_view level_tag(int level) noexcept
{
    if (level < 0 || static_cast<size_t>(level) >= kLevelTags.size())
    {
        return "?";
    }
    return kLevelTags[static_cast<size_t>(level)];
}
} // namespace

std::string Sink::render(const LogRecord &record)
{
    return fmt::format("{} {:<6} [{}] {}\n", format_tools::formatted_time(record.stamp),
                       level_tag(record.level), record.thread_id, record.text);
}

} // namespace walkie::utils
