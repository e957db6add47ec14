#include "TimestampRelocator/TimestampRelocator.hpp"

namespace
{

// Group 1: description.
// Group 2: standard layout, separated from the description by '-'.
// Group 3: edge-case layout, separated by '-' or by the "_-_" token.
constexpr const char* TimestampPattern =
    R"((.+)(?:-(\d{4}-\d+-\d+-\d+-\d+-\d+-\w+)|(?:_-_|-)(\d{4}-\d+-\d+_-_\d+-\d+-\d+(?:-\w+)?)))";

constexpr std::size_t DescriptionGroup = 1;
constexpr std::size_t StandardGroup = 2;
constexpr std::size_t EdgeCaseGroup = 3;

} // namespace

TimestampRelocator::TimestampRelocator()
    : _pattern(TimestampPattern, std::regex::ECMAScript | std::regex::optimize)
{
}

std::optional<TimestampMatch> TimestampRelocator::Match(const std::string& name) const
{
    if (MaxNameLength < name.size())
    {
        return std::nullopt;
    }

    std::smatch match;
    if (false == std::regex_search(name, match, _pattern))
    {
        return std::nullopt;
    }

    TimestampMatch result;
    result.leading = match.prefix().str();
    result.description = match[DescriptionGroup].str();
    result.trailing = match.suffix().str();

    if (true == match[StandardGroup].matched)
    {
        result.timestamp = match[StandardGroup].str();
        result.layout = TimestampLayout::Standard;
    }
    else
    {
        result.timestamp = match[EdgeCaseGroup].str();
        result.layout = TimestampLayout::EdgeCase;
    }

    return result;
}

std::string TimestampRelocator::Relocate(const std::string& name) const
{
    const std::optional<TimestampMatch> match = Match(name);
    if (false == match.has_value())
    {
        return name;
    }

    return match->leading + match->timestamp + "-" + match->description + match->trailing;
}
