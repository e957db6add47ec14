#include "ConsoleStyle/ConsoleStyle.hpp"

#include <algorithm>
#include <cctype>

namespace
{

const char* AnsiColorName(AnsiColor color)
{
    switch (color)
    {
    case AnsiColor::Red:
        return "RED";
    case AnsiColor::Green:
        return "GREEN";
    case AnsiColor::Yellow:
        return "YELLOW";
    case AnsiColor::Blue:
        return "BLUE";
    case AnsiColor::Magenta:
        return "MAGENTA";
    case AnsiColor::Cyan:
        return "CYAN";
    case AnsiColor::Grey:
        return "GREY";
    case AnsiColor::Sage:
        return "SAGE";
    case AnsiColor::Rose:
        return "ROSE";
    case AnsiColor::Lilac:
        return "LILAC";
    case AnsiColor::Reset:
        return "RESET";
    }
    return "RESET";
}

} // namespace

const std::map<std::string, std::string>& AnsiColorTable()
{
    static const std::map<std::string, std::string> table = {
        {"RED", "\033[31m"},
        {"GREEN", "\033[32m"},
        {"YELLOW", "\033[33m"},
        {"BLUE", "\033[34m"},
        {"MAGENTA", "\033[35m"},
        {"CYAN", "\033[36m"},
        {"GREY", "\033[90m"},
        {"SAGE", "\033[38;5;108m"},
        {"ROSE", "\033[38;5;167m"},
        {"LILAC", "\033[38;5;141m"},
        {"RESET", "\033[0m"},
    };
    return table;
}

const std::string& AnsiCode(AnsiColor color)
{
    return AnsiColorTable().at(AnsiColorName(color));
}

std::optional<std::string> AnsiCodeByName(const std::string& name)
{
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });

    const auto& table = AnsiColorTable();
    const auto found = table.find(key);
    if (table.end() == found)
    {
        return std::nullopt;
    }
    return found->second;
}

std::string Colorize(const std::string& text, AnsiColor color, bool enabled)
{
    if (false == enabled)
    {
        return text;
    }
    return AnsiCode(color) + text + AnsiCode(AnsiColor::Reset);
}
