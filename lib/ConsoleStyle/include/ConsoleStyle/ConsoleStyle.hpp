#pragma once

#include <map>
#include <optional>
#include <string>

/**
 * @brief Named ANSI colors used by console reports.
 */
enum class AnsiColor
{
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    Grey,
    Sage,
    Rose,
    Lilac,
    Reset
};

/**
 * @brief Immutable table of color names to escape sequences.
 *
 * Keys are upper-case names ("RED", "SAGE", "RESET", ...).
 *
 * @return Reference to the process-wide table
 */
const std::map<std::string, std::string>& AnsiColorTable();

/**
 * @brief Escape sequence for a color.
 *
 * @param[in] color Color to look up
 * @return Escape sequence, e.g. "\033[31m" for AnsiColor::Red
 */
const std::string& AnsiCode(AnsiColor color);

/**
 * @brief Escape sequence for a color name, case-insensitive.
 *
 * @param[in] name Color name such as "green" or "LILAC"
 * @return Escape sequence, or std::nullopt for an unknown name
 */
std::optional<std::string> AnsiCodeByName(const std::string& name);

/**
 * @brief Wrap text in a color and a reset sequence.
 *
 * @param[in] text Text to wrap
 * @param[in] color Color to apply
 * @param[in] enabled When false the text is returned unchanged
 * @return Possibly colored text
 */
std::string Colorize(const std::string& text, AnsiColor color, bool enabled = true);
