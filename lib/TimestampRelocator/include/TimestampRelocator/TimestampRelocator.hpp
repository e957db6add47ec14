#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>

/**
 * @brief Recognized timestamp suffix layouts.
 */
enum class TimestampLayout
{
    Standard, /**< YYYY-M-D-H-m-s-MERIDIEM */
    EdgeCase  /**< YYYY-M-D_-_H-m-s with an optional -MERIDIEM */
};

/**
 * @brief Convert a TimestampLayout value to its string representation.
 *
 * @param[in] layout The layout to convert
 * @return String representation of the layout
 */
inline const char* TimestampLayoutToString(TimestampLayout layout)
{
    switch (layout)
    {
    case TimestampLayout::Standard:
        return "Standard";
    case TimestampLayout::EdgeCase:
        return "EdgeCase";
    }
    return "Unknown";
}

/**
 * @brief Result of locating a timestamp suffix inside a file name.
 */
struct TimestampMatch
{
    std::string leading;      /**< Text up to the last line terminator before the description, normally empty */
    std::string description;  /**< Text before the timestamp separator */
    std::string timestamp;    /**< The timestamp itself */
    std::string trailing;     /**< Text after the timestamp, e.g. the extension */
    TimestampLayout layout;   /**< Layout that matched */
};

/**
 * @brief Moves an embedded timestamp suffix to the front of a file name.
 *
 * "vacation-photo-2025-10-09-21-15-39-PM.jpg" becomes
 * "2025-10-09-21-15-39-PM-vacation-photo.jpg". The description is matched
 * greedily, so when several timestamp-shaped runs exist the last one wins.
 *
 * Names longer than MaxNameLength never match; the regex engine recurses
 * once per character of the description.
 */
class TimestampRelocator
{
  public:
    /** Longest name examined, PATH_MAX on Linux. File names are limited to 255 bytes. */
    static constexpr std::size_t MaxNameLength = 4096;

    TimestampRelocator();

    /**
     * @brief Locate the timestamp suffix of a name.
     *
     * @param[in] name File name, extension included
     * @return The split on success, std::nullopt if no layout matches or
     *         @p name exceeds MaxNameLength
     */
    std::optional<TimestampMatch> Match(const std::string& name) const;

    /**
     * @brief Reassemble a name as "<timestamp>-<description>".
     *
     * @param[in] name File name, extension included
     * @return Relocated name, or @p name unchanged when nothing matches or
     *         @p name exceeds MaxNameLength
     */
    std::string Relocate(const std::string& name) const;

  private:
    std::regex _pattern;
};
