#include "NameSanitizer/NameSanitizer.hpp"

#include <algorithm>
#include <cctype>

namespace
{

bool IsAllowedCharacter(char character)
{
    const unsigned char value = static_cast<unsigned char>(character);
    return (0 != std::isalnum(value)) || ('.' == character) || ('-' == character) || ('_' == character);
}

// Only ASCII letters survive IsAllowedCharacter, so a locale-independent
// conversion is enough.
char ToLowerAscii(char character)
{
    if (('A' <= character) && ('Z' >= character))
    {
        return static_cast<char>(character - 'A' + 'a');
    }
    return character;
}

std::string FilterAllowed(const std::string& text)
{
    std::string filtered;
    filtered.reserve(text.size());
    for (char character : text)
    {
        if (true == IsAllowedCharacter(character))
        {
            filtered.push_back(character);
        }
    }
    return filtered;
}

std::string SanitizeOutside(const std::string& text)
{
    std::string hyphenated = text;
    std::replace(hyphenated.begin(), hyphenated.end(), ' ', '-');

    std::string collapsed;
    collapsed.reserve(hyphenated.size());
    for (char character : FilterAllowed(hyphenated))
    {
        if (('-' == character) && (false == collapsed.empty()) && ('-' == collapsed.back()))
        {
            continue;
        }
        collapsed.push_back(ToLowerAscii(character));
    }

    const std::size_t first = collapsed.find_first_not_of('-');
    if (std::string::npos == first)
    {
        return std::string();
    }
    const std::size_t last = collapsed.find_last_not_of('-');
    return collapsed.substr(first, last - first + 1);
}

std::string SanitizeBracket(const std::string& text)
{
    return "-[" + FilterAllowed(text) + "]";
}

} // namespace

std::vector<NameSegment> NameSanitizer::Split(const std::string& name) const
{
    std::vector<NameSegment> segments;
    std::string outside;
    std::string bracket;
    bool insideBracket = false;

    for (char character : name)
    {
        if (false == insideBracket)
        {
            if ('[' == character)
            {
                insideBracket = true;
                bracket.clear();
            }
            else
            {
                outside.push_back(character);
            }
            continue;
        }

        if (']' == character)
        {
            segments.push_back({SegmentKind::Outside, outside});
            segments.push_back({SegmentKind::Bracket, bracket});
            outside.clear();
            insideBracket = false;
        }
        else
        {
            bracket.push_back(character);
        }
    }

    // Unclosed bracket: nothing after it can close, keep it as plain text.
    if (true == insideBracket)
    {
        outside += '[';
        outside += bracket;
    }

    if ((false == outside.empty()) || (true == segments.empty()))
    {
        segments.push_back({SegmentKind::Outside, outside});
    }

    return segments;
}

std::string NameSanitizer::Sanitize(const std::string& name) const
{
    std::string sanitized;
    for (const auto& segment : Split(name))
    {
        if (SegmentKind::Bracket == segment.kind)
        {
            sanitized += SanitizeBracket(segment.text);
        }
        else
        {
            sanitized += SanitizeOutside(segment.text);
        }
    }
    return sanitized;
}
