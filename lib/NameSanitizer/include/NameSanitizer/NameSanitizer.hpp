#pragma once

#include <string>
#include <vector>

/**
 * @brief Kind of a file name segment produced by the bracket scanner.
 */
enum class SegmentKind
{
    Outside, /**< Free text outside square brackets */
    Bracket  /**< Content of a [...] annotation, without the brackets */
};

/**
 * @brief A tagged piece of a file name.
 */
struct NameSegment
{
    SegmentKind kind;  /**< Whether the text was inside brackets */
    std::string text;  /**< Segment text; bracket segments exclude the delimiters */
};

/**
 * @brief Normalizes file names into a constrained character set.
 *
 * Text outside brackets is lowercased, spaces become hyphens, hyphen runs
 * collapse and edge hyphens are stripped. Bracketed annotations (hashes,
 * ids) keep their case and are reattached as "-[content]".
 */
class NameSanitizer
{
  public:
    /**
     * @brief Split a name into alternating outside and bracket segments.
     *
     * A bracket segment runs from a '[' to the next ']'. A '[' inside an open
     * bracket is ordinary content; an unclosed '[' stays in the outside text.
     *
     * @param[in] name Raw file name
     * @return Segments in original order
     */
    std::vector<NameSegment> Split(const std::string& name) const;

    /**
     * @brief Sanitize a raw file name.
     *
     * @param[in] name Raw file name, may include an extension
     * @return Sanitized name, possibly empty
     */
    std::string Sanitize(const std::string& name) const;
};
