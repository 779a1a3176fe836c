/**
 * @file PathTokenizer.hpp
 * @brief Splitting of delimited path strings into segments
 *
 * A path is a list of segments joined by a caller-chosen separator:
 * "one.two.three[2].four" with separator ".". Each segment is a property
 * name, optionally followed by a single bracketed index.
 *
 * Rules:
 * - An empty separator is normalized to "."
 * - An empty path is treated as the separator itself
 * - A path equal to the separator addresses the root
 * - Zero-length fragments (leading, trailing or doubled separators) are
 *   dropped silently
 */

#ifndef DOCPATH_PATHTOKENIZER_HPP
#define DOCPATH_PATHTOKENIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace docpath {

/// Separator used when the caller passes an empty one.
constexpr const char* kDefaultSeparator = ".";

/**
 * @brief One path component: a property name with an optional index
 */
struct Segment {
    /// Property (mapping key) addressed by this segment
    std::string property;

    /// Whether the segment carried a "[n]" suffix
    bool has_index = false;

    /// Digits between the brackets (set if has_index)
    std::string index_token;

    /// Fragment exactly as it appeared in the path string
    std::string text;

    /**
     * @brief Numeric value of index_token
     *
     * Converted on demand so that a bad index only fails once resolution
     * reaches this segment.
     *
     * @throws InvalidIndexType if the digits do not fit the index type
     */
    std::size_t index() const;
};

/**
 * @brief Result of tokenizing a path
 */
struct ParsedPath {
    /// Segments in path order; empty for the root
    std::vector<Segment> segments;

    /// True iff the normalized path equals the separator
    bool is_root = false;

    /// Normalized path text (empty path replaced by the separator)
    std::string text;

    /// Normalized separator
    std::string separator;
};

/**
 * @brief Normalize a separator (empty -> ".")
 */
std::string normalize_separator(const std::string& separator);

/**
 * @brief Parse a single fragment into a Segment
 *
 * A fragment of the form `name[digits]`, where name is made of word
 * characters and hyphens, yields an indexed segment. Any other fragment is
 * taken verbatim as the property name.
 *
 * Examples:
 * - "three" → {property: "three"}
 * - "three[2]" → {property: "three", index: 2}
 * - "my-key[0]" → {property: "my-key", index: 0}
 * - "a[x]" → {property: "a[x]"}
 */
Segment parse_segment(const std::string& fragment);

/**
 * @brief Split a path into segments
 *
 * @param path Path string like "a.b[1].c"
 * @param separator Separator string; empty means "."
 * @return ParsedPath with ordered segments and root flag
 *
 * Examples (separator "."):
 * - "one.two" → ["one", "two"]
 * - "." → [] (root)
 * - "" → [] (root)
 * - ".one..two." → ["one", "two"]
 * - ".." → [] (not root, resolves to nothing)
 */
ParsedPath tokenize(const std::string& path, const std::string& separator);

/**
 * @brief Join the original text of segments [first, last) with a separator
 *
 * Used to rebuild the remaining path below a given recursion level.
 */
std::string join_path(std::vector<Segment>::const_iterator first,
                      std::vector<Segment>::const_iterator last,
                      const std::string& separator);

/**
 * @brief Join all segments of a vector with a separator
 */
std::string join_path(const std::vector<Segment>& segments, const std::string& separator);

} // namespace docpath

#endif // DOCPATH_PATHTOKENIZER_HPP
