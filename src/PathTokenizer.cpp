/**
 * @file PathTokenizer.cpp
 * @brief Implementation of path tokenizing
 */

#include "docpath/PathTokenizer.hpp"
#include "docpath/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace docpath {

namespace {
    /**
     * @brief Check if character is allowed in an indexed property name
     */
    bool is_name_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    }

    bool is_digits(const std::string& s) {
        if (s.empty()) return false;
        return std::all_of(s.begin(), s.end(),
                           [](unsigned char c) { return std::isdigit(c); });
    }
}

std::string normalize_separator(const std::string& separator) {
    return separator.empty() ? std::string(kDefaultSeparator) : separator;
}

Segment parse_segment(const std::string& fragment) {
    Segment seg;
    seg.text = fragment;
    seg.property = fragment;

    const auto open = fragment.find('[');
    if (open == std::string::npos || open == 0 || fragment.back() != ']') {
        return seg;
    }

    const std::string name = fragment.substr(0, open);
    const std::string token = fragment.substr(open + 1, fragment.size() - open - 2);
    if (!std::all_of(name.begin(), name.end(), is_name_char) || !is_digits(token)) {
        return seg;
    }

    seg.property = name;
    seg.index_token = token;
    seg.has_index = true;
    return seg;
}

std::size_t Segment::index() const {
    try {
        return static_cast<std::size_t>(std::stoull(index_token));
    } catch (const std::out_of_range&) {
        throw InvalidIndexType(property, index_token);
    }
}

ParsedPath tokenize(const std::string& path, const std::string& separator) {
    ParsedPath parsed;
    parsed.separator = normalize_separator(separator);
    parsed.text = path.empty() ? parsed.separator : path;

    if (parsed.text == parsed.separator) {
        parsed.is_root = true;
        return parsed;
    }

    const std::string& sep = parsed.separator;
    std::size_t start = 0;
    while (start <= parsed.text.size()) {
        auto pos = parsed.text.find(sep, start);
        if (pos == std::string::npos) pos = parsed.text.size();

        // Drop zero-length fragments
        if (pos > start) {
            parsed.segments.push_back(parse_segment(parsed.text.substr(start, pos - start)));
        }
        start = pos + sep.size();
    }

    return parsed;
}

std::string join_path(std::vector<Segment>::const_iterator first,
                      std::vector<Segment>::const_iterator last,
                      const std::string& separator) {
    std::ostringstream oss;
    for (auto it = first; it != last; ++it) {
        if (it != first) oss << separator;
        oss << it->text;
    }
    return oss.str();
}

std::string join_path(const std::vector<Segment>& segments, const std::string& separator) {
    return join_path(segments.begin(), segments.end(), separator);
}

} // namespace docpath
