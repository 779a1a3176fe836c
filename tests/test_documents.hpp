/**
 * @file test_documents.hpp
 * @brief Sample documents shared by the resolver tests
 */

#ifndef DOCPATH_TEST_DOCUMENTS_HPP
#define DOCPATH_TEST_DOCUMENTS_HPP

#include "docpath/Value.hpp"

namespace docpath {
namespace fixtures {

/// Mappings over sequences of scalars.
inline Value nested_document() {
    return Value::parse(R"({
        "one": {
            "two":  {"three": [1, 2, 3]},
            "four": {"five":  [11, 22, 33]}
        }
    })");
}

/// A sequence of single-key mappings.
inline Value sequence_of_maps() {
    return Value::parse(R"({
        "one": [
            {"map_a": [1, 2, 3]},
            {"map_b": [4, 5, 6]},
            {"map_c": [7, 8, 9]}
        ]
    })");
}

/// Sequences of mappings holding further sequences of mappings.
inline Value interleaved_document() {
    return Value::parse(R"({
        "one": [
            {"two": [{"three": "got three"}, {"four": "got four"}]},
            {"two": [{"five": "got five"},   {"six": "got six"}]},
            {"two": [{"seven": "got seven"}, {"eight": "got eight"}]},
            {"three": [
                {"four":  {"five": "six"}},
                {"seven": {"eight": "ten"}}
            ]}
        ]
    })");
}

} // namespace fixtures
} // namespace docpath

#endif // DOCPATH_TEST_DOCUMENTS_HPP
