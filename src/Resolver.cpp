/**
 * @file Resolver.cpp
 * @brief Recursive resolution of paths against a document tree
 */

#include "docpath/Resolver.hpp"
#include <iterator>

namespace docpath {

namespace {
    using SegmentIter = std::vector<Segment>::const_iterator;

    /**
     * @brief Result of a read-only descent
     *
     * wrapped_by is set when a non-mapping value was reached with segments
     * still remaining; node then points at that value.
     */
    struct Resolved {
        const Value* node = nullptr;
        const Segment* wrapped_by = nullptr;
    };

    void require_mapping(const Value& tree) {
        if (node_kind(tree) != NodeKind::Mapping) {
            throw TypeError("tree", "object", type_name(tree));
        }
    }

    /**
     * @brief Look up the sequence an indexed segment refers to
     * @throws PropertyNotExist if the property is absent
     * @throws NotAnArray if the property is not a sequence
     */
    template <typename V>
    V& sequence_under(V& map, const Segment& seg) {
        auto it = map.find(seg.property);
        if (it == map.end()) {
            throw PropertyNotExist(seg.property);
        }
        if (node_kind(*it) != NodeKind::Sequence) {
            throw NotAnArray(seg.property);
        }
        return *it;
    }

    /**
     * @brief Require 0 <= index < length
     */
    void check_in_range(const Segment& seg, std::size_t index, const Value& seq) {
        if (index >= seq.size()) {
            throw IndexOutOfRange(seg.property, seq.size());
        }
    }

    Resolved resolve(const Value& map, SegmentIter head, SegmentIter last,
                     const std::string& separator) {
        const SegmentIter tail = std::next(head);
        const Value* working = nullptr;

        if (head->has_index) {
            const std::size_t index = head->index();
            const Value& seq = sequence_under(map, *head);
            check_in_range(*head, index, seq);
            working = &seq[index];
        } else {
            auto it = map.find(head->property);
            if (it != map.end()) {
                working = &*it;
            }
        }

        if (working == nullptr) {
            throw PropertyNotExist(head->property);
        }

        if (tail == last) {
            return Resolved{working, nullptr};
        }

        switch (node_kind(*working)) {
            case NodeKind::Mapping:
                return resolve(*working, tail, last, separator);
            case NodeKind::Sequence:
                return Resolved{working, &*head};
            case NodeKind::Leaf:
                if (working->is_null()) {
                    // null can neither be descended nor wrapped
                    throw PropertyNotExist(join_path(head, last, separator));
                }
                return Resolved{working, &*head};
        }
        return Resolved{working, &*head};
    }

    /**
     * @brief Descend from the root of a parsed path
     *
     * A non-root path without segments resolves to nothing.
     */
    Resolved resolve_parsed(const Value& tree, const ParsedPath& parsed) {
        if (parsed.is_root) {
            return Resolved{&tree, nullptr};
        }
        if (parsed.segments.empty()) {
            throw PropertyNotExist(parsed.text);
        }
        return resolve(tree, parsed.segments.begin(), parsed.segments.end(), parsed.separator);
    }

    bool resolves(const Value& tree, const ParsedPath& parsed) {
        try {
            resolve_parsed(tree, parsed);
            return true;
        } catch (const PathError&) {
            return false;
        }
    }

    void delete_at(Value& map, SegmentIter head, SegmentIter last,
                   const std::string& separator) {
        const SegmentIter tail = std::next(head);

        if (head->has_index) {
            const std::size_t index = head->index();
            Value& seq = sequence_under(map, *head);
            check_in_range(*head, index, seq);

            if (tail == last) {
                seq.erase(index);
                return;
            }

            Value& element = seq[index];
            if (node_kind(element) == NodeKind::Mapping) {
                delete_at(element, tail, last, separator);
                // No empty element containers left behind
                if (element.empty()) {
                    seq.erase(index);
                }
                return;
            }
            map.erase(join_path(head, last, separator));
            return;
        }

        if (tail == last) {
            map.erase(head->property);
            return;
        }

        auto it = map.find(head->property);
        if (it == map.end()) {
            throw PropertyNotExist(head->property);
        }

        switch (node_kind(*it)) {
            case NodeKind::Mapping:
                delete_at(*it, tail, last, separator);
                return;
            case NodeKind::Sequence:
            case NodeKind::Leaf:
                map.erase(join_path(head, last, separator));
                return;
        }
    }

    void create_at(Value& map, SegmentIter head, SegmentIter last,
                   const std::string& separator, const Value& value) {
        const SegmentIter tail = std::next(head);

        if (head->has_index) {
            const std::size_t index = head->index();
            Value& seq = sequence_under(map, *head);

            if (tail == last) {
                // Strict append; an index past the end drops the value
                if (index == seq.size()) {
                    seq.push_back(value);
                }
                return;
            }

            check_in_range(*head, index, seq);
            Value& element = seq[index];
            if (node_kind(element) == NodeKind::Mapping) {
                create_at(element, tail, last, separator, value);
            }
            return;
        }

        if (tail == last) {
            if (!map.contains(head->property)) {
                map[head->property] = value;
            }
            return;
        }

        auto it = map.find(head->property);
        if (it == map.end()) {
            throw PropertyNotExist(head->property);
        }

        switch (node_kind(*it)) {
            case NodeKind::Mapping:
                create_at(*it, tail, last, separator, value);
                return;
            case NodeKind::Sequence:
            case NodeKind::Leaf:
                return;
        }
    }

    void update_at(Value& map, SegmentIter head, SegmentIter last,
                   const std::string& separator, const Value& value) {
        const SegmentIter tail = std::next(head);

        if (head->has_index) {
            const std::size_t index = head->index();
            Value& seq = sequence_under(map, *head);

            if (tail == last) {
                if (index < seq.size()) {
                    seq[index] = value;
                } else if (index == seq.size()) {
                    seq.push_back(value);
                } else {
                    throw IndexOutOfRange(head->property, seq.size());
                }
                return;
            }

            if (index < seq.size() &&
                node_kind(seq[index]) == NodeKind::Mapping) {
                update_at(seq[index], tail, last, separator, value);
                return;
            }
            map[join_path(head, last, separator)] = value;
            return;
        }

        if (tail == last) {
            map[head->property] = value;
            return;
        }

        auto it = map.find(head->property);
        if (it == map.end()) {
            throw PropertyNotExist(head->property);
        }

        switch (node_kind(*it)) {
            case NodeKind::Mapping:
                update_at(*it, tail, last, separator, value);
                return;
            case NodeKind::Sequence:
            case NodeKind::Leaf:
                // TODO: write under head->property instead of the remaining path text
                map[join_path(head, last, separator)] = value;
                return;
        }
    }

    void create_parsed(Value& tree, const ParsedPath& parsed, const Value& value) {
        if (resolves(tree, parsed)) {
            throw AlreadyExists(parsed.text);
        }
        if (parsed.is_root) {
            tree[parsed.text] = value;
            return;
        }
        if (parsed.segments.empty()) {
            throw PropertyNotExist(parsed.text);
        }
        create_at(tree, parsed.segments.begin(), parsed.segments.end(), parsed.separator, value);
    }
}

Value get_path(const Value& tree, const std::string& path, const std::string& separator) {
    require_mapping(tree);
    const ParsedPath parsed = tokenize(path, separator);
    const Resolved found = resolve_parsed(tree, parsed);

    if (found.wrapped_by != nullptr) {
        Value wrapped = Value::object();
        wrapped[found.wrapped_by->property] = *found.node;
        return wrapped;
    }
    return *found.node;
}

const Value* find_path(const Value& tree, const std::string& path, const std::string& separator) {
    require_mapping(tree);
    try {
        const ParsedPath parsed = tokenize(path, separator);
        const Resolved found = resolve_parsed(tree, parsed);
        return found.wrapped_by != nullptr ? nullptr : found.node;
    } catch (const PathError&) {
        return nullptr;
    }
}

bool contains_path(const Value& tree, const std::string& path, const std::string& separator) {
    require_mapping(tree);
    return resolves(tree, tokenize(path, separator));
}

void create_path(Value& tree, const std::string& path, const Value& value,
                 const std::string& separator) {
    require_mapping(tree);
    create_parsed(tree, tokenize(path, separator), value);
}

void update_path(Value& tree, const std::string& path, const Value& value,
                 const std::string& separator) {
    require_mapping(tree);
    const ParsedPath parsed = tokenize(path, separator);

    if (!resolves(tree, parsed)) {
        create_parsed(tree, parsed, value);
        return;
    }

    if (parsed.is_root) {
        // The root has no parent key: the separator itself becomes the key
        tree[parsed.text] = value;
        return;
    }
    update_at(tree, parsed.segments.begin(), parsed.segments.end(), parsed.separator, value);
}

void delete_path(Value& tree, const std::string& path, const std::string& separator) {
    require_mapping(tree);
    const ParsedPath parsed = tokenize(path, separator);

    // Exists-then-remove: report the read failure untouched
    resolve_parsed(tree, parsed);

    if (parsed.is_root) {
        tree.clear();
        return;
    }
    delete_at(tree, parsed.segments.begin(), parsed.segments.end(), parsed.separator);
}

} // namespace docpath
