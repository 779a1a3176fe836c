#ifndef DOCPATH_DOCUMENT_HPP
#define DOCPATH_DOCUMENT_HPP

#include "docpath/Value.hpp"
#include "docpath/PathTokenizer.hpp"
#include <string>

namespace docpath {

/**
 * @brief Mapping-rooted document with path helpers.
 *
 * Owns its tree and the separator used by every path operation. All path
 * operations forward to the free functions of Resolver.hpp.
 */
class Document {
public:
    Document() = default;

    /**
     * @throws TypeError if data is not an object
     */
    explicit Document(Value data, std::string separator = kDefaultSeparator);

    // Load a .json or .toml file
    static Document load(const std::string& file, const std::string& separator = kDefaultSeparator);

    // Parse JSON text
    static Document parse(const std::string& json_text, const std::string& separator = kDefaultSeparator);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    const std::string& separator() const noexcept { return separator_; }

    // Path helpers
    Value get(const std::string& path) const;
    const Value* find(const std::string& path) const;
    bool contains(const std::string& path) const;
    void create(const std::string& path, const Value& value);
    void update(const std::string& path, const Value& value);
    void remove(const std::string& path);

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        const Value* v = find(path);
        if (v == nullptr) return fallback;
        try {
            return v->get<T>();
        } catch (const Value::type_error&) {
            return fallback;
        }
    }

    // Serialization
    std::string to_json_string(int indent = 2) const;
    std::string to_toml_string() const;
    void save(const std::string& file, int indent = 2) const;

private:
    Value data_ = Value::object();
    std::string separator_ = kDefaultSeparator;
};

} // namespace docpath

#endif // DOCPATH_DOCUMENT_HPP
