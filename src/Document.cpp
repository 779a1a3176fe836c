#include "docpath/Document.hpp"
#include "docpath/Errors.hpp"
#include "docpath/Loader.hpp"
#include "docpath/Resolver.hpp"
#include <utility>

namespace docpath {

Document::Document(Value data, std::string separator)
    : data_(std::move(data))
    , separator_(normalize_separator(separator)) {
    if (!data_.is_object()) {
        throw TypeError("document", "object", type_name(data_));
    }
}

Document Document::load(const std::string& file, const std::string& separator) {
    return Document(load_document_file(file), separator);
}

Document Document::parse(const std::string& json_text, const std::string& separator) {
    return Document(parse_json_document(json_text), separator);
}

Value Document::get(const std::string& path) const {
    return get_path(data_, path, separator_);
}

const Value* Document::find(const std::string& path) const {
    return find_path(data_, path, separator_);
}

bool Document::contains(const std::string& path) const {
    return contains_path(data_, path, separator_);
}

void Document::create(const std::string& path, const Value& value) {
    create_path(data_, path, value, separator_);
}

void Document::update(const std::string& path, const Value& value) {
    update_path(data_, path, value, separator_);
}

void Document::remove(const std::string& path) {
    delete_path(data_, path, separator_);
}

std::string Document::to_json_string(int indent) const {
    return data_.dump(indent);
}

std::string Document::to_toml_string() const {
    return docpath::to_toml_string(data_);
}

void Document::save(const std::string& file, int indent) const {
    write_document_file(file, data_, indent);
}

} // namespace docpath
