/**
 * @file Parse.cpp
 * @brief Implementation of VALUE argument conversion
 */

#include "docpath/Parse.hpp"

namespace docpath {

Value parse_value(const std::string& text, ValueMode mode) {
    if (mode == ValueMode::String) {
        return text;
    }

    Value parsed = Value::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return text;
    }
    return parsed;
}

} // namespace docpath
