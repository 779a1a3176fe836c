/**
 * @file Parse.hpp
 * @brief Conversion of command-line VALUE arguments into tree values
 *
 * A VALUE is read as a JSON literal, so `create a.b 3` stores a number and
 * `create a.b '{"x": []}'` stores an object. Text that is not valid JSON is
 * stored as a string unchanged.
 */

#ifndef DOCPATH_PARSE_HPP
#define DOCPATH_PARSE_HPP

#include "docpath/Value.hpp"
#include <string>

namespace docpath {

/**
 * @brief How a VALUE argument is interpreted
 */
enum class ValueMode {
    Json,    ///< JSON literal, raw string when it does not parse
    String   ///< always the raw string
};

/**
 * @brief Convert a VALUE argument into a Value
 *
 * Examples (ValueMode::Json):
 * - `42` → 42, `-1.5e3` → -1500.0, `true` → true, `null` → null
 * - `[1, 2]` → array, `{"k": "v"}` → object
 * - `"quoted"` → "quoted"
 * - `hello`, `True`, `{broken` → the text itself
 */
Value parse_value(const std::string& text, ValueMode mode = ValueMode::Json);

} // namespace docpath

#endif // DOCPATH_PARSE_HPP
