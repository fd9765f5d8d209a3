/**
 * @file Value.hpp
 * @brief Value type for configuration data and field maps
 *
 * Uses nlohmann::json as the underlying value model. It carries:
 * - Layered merge configuration (defaults, file, overrides)
 * - Desired field values handed to the script splicer: a string, or an
 *   array of strings
 * - Decoded literal values read back from a script syntax tree
 */

#ifndef REMOLD_VALUE_HPP
#define REMOLD_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace remold {

/**
 * @brief JSON-like value type
 *
 * This is an alias for nlohmann::json. See nlohmann::json documentation
 * for the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is an array whose elements are all strings
 *
 * An empty array qualifies.
 */
inline bool is_string_array(const Value& val) {
    if (!val.is_array()) return false;
    for (const auto& elem : val) {
        if (!elem.is_string()) return false;
    }
    return true;
}

/**
 * @brief Check if value can be written as a script field literal
 * @return true for a string or an array of strings
 */
inline bool is_field_literal(const Value& val) {
    return val.is_string() || is_string_array(val);
}

} // namespace remold

#endif // REMOLD_VALUE_HPP
