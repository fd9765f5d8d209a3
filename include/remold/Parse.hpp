/**
 * @file Parse.hpp
 * @brief String-to-Value typing for command-line config overrides
 *
 * Typing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...", JSON escapes honoured)
 * - Raw string (fallback)
 */

#ifndef REMOLD_PARSE_HPP
#define REMOLD_PARSE_HPP

#include "remold/Value.hpp"
#include <string>

namespace remold {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("false")                 // false
 * parse_value("3")                     // 3
 * parse_value("[\"synopsis\",\"faq\"]") // ["synopsis", "faq"]
 * parse_value("\"Unreleased\"")        // "Unreleased"
 * parse_value("Unreleased")            // "Unreleased"
 * ```
 */
Value parse_value(const std::string& str);

} // namespace remold

#endif // REMOLD_PARSE_HPP
