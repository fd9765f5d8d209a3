/**
 * @file DotPath.hpp
 * @brief Dot-notation paths into the layered merge configuration
 *
 * Paths look like "markdown.preserve_h1" or "changelog.categories.0".
 * Used to apply command-line overrides and to read typed keys out of the
 * merged configuration tree.
 */

#ifndef REMOLD_DOTPATH_HPP
#define REMOLD_DOTPATH_HPP

#include "remold/Value.hpp"
#include "remold/Errors.hpp"
#include <string>
#include <vector>

namespace remold {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped: "a..b" -> ["a", "b"], "" -> [].
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Look up a value by dot-path
 * @return Pointer to the value, or nullptr if any segment is missing
 * @throws TypeError if traversal hits a scalar before the final segment
 */
const Value* find_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * Intermediate objects are created as needed. An intermediate that exists
 * but is not an object is never overwritten.
 *
 * @throws TypeError if an intermediate segment holds a non-object
 * @throws KeyError if the path is empty
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

} // namespace remold

#endif // REMOLD_DOTPATH_HPP
