/**
 * @file Merge.hpp
 * @brief Deep merge of configuration layers
 *
 * Objects merge key by key; any non-object (scalar or array) on the
 * override side replaces the base value entirely. This is how a config
 * file replaces, for example, the whole default
 * `markdown.preserve_sections` list instead of appending to it.
 */

#ifndef REMOLD_MERGE_HPP
#define REMOLD_MERGE_HPP

#include "remold/Value.hpp"
#include <vector>

namespace remold {

/**
 * @brief Deep merge two values
 *
 * @param base Base value (lower precedence)
 * @param override_val Override value (higher precedence); null leaves base as is
 * @return Merged result
 *
 * ```cpp
 * Value base = {{"markdown", {{"preserve_h1", true}, {"preserve_sections", {"synopsis"}}}}};
 * Value over = {{"markdown", {{"preserve_sections", {"faq"}}}}};
 * auto result = deep_merge(base, over);
 * // {"markdown": {"preserve_h1": true, "preserve_sections": ["faq"]}}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge several layers, lowest precedence first
 */
Value deep_merge_all(const std::vector<Value>& layers);

} // namespace remold

#endif // REMOLD_MERGE_HPP
