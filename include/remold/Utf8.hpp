/**
 * @file Utf8.hpp
 * @brief Byte-level UTF-8 helpers and leading-symbol detection
 *
 * Document titles and script summaries often start with a decorative
 * symbol ("# 🍲 Kettle Soup"). These helpers find such a symbol as a whole
 * grapheme cluster, so multi-code-point sequences (ZWJ families, flags,
 * keycaps, skin tones) are never split. All offsets are byte offsets.
 */

#ifndef REMOLD_UTF8_HPP
#define REMOLD_UTF8_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace remold {
namespace utf8 {

/**
 * @brief Decode the code point starting at byte offset `pos`
 * @param[out] length Number of bytes consumed (at least 1)
 * @return The code point, or U+FFFD for an invalid or truncated sequence
 */
char32_t decode(const std::string& text, size_t pos, size_t& length) noexcept;

/**
 * @brief True if the code point is an emoji-style pictograph or symbol
 *
 * Covers the Miscellaneous Symbols and Pictographs, Emoticons, Transport,
 * Supplemental Symbols, Dingbats, arrows, geometric shapes and the
 * regional indicators, plus a few stand-alone symbols (©, ®, ™).
 */
bool is_pictographic(char32_t cp) noexcept;

/**
 * @brief Byte length of the extended grapheme cluster starting at `pos`
 *
 * Extends a base code point over variation selectors, skin-tone
 * modifiers, combining marks, the keycap mark, tag characters, ZWJ
 * continuations, and pairs a regional indicator with the next one.
 * Returns 0 at end of text.
 */
size_t grapheme_length(const std::string& text, size_t pos) noexcept;

/**
 * @brief First grapheme cluster of text, or empty if text is empty
 */
std::string leading_grapheme(const std::string& text);

/**
 * @brief Leading pictographic symbol of text
 * @return The first grapheme cluster if its base is pictographic, else nullopt
 *
 * ```cpp
 * leading_symbol("🍲 Soup");    // "🍲"
 * leading_symbol("👨‍👩‍👧 Family"); // whole ZWJ sequence
 * leading_symbol("Soup");       // nullopt
 * ```
 */
std::optional<std::string> leading_symbol(const std::string& text);

/**
 * @brief Drop every leading pictographic cluster, then leading whitespace
 */
std::string strip_leading_symbols(const std::string& text);

} // namespace utf8
} // namespace remold

#endif // REMOLD_UTF8_HPP
