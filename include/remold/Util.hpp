#ifndef REMOLD_UTIL_HPP
#define REMOLD_UTIL_HPP

#include "remold/Value.hpp"
#include <string>
#include <vector>
#include <utility>

namespace remold {

// Split text on '\n' keeping empty fields, including a trailing one:
// "a\nb\n" -> {"a", "b", ""}. Empty text yields a single empty line.
std::vector<std::string> split_lines(const std::string& text);

// Inverse of split_lines.
std::string join_lines(const std::vector<std::string>& lines);

// ASCII lower-casing; bytes >= 0x80 are left alone.
std::string to_lower(std::string s);

std::string trim(const std::string& s);
std::string rtrim(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool is_blank(const std::string& s);

// Number of leading space/tab characters.
size_t indent_width(const std::string& line);

// Replace every run of spaces/tabs with a single space.
std::string squeeze_horizontal_space(const std::string& s);

// Collapse all whitespace runs to one space and trim the ends.
std::string collapse_whitespace(const std::string& s);

// Parse an override "dot.key:value" into (key, typed value). The value is
// typed with parse_value(). Returns false when no ':' separates a
// non-empty key.
bool parse_override(const std::string& spec, std::pair<std::string, Value>& out);

} // namespace remold

#endif // REMOLD_UTIL_HPP
