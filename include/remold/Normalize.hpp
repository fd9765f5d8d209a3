/**
 * @file Normalize.hpp
 * @brief Whitespace clean-up applied to merged output
 */

#ifndef REMOLD_NORMALIZE_HPP
#define REMOLD_NORMALIZE_HPP

#include <string>

namespace remold {

/**
 * @brief Convert CRLF and lone CR line endings to '\n'
 *
 * The mergers expect '\n'-delimited input; callers apply this to every
 * text they read before merging.
 */
std::string normalize_newlines(const std::string& text);

/**
 * @brief Make text end in exactly one '\n'; empty text stays empty
 */
std::string ensure_trailing_newline(const std::string& text);

/**
 * @brief Drop repeated magic comments from a script's leading comment run
 *
 * `# frozen_string_literal:`, `# encoding:` / `# coding:`,
 * `# warn_indent:` and `# shareable_constant_value:` are kept once each
 * (first occurrence). Comments after the first code line are not touched.
 */
std::string collapse_magic_comments(const std::string& text);

/**
 * @brief One blank line around each heading, no runs of blank lines
 *
 * Lines inside fenced code blocks are copied as is. Leading blank lines
 * of the document are removed.
 */
std::string normalize_heading_spacing(const std::string& text);

} // namespace remold

#endif // REMOLD_NORMALIZE_HPP
