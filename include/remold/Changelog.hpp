/**
 * @file Changelog.hpp
 * @brief Merge of "Keep a Changelog" style documents
 *
 * The template header (title and intro text) and the template's heading
 * for the named section (normally `## [Unreleased]`) are used as is. The
 * section body is rebuilt with every canonical category sub-heading in
 * fixed order, each followed by the destination's items for that
 * category. Everything the destination has below the section (the
 * release history) is carried over untouched apart from whitespace
 * normalization of release heading lines.
 */

#ifndef REMOLD_CHANGELOG_HPP
#define REMOLD_CHANGELOG_HPP

#include "remold/Report.hpp"
#include <optional>
#include <string>
#include <vector>

namespace remold {

struct ChangelogOptions {
    /// Bracketed level-2 heading to rebuild, matched case-insensitively
    std::string section = "Unreleased";

    /// Category labels in output order; rendered as "### <label>"
    std::vector<std::string> categories{"Added", "Changed", "Deprecated",
                                        "Removed", "Fixed", "Security"};
};

/**
 * @brief Item blocks per category, in category order
 *
 * `items[c]` holds the lines of every item block found under category
 * `c`: each bullet line followed by its continuation lines, right-trimmed.
 */
struct CategoryBuckets {
    std::vector<std::vector<std::string>> items;
    size_t dropped_lines = 0; ///< non-blank lines that belonged to no category
};

/**
 * @brief True if `line` is a `## [name]` heading (case-insensitive name)
 */
bool is_named_release_heading(const std::string& line, const std::string& name);

/**
 * @brief Line index of the named section heading, ignoring fenced text
 */
std::optional<size_t> find_named_section(const std::vector<std::string>& lines,
                                         const std::string& name);

/**
 * @brief Group section body lines into category item blocks
 *
 * A `### <label>` line selects the category whose label matches
 * case-insensitively, or no category for unknown labels. A bullet (`-` or
 * `*` followed by a space, at any indent) opens an item block that
 * continues over blank lines, lines indented deeper than the bullet, and
 * everything inside a fence opened within the item. A bullet at the same
 * or a lesser indent, or a `### ` line, ends it. Items outside a known
 * category are dropped. Trailing blank lines of each category are removed.
 */
CategoryBuckets parse_category_items(const std::vector<std::string>& body,
                                     const std::vector<std::string>& categories);

/**
 * @brief Collapse runs of spaces/tabs inside `## [...]` heading lines
 */
std::string normalize_release_headers(const std::string& text);

/**
 * @brief Merge template and destination changelogs
 *
 * - Blank destination: the template is returned unchanged.
 * - Template without the named section: the template is returned after
 *   release-heading normalization.
 * Never throws for malformed input.
 */
std::string merge_changelog(const std::string& template_text,
                            const std::string& destination_text,
                            const ChangelogOptions& options = ChangelogOptions{},
                            Report* report = nullptr);

} // namespace remold

#endif // REMOLD_CHANGELOG_HPP
