/**
 * @file Sections.hpp
 * @brief Heading sections and their branches in a line-oriented document
 *
 * A document is split into lines (see split_lines()). Every line of the
 * form `#... text` outside a fenced code block opens a Section. The
 * *branch* of a section is the inclusive line range from its heading to
 * the line before the next heading of the same or a shallower level (or
 * the last line of the document), so it contains all nested subsections.
 *
 * Fences are lines starting, after optional indentation, with three
 * backticks. Each one toggles a single opaque flag; an unterminated fence
 * makes the rest of the document opaque.
 */

#ifndef REMOLD_SECTIONS_HPP
#define REMOLD_SECTIONS_HPP

#include <optional>
#include <string>
#include <vector>

namespace remold {

struct Section {
    size_t start_line = 0;
    int level = 1;
    std::string heading; ///< raw heading line
    std::string key;     ///< normalized heading text, see section_key()
};

/**
 * @brief A document split into lines plus its section list
 *
 * Immutable once built. `sections` is strictly increasing in start_line.
 */
struct Outline {
    std::vector<std::string> lines;
    std::vector<Section> sections;

    size_t line_count() const noexcept { return lines.size(); }

    /**
     * @brief Inclusive last line of section `i`'s branch
     */
    size_t branch_end(size_t i) const;

    /**
     * @brief Lines after the heading up to branch_end(i), joined by '\n'
     */
    std::string branch_body(size_t i) const;

    /**
     * @brief Index of the first section with the given key
     */
    std::optional<size_t> find(const std::string& key) const;

    /**
     * @brief Index of the first section at the given level
     */
    std::optional<size_t> first_at_level(int level) const;
};

/**
 * @brief True for a fence-toggle line (optional indentation, then ```)
 */
bool is_fence_line(const std::string& line);

/**
 * @brief Heading level of a line, or 0 if it is not a heading
 *
 * A heading is one or more '#' at column 0, at least one space or tab,
 * then some non-blank text. Fences are not considered here.
 */
int heading_level(const std::string& line);

/**
 * @brief Normalized lookup key for a heading line
 *
 * Drops the '#' markers, then every leading code point that is not a
 * letter or decimal digit (punctuation, emphasis markers, symbols, enclosed
 * numbers, pictographs), lower-cases ASCII letters and collapses
 * whitespace.
 *
 * ```cpp
 * section_key("## 🚀 Basic   Usage"); // "basic usage"
 * section_key("### **Note:** beta");   // "note:** beta"
 * ```
 */
std::string section_key(const std::string& heading_line);

/**
 * @brief Scan lines once and collect the sections outside fences
 */
std::vector<Section> build_sections(const std::vector<std::string>& lines);

/**
 * @brief Split text into lines and build its sections
 */
Outline build_outline(const std::string& text);

/**
 * @brief Inclusive end line of section `i`'s branch
 *
 * Returns sections[j].start_line - 1 for the first j > i with
 * sections[j].level <= sections[i].level, else total_lines - 1.
 * Linear in the number of sections.
 */
size_t branch_end(const std::vector<Section>& sections, size_t i, size_t total_lines);

/**
 * @brief branch_end() for every section in a single pass
 */
std::vector<size_t> branch_ends(const std::vector<Section>& sections, size_t total_lines);

} // namespace remold

#endif // REMOLD_SECTIONS_HPP
