/**
 * @file DocumentMerge.hpp
 * @brief Branch-preserving merge of heading-delimited documents
 *
 * The template supplies structure and boilerplate. For each section the
 * user is known to customize (matched by normalized key), the whole
 * branch body is taken from the destination instead. The first H1 line is
 * also taken verbatim from the destination, keeping author decoration
 * such as a leading symbol.
 *
 * The template text is expected to already be the output of any
 * node-level merge; this layer only rewrites section branches.
 */

#ifndef REMOLD_DOCUMENT_MERGE_HPP
#define REMOLD_DOCUMENT_MERGE_HPP

#include "remold/Report.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace remold {

struct DocumentMergeOptions {
    /// Section keys (see section_key()) whose branch body comes from the destination
    std::set<std::string> preserved_keys{"synopsis", "configuration", "basic usage"};

    /// Additional preservation test on a section key; may be empty
    std::function<bool(const std::string&)> preserved_predicate;

    /// Replace the first H1 line with the destination's first H1 line
    bool preserve_h1 = true;
};

/**
 * @brief Build a predicate matching keys that start with any of the prefixes
 *
 * Matching is case-insensitive. `prefix_predicate({"note:"})` accepts
 * "note: beta" and "note:".
 */
std::function<bool(const std::string&)> prefix_predicate(std::vector<std::string> prefixes);

/**
 * @brief Merge template and destination documents
 *
 * Returns the template unchanged if the destination is empty or blank.
 * Never throws for malformed input.
 */
std::string merge_document(const std::string& template_text,
                           const std::string& destination_text,
                           const DocumentMergeOptions& options = DocumentMergeOptions{},
                           Report* report = nullptr);

/**
 * @brief Replace preserved branches of `merged` with the destination's
 *
 * A preserved section missing from the destination gets an empty body of
 * two blank lines. A preserved section nested in another preserved branch
 * is not rewritten on its own; the outer branch replaces it whole.
 * Sections are rewritten from last to first.
 */
std::string preserve_sections(const std::string& merged,
                              const std::string& destination,
                              const DocumentMergeOptions& options,
                              Report* report = nullptr);

/**
 * @brief Replace the first H1 line of `merged` with the destination's first H1
 *
 * Returns `merged` unchanged when either side has no H1 outside fences.
 */
std::string preserve_h1(const std::string& merged, const std::string& destination);

} // namespace remold

#endif // REMOLD_DOCUMENT_MERGE_HPP
