/**
 * @file Config.hpp
 * @brief Layered configuration of the merge and splice operations
 *
 * Layers, lowest precedence first:
 * 1. built-in defaults (default_tree())
 * 2. a JSON or TOML file
 * 3. `dot.key:value` overrides, typed with parse_value()
 *
 * The merged tree is then read into typed option structs. Unknown keys
 * are ignored; a known key holding the wrong type raises ConfigValueError.
 *
 * ```toml
 * [markdown]
 * preserve_sections = ["synopsis", "installation"]
 * preserve_h1 = false
 *
 * [changelog]
 * section = "Unreleased"
 *
 * [script]
 * freeform_fields = ["summary", "description"]
 * ```
 */

#ifndef REMOLD_CONFIG_HPP
#define REMOLD_CONFIG_HPP

#include "remold/Changelog.hpp"
#include "remold/DocumentMerge.hpp"
#include "remold/Splice.hpp"
#include "remold/Value.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace remold {

struct MarkdownSettings {
    std::vector<std::string> preserve_sections{"synopsis", "configuration", "basic usage"};
    std::vector<std::string> preserve_prefixes{"note:"};
    bool preserve_h1 = true;
    bool normalize_heading_spacing = false;

    /**
     * @brief Options for merge_document(), keys normalized like section keys
     */
    DocumentMergeOptions document_options() const;
};

/**
 * @brief Sources for MergeConfig::load()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::vector<std::pair<std::string, Value>> overrides; // final precedence
};

struct MergeConfig {
    MarkdownSettings markdown;
    ChangelogOptions changelog;
    SplicerOptions script;

    /**
     * @brief Defaults as a configuration tree
     */
    static Value default_tree();

    /**
     * @brief Read a configuration tree
     * @throws ConfigValueError if a known key has the wrong type
     * @throws TypeError if a section (e.g. "markdown") is not a table
     */
    static MergeConfig from_value(const Value& tree);

    /**
     * @brief Load using the precedence defaults -> file -> overrides
     * @throws FileNotFoundError, ConfigParseError, ConfigValueError
     */
    static MergeConfig load(const LoadOptions& opts);

    Value to_value() const;
};

} // namespace remold

#endif // REMOLD_CONFIG_HPP
