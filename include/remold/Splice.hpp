/**
 * @file Splice.hpp
 * @brief Field-level editing of declarative build scripts
 *
 * The splicer locates the script's target block call (by default
 * `Gem::Specification.new do |spec| ... end`), plans byte-range edits
 * against that block's body, applies them back to front, and re-inserts
 * the edited body between the call's original opening and closing text.
 * Everything outside the body is left byte-for-byte untouched.
 *
 * Edit offsets are relative to the start of the block body and are
 * measured in bytes.
 *
 * Public operations never throw for data-shape reasons: a parse failure,
 * a missing target block, or any exception raised while planning or
 * applying edits results in the original content being returned, with a
 * diagnostic added to the optional Report.
 */

#ifndef REMOLD_SPLICE_HPP
#define REMOLD_SPLICE_HPP

#include "remold/Report.hpp"
#include "remold/ScriptTree.hpp"
#include "remold/Value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace remold {

struct Edit {
    size_t offset = 0;
    size_t length = 0;
    std::string replacement;
};

/// Ordered (field name, value) pairs; values are strings or string arrays.
using FieldMap = std::vector<std::pair<std::string, Value>>;

/// Ordered (dependency name, full declaration line) pairs.
using DependencyLines = std::vector<std::pair<std::string, std::string>>;

struct SplicerOptions {
    std::string receiver = "Gem::Specification";
    std::string constructor = "new";
    std::string default_param = "spec";

    /// Fields whose real content is never replaced by a placeholder value
    std::vector<std::string> freeform_fields{"summary", "description"};

    /// Field after which missing fields are inserted
    std::string anchor_field = "version";

    /// Methods declaring a dependency on another package
    std::vector<std::string> dependency_methods{"add_dependency", "add_development_dependency"};
};

/**
 * @brief True for a short non-text stand-in value
 *
 * A string whose whitespace-stripped form is one to four characters, none
 * of them ASCII (e.g. a lone emoji). Arrays are never placeholders.
 */
bool is_placeholder(const Value& value);

/**
 * @brief Render a value as script source: "text" or ["a", "b"]
 *
 * Backslashes, double quotes and interpolation openers are escaped.
 * @throws ContractError if the value is not a string or an array of strings
 */
std::string render_literal(const Value& value);

/**
 * @brief Apply edits to a buffer, highest offset first
 *
 * Edits with an out-of-range offset or length are skipped, as are edits
 * overlapping one already applied. Edits sharing an offset are applied
 * so that the result keeps their original order.
 */
std::string apply_edits(const std::string& buffer, std::vector<Edit> edits, Report* report = nullptr);

/**
 * @brief Replace the byte range `body` of `content` with `new_body`
 */
std::string reassemble(const std::string& content, const SourceRange& body, const std::string& new_body);

/**
 * @brief First top-level block call matching the options' receiver and constructor
 * @return nullptr when the script has none
 */
const Statement* find_target_call(const std::vector<Statement>& statements, const SplicerOptions& options);

/**
 * @brief Block parameter of the target call, or the configured default
 */
std::string block_parameter(const Statement& call, const SplicerOptions& options);

/**
 * @brief Assignment of `field` on a receiver ending in `param`
 * @return nullptr when the field is not assigned
 */
const Statement* find_field_node(const std::vector<Statement>& statements,
                                 const std::string& param,
                                 const std::string& field);

class ScriptSplicer {
public:
    explicit ScriptSplicer(const ScriptParser& parser, SplicerOptions options = SplicerOptions{});

    const SplicerOptions& options() const noexcept { return options_; }

    /**
     * @brief Set each field to its desired value
     *
     * Existing literal assignments are rewritten in place; assignments with
     * a computed right-hand side are left alone. Missing fields are
     * inserted after the anchor field, or at the end of the block body.
     * A placeholder never replaces real content of a freeform field, and
     * is never inserted for a missing freeform field.
     */
    std::string replace_fields(const std::string& content, const FieldMap& fields,
                               Report* report = nullptr) const;

    /**
     * @brief Delete every dependency declaration naming `name`
     *
     * Whole source lines are removed, including their line break.
     */
    std::string remove_dependency(const std::string& content, const std::string& name,
                                  Report* report = nullptr) const;

    /**
     * @brief Make the script declare exactly the given dependency lines
     *
     * An existing declaration for a name is rewritten to the desired line;
     * a missing one is inserted like a missing field. Without a target
     * block the lines are appended to the content.
     */
    std::string ensure_dependencies(const std::string& content, const DependencyLines& desired,
                                    Report* report = nullptr) const;

    /// @name Edit planning against a parsed target call
    /// Offsets are relative to `call.block->body.start`.
    /// @{
    std::vector<Edit> plan_fields(const std::string& content, const Statement& call,
                                  const FieldMap& fields, Report* report = nullptr) const;
    std::vector<Edit> plan_removal(const std::string& content, const Statement& call,
                                   const std::string& name) const;
    std::vector<Edit> plan_dependencies(const std::string& content, const Statement& call,
                                        const DependencyLines& desired) const;
    /// @}

private:
    bool is_freeform(const std::string& field) const;
    bool is_dependency_call(const Statement& st, const std::string& param) const;
    Edit insertion(const std::string& content, const Statement& call,
                   const std::string& param, const std::string& line) const;

    const ScriptParser& parser_;
    SplicerOptions options_;
};

} // namespace remold

#endif // REMOLD_SPLICE_HPP
