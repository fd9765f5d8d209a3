/**
 * @file ScriptTree.hpp
 * @brief Read-only syntax tree of a declarative build script
 *
 * The splicer works against this interface, never against a concrete
 * parser. A tree is a list of top-level statements; each statement has
 * been classified exactly once by the parser into a StatementKind so the
 * splicer can dispatch on the tag instead of re-inspecting source text.
 *
 * Every SourceRange is a half-open [start, end) pair of *byte* offsets into
 * the buffer that was parsed, so offsets stay valid for text containing
 * multi-byte characters.
 */

#ifndef REMOLD_SCRIPT_TREE_HPP
#define REMOLD_SCRIPT_TREE_HPP

#include "remold/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace remold {

struct SourceRange {
    size_t start = 0;
    size_t end = 0;

    size_t length() const noexcept { return end - start; }
};

/**
 * @brief One call argument, or the right-hand side of an assignment
 */
struct Argument {
    SourceRange location;
    /// Decoded literal: a string, or an array of strings. Null when the
    /// argument is computed (identifier, interpolation, call, heredoc, ...).
    Value literal;

    bool is_literal() const { return !literal.is_null(); }
};

enum class StatementKind {
    FieldAssignment, ///< recv.field = rhs
    MethodCall,      ///< recv.method args / method(args)
    BlockCall,       ///< a MethodCall carrying a do ... end block
    Other
};

const char* statement_kind_name(StatementKind kind) noexcept;

struct Statement;

/**
 * @brief A `do |param| ... end` block
 */
struct Block {
    std::string parameter;   ///< first block parameter, empty if none
    SourceRange opening;     ///< `do` through the end of the parameter list
    SourceRange body;        ///< from the end of `opening` to the start of `end`
    SourceRange closing;     ///< the `end` keyword
    std::vector<Statement> statements;
};

struct Statement {
    StatementKind kind = StatementKind::Other;
    SourceRange location;    ///< whole statement, trailing comment excluded
    std::string receiver;    ///< receiver source text, empty if none
    std::string name;        ///< field name (without '=') or method name
    std::vector<Argument> arguments;
    std::optional<Block> block;

    /**
     * @brief First argument's literal value, or null
     */
    const Value& first_literal() const;
};

struct Comment {
    SourceRange location;
    std::string text; ///< including the leading '#'
};

struct ParseResult {
    bool success = false;
    std::string error;            ///< set when success is false
    std::vector<Statement> statements;
    std::vector<Comment> comments;
};

/**
 * @brief A parser producing ScriptTree statements from source text
 */
class ScriptParser {
public:
    virtual ~ScriptParser() = default;

    /**
     * @brief Parse a whole script
     *
     * Must not throw for malformed input: report it through
     * ParseResult::success and ParseResult::error instead.
     */
    virtual ParseResult parse(const std::string& source) const = 0;
};

} // namespace remold

#endif // REMOLD_SCRIPT_TREE_HPP
