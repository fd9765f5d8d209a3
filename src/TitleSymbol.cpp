#include "remold/TitleSymbol.hpp"
#include "remold/Sections.hpp"
#include "remold/Utf8.hpp"
#include "remold/Util.hpp"

namespace remold {

namespace {

// Title text of a level-1 heading line: everything after "#" and blanks.
std::string h1_text(const std::string& heading) {
    const size_t text = heading.find_first_not_of(" \t", 1);
    return text == std::string::npos ? std::string() : heading.substr(text);
}

} // namespace

std::optional<std::string> readme_h1_symbol(const std::string& readme) {
    const Outline outline = build_outline(readme);
    const auto h1 = outline.first_at_level(1);
    if (!h1) return std::nullopt;
    return utf8::leading_symbol(h1_text(outline.sections[*h1].heading));
}

std::optional<std::string> script_symbol(const std::string& script,
                                         const ScriptParser& parser,
                                         const SplicerOptions& options) {
    const ParseResult tree = parser.parse(script);
    if (!tree.success) return std::nullopt;

    const Statement* call = find_target_call(tree.statements, options);
    if (!call) return std::nullopt;

    const std::string param = block_parameter(*call, options);
    for (const std::string& field : options.freeform_fields) {
        const Statement* node = find_field_node(call->block->statements, param, field);
        if (!node) continue;
        const Value& literal = node->first_literal();
        if (!literal.is_string()) continue;
        if (auto symbol = utf8::leading_symbol(literal.get<std::string>())) {
            return symbol;
        }
    }
    return std::nullopt;
}

std::string sync_readme_h1_symbol(const std::string& readme,
                                  const std::string& script,
                                  const ScriptParser& parser,
                                  const SplicerOptions& options,
                                  Report* report) {
    static const char* const kOp = "sync_readme_h1_symbol";

    const auto symbol = script_symbol(script, parser, options);
    if (!symbol) {
        if (report) report->debug(kOp, "script has no leading symbol");
        return readme;
    }

    Outline outline = build_outline(readme);
    const auto h1 = outline.first_at_level(1);
    if (!h1) {
        if (report) report->info(kOp, "README has no level-1 heading");
        return readme;
    }

    const size_t line = outline.sections[*h1].start_line;
    const std::string title = utf8::strip_leading_symbols(h1_text(outline.lines[line]));
    const std::string updated = "# " + *symbol + " " + title;
    if (updated == outline.lines[line]) return readme;

    outline.lines[line] = updated;
    if (report) report->debug(kOp, "title symbol set to " + *symbol);
    return join_lines(outline.lines);
}

} // namespace remold
