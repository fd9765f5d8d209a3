#include "remold/Splice.hpp"
#include "remold/Errors.hpp"
#include "remold/Utf8.hpp"
#include "remold/Util.hpp"

#include <algorithm>

namespace remold {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\' || c == '"') {
            out += '\\';
        } else if (c == '#' && i + 1 < text.size() && text[i + 1] == '{') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

// Leading whitespace of the line holding byte offset `pos`.
std::string line_indent(const std::string& content, size_t pos) {
    const size_t nl = pos == 0 ? std::string::npos : content.rfind('\n', pos - 1);
    const size_t line_start = nl == std::string::npos ? 0 : nl + 1;
    size_t end = line_start;
    while (end < content.size() && (content[end] == ' ' || content[end] == '\t')) ++end;
    return content.substr(line_start, end - line_start);
}

bool has_receiver(const Statement& st, const std::string& param) {
    return !st.receiver.empty() && ends_with(st.receiver, param);
}

std::string strip_root_scope(const std::string& receiver) {
    return starts_with(receiver, "::") ? receiver.substr(2) : receiver;
}

} // namespace

bool is_placeholder(const Value& value) {
    if (!value.is_string()) return false;
    const std::string stripped = trim(value.get<std::string>());
    if (stripped.empty()) return false;

    size_t chars = 0;
    size_t pos = 0;
    while (pos < stripped.size()) {
        if (static_cast<unsigned char>(stripped[pos]) < 0x80) return false;
        size_t length = 1;
        utf8::decode(stripped, pos, length);
        pos += length;
        if (++chars > 4) return false;
    }
    return true;
}

std::string render_literal(const Value& value) {
    if (value.is_string()) {
        return quote(value.get<std::string>());
    }
    if (!is_string_array(value)) {
        throw ContractError("literal must be a string or an array of strings, got " + type_name(value));
    }
    std::string out = "[";
    for (size_t i = 0; i < value.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote(value[i].get<std::string>());
    }
    out += "]";
    return out;
}

std::string apply_edits(const std::string& buffer, std::vector<Edit> edits, Report* report) {
    std::vector<size_t> order(edits.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&edits](size_t a, size_t b) {
        if (edits[a].offset != edits[b].offset) return edits[a].offset > edits[b].offset;
        return a > b;
    });

    std::string out = buffer;
    size_t limit = buffer.size(); // lowest original offset touched so far
    for (size_t idx : order) {
        const Edit& e = edits[idx];
        if (e.offset > buffer.size() || e.length > buffer.size() - e.offset) {
            if (report) {
                report->debug("apply_edits", "skipped out-of-range edit at offset " +
                                                 std::to_string(e.offset));
            }
            continue;
        }
        if (e.offset + e.length > limit) {
            if (report) {
                report->debug("apply_edits", "skipped overlapping edit at offset " +
                                                 std::to_string(e.offset));
            }
            continue;
        }
        out.replace(e.offset, e.length, e.replacement);
        limit = e.offset;
    }
    return out;
}

std::string reassemble(const std::string& content, const SourceRange& body, const std::string& new_body) {
    return content.substr(0, body.start) + new_body + content.substr(body.end);
}

const Statement* find_target_call(const std::vector<Statement>& statements, const SplicerOptions& options) {
    for (const Statement& st : statements) {
        if (st.kind == StatementKind::BlockCall && st.name == options.constructor &&
            strip_root_scope(st.receiver) == options.receiver) {
            return &st;
        }
    }
    return nullptr;
}

std::string block_parameter(const Statement& call, const SplicerOptions& options) {
    if (call.block && !call.block->parameter.empty()) {
        return call.block->parameter;
    }
    return options.default_param;
}

const Statement* find_field_node(const std::vector<Statement>& statements,
                                 const std::string& param,
                                 const std::string& field) {
    for (const Statement& st : statements) {
        if (st.kind == StatementKind::FieldAssignment && st.name == field && has_receiver(st, param)) {
            return &st;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// ScriptSplicer
// ---------------------------------------------------------------------------

ScriptSplicer::ScriptSplicer(const ScriptParser& parser, SplicerOptions options)
    : parser_(parser), options_(std::move(options)) {}

bool ScriptSplicer::is_freeform(const std::string& field) const {
    return contains(options_.freeform_fields, field);
}

bool ScriptSplicer::is_dependency_call(const Statement& st, const std::string& param) const {
    return (st.kind == StatementKind::MethodCall || st.kind == StatementKind::BlockCall) &&
           contains(options_.dependency_methods, st.name) && has_receiver(st, param);
}

// New line after the anchor field, else after the last non-blank body text.
Edit ScriptSplicer::insertion(const std::string& content, const Statement& call,
                              const std::string& param, const std::string& line) const {
    const Block& block = *call.block;
    const size_t base = block.body.start;

    if (const Statement* anchor = find_field_node(block.statements, param, options_.anchor_field)) {
        // End of the anchor's last line, so a trailing comment stays with it.
        // In a single-line block, right after the anchor itself.
        size_t at = content.find('\n', anchor->location.end);
        if (at == std::string::npos || at > block.body.end) at = anchor->location.end;
        return Edit{at - base, 0, "\n" + line_indent(content, anchor->location.start) + line};
    }

    const std::string body = content.substr(base, block.body.length());
    const std::string indent = block.statements.empty()
                                   ? std::string("  ")
                                   : line_indent(content, block.statements.back().location.start);
    return Edit{rtrim(body).size(), 0, "\n" + indent + line};
}

std::vector<Edit> ScriptSplicer::plan_fields(const std::string& content, const Statement& call,
                                             const FieldMap& fields, Report* report) const {
    static const char* const kOp = "replace_fields";
    std::vector<Edit> edits;
    const std::string param = block_parameter(call, options_);
    const size_t base = call.block->body.start;

    for (const auto& [field, value] : fields) {
        if (value.is_null()) continue;
        const bool placeholder = is_placeholder(value);

        if (const Statement* node = find_field_node(call.block->statements, param, field)) {
            const Value& existing = node->first_literal();
            if (is_freeform(field) && placeholder && !existing.is_null() && !is_placeholder(existing)) {
                if (report) report->debug(kOp, "kept " + field + ": placeholder over real content");
                continue;
            }
            if (existing.is_null()) {
                if (report) report->debug(kOp, "kept " + field + ": existing value is not a literal");
                continue;
            }
            edits.push_back(Edit{node->location.start - base, node->location.length(),
                                 param + "." + field + " = " + render_literal(value)});
            continue;
        }

        if (is_freeform(field) && placeholder) {
            if (report) report->debug(kOp, "not inserting placeholder " + field);
            continue;
        }
        edits.push_back(insertion(content, call, param, param + "." + field + " = " + render_literal(value)));
    }
    return edits;
}

std::vector<Edit> ScriptSplicer::plan_removal(const std::string& content, const Statement& call,
                                              const std::string& name) const {
    std::vector<Edit> edits;
    const std::string param = block_parameter(call, options_);
    const size_t base = call.block->body.start;
    const std::string body = content.substr(base, call.block->body.length());

    for (const Statement& st : call.block->statements) {
        if (!is_dependency_call(st, param)) continue;
        const Value& first = st.first_literal();
        if (!first.is_string() || first.get<std::string>() != name) continue;

        const size_t rel_start = st.location.start - base;
        const size_t rel_end = st.location.end - base;
        const size_t before = rel_start == 0 ? std::string::npos : body.rfind('\n', rel_start - 1);
        const size_t line_start = before == std::string::npos ? 0 : before + 1;
        const size_t after = body.find('\n', rel_end);
        const size_t line_end = after == std::string::npos ? body.size() : after + 1;

        const bool duplicate = std::any_of(edits.begin(), edits.end(), [&](const Edit& e) {
            return e.offset == line_start && e.length == line_end - line_start;
        });
        if (!duplicate) edits.push_back(Edit{line_start, line_end - line_start, ""});
    }
    return edits;
}

std::vector<Edit> ScriptSplicer::plan_dependencies(const std::string& content, const Statement& call,
                                                   const DependencyLines& desired) const {
    std::vector<Edit> edits;
    const std::string param = block_parameter(call, options_);
    const size_t base = call.block->body.start;

    for (const auto& [name, line] : desired) {
        const Statement* found = nullptr;
        for (const Statement& st : call.block->statements) {
            const Value& first = st.first_literal();
            if (is_dependency_call(st, param) && first.is_string() && first.get<std::string>() == name) {
                found = &st;
                break;
            }
        }
        if (found) {
            edits.push_back(Edit{found->location.start - base, found->location.length(), trim(line)});
        } else {
            edits.push_back(insertion(content, call, param, trim(line)));
        }
    }
    return edits;
}

std::string ScriptSplicer::replace_fields(const std::string& content, const FieldMap& fields,
                                          Report* report) const {
    static const char* const kOp = "replace_fields";
    if (fields.empty()) return content;
    try {
        const ParseResult tree = parser_.parse(content);
        if (!tree.success) {
            if (report) report->warn(kOp, "script not parsed: " + tree.error);
            return content;
        }
        const Statement* call = find_target_call(tree.statements, options_);
        if (!call) {
            if (report) report->info(kOp, "no " + options_.receiver + "." + options_.constructor + " block");
            return content;
        }
        const SourceRange& body = call->block->body;
        const std::vector<Edit> edits = plan_fields(content, *call, fields, report);
        const std::string new_body =
            apply_edits(content.substr(body.start, body.length()), edits, report);
        return reassemble(content, body, new_body);
    } catch (const std::exception& e) {
        if (report) report->warn(kOp, std::string("left unchanged: ") + e.what());
        return content;
    }
}

std::string ScriptSplicer::remove_dependency(const std::string& content, const std::string& name,
                                             Report* report) const {
    static const char* const kOp = "remove_dependency";
    if (trim(name).empty()) return content;
    try {
        const ParseResult tree = parser_.parse(content);
        if (!tree.success) {
            if (report) report->warn(kOp, "script not parsed: " + tree.error);
            return content;
        }
        const Statement* call = find_target_call(tree.statements, options_);
        if (!call) {
            if (report) report->info(kOp, "no " + options_.receiver + "." + options_.constructor + " block");
            return content;
        }
        const SourceRange& body = call->block->body;
        const std::vector<Edit> edits = plan_removal(content, *call, name);
        if (report) report->debug(kOp, std::to_string(edits.size()) + " declaration(s) of " + name);
        const std::string new_body =
            apply_edits(content.substr(body.start, body.length()), edits, report);
        return reassemble(content, body, new_body);
    } catch (const std::exception& e) {
        if (report) report->warn(kOp, std::string("left unchanged: ") + e.what());
        return content;
    }
}

std::string ScriptSplicer::ensure_dependencies(const std::string& content, const DependencyLines& desired,
                                               Report* report) const {
    static const char* const kOp = "ensure_dependencies";
    if (desired.empty()) return content;
    try {
        const ParseResult tree = parser_.parse(content);
        if (!tree.success) {
            if (report) report->warn(kOp, "script not parsed: " + tree.error);
            return content;
        }
        const Statement* call = find_target_call(tree.statements, options_);
        if (!call) {
            std::string out = content;
            if (!out.empty() && out.back() != '\n') out += '\n';
            for (const auto& entry : desired) {
                out += trim(entry.second) + "\n";
            }
            if (report) report->info(kOp, "no target block; appended " +
                                              std::to_string(desired.size()) + " line(s)");
            return out;
        }
        const SourceRange& body = call->block->body;
        const std::vector<Edit> edits = plan_dependencies(content, *call, desired);
        const std::string new_body =
            apply_edits(content.substr(body.start, body.length()), edits, report);
        return reassemble(content, body, new_body);
    } catch (const std::exception& e) {
        if (report) report->warn(kOp, std::string("left unchanged: ") + e.what());
        return content;
    }
}

} // namespace remold
