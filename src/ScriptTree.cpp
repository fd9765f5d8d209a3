#include "remold/ScriptTree.hpp"

namespace remold {

const char* statement_kind_name(StatementKind kind) noexcept {
    switch (kind) {
        case StatementKind::FieldAssignment: return "field_assignment";
        case StatementKind::MethodCall: return "method_call";
        case StatementKind::BlockCall: return "block_call";
        case StatementKind::Other: return "other";
    }
    return "unknown";
}

const Value& Statement::first_literal() const {
    static const Value null_value;
    if (arguments.empty()) return null_value;
    return arguments.front().literal;
}

} // namespace remold
