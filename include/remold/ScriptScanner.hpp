/**
 * @file ScriptScanner.hpp
 * @brief Lightweight parser for block-structured declarative scripts
 *
 * Understands enough of the Ruby-like build-script dialect to locate
 * statements and their byte ranges:
 * - `"..."` (with escapes and `#{}` interpolation), `'...'`, `%q()`/`%Q()`,
 *   `%w[]`/`%i[]` word arrays, `:symbols`, `[...]` arrays
 * - `# comments`, `=begin`/`=end` blocks, `__END__`
 * - heredocs (`<<~ID`, `<<-ID`, `<<ID`), always non-literal
 * - `do |p| ... end` blocks and `if/unless/while/until/case/begin/def/
 *   class/module/for ... end` nesting, including modifier forms
 * - logical lines continued by open brackets, a trailing operator or
 *   comma, a backslash, or a leading `.method` on the next line
 *
 * Only the first `do` block of each statement is parsed into nested
 * statements; other nested constructs are skipped as opaque spans.
 */

#ifndef REMOLD_SCRIPT_SCANNER_HPP
#define REMOLD_SCRIPT_SCANNER_HPP

#include "remold/ScriptTree.hpp"

namespace remold {

class ScriptScanner : public ScriptParser {
public:
    ParseResult parse(const std::string& source) const override;
};

} // namespace remold

#endif // REMOLD_SCRIPT_SCANNER_HPP
