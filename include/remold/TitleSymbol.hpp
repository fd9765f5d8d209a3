/**
 * @file TitleSymbol.hpp
 * @brief Keep a README title's leading symbol in step with the build script
 *
 * Projects decorate their summary ("🍲 Soup for everyone") and their
 * README title ("# 🍲 Kettle Soup") with the same symbol. The script is
 * the source of truth; the README title follows it.
 */

#ifndef REMOLD_TITLE_SYMBOL_HPP
#define REMOLD_TITLE_SYMBOL_HPP

#include "remold/Report.hpp"
#include "remold/ScriptTree.hpp"
#include "remold/Splice.hpp"

#include <optional>
#include <string>

namespace remold {

/**
 * @brief Leading symbol of the first level-1 heading (outside fences)
 */
std::optional<std::string> readme_h1_symbol(const std::string& readme);

/**
 * @brief Leading symbol of the first freeform field that has one
 *
 * Freeform fields are checked in SplicerOptions::freeform_fields order;
 * only literal string values count.
 */
std::optional<std::string> script_symbol(const std::string& script,
                                         const ScriptParser& parser,
                                         const SplicerOptions& options = SplicerOptions{});

/**
 * @brief Rewrite the README's first H1 as `# <symbol> <title>`
 *
 * Any symbols already leading the title are replaced. The README is
 * returned unchanged when the script has no symbol or the README has no H1.
 */
std::string sync_readme_h1_symbol(const std::string& readme,
                                  const std::string& script,
                                  const ScriptParser& parser,
                                  const SplicerOptions& options = SplicerOptions{},
                                  Report* report = nullptr);

} // namespace remold

#endif // REMOLD_TITLE_SYMBOL_HPP
