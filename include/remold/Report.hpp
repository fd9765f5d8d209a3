/**
 * @file Report.hpp
 * @brief Per-run result accumulator
 *
 * A Report is created by the caller for one templating run and passed by
 * pointer into merge and splice operations. It collects soft diagnostics
 * (skipped edits, dropped content, recovered failures) and the action
 * taken for each destination path. Operations accept a null Report and
 * then record nothing.
 */

#ifndef REMOLD_REPORT_HPP
#define REMOLD_REPORT_HPP

#include <map>
#include <string>
#include <vector>

namespace remold {

enum class Severity { Debug, Info, Warning };

/**
 * @brief Name of a severity as printed by the CLI ("debug", "info", "warning")
 */
const char* severity_name(Severity s) noexcept;

struct Diagnostic {
    Severity severity = Severity::Info;
    std::string operation; ///< e.g. "replace_fields"
    std::string message;
};

/**
 * @brief What happened to a destination path during a run
 */
enum class TemplateAction { Create, Replace, Skip, DirCreate, DirReplace };

const char* action_name(TemplateAction a) noexcept;

class Report {
public:
    void debug(const std::string& operation, const std::string& message);
    void info(const std::string& operation, const std::string& message);
    void warn(const std::string& operation, const std::string& message);

    const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    /**
     * @brief Count diagnostics at or above a severity
     */
    size_t count(Severity at_least) const;

    /**
     * @brief Record the action taken for a destination path
     *
     * A Skip never replaces an action already recorded for the same path,
     * so a file written earlier in the run stays marked as written.
     */
    void record(const std::string& path, TemplateAction action);

    /**
     * @brief Action recorded for a path, if any
     * @return nullptr when nothing was recorded
     */
    const TemplateAction* action_for(const std::string& path) const;

    /**
     * @brief True if the path was created or replaced in this run
     */
    bool modified(const std::string& path) const;

    const std::map<std::string, TemplateAction>& actions() const noexcept { return actions_; }

    void clear();

private:
    void add(Severity severity, const std::string& operation, const std::string& message);

    std::vector<Diagnostic> diagnostics_;
    std::map<std::string, TemplateAction> actions_;
};

} // namespace remold

#endif // REMOLD_REPORT_HPP
