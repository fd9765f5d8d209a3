#include "remold/Report.hpp"
#include <algorithm>

namespace remold {

const char* severity_name(Severity s) noexcept {
    switch (s) {
        case Severity::Debug: return "debug";
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

const char* action_name(TemplateAction a) noexcept {
    switch (a) {
        case TemplateAction::Create: return "create";
        case TemplateAction::Replace: return "replace";
        case TemplateAction::Skip: return "skip";
        case TemplateAction::DirCreate: return "dir_create";
        case TemplateAction::DirReplace: return "dir_replace";
    }
    return "unknown";
}

void Report::add(Severity severity, const std::string& operation, const std::string& message) {
    diagnostics_.push_back(Diagnostic{severity, operation, message});
}

void Report::debug(const std::string& operation, const std::string& message) {
    add(Severity::Debug, operation, message);
}

void Report::info(const std::string& operation, const std::string& message) {
    add(Severity::Info, operation, message);
}

void Report::warn(const std::string& operation, const std::string& message) {
    add(Severity::Warning, operation, message);
}

size_t Report::count(Severity at_least) const {
    return static_cast<size_t>(std::count_if(
        diagnostics_.begin(), diagnostics_.end(),
        [at_least](const Diagnostic& d) { return d.severity >= at_least; }));
}

void Report::record(const std::string& path, TemplateAction action) {
    if (action == TemplateAction::Skip && actions_.count(path) > 0) {
        return;
    }
    actions_[path] = action;
}

const TemplateAction* Report::action_for(const std::string& path) const {
    auto it = actions_.find(path);
    return it == actions_.end() ? nullptr : &it->second;
}

bool Report::modified(const std::string& path) const {
    const TemplateAction* a = action_for(path);
    return a != nullptr && *a != TemplateAction::Skip;
}

void Report::clear() {
    diagnostics_.clear();
    actions_.clear();
}

} // namespace remold
