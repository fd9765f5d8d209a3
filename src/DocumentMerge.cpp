#include "remold/DocumentMerge.hpp"
#include "remold/Sections.hpp"
#include "remold/Util.hpp"
#include <map>

namespace remold {

namespace {

const char* const kOp = "merge_document";

struct DestinationBranch {
    std::vector<std::string> body;
    int level = 1;
};

// First occurrence of each key wins.
std::map<std::string, DestinationBranch> build_lookup(const Outline& outline) {
    std::map<std::string, DestinationBranch> lookup;
    const auto ends = branch_ends(outline.sections, outline.line_count());

    for (size_t i = 0; i < outline.sections.size(); ++i) {
        const Section& s = outline.sections[i];
        if (lookup.count(s.key) > 0) continue;

        DestinationBranch entry;
        entry.level = s.level;
        for (size_t ln = s.start_line + 1; ln <= ends[i] && ln < outline.lines.size(); ++ln) {
            entry.body.push_back(outline.lines[ln]);
        }
        lookup.emplace(s.key, std::move(entry));
    }
    return lookup;
}

bool is_preserved(const std::string& key, const DocumentMergeOptions& options) {
    if (options.preserved_keys.count(key) > 0) return true;
    return options.preserved_predicate && options.preserved_predicate(key);
}

} // namespace

std::function<bool(const std::string&)> prefix_predicate(std::vector<std::string> prefixes) {
    for (auto& p : prefixes) p = to_lower(p);
    return [prefixes](const std::string& key) {
        const std::string lowered = to_lower(key);
        for (const auto& p : prefixes) {
            if (starts_with(lowered, p)) return true;
        }
        return false;
    };
}

std::string preserve_sections(const std::string& merged,
                              const std::string& destination,
                              const DocumentMergeOptions& options,
                              Report* report) {
    const Outline src = build_outline(merged);
    if (src.sections.empty()) {
        return merged;
    }

    const auto dest_lookup = build_lookup(build_outline(destination));
    const auto ends = branch_ends(src.sections, src.line_count());
    std::vector<std::string> lines = src.lines;

    // A preserved section inside a preserved ancestor's branch is carried by
    // the ancestor's replacement, so the remaining branches are disjoint.
    std::vector<size_t> targets;
    for (size_t n = 0; n < src.sections.size(); ++n) {
        if (!is_preserved(src.sections[n].key, options)) continue;
        if (!targets.empty() && src.sections[n].start_line <= ends[targets.back()]) continue;
        targets.push_back(n);
    }

    // Back to front so earlier start lines stay valid after each splice.
    for (size_t t = targets.size(); t-- > 0;) {
        const size_t n = targets[t];
        const Section& sec = src.sections[n];

        std::vector<std::string> block{sec.heading};
        auto found = dest_lookup.find(sec.key);
        if (found != dest_lookup.end()) {
            block.insert(block.end(), found->second.body.begin(), found->second.body.end());
            if (report) report->debug(kOp, "kept destination body of '" + sec.key + "'");
        } else {
            block.push_back("");
            block.push_back("");
            if (report) report->info(kOp, "destination has no '" + sec.key + "' section; body emptied");
        }

        auto first = lines.begin() + static_cast<std::ptrdiff_t>(sec.start_line);
        auto last = lines.begin() + static_cast<std::ptrdiff_t>(ends[n] + 1);
        lines.erase(first, last);
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(sec.start_line),
                     block.begin(), block.end());
    }

    return join_lines(lines);
}

std::string preserve_h1(const std::string& merged, const std::string& destination) {
    const Outline dest = build_outline(destination);
    auto dest_h1 = dest.first_at_level(1);
    if (!dest_h1) return merged;

    Outline out = build_outline(merged);
    auto h1 = out.first_at_level(1);
    if (!h1) return merged;

    out.lines[out.sections[*h1].start_line] = dest.sections[*dest_h1].heading;
    return join_lines(out.lines);
}

std::string merge_document(const std::string& template_text,
                           const std::string& destination_text,
                           const DocumentMergeOptions& options,
                           Report* report) {
    if (is_blank(destination_text)) {
        return template_text;
    }

    std::string merged = preserve_sections(template_text, destination_text, options, report);
    if (options.preserve_h1) {
        merged = preserve_h1(merged, destination_text);
    }
    return merged;
}

} // namespace remold
