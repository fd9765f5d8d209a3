#include "remold/Normalize.hpp"
#include "remold/Sections.hpp"
#include "remold/Util.hpp"

#include <optional>
#include <set>
#include <vector>

namespace remold {

namespace {

std::optional<std::string> magic_comment_key(const std::string& line) {
    if (!starts_with(line, "#")) return std::nullopt;
    const std::string body = to_lower(trim(line.substr(1)));
    for (const char* key : {"frozen_string_literal", "encoding", "coding", "warn_indent",
                            "shareable_constant_value"}) {
        if (starts_with(body, std::string(key) + ":")) {
            const std::string k = key;
            return k == "encoding" ? std::string("coding") : k;
        }
    }
    return std::nullopt;
}

bool is_heading(const std::string& line) {
    return heading_level(line.substr(indent_width(line))) > 0;
}

} // namespace

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') {
            out += text[i];
            continue;
        }
        out += '\n';
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    }
    return out;
}

std::string ensure_trailing_newline(const std::string& text) {
    if (text.empty()) return text;
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '\n') --end;
    return text.substr(0, end) + "\n";
}

std::string collapse_magic_comments(const std::string& text) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    bool leading = true;
    for (const std::string& line : split_lines(text)) {
        if (leading) {
            const std::string t = trim(line);
            if (starts_with(t, "#")) {
                if (auto key = magic_comment_key(t)) {
                    if (!seen.insert(*key).second) continue;
                }
            } else if (!t.empty()) {
                leading = false;
            }
        }
        out.push_back(line);
    }
    return join_lines(out);
}

std::string normalize_heading_spacing(const std::string& text) {
    const std::vector<std::string> lines = split_lines(text);
    std::vector<std::string> spaced;
    std::vector<bool> fenced; // parallel to `spaced`
    bool in_fence = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (is_fence_line(line)) {
            spaced.push_back(line);
            fenced.push_back(true);
            in_fence = !in_fence;
            continue;
        }
        if (!in_fence && is_heading(line)) {
            if (!spaced.empty() && !is_blank(spaced.back())) {
                spaced.push_back("");
                fenced.push_back(false);
            }
            spaced.push_back(line);
            fenced.push_back(false);
            if (i + 1 < lines.size() && !is_blank(lines[i + 1])) {
                spaced.push_back("");
                fenced.push_back(false);
            }
            continue;
        }
        spaced.push_back(line);
        fenced.push_back(in_fence);
    }

    std::vector<std::string> out;
    for (size_t i = 0; i < spaced.size(); ++i) {
        const bool blank_run = is_blank(spaced[i]) && (out.empty() || is_blank(out.back()));
        if (blank_run && !fenced[i]) continue;
        out.push_back(spaced[i]);
    }
    return join_lines(out);
}

} // namespace remold
