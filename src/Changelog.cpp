#include "remold/Changelog.hpp"
#include "remold/Sections.hpp"
#include "remold/Util.hpp"

namespace remold {

namespace {

const char* const kOp = "merge_changelog";
const char* const kSubheading = "### ";

// `- ` or `* ` after optional indentation; `indent` receives its width.
bool is_bullet(const std::string& line, size_t& indent) {
    indent = indent_width(line);
    if (indent + 1 >= line.size()) return false;
    const char marker = line[indent];
    const char after = line[indent + 1];
    return (marker == '-' || marker == '*') && (after == ' ' || after == '\t');
}

std::optional<size_t> category_index(const std::string& subheading,
                                     const std::vector<std::string>& categories) {
    const std::string label = to_lower(trim(subheading.substr(4)));
    for (size_t c = 0; c < categories.size(); ++c) {
        if (to_lower(categories[c]) == label) return c;
    }
    return std::nullopt;
}

void drop_trailing_blanks(std::vector<std::string>& lines) {
    while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
}

void drop_leading_blanks(std::vector<std::string>& lines) {
    size_t n = 0;
    while (n < lines.size() && is_blank(lines[n])) ++n;
    lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(n));
}

// Last line of the section starting at `heading`: the line before the next
// level 1 or 2 heading outside fences.
size_t named_section_end(const std::vector<std::string>& lines, size_t heading) {
    for (const Section& s : build_sections(lines)) {
        if (s.start_line > heading && s.level <= 2) {
            return s.start_line - 1;
        }
    }
    return lines.size() - 1;
}

std::vector<std::string> slice(const std::vector<std::string>& lines, size_t from, size_t to_exclusive) {
    if (from >= to_exclusive || from >= lines.size()) return {};
    if (to_exclusive > lines.size()) to_exclusive = lines.size();
    return std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(from),
                                    lines.begin() + static_cast<std::ptrdiff_t>(to_exclusive));
}

} // namespace

bool is_named_release_heading(const std::string& line, const std::string& name) {
    if (!starts_with(line, "##")) return false;
    size_t pos = 2;
    auto skip_space = [&line, &pos]() {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;
    };
    skip_space();
    if (pos >= line.size() || line[pos] != '[') return false;
    ++pos;
    skip_space();
    if (to_lower(line.substr(pos, name.size())) != to_lower(name)) return false;
    pos += name.size();
    skip_space();
    return pos < line.size() && line[pos] == ']';
}

std::optional<size_t> find_named_section(const std::vector<std::string>& lines,
                                         const std::string& name) {
    bool opaque = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_fence_line(lines[i])) {
            opaque = !opaque;
            continue;
        }
        if (!opaque && is_named_release_heading(lines[i], name)) return i;
    }
    return std::nullopt;
}

CategoryBuckets parse_category_items(const std::vector<std::string>& body,
                                     const std::vector<std::string>& categories) {
    CategoryBuckets buckets;
    buckets.items.resize(categories.size());
    std::optional<size_t> current;

    size_t i = 0;
    while (i < body.size()) {
        const std::string& line = body[i];

        if (starts_with(line, kSubheading)) {
            current = category_index(line, categories);
            if (!current) ++buckets.dropped_lines;
            ++i;
            continue;
        }

        size_t base_indent = 0;
        if (!is_bullet(line, base_indent)) {
            if (!is_blank(line)) ++buckets.dropped_lines;
            ++i;
            continue;
        }

        std::vector<std::string> block{rtrim(line)};
        bool in_fence = false;
        ++i;
        while (i < body.size()) {
            const std::string& next = body[i];
            size_t next_indent = 0;
            if (!in_fence && is_bullet(next, next_indent) && next_indent <= base_indent) break;
            if (!in_fence && starts_with(next, kSubheading)) break;

            if (is_fence_line(next)) {
                in_fence = !in_fence;
            } else if (!in_fence && !is_blank(next) && indent_width(next) <= base_indent) {
                break;
            }
            block.push_back(rtrim(next));
            ++i;
        }

        if (current) {
            auto& bucket = buckets.items[*current];
            bucket.insert(bucket.end(), block.begin(), block.end());
        } else {
            for (const auto& l : block) {
                if (!is_blank(l)) ++buckets.dropped_lines;
            }
        }
    }

    for (auto& bucket : buckets.items) {
        drop_trailing_blanks(bucket);
    }
    return buckets;
}

std::string normalize_release_headers(const std::string& text) {
    std::vector<std::string> lines = split_lines(text);
    for (auto& line : lines) {
        if (!starts_with(line, "##") || line.size() < 3) continue;
        if (line[2] != ' ' && line[2] != '\t') continue;
        const size_t open = line.find_first_not_of(" \t", 2);
        if (open == std::string::npos || line[open] != '[') continue;
        if (line.find(']', open) == std::string::npos) continue;
        line = squeeze_horizontal_space(line);
    }
    return join_lines(lines);
}

std::string merge_changelog(const std::string& template_text,
                            const std::string& destination_text,
                            const ChangelogOptions& options,
                            Report* report) {
    if (is_blank(destination_text)) {
        return template_text;
    }

    const std::vector<std::string> tpl = split_lines(template_text);
    const auto tpl_idx = find_named_section(tpl, options.section);
    if (!tpl_idx) {
        if (report) report->info(kOp, "template has no [" + options.section + "] section");
        return normalize_release_headers(template_text);
    }

    const std::vector<std::string> dest = split_lines(destination_text);
    const auto dest_idx = find_named_section(dest, options.section);

    std::vector<std::string> body;
    std::vector<std::string> tail;
    if (dest_idx) {
        const size_t end = named_section_end(dest, *dest_idx);
        body = slice(dest, *dest_idx + 1, end + 1);
        tail = slice(dest, end + 1, dest.size());
    } else {
        // Keep the release history even when the section itself is missing.
        for (const Section& s : build_sections(dest)) {
            if (s.level == 2) {
                tail = slice(dest, s.start_line, dest.size());
                break;
            }
        }
        if (report) {
            report->info(kOp, "destination has no [" + options.section + "] section");
        }
    }

    const CategoryBuckets buckets = parse_category_items(body, options.categories);
    if (report && buckets.dropped_lines > 0) {
        report->warn(kOp, std::to_string(buckets.dropped_lines) +
                              " line(s) outside the known categories were dropped");
    }

    std::vector<std::string> merged = slice(tpl, 0, *tpl_idx);
    merged.push_back(tpl[*tpl_idx]);
    for (size_t c = 0; c < options.categories.size(); ++c) {
        merged.push_back(kSubheading + options.categories[c]);
        const auto& items = buckets.items[c];
        merged.insert(merged.end(), items.begin(), items.end());
    }

    drop_trailing_blanks(merged);
    drop_leading_blanks(tail);
    if (!tail.empty()) {
        merged.push_back("");
        merged.insert(merged.end(), tail.begin(), tail.end());
    }

    return normalize_release_headers(join_lines(merged));
}

} // namespace remold
