#include "remold/Sections.hpp"
#include "remold/Util.hpp"
#include "remold/Utf8.hpp"
#include <cctype>

namespace remold {

namespace {

struct CodeRange {
    char32_t first;
    char32_t last;
};

// Non-ASCII punctuation, symbols, spaces, other numbers and combining marks.
// Letters and decimal digits of any script are never in this table.
const CodeRange kDecoration[] = {
    {0x00A0, 0x00A9}, {0x00AB, 0x00B4}, {0x00B6, 0x00B9}, {0x00BB, 0x00BF},
    {0x00D7, 0x00D7}, {0x00F7, 0x00F7}, {0x0300, 0x036F},
    {0x2000, 0x206F}, // general punctuation
    {0x20A0, 0x20FF}, // currency, combining marks for symbols
    {0x2100, 0x2101}, {0x2103, 0x2106}, {0x2108, 0x2109}, {0x2114, 0x2114},
    {0x2116, 0x2118}, {0x211E, 0x2123}, {0x2125, 0x2125}, {0x2127, 0x2127},
    {0x2129, 0x2129}, {0x212E, 0x212E}, {0x213A, 0x213B}, {0x2140, 0x2144},
    {0x214A, 0x214D}, {0x214F, 0x215F},
    {0x2189, 0x24B5}, // arrows .. enclosed numbers
    {0x24EA, 0x2BFF}, // box drawing .. misc symbols and arrows
    {0x2E00, 0x2E7F}, {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030},
    {0x303D, 0x303F}, {0xFE00, 0xFE0F}, {0xFE10, 0xFE19}, {0xFE30, 0xFE4F},
    {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
    {0xE0000, 0xE007F},
};

bool is_decoration(char32_t cp) {
    if (utf8::is_pictographic(cp)) return true;
    for (const CodeRange& r : kDecoration) {
        if (cp < r.first) return false;
        if (cp <= r.last) return true;
    }
    return false;
}

std::string strip_leading_decoration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const auto b = static_cast<unsigned char>(text[pos]);
        if (b < 0x80) {
            if (std::isalnum(b)) break;
            ++pos;
            continue;
        }
        size_t len = 0;
        char32_t cp = utf8::decode(text, pos, len);
        if (!is_decoration(cp)) {
            break;
        }
        size_t cluster = utf8::grapheme_length(text, pos);
        pos += cluster > 0 ? cluster : len;
    }
    return text.substr(pos);
}

} // namespace

bool is_fence_line(const std::string& line) {
    size_t i = indent_width(line);
    return line.compare(i, 3, "```") == 0;
}

int heading_level(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && line[n] == '#') ++n;
    if (n == 0 || n >= line.size()) return 0;
    if (line[n] != ' ' && line[n] != '\t') return 0;
    if (is_blank(line.substr(n))) return 0;
    return static_cast<int>(n);
}

std::string section_key(const std::string& heading_line) {
    size_t i = 0;
    while (i < heading_line.size() && heading_line[i] == '#') ++i;
    std::string text = strip_leading_decoration(heading_line.substr(i));
    return to_lower(collapse_whitespace(text));
}

std::vector<Section> build_sections(const std::vector<std::string>& lines) {
    std::vector<Section> sections;
    bool opaque = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (is_fence_line(line)) {
            opaque = !opaque;
            continue;
        }
        if (opaque) continue;

        int level = heading_level(line);
        if (level > 0) {
            sections.push_back(Section{i, level, line, section_key(line)});
        }
    }
    return sections;
}

Outline build_outline(const std::string& text) {
    Outline outline;
    outline.lines = split_lines(text);
    outline.sections = build_sections(outline.lines);
    return outline;
}

size_t branch_end(const std::vector<Section>& sections, size_t i, size_t total_lines) {
    const int level = sections[i].level;
    for (size_t j = i + 1; j < sections.size(); ++j) {
        if (sections[j].level <= level) {
            return sections[j].start_line - 1;
        }
    }
    return total_lines - 1;
}

std::vector<size_t> branch_ends(const std::vector<Section>& sections, size_t total_lines) {
    std::vector<size_t> ends(sections.size(), total_lines - 1);
    // Sections still waiting for a same-or-shallower successor.
    std::vector<size_t> open;
    for (size_t j = 0; j < sections.size(); ++j) {
        while (!open.empty() && sections[open.back()].level >= sections[j].level) {
            ends[open.back()] = sections[j].start_line - 1;
            open.pop_back();
        }
        open.push_back(j);
    }
    return ends;
}

size_t Outline::branch_end(size_t i) const {
    return remold::branch_end(sections, i, lines.size());
}

std::string Outline::branch_body(size_t i) const {
    const size_t end = branch_end(i);
    std::vector<std::string> body;
    for (size_t ln = sections[i].start_line + 1; ln <= end && ln < lines.size(); ++ln) {
        body.push_back(lines[ln]);
    }
    return join_lines(body);
}

std::optional<size_t> Outline::find(const std::string& key) const {
    for (size_t i = 0; i < sections.size(); ++i) {
        if (sections[i].key == key) return i;
    }
    return std::nullopt;
}

std::optional<size_t> Outline::first_at_level(int level) const {
    for (size_t i = 0; i < sections.size(); ++i) {
        if (sections[i].level == level) return i;
    }
    return std::nullopt;
}

} // namespace remold
