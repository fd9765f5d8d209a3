#include "remold/Utf8.hpp"

namespace remold {
namespace utf8 {

namespace {

constexpr char32_t kReplacement = 0xFFFD;
constexpr char32_t kZwj = 0x200D;

bool is_continuation(unsigned char b) noexcept {
    return (b & 0xC0) == 0x80;
}

bool is_regional_indicator(char32_t cp) noexcept {
    return cp >= 0x1F1E6 && cp <= 0x1F1FF;
}

// Code points that never start a cluster of their own.
bool is_extender(char32_t cp) noexcept {
    return (cp >= 0xFE00 && cp <= 0xFE0F)      // variation selectors
        || (cp >= 0x1F3FB && cp <= 0x1F3FF)    // skin-tone modifiers
        || (cp >= 0x0300 && cp <= 0x036F)      // combining diacritics
        || (cp >= 0x1AB0 && cp <= 0x1AFF)
        || (cp >= 0x20D0 && cp <= 0x20FF)      // combining marks for symbols, keycap
        || (cp >= 0xE0020 && cp <= 0xE007F)    // tag sequences
        || (cp >= 0xE0100 && cp <= 0xE01EF);
}

} // namespace

char32_t decode(const std::string& text, size_t pos, size_t& length) noexcept {
    length = 1;
    if (pos >= text.size()) {
        return kReplacement;
    }

    const auto b0 = static_cast<unsigned char>(text[pos]);
    if (b0 < 0x80) {
        return b0;
    }

    size_t need = 0;
    char32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; }
    else { return kReplacement; }

    if (pos + need >= text.size()) {
        return kReplacement;
    }
    for (size_t i = 1; i <= need; ++i) {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(b)) {
            return kReplacement;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    length = need + 1;
    return cp;
}

bool is_pictographic(char32_t cp) noexcept {
    return (cp >= 0x1F000 && cp <= 0x1FAFF)    // mahjong .. symbols & pictographs ext-A
        || (cp >= 0x2600 && cp <= 0x27BF)      // misc symbols, dingbats
        || (cp >= 0x2190 && cp <= 0x21FF)      // arrows
        || (cp >= 0x2300 && cp <= 0x23FF)      // misc technical (⌚, ⏰)
        || (cp >= 0x25A0 && cp <= 0x25FF)      // geometric shapes
        || (cp >= 0x2B00 && cp <= 0x2BFF)      // misc symbols and arrows (⭐)
        || (cp >= 0x2900 && cp <= 0x297F)
        || cp == 0x00A9 || cp == 0x00AE || cp == 0x2122 || cp == 0x2139
        || cp == 0x203C || cp == 0x2049 || cp == 0x3030 || cp == 0x303D
        || cp == 0x3297 || cp == 0x3299;
}

size_t grapheme_length(const std::string& text, size_t pos) noexcept {
    if (pos >= text.size()) {
        return 0;
    }

    size_t len = 0;
    char32_t base = decode(text, pos, len);
    size_t end = pos + len;

    if (is_regional_indicator(base) && end < text.size()) {
        size_t next_len = 0;
        char32_t next = decode(text, end, next_len);
        if (is_regional_indicator(next)) {
            return end + next_len - pos;
        }
    }

    while (end < text.size()) {
        size_t next_len = 0;
        char32_t next = decode(text, end, next_len);
        if (is_extender(next)) {
            end += next_len;
        } else if (next == kZwj) {
            end += next_len;
            if (end < text.size()) {
                decode(text, end, next_len);
                end += next_len;
            }
        } else {
            break;
        }
    }
    return end - pos;
}

std::string leading_grapheme(const std::string& text) {
    return text.substr(0, grapheme_length(text, 0));
}

std::optional<std::string> leading_symbol(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t len = 0;
    char32_t base = decode(text, 0, len);
    if (!is_pictographic(base)) {
        return std::nullopt;
    }
    return leading_grapheme(text);
}

std::string strip_leading_symbols(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = 0;
        char32_t cp = decode(text, pos, len);
        if (!is_pictographic(cp)) {
            break;
        }
        pos += grapheme_length(text, pos);
    }
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
    return text.substr(pos);
}

} // namespace utf8
} // namespace remold
