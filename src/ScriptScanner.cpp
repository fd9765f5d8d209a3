#include "remold/ScriptScanner.hpp"
#include "remold/Util.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace remold {

namespace {

enum class TokenKind { Word, Label, String, Symbol, WordArray, Number, Regex, Punct, Newline };

struct Token {
    TokenKind kind = TokenKind::Punct;
    size_t start = 0;
    size_t end = 0;
    std::string text;
    Value literal;        // decoded String/Symbol/WordArray; null when computed
    bool keyword = false; // Word in a position where it may act as a keyword
    bool spaced = false;  // whitespace between this token and the previous one
};

class ScanError : public std::runtime_error {
public:
    ScanError(size_t offset, const std::string& message)
        : std::runtime_error(message), offset_(offset) {}

    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

const std::set<std::string> kReserved = {
    "alias", "and", "begin", "break", "case", "class", "def", "defined?", "do",
    "else", "elsif", "end", "ensure", "for", "if", "in", "module", "next", "not",
    "or", "redo", "rescue", "retry", "return", "super", "then", "undef", "unless",
    "until", "when", "while", "yield"};

// Always open a construct closed by `end`.
const std::set<std::string> kAlwaysOpens = {"begin", "case", "class", "def", "for", "module"};

// Open a construct only at the start of an expression; otherwise modifiers.
const std::set<std::string> kConditionalOpens = {"if", "unless", "while", "until"};

const std::set<std::string> kModifiers = {"if", "unless", "while", "until", "rescue"};

// Keywords after which an `if`/`while`/... begins a new expression.
const std::set<std::string> kExpressionLead = {
    "and", "begin", "do", "else", "elsif", "ensure", "if", "in", "not", "or",
    "then", "unless", "until", "when", "while"};

// Longest first.
const char* const kPunct[] = {
    "**=", "<=>", "===", "...", "<<=", ">>=", "&&=", "||=",
    "**", "==", "!=", ">=", "<=", "&&", "||", "<<", ">>", "=~", "!~",
    "+=", "-=", "*=", "/=", "%=", "|=", "&=", "^=", "=>", "->", "..", "::", "&."};

bool is_ident_start(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

char32_t hex_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<char32_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<char32_t>(c - 'a' + 10);
    return static_cast<char32_t>(c - 'A' + 10);
}

char closing_delimiter(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        case '{': return '}';
        case '<': return '>';
        default: return open;
    }
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_punct(const Token& t, const char* text) {
    return t.kind == TokenKind::Punct && t.text == text;
}

bool is_separator(const Token& t) {
    return t.kind == TokenKind::Newline || is_punct(t, ";");
}

bool is_reserved(const Token& t) {
    return t.kind == TokenKind::Word && t.keyword && kReserved.count(t.text) > 0;
}

bool is_keyword(const Token& t, const char* word) {
    return t.kind == TokenKind::Word && t.keyword && t.text == word;
}

bool is_modifier(const Token& t) {
    return t.kind == TokenKind::Word && t.keyword && kModifiers.count(t.text) > 0;
}

bool is_member_access(const Token& t) {
    return is_punct(t, ".") || is_punct(t, "&.") || is_punct(t, "::");
}

bool is_opening_bracket(const Token& t) {
    return is_punct(t, "(") || is_punct(t, "[") || is_punct(t, "{");
}

bool is_closing_bracket(const Token& t) {
    return is_punct(t, ")") || is_punct(t, "]") || is_punct(t, "}");
}

// ---------------------------------------------------------------------------
// Lexer
// ---------------------------------------------------------------------------

class Lexer {
public:
    explicit Lexer(const std::string& source) : src_(source) {}

    void run(std::vector<Token>& tokens, std::vector<Comment>& comments);

private:
    struct Heredoc {
        std::string id;
        bool indented = false;
    };

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    bool at_line_start() const { return pos_ == 0 || src_[pos_ - 1] == '\n'; }
    bool prev_is_value() const;
    bool after_member_access() const;
    bool value_expected() const;

    void push(TokenKind kind, size_t start, Value literal = Value());

    bool skip_embedded_doc();
    bool at_end_marker() const;
    void lex_newline();
    void skip_heredoc_bodies();
    void lex_comment();
    bool lex_heredoc();
    bool lex_percent();
    void lex_symbol();
    void lex_word();
    void lex_number();
    void lex_regex(size_t start);
    void lex_punct();

    std::string read_quoted(char open, char close, bool escapes, bool& interpolated);
    void read_escape(std::string& out);
    void skip_interpolation();

    const std::string& src_;
    size_t pos_ = 0;
    bool spaced_ = true;
    std::vector<Token>* tokens_ = nullptr;
    std::vector<Comment>* comments_ = nullptr;
    std::vector<Heredoc> pending_;
};

void Lexer::run(std::vector<Token>& tokens, std::vector<Comment>& comments) {
    tokens_ = &tokens;
    comments_ = &comments;

    while (pos_ < src_.size()) {
        if (at_line_start()) {
            if (skip_embedded_doc()) continue;
            if (at_end_marker()) break;
        }

        const char c = src_[pos_];
        if (c == '\n') {
            lex_newline();
            continue;
        }
        if (is_space(c)) {
            spaced_ = true;
            ++pos_;
            continue;
        }
        if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
            pos_ += peek(1) == '\n' ? 2 : 3;
            spaced_ = true;
            continue;
        }
        if (c == '#') {
            lex_comment();
            continue;
        }

        const size_t start = pos_;
        if (c == '"' || c == '`') {
            ++pos_;
            bool interpolated = false;
            std::string text = read_quoted(c, c, true, interpolated);
            push(TokenKind::String, start,
                 (interpolated || c == '`') ? Value() : Value(std::move(text)));
            continue;
        }
        if (c == '\'') {
            ++pos_;
            bool interpolated = false;
            std::string text = read_quoted('\'', '\'', false, interpolated);
            push(TokenKind::String, start, Value(std::move(text)));
            continue;
        }
        if (c == '%' && lex_percent()) continue;
        if (c == '<' && peek(1) == '<' && lex_heredoc()) continue;
        if (c == ':' && peek(1) != ':' && (peek(1) == '"' || peek(1) == '\'' ||
                                           is_ident_start(peek(1)) || peek(1) == '@' ||
                                           peek(1) == '$')) {
            lex_symbol();
            continue;
        }
        if (is_ident_start(c) || c == '@' || c == '$') {
            lex_word();
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            lex_number();
            continue;
        }
        if (c == '/' && (!prev_is_value() ||
                         (spaced_ && !tokens_->empty() &&
                          tokens_->back().kind == TokenKind::Word && !is_space(peek(1))))) {
            lex_regex(start);
            continue;
        }
        lex_punct();
    }

    if (!pending_.empty()) {
        throw ScanError(src_.size(), "unterminated heredoc <<" + pending_.front().id);
    }
}

bool Lexer::prev_is_value() const {
    if (tokens_->empty()) return false;
    const Token& t = tokens_->back();
    switch (t.kind) {
        case TokenKind::Word:
            return !is_reserved(t) || t.text == "end";
        case TokenKind::Label:
        case TokenKind::Newline:
            return false;
        case TokenKind::Punct:
            return is_closing_bracket(t);
        default:
            return true;
    }
}

bool Lexer::after_member_access() const {
    if (tokens_->empty()) return false;
    const Token& t = tokens_->back();
    return is_punct(t, ".") || is_punct(t, "&.") || is_punct(t, "::") || is_keyword(t, "def");
}

// True where a literal may start: after an operator, or as the first
// argument of a command call (`foo %w[a]`).
bool Lexer::value_expected() const {
    if (!prev_is_value()) return true;
    const Token& t = tokens_->back();
    return spaced_ && t.kind == TokenKind::Word && !is_space(peek(1)) && peek(1) != '=';
}

void Lexer::push(TokenKind kind, size_t start, Value literal) {
    Token t;
    t.kind = kind;
    t.start = start;
    t.end = pos_;
    t.text = src_.substr(start, pos_ - start);
    t.literal = std::move(literal);
    t.spaced = spaced_;
    if (kind == TokenKind::Word) {
        t.keyword = !after_member_access();
    }
    tokens_->push_back(std::move(t));
    spaced_ = false;
}

bool Lexer::skip_embedded_doc() {
    if (src_.compare(pos_, 6, "=begin") != 0) return false;
    if (pos_ + 6 < src_.size() && !is_space(src_[pos_ + 6]) && src_[pos_ + 6] != '\n') {
        return false;
    }
    const size_t start = pos_;
    size_t search = pos_;
    while (true) {
        const size_t nl = src_.find('\n', search);
        if (nl == std::string::npos) {
            throw ScanError(start, "unterminated =begin block");
        }
        search = nl + 1;
        if (src_.compare(search, 4, "=end") == 0) {
            const size_t eol = src_.find('\n', search);
            const size_t end = eol == std::string::npos ? src_.size() : eol;
            comments_->push_back(Comment{SourceRange{start, end}, src_.substr(start, end - start)});
            pos_ = end;
            return true;
        }
    }
}

bool Lexer::at_end_marker() const {
    if (src_.compare(pos_, 7, "__END__") != 0) return false;
    const size_t after = pos_ + 7;
    return after == src_.size() || src_[after] == '\n' || src_[after] == '\r';
}

void Lexer::lex_newline() {
    const size_t start = pos_;
    ++pos_;
    push(TokenKind::Newline, start);
    spaced_ = true;
    skip_heredoc_bodies();
}

void Lexer::skip_heredoc_bodies() {
    for (const Heredoc& doc : pending_) {
        bool closed = false;
        while (pos_ < src_.size()) {
            const size_t eol = src_.find('\n', pos_);
            const size_t line_end = eol == std::string::npos ? src_.size() : eol;
            std::string line = src_.substr(pos_, line_end - pos_);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pos_ = eol == std::string::npos ? src_.size() : eol + 1;
            if ((doc.indented ? trim(line) : line) == doc.id) {
                closed = true;
                break;
            }
        }
        if (!closed) {
            throw ScanError(src_.size(), "unterminated heredoc <<" + doc.id);
        }
    }
    pending_.clear();
}

void Lexer::lex_comment() {
    const size_t start = pos_;
    const size_t eol = src_.find('\n', pos_);
    pos_ = eol == std::string::npos ? src_.size() : eol;
    comments_->push_back(Comment{SourceRange{start, pos_}, src_.substr(start, pos_ - start)});
}

bool Lexer::lex_heredoc() {
    size_t q = pos_ + 2;
    bool indented = false;
    if (q < src_.size() && (src_[q] == '~' || src_[q] == '-')) {
        indented = true;
        ++q;
    }
    if (q >= src_.size()) return false;
    const char c = src_[q];
    const bool quoted = c == '"' || c == '\'' || c == '`';
    const bool bare = is_ident_start(c) &&
                      (indented || std::isupper(static_cast<unsigned char>(c)) || c == '_');
    if (!quoted && !bare) return false;
    if (prev_is_value() && !(spaced_ && tokens_->back().kind == TokenKind::Word)) return false;

    const size_t start = pos_;
    std::string id;
    if (quoted) {
        const size_t close = src_.find(c, q + 1);
        if (close == std::string::npos || src_.find('\n', q) < close) {
            throw ScanError(start, "unterminated heredoc identifier");
        }
        id = src_.substr(q + 1, close - q - 1);
        pos_ = close + 1;
    } else {
        size_t e = q;
        while (e < src_.size() && is_ident_char(src_[e])) ++e;
        id = src_.substr(q, e - q);
        pos_ = e;
    }
    pending_.push_back(Heredoc{id, indented});
    push(TokenKind::String, start);
    return true;
}

bool Lexer::lex_percent() {
    const size_t start = pos_;
    const char kind = peek(1);
    char open = '\0';
    size_t body = 0;

    if (std::isalpha(static_cast<unsigned char>(kind))) {
        const char delim = peek(2);
        if (std::string("wWiIqQrsx").find(kind) == std::string::npos) return false;
        if (delim == '\0' || is_ident_char(delim) || is_space(delim) || delim == '\n') return false;
        open = delim;
        body = pos_ + 3;
    } else if (kind != '\0' && std::string("([{<|!/^").find(kind) != std::string::npos) {
        if (!value_expected()) return false;
        open = kind;
        body = pos_ + 2;
    } else {
        return false;
    }
    if (!value_expected()) return false;

    const char tag = body == pos_ + 3 ? kind : 'Q';
    const bool escapes = tag == 'W' || tag == 'I' || tag == 'Q' || tag == 'r' || tag == 'x';
    pos_ = body;
    bool interpolated = false;
    std::string text = read_quoted(open, closing_delimiter(open), escapes, interpolated);

    switch (tag) {
        case 'w': case 'W': case 'i': case 'I': {
            if (interpolated) {
                push(TokenKind::WordArray, start);
                break;
            }
            Value words = Value::array();
            std::string word;
            for (char ch : text) {
                if (is_space(ch) || ch == '\n') {
                    if (!word.empty()) words.push_back(word);
                    word.clear();
                } else {
                    word += ch;
                }
            }
            if (!word.empty()) words.push_back(word);
            push(TokenKind::WordArray, start, std::move(words));
            break;
        }
        case 'r':
            while (std::isalpha(static_cast<unsigned char>(peek()))) ++pos_;
            push(TokenKind::Regex, start);
            break;
        case 's':
            push(TokenKind::Symbol, start, Value(std::move(text)));
            break;
        case 'x':
            push(TokenKind::String, start);
            break;
        default:
            push(TokenKind::String, start, interpolated ? Value() : Value(std::move(text)));
            break;
    }
    return true;
}

void Lexer::lex_symbol() {
    const size_t start = pos_;
    ++pos_; // ':'
    const char c = peek();
    if (c == '"' || c == '\'') {
        ++pos_;
        bool interpolated = false;
        std::string text = read_quoted(c, c, c == '"', interpolated);
        push(TokenKind::Symbol, start, interpolated ? Value() : Value(std::move(text)));
        return;
    }
    if (c == '@' || c == '$') ++pos_;
    if (peek() == '@') ++pos_;
    while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;
    const char suffix = peek();
    if ((suffix == '?' || suffix == '!') && peek(1) != '=') {
        ++pos_;
    } else if (suffix == '=' && peek(1) != '=' && peek(1) != '~' && peek(1) != '>') {
        ++pos_;
    }
    push(TokenKind::Symbol, start, Value(src_.substr(start + 1, pos_ - start - 1)));
}

void Lexer::lex_word() {
    const size_t start = pos_;
    if (peek() == '$' && !is_ident_start(peek(1))) {
        pos_ += 2; // $0, $:, $!
        push(TokenKind::Word, start);
        return;
    }
    while (peek() == '@' || peek() == '$') ++pos_;
    while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;

    const char suffix = peek();
    if ((suffix == '?' || suffix == '!') && peek(1) != '=') {
        ++pos_;
    }
    if (peek() == ':' && peek(1) != ':' && src_[start] != '@' && src_[start] != '$' &&
        !after_member_access()) {
        ++pos_;
        push(TokenKind::Label, start);
        return;
    }
    push(TokenKind::Word, start);
}

void Lexer::lex_number() {
    const size_t start = pos_;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (is_ident_char(c)) {
            ++pos_;
        } else if (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            ++pos_;
        } else if ((c == '-' || c == '+') && (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E') &&
                   !(src_[start] == '0' && (peek(1) == 'x' || peek(1) == 'X'))) {
            ++pos_;
        } else {
            break;
        }
    }
    push(TokenKind::Number, start);
}

void Lexer::lex_regex(size_t start) {
    ++pos_; // '/'
    bool in_class = false;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (c == '\\') {
            pos_ += 2;
            continue;
        }
        if (c == '\n' && !in_class) break;
        if (c == '[') in_class = true;
        else if (c == ']') in_class = false;
        else if (c == '#' && peek(1) == '{') {
            skip_interpolation();
            continue;
        } else if (c == '/' && !in_class) {
            ++pos_;
            while (std::isalpha(static_cast<unsigned char>(peek()))) ++pos_;
            push(TokenKind::Regex, start);
            return;
        }
        ++pos_;
    }
    throw ScanError(start, "unterminated regular expression");
}

void Lexer::lex_punct() {
    const size_t start = pos_;
    for (const char* p : kPunct) {
        const size_t len = std::char_traits<char>::length(p);
        if (src_.compare(pos_, len, p) == 0) {
            pos_ += len;
            push(TokenKind::Punct, start);
            return;
        }
    }
    ++pos_;
    push(TokenKind::Punct, start);
}

// pos_ is just past the opening delimiter. Paired delimiters nest.
std::string Lexer::read_quoted(char open, char close, bool escapes, bool& interpolated) {
    const size_t start = pos_ - 1;
    std::string out;
    int depth = 0;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (c == '\\' && pos_ + 1 < src_.size()) {
            const char e = src_[pos_ + 1];
            if (escapes) {
                read_escape(out);
            } else {
                pos_ += 2;
                if (e == close || e == '\\' || (open != close && e == open)) {
                    out += e;
                } else {
                    out += '\\';
                    out += e;
                }
            }
            continue;
        }
        if (open != close && c == open) {
            ++depth;
        } else if (c == close) {
            if (depth == 0) {
                ++pos_;
                return out;
            }
            --depth;
        } else if (escapes && c == '#') {
            const char n = peek(1);
            if (n == '{') {
                interpolated = true;
                skip_interpolation();
                continue;
            }
            if (n == '@' || n == '$') interpolated = true;
        }
        out += c;
        ++pos_;
    }
    throw ScanError(start, "unterminated string");
}

// pos_ is on the backslash.
void Lexer::read_escape(std::string& out) {
    const char e = src_[pos_ + 1];
    pos_ += 2;
    switch (e) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 's': out += ' '; break;
        case '0': out += '\0'; break;
        case 'a': out += '\a'; break;
        case 'b': out += '\b'; break;
        case 'e': out += '\x1b'; break;
        case 'f': out += '\f'; break;
        case 'v': out += '\v'; break;
        case '\n': break;
        case 'u': {
            if (peek() == '{') {
                ++pos_;
                while (pos_ < src_.size() && src_[pos_] != '}') {
                    if (is_space(src_[pos_])) {
                        ++pos_;
                        continue;
                    }
                    char32_t cp = 0;
                    size_t digits = 0;
                    while (pos_ < src_.size() && is_hex(src_[pos_]) && digits < 6) {
                        cp = cp * 16 + hex_value(src_[pos_]);
                        ++pos_;
                        ++digits;
                    }
                    if (digits == 0) throw ScanError(pos_, "invalid unicode escape");
                    append_utf8(out, cp);
                }
                if (pos_ >= src_.size()) throw ScanError(pos_, "unterminated unicode escape");
                ++pos_;
            } else {
                if (pos_ + 4 > src_.size() ||
                    !std::all_of(src_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 src_.begin() + static_cast<std::ptrdiff_t>(pos_ + 4), is_hex)) {
                    throw ScanError(pos_, "invalid unicode escape");
                }
                char32_t cp = 0;
                for (size_t k = 0; k < 4; ++k) cp = cp * 16 + hex_value(src_[pos_ + k]);
                append_utf8(out, cp);
                pos_ += 4;
            }
            break;
        }
        default:
            out += e;
            break;
    }
}

// pos_ is on the '#' of "#{".
void Lexer::skip_interpolation() {
    const size_t start = pos_;
    pos_ += 2;
    int depth = 1;
    while (pos_ < src_.size() && depth > 0) {
        const char c = src_[pos_];
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
        } else if (c == '"' || c == '\'') {
            const size_t close = src_.find(c, pos_ + 1);
            if (close == std::string::npos) break;
            pos_ = close;
        } else if (c == '\\') {
            ++pos_;
        }
        ++pos_;
    }
    if (depth > 0) throw ScanError(start, "unterminated interpolation");
}

// ---------------------------------------------------------------------------
// Statement parser
// ---------------------------------------------------------------------------

using TokenRefs = std::vector<const Token*>;

size_t matching_bracket(const TokenRefs& sig, size_t open) {
    int depth = 0;
    for (size_t i = open; i < sig.size(); ++i) {
        if (is_opening_bracket(*sig[i])) ++depth;
        else if (is_closing_bracket(*sig[i]) && --depth == 0) return i;
    }
    return std::string::npos;
}

Value decode_literal(const TokenRefs& sig, size_t from, size_t to) {
    if (to - from == 1) {
        const Token& t = *sig[from];
        if (t.kind == TokenKind::String || t.kind == TokenKind::Symbol ||
            t.kind == TokenKind::WordArray) {
            return t.literal;
        }
        return Value();
    }
    if (to - from < 2 || !is_punct(*sig[from], "[") || !is_punct(*sig[to - 1], "]") ||
        matching_bracket(sig, from) != to - 1) {
        return Value();
    }

    Value out = Value::array();
    bool expect_element = true;
    for (size_t i = from + 1; i + 1 < to; ++i) {
        const Token& t = *sig[i];
        if (expect_element) {
            if ((t.kind == TokenKind::String || t.kind == TokenKind::Symbol) && t.literal.is_string()) {
                out.push_back(t.literal);
                expect_element = false;
                continue;
            }
            return Value();
        }
        if (!is_punct(t, ",")) return Value();
        expect_element = true;
    }
    return out;
}

Argument make_argument(const TokenRefs& sig, size_t from, size_t to) {
    Argument arg;
    arg.location = SourceRange{sig[from]->start, sig[to - 1]->end};
    arg.literal = decode_literal(sig, from, to);
    return arg;
}

// First top-level modifier keyword in [from, to), or `to`.
size_t modifier_position(const TokenRefs& sig, size_t from, size_t to) {
    int depth = 0;
    for (size_t i = from; i < to; ++i) {
        if (is_opening_bracket(*sig[i])) ++depth;
        else if (is_closing_bracket(*sig[i])) --depth;
        else if (depth == 0 && is_modifier(*sig[i])) return i;
    }
    return to;
}

std::vector<Argument> split_arguments(const TokenRefs& sig, size_t from, size_t to) {
    std::vector<Argument> args;
    const size_t stop = modifier_position(sig, from, to);
    int depth = 0;
    size_t begin = from;
    for (size_t i = from; i < stop; ++i) {
        const Token& t = *sig[i];
        if (is_opening_bracket(t)) {
            ++depth;
        } else if (is_closing_bracket(t)) {
            --depth;
        } else if (depth == 0 && is_punct(t, ",")) {
            if (i > begin) args.push_back(make_argument(sig, begin, i));
            begin = i + 1;
        }
    }
    if (stop > begin) args.push_back(make_argument(sig, begin, stop));
    return args;
}

// Whether sig[p] opens the first argument of a parenthesis-less call.
bool starts_argument(const TokenRefs& sig, size_t p) {
    const Token& t = *sig[p];
    if (!t.spaced) return false;
    switch (t.kind) {
        case TokenKind::String:
        case TokenKind::Symbol:
        case TokenKind::WordArray:
        case TokenKind::Number:
        case TokenKind::Regex:
        case TokenKind::Label:
            return true;
        case TokenKind::Word:
            return !is_reserved(t) || is_keyword(t, "not") || is_keyword(t, "defined?");
        case TokenKind::Punct: {
            if (t.text == "[" || t.text == "(" || t.text == "::" || t.text == "->") return true;
            const bool unary = t.text == "*" || t.text == "**" || t.text == "&" ||
                               t.text == "-" || t.text == "!";
            return unary && p + 1 < sig.size() && sig[p + 1]->start == t.end;
        }
        default:
            return false;
    }
}

class Parser {
public:
    Parser(const std::string& source, const std::vector<Token>& tokens)
        : src_(source), toks_(tokens) {}

    std::vector<Statement> run() {
        std::vector<Statement> out;
        parse_sequence(false, out);
        return out;
    }

private:
    // Statements up to EOF, or up to (not including) the `end` closing a block.
    void parse_sequence(bool in_block, std::vector<Statement>& out);
    Statement parse_statement();
    Block parse_block();

    bool at_expression_start(size_t first) const;
    bool continues(size_t last) const;
    void classify(const TokenRefs& sig, Statement& st) const;

    const std::string& src_;
    const std::vector<Token>& toks_;
    size_t pos_ = 0;
};

void Parser::parse_sequence(bool in_block, std::vector<Statement>& out) {
    while (true) {
        while (pos_ < toks_.size() && is_separator(toks_[pos_])) ++pos_;
        if (pos_ >= toks_.size()) {
            if (in_block) throw ScanError(src_.size(), "missing `end` for `do` block");
            return;
        }
        if (is_keyword(toks_[pos_], "end")) {
            if (in_block) return;
            throw ScanError(toks_[pos_].start, "unexpected `end`");
        }
        out.push_back(parse_statement());
    }
}

Statement Parser::parse_statement() {
    const size_t first = pos_;
    size_t last = first;
    std::vector<char> brackets;
    int nesting = 0;
    bool loop_header = false;
    std::optional<size_t> do_at;
    Statement st;

    while (pos_ < toks_.size()) {
        const Token& t = toks_[pos_];
        if (is_separator(t)) {
            if (brackets.empty() && nesting == 0 && !continues(last)) break;
            loop_header = false;
            ++pos_;
            continue;
        }

        if (t.kind == TokenKind::Word && t.keyword) {
            if (t.text == "end") {
                if (nesting == 0) {
                    if (brackets.empty()) break;
                    throw ScanError(t.start, "unexpected `end` inside brackets");
                }
                --nesting;
            } else if (t.text == "do") {
                if (loop_header) {
                    loop_header = false;
                } else if (brackets.empty() && nesting == 0 && !do_at) {
                    do_at = pos_;
                    st.block = parse_block();
                    last = pos_ - 1;
                    continue;
                } else {
                    ++nesting;
                }
            } else if (kAlwaysOpens.count(t.text)) {
                ++nesting;
                loop_header = t.text == "for";
            } else if (kConditionalOpens.count(t.text) && at_expression_start(first)) {
                ++nesting;
                loop_header = t.text == "while" || t.text == "until";
            }
        } else if (t.kind == TokenKind::Punct) {
            if (is_opening_bracket(t)) {
                brackets.push_back(closing_delimiter(t.text[0]));
            } else if (is_closing_bracket(t)) {
                if (brackets.empty() || brackets.back() != t.text[0]) {
                    throw ScanError(t.start, "unbalanced `" + t.text + "`");
                }
                brackets.pop_back();
            }
        }
        last = pos_;
        ++pos_;
    }

    if (!brackets.empty()) {
        throw ScanError(src_.size(), std::string("missing `") + brackets.back() + "`");
    }
    if (nesting != 0) {
        throw ScanError(src_.size(), "missing `end`");
    }

    st.location = SourceRange{toks_[first].start, toks_[last].end};
    TokenRefs sig;
    const size_t head_end = do_at ? *do_at : last + 1;
    for (size_t i = first; i < head_end; ++i) {
        if (toks_[i].kind != TokenKind::Newline) sig.push_back(&toks_[i]);
    }
    classify(sig, st);
    return st;
}

Block Parser::parse_block() {
    Block block;
    const Token& opener = toks_[pos_];
    block.opening = SourceRange{opener.start, opener.end};
    ++pos_;

    if (pos_ < toks_.size() && is_punct(toks_[pos_], "||")) {
        block.opening.end = toks_[pos_].end;
        ++pos_;
    } else if (pos_ < toks_.size() && is_punct(toks_[pos_], "|")) {
        ++pos_;
        while (pos_ < toks_.size() && !is_punct(toks_[pos_], "|")) {
            const Token& t = toks_[pos_];
            if (t.kind == TokenKind::Newline) {
                throw ScanError(t.start, "unterminated block parameters");
            }
            if (block.parameter.empty() && t.kind == TokenKind::Word) {
                block.parameter = t.text;
            }
            ++pos_;
        }
        if (pos_ >= toks_.size()) {
            throw ScanError(src_.size(), "unterminated block parameters");
        }
        block.opening.end = toks_[pos_].end;
        ++pos_;
    }

    block.body.start = block.opening.end;
    parse_sequence(true, block.statements);

    const Token& closer = toks_[pos_];
    block.body.end = closer.start;
    block.closing = SourceRange{closer.start, closer.end};
    ++pos_;
    return block;
}

bool Parser::at_expression_start(size_t first) const {
    if (pos_ == first) return true;
    const Token& prev = toks_[pos_ - 1];
    switch (prev.kind) {
        case TokenKind::Newline:
        case TokenKind::Label:
            return true;
        case TokenKind::Punct:
            return !is_closing_bracket(prev);
        case TokenKind::Word:
            return prev.keyword && kExpressionLead.count(prev.text) > 0;
        default:
            return false;
    }
}

// A line break inside a statement: after an operator, a comma or a label,
// or before a line starting with `.method`.
bool Parser::continues(size_t last) const {
    const Token& t = toks_[last];
    if (t.kind == TokenKind::Punct && !is_closing_bracket(t)) return true;
    if (t.kind == TokenKind::Label) return true;
    if (is_keyword(t, "and") || is_keyword(t, "or") || is_keyword(t, "not")) return true;

    size_t next = pos_;
    while (next < toks_.size() && toks_[next].kind == TokenKind::Newline) ++next;
    return next < toks_.size() && (is_punct(toks_[next], ".") || is_punct(toks_[next], "&."));
}

void Parser::classify(const TokenRefs& sig, Statement& st) const {
    st.kind = StatementKind::Other;
    const size_t n = sig.size();
    if (n == 0) return;

    size_t p = 0;
    if (is_punct(*sig[0], "::") && n > 1 && sig[1]->kind == TokenKind::Word) {
        p = 2;
    } else if (sig[0]->kind == TokenKind::Word && !is_reserved(*sig[0])) {
        p = 1;
    } else {
        return;
    }
    st.name = sig[p - 1]->text;

    std::optional<size_t> dot;
    std::optional<size_t> open_paren;
    size_t close_paren = 0;
    while (p < n) {
        const Token& t = *sig[p];
        if (is_member_access(t) && p + 1 < n && sig[p + 1]->kind == TokenKind::Word) {
            if (t.text != "::") dot = p;
            st.name = sig[p + 1]->text;
            p += 2;
            continue;
        }
        if ((is_punct(t, "(") || is_punct(t, "[")) && !t.spaced) {
            const size_t close = matching_bracket(sig, p);
            if (close == std::string::npos) return;
            if (close + 1 < n && is_member_access(*sig[close + 1])) {
                p = close + 1;
                continue;
            }
            if (t.text == "[") return; // index expression
            open_paren = p;
            close_paren = close;
            p = close + 1;
        }
        break;
    }

    if (dot) {
        st.receiver = trim(src_.substr(sig[0]->start, sig[*dot]->start - sig[0]->start));
    }

    if (open_paren) {
        if (p < n && !is_modifier(*sig[p])) return;
        st.arguments = split_arguments(sig, *open_paren + 1, close_paren);
        st.kind = StatementKind::MethodCall;
    } else if (p < n && is_punct(*sig[p], "=")) {
        if (!dot || p + 1 >= n) return;
        const size_t rhs_end = modifier_position(sig, p + 1, n);
        if (rhs_end == p + 1) return;
        st.arguments.push_back(make_argument(sig, p + 1, rhs_end));
        st.kind = StatementKind::FieldAssignment;
        return;
    } else if (p == n || is_modifier(*sig[p])) {
        st.kind = StatementKind::MethodCall;
    } else if (starts_argument(sig, p)) {
        st.arguments = split_arguments(sig, p, n);
        st.kind = StatementKind::MethodCall;
    } else {
        return;
    }

    if (st.block) st.kind = StatementKind::BlockCall;
}

size_t line_of(const std::string& source, size_t offset) {
    const size_t end = std::min(offset, source.size());
    return 1 + static_cast<size_t>(std::count(source.begin(),
                                              source.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
}

} // namespace

ParseResult ScriptScanner::parse(const std::string& source) const {
    ParseResult result;
    try {
        std::vector<Token> tokens;
        Lexer lexer(source);
        lexer.run(tokens, result.comments);
        Parser parser(source, tokens);
        result.statements = parser.run();
        result.success = true;
    } catch (const ScanError& e) {
        result.success = false;
        result.statements.clear();
        result.error = "line " + std::to_string(line_of(source, e.offset())) + ": " + e.what();
    }
    return result;
}

} // namespace remold
