/**
 * @file test_title_symbol.cpp
 * @brief Tests for leading-symbol detection and README title sync
 */

#include <gtest/gtest.h>
#include "remold/ScriptScanner.hpp"
#include "remold/TitleSymbol.hpp"
#include "remold/Utf8.hpp"

using namespace remold;

namespace {

const std::string kSoup = "\xF0\x9F\x8D\xB2";   // U+1F372
const std::string kStar = "\xE2\xAD\x90";       // U+2B50
const std::string kHeart = "\xE2\x9D\xA4\xEF\xB8\x8F"; // U+2764 U+FE0F

std::string script_with_summary(const std::string& summary) {
    return "Gem::Specification.new do |spec|\n"
           "  spec.name = \"demo\"\n"
           "  spec.summary = \"" + summary + "\"\n"
           "end\n";
}

} // namespace

// ============================================================================
// UTF-8 helpers
// ============================================================================

TEST(Utf8, DecodeMultiByte) {
    size_t len = 0;
    EXPECT_EQ(utf8::decode(kSoup, 0, len), U'\U0001F372');
    EXPECT_EQ(len, 4u);
    EXPECT_EQ(utf8::decode("A", 0, len), U'A');
    EXPECT_EQ(len, 1u);
}

TEST(Utf8, TruncatedSequenceIsReplacement) {
    size_t len = 0;
    EXPECT_EQ(utf8::decode(kSoup.substr(0, 2), 0, len), U'\uFFFD');
    EXPECT_EQ(len, 1u);
}

TEST(Utf8, GraphemeIncludesVariationSelector) {
    EXPECT_EQ(utf8::grapheme_length(kHeart + " x", 0), kHeart.size());
    EXPECT_EQ(utf8::leading_grapheme(kHeart + "x"), kHeart);
}

TEST(Utf8, FlagIsOneGrapheme) {
    const std::string flag = "\xF0\x9F\x87\xBA\xF0\x9F\x87\xB8"; // regional indicators U S
    EXPECT_EQ(utf8::grapheme_length(flag, 0), flag.size());
}

TEST(Utf8, LeadingSymbol) {
    EXPECT_EQ(utf8::leading_symbol(kSoup + " Demo"), std::optional<std::string>(kSoup));
    EXPECT_EQ(utf8::leading_symbol(kHeart + "Demo"), std::optional<std::string>(kHeart));
    EXPECT_FALSE(utf8::leading_symbol("Demo " + kSoup).has_value());
    EXPECT_FALSE(utf8::leading_symbol("").has_value());
}

TEST(Utf8, StripLeadingSymbols) {
    EXPECT_EQ(utf8::strip_leading_symbols(kStar + kSoup + "  Demo"), "Demo");
    EXPECT_EQ(utf8::strip_leading_symbols("Demo"), "Demo");
}

// ============================================================================
// Symbol sources
// ============================================================================

TEST(ReadmeSymbol, FromFirstH1) {
    EXPECT_EQ(readme_h1_symbol("intro\n# " + kStar + " Demo\n"), std::optional<std::string>(kStar));
    EXPECT_FALSE(readme_h1_symbol("# Demo\n").has_value());
    EXPECT_FALSE(readme_h1_symbol("## " + kStar + " Not a title\n").has_value());
}

TEST(ScriptSymbol, FromSummary) {
    ScriptScanner scanner;
    EXPECT_EQ(script_symbol(script_with_summary(kSoup + " A demo"), scanner),
              std::optional<std::string>(kSoup));
    EXPECT_FALSE(script_symbol(script_with_summary("A demo"), scanner).has_value());
    EXPECT_FALSE(script_symbol("not ( valid", scanner).has_value());
}

// ============================================================================
// sync_readme_h1_symbol
// ============================================================================

class SyncSymbolTest : public ::testing::Test {
protected:
    ScriptScanner scanner;
    Report report;
    const std::string script = script_with_summary(kSoup + " A demo");
};

TEST_F(SyncSymbolTest, AddsSymbolToPlainTitle) {
    EXPECT_EQ(sync_readme_h1_symbol("# Demo\n\ntext\n", script, scanner),
              "# " + kSoup + " Demo\n\ntext\n");
}

TEST_F(SyncSymbolTest, ReplacesExistingSymbols) {
    EXPECT_EQ(sync_readme_h1_symbol("#   " + kStar + kHeart + " Demo\n", script, scanner),
              "# " + kSoup + " Demo\n");
}

TEST_F(SyncSymbolTest, AlreadyInSyncIsUnchanged) {
    const std::string readme = "# " + kSoup + " Demo\n";
    EXPECT_EQ(sync_readme_h1_symbol(readme, script, scanner), readme);
}

TEST_F(SyncSymbolTest, NoSymbolOrNoTitleLeavesReadme) {
    EXPECT_EQ(sync_readme_h1_symbol("# Demo\n", script_with_summary("plain"), scanner, SplicerOptions{}, &report),
              "# Demo\n");
    EXPECT_EQ(sync_readme_h1_symbol("no title\n", script, scanner, SplicerOptions{}, &report),
              "no title\n");
    EXPECT_EQ(report.count(Severity::Info), 1u);
}
