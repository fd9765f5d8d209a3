/**
 * @file test_splice.cpp
 * @brief Tests for byte-range script editing
 */

#include <gtest/gtest.h>
#include "remold/Errors.hpp"
#include "remold/ScriptScanner.hpp"
#include "remold/Splice.hpp"

using namespace remold;

namespace {

const std::string kScript =
    "# frozen_string_literal: true\n"
    "\n"
    "Gem::Specification.new do |spec|\n"
    "  spec.name = \"demo\"\n"
    "  spec.version = Demo::VERSION # bumped by release\n"
    "  spec.summary = \"\xF0\x9F\x8D\xB2 A demo\"\n"
    "\n"
    "  spec.add_dependency \"rake\", \"~> 13.0\"\n"
    "  spec.add_development_dependency(\"rspec\", \"~> 3.0\")\n"
    "end\n";

// Always fails, to exercise the parse-failure path.
class BrokenParser : public ScriptParser {
public:
    ParseResult parse(const std::string&) const override {
        ParseResult r;
        r.error = "line 1: broken";
        return r;
    }
};

} // namespace

// ============================================================================
// Free helpers
// ============================================================================

TEST(Placeholder, ShortNonAsciiStrings) {
    EXPECT_TRUE(is_placeholder(Value("\xF0\x9F\x8D\xB2")));
    EXPECT_TRUE(is_placeholder(Value("  \xE2\x9C\xA8  ")));
    EXPECT_FALSE(is_placeholder(Value("x")));
    EXPECT_FALSE(is_placeholder(Value("\xF0\x9F\x8D\xB2 soup")));
    EXPECT_FALSE(is_placeholder(Value("")));
    EXPECT_FALSE(is_placeholder(Value::array({"\xF0\x9F\x8D\xB2"})));
    EXPECT_FALSE(is_placeholder(Value(
        "\xF0\x9F\x8D\xB2\xF0\x9F\x8D\xB2\xF0\x9F\x8D\xB2\xF0\x9F\x8D\xB2\xF0\x9F\x8D\xB2")));
}

TEST(RenderLiteral, EscapesAndArrays) {
    EXPECT_EQ(render_literal(Value("a\"b\\c")), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(render_literal(Value("#{x} #y")), "\"\\#{x} #y\"");
    EXPECT_EQ(render_literal(Value::array({"a", "b"})), "[\"a\", \"b\"]");
    EXPECT_EQ(render_literal(Value::array()), "[]");
}

TEST(RenderLiteral, RejectsNonLiterals) {
    EXPECT_THROW(render_literal(Value(3)), ContractError);
    EXPECT_THROW(render_literal(Value::array({1})), ContractError);
}

TEST(ApplyEdits, SameOffsetKeepsPlanningOrder) {
    std::vector<Edit> edits{{1, 0, "X"}, {1, 0, "Y"}, {0, 1, "A"}};
    EXPECT_EQ(apply_edits("abc", edits), "AXYbc");
}

TEST(ApplyEdits, SkipsOverlappingAndOutOfRange) {
    Report report;
    std::vector<Edit> edits{{0, 2, "Z"}, {1, 1, "Q"}, {5, 0, "!"}, {2, 4, "?"}};
    EXPECT_EQ(apply_edits("abc", edits, &report), "aQc");
    EXPECT_EQ(report.count(Severity::Debug), 3u);
}

TEST(Reassemble, ReplacesOnlyTheRange) {
    EXPECT_EQ(reassemble("head[body]tail", SourceRange{5, 9}, "NEW"), "head[NEW]tail");
}

// ============================================================================
// Node lookup
// ============================================================================

TEST(FindTargetCall, MatchesReceiverAndConstructor) {
    ScriptScanner scanner;
    auto tree = scanner.parse("foo do\nend\n::Gem::Specification.new do\nend\n");
    ASSERT_TRUE(tree.success) << tree.error;

    const Statement* call = find_target_call(tree.statements, SplicerOptions{});
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call, &tree.statements[1]);
    EXPECT_EQ(block_parameter(*call, SplicerOptions{}), "spec");

    SplicerOptions other;
    other.receiver = "Bundler::Spec";
    EXPECT_EQ(find_target_call(tree.statements, other), nullptr);
}

// ============================================================================
// replace_fields
// ============================================================================

class SplicerTest : public ::testing::Test {
protected:
    ScriptScanner scanner;
    ScriptSplicer splicer{scanner};
    Report report;
};

TEST_F(SplicerTest, RewritesLiteralFieldInPlace) {
    const std::string out = splicer.replace_fields(kScript, {{"name", "renamed"}}, &report);
    std::string expected = kScript;
    expected.replace(expected.find("\"demo\""), 6, "\"renamed\"");
    EXPECT_EQ(out, expected);
}

TEST_F(SplicerTest, ComputedValueIsLeftAlone) {
    EXPECT_EQ(splicer.replace_fields(kScript, {{"version", "9.9.9"}}, &report), kScript);
}

TEST_F(SplicerTest, MissingFieldInsertedAfterAnchorLine) {
    const std::string out = splicer.replace_fields(
        kScript, {{"homepage", "https://example.org"}, {"license", "MIT"}}, &report);
    EXPECT_NE(out.find("  spec.version = Demo::VERSION # bumped by release\n"
                       "  spec.homepage = \"https://example.org\"\n"
                       "  spec.license = \"MIT\"\n"
                       "  spec.summary"),
              std::string::npos)
        << out;
}

TEST_F(SplicerTest, InsertionInSingleLineBlockFollowsAnchor) {
    const std::string script = "Gem::Specification.new do |s| s.version = \"1\" end\n";
    EXPECT_EQ(splicer.replace_fields(script, {{"license", "MIT"}}),
              "Gem::Specification.new do |s| s.version = \"1\"\ns.license = \"MIT\" end\n");
}

TEST_F(SplicerTest, MissingFieldWithoutAnchorGoesToBodyEnd) {
    const std::string script = "Gem::Specification.new do |s|\n  s.name = \"x\"\n\nend\n";
    EXPECT_EQ(splicer.replace_fields(script, {{"authors", Value::array({"A", "B"})}}),
              "Gem::Specification.new do |s|\n  s.name = \"x\"\n  s.authors = [\"A\", \"B\"]\n\nend\n");
}

TEST_F(SplicerTest, PlaceholderNeverReplacesFreeformContent) {
    EXPECT_EQ(splicer.replace_fields(kScript, {{"summary", "\xE2\x9C\xA8"}}, &report), kScript);
    EXPECT_EQ(splicer.replace_fields(kScript, {{"description", "\xE2\x9C\xA8"}}, &report), kScript);

    const std::string out = splicer.replace_fields(kScript, {{"summary", "Real text"}});
    EXPECT_NE(out.find("spec.summary = \"Real text\""), std::string::npos);
}

TEST_F(SplicerTest, OutsideTheBlockIsUntouched) {
    const std::string out = splicer.replace_fields(kScript, {{"name", "n"}, {"license", "MIT"}});
    EXPECT_EQ(out.substr(0, 63), kScript.substr(0, 63));
    EXPECT_EQ(out.substr(out.size() - 4), "end\n");
}

TEST_F(SplicerTest, NoTargetBlockIsReported) {
    const std::string script = "puts 1\n";
    EXPECT_EQ(splicer.replace_fields(script, {{"name", "x"}}, &report), script);
    EXPECT_EQ(report.count(Severity::Info), 1u);
}

TEST(Splicer, ParseFailureReturnsContentWithWarning) {
    BrokenParser parser;
    ScriptSplicer splicer(parser);
    Report report;
    EXPECT_EQ(splicer.replace_fields(kScript, {{"name", "x"}}, &report), kScript);
    EXPECT_EQ(splicer.remove_dependency(kScript, "rake", &report), kScript);
    EXPECT_EQ(splicer.ensure_dependencies(kScript, {{"rake", "spec.add_dependency \"rake\""}}, &report),
              kScript);
    EXPECT_EQ(report.count(Severity::Warning), 3u);
}

TEST(Splicer, CustomReceiverAndParameter) {
    ScriptScanner scanner;
    SplicerOptions opts;
    opts.receiver = "Pkg::Spec";
    opts.constructor = "build";
    ScriptSplicer splicer(scanner, opts);

    const std::string script = "Pkg::Spec.build do |p|\n  p.name = \"a\"\nend\n";
    EXPECT_EQ(splicer.replace_fields(script, {{"name", "b"}}),
              "Pkg::Spec.build do |p|\n  p.name = \"b\"\nend\n");
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_F(SplicerTest, RemoveDependencyDeletesWholeLines) {
    const std::string out = splicer.remove_dependency(kScript, "rake", &report);
    EXPECT_EQ(out.find("rake"), std::string::npos);
    EXPECT_NE(out.find("\n\n  spec.add_development_dependency(\"rspec\""), std::string::npos) << out;
    EXPECT_EQ(out.size(), kScript.size() - std::string("  spec.add_dependency \"rake\", \"~> 13.0\"\n").size());
}

TEST_F(SplicerTest, RemoveUnknownDependencyIsNoOp) {
    EXPECT_EQ(splicer.remove_dependency(kScript, "nokogiri"), kScript);
    EXPECT_EQ(splicer.remove_dependency(kScript, "  "), kScript);
}

TEST_F(SplicerTest, EnsureDependenciesRewritesAndInserts) {
    const DependencyLines desired{
        {"rspec", "  spec.add_development_dependency \"rspec\", \"~> 3.12\"  "},
        {"rubocop", "spec.add_development_dependency \"rubocop\""},
    };
    const std::string out = splicer.ensure_dependencies(kScript, desired, &report);

    EXPECT_NE(out.find("\n  spec.add_development_dependency \"rspec\", \"~> 3.12\"\nend\n"),
              std::string::npos)
        << out;
    EXPECT_NE(out.find("# bumped by release\n  spec.add_development_dependency \"rubocop\"\n"),
              std::string::npos)
        << out;
    EXPECT_EQ(out.find("~> 3.0"), std::string::npos);
}

TEST_F(SplicerTest, EnsureDependenciesWithoutTargetAppends) {
    EXPECT_EQ(splicer.ensure_dependencies("source \"x\"", {{"rake", " gem \"rake\" "}}, &report),
              "source \"x\"\ngem \"rake\"\n");
}
