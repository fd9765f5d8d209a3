/**
 * @file test_changelog.cpp
 * @brief Tests for changelog merging
 *
 * Covers release heading detection, category bucketing of unreleased
 * items, and the full template/destination merge.
 */

#include <gtest/gtest.h>
#include "remold/Changelog.hpp"

using namespace remold;

// ============================================================================
// Heading detection
// ============================================================================

TEST(ReleaseHeading, MatchesNameCaseInsensitively) {
    EXPECT_TRUE(is_named_release_heading("## [Unreleased]", "Unreleased"));
    EXPECT_TRUE(is_named_release_heading("##  [ unreleased ]", "Unreleased"));
    EXPECT_FALSE(is_named_release_heading("## Unreleased", "Unreleased"));
    EXPECT_FALSE(is_named_release_heading("### [Unreleased]", "Unreleased"));
    EXPECT_FALSE(is_named_release_heading("## [1.0.0]", "Unreleased"));
}

TEST(ReleaseHeading, FindSkipsFencedText) {
    const std::vector<std::string> lines{"```", "## [Unreleased]", "```", "## [Unreleased]"};
    EXPECT_EQ(find_named_section(lines, "Unreleased"), std::optional<size_t>(3));
    EXPECT_FALSE(find_named_section({"# Changelog"}, "Unreleased").has_value());
}

TEST(ReleaseHeading, UnclosedFenceHidesSection) {
    const std::vector<std::string> lines{"# Changelog", "```", "## [Unreleased]", "- x"};
    EXPECT_FALSE(find_named_section(lines, "Unreleased").has_value());
}

TEST(MergeChangelog, DestinationSectionAfterUnclosedFenceIsIgnored) {
    const std::string tpl = "# Changelog\n## [Unreleased]\n### Added\n";
    const std::string dest = "# Changelog\n```\n## [Unreleased]\n### Added\n- hidden\n";
    EXPECT_EQ(merge_changelog(tpl, dest).find("- hidden"), std::string::npos);
}

TEST(ReleaseHeading, NormalizeCollapsesSpaces) {
    EXPECT_EQ(normalize_release_headers("##  [1.0.0]   -  2024-01-01\n- a  b\n"),
              "## [1.0.0] - 2024-01-01\n- a  b\n");
}

// ============================================================================
// Category items
// ============================================================================

TEST(CategoryItems, GroupsBulletsWithContinuations) {
    const ChangelogOptions opts;
    const std::vector<std::string> body{
        "### added",
        "- first",
        "  continued   ",
        "",
        "* second",
        "### Fixed",
        "- fix",
        "  ```",
        "code",
        "  ```",
    };
    const CategoryBuckets b = parse_category_items(body, opts.categories);

    ASSERT_EQ(b.items.size(), 6u);
    EXPECT_EQ(b.items[0], (std::vector<std::string>{"- first", "  continued", "", "* second"}));
    EXPECT_EQ(b.items[4], (std::vector<std::string>{"- fix", "  ```", "code", "  ```"}));
    EXPECT_TRUE(b.items[1].empty());
    EXPECT_EQ(b.dropped_lines, 0u);
}

TEST(CategoryItems, UnknownCategoriesAreDropped) {
    const ChangelogOptions opts;
    const CategoryBuckets b = parse_category_items(
        {"stray text", "### Misc", "- gone", "  also gone", "### Added", "- kept"}, opts.categories);

    EXPECT_EQ(b.items[0], (std::vector<std::string>{"- kept"}));
    EXPECT_EQ(b.dropped_lines, 4u);
}

// ============================================================================
// merge_changelog
// ============================================================================

class MergeChangelogTest : public ::testing::Test {
protected:
    const std::string tpl =
        "# Changelog\n"
        "All notable changes.\n"
        "\n"
        "## [Unreleased]\n"
        "### Added\n"
        "### Changed\n"
        "### Deprecated\n"
        "### Removed\n"
        "### Fixed\n"
        "### Security\n"
        "\n"
        "## [0.0.1] - 2000-01-01\n"
        "- template history\n";
};

TEST_F(MergeChangelogTest, RebuildsUnreleasedAndKeepsHistory) {
    const std::string dest =
        "# Changelog\n"
        "## [Unreleased]\n"
        "### Fixed\n"
        "- a fix\n"
        "### Added\n"
        "- new thing\n"
        "  details\n"
        "### Misc\n"
        "- dropped\n"
        "\n"
        "## [1.0.0]  -  2024-01-01\n"
        "- released\n";

    const std::string expected =
        "# Changelog\n"
        "All notable changes.\n"
        "\n"
        "## [Unreleased]\n"
        "### Added\n"
        "- new thing\n"
        "  details\n"
        "### Changed\n"
        "### Deprecated\n"
        "### Removed\n"
        "### Fixed\n"
        "- a fix\n"
        "### Security\n"
        "\n"
        "## [1.0.0] - 2024-01-01\n"
        "- released\n";

    Report report;
    EXPECT_EQ(merge_changelog(tpl, dest, ChangelogOptions{}, &report), expected);
    EXPECT_EQ(report.count(Severity::Warning), 1u);
}

TEST_F(MergeChangelogTest, BlankDestinationReturnsTemplate) {
    EXPECT_EQ(merge_changelog(tpl, "\n"), tpl);
}

TEST_F(MergeChangelogTest, DestinationWithoutSectionKeepsReleases) {
    const std::string dest = "# Changelog\n\n## [2.0.0]\n- shipped\n";
    const std::string out = merge_changelog(tpl, dest);

    EXPECT_NE(out.find("### Security\n\n## [2.0.0]\n- shipped\n"), std::string::npos);
    EXPECT_EQ(out.find("template history"), std::string::npos);
}

TEST(MergeChangelog, TemplateWithoutSectionIsNormalizedOnly) {
    const std::string tpl = "# Changelog\n##  [1.0]\n";
    EXPECT_EQ(merge_changelog(tpl, "# Other\n"), "# Changelog\n## [1.0]\n");
}

TEST(MergeChangelog, CustomSectionAndCategories) {
    ChangelogOptions opts;
    opts.section = "Next";
    opts.categories = {"Features", "Bugfixes"};

    const std::string tpl = "# Log\n## [Next]\n";
    const std::string dest = "## [Next]\n### Bugfixes\n- b\n### Features\n- f\n";
    EXPECT_EQ(merge_changelog(tpl, dest, opts), "# Log\n## [Next]\n### Features\n- f\n### Bugfixes\n- b");
}

TEST_F(MergeChangelogTest, MergingTwiceIsStable) {
    const std::string dest =
        "## [Unreleased]\n### Security\n- patched\n### Added\n- thing\n\n## [1.0.0]\n- released\n";
    const std::string once = merge_changelog(tpl, dest);
    EXPECT_EQ(merge_changelog(tpl, once), once);
}

TEST(MergeChangelog, SingleItemAndAllCategories) {
    const std::string out = merge_changelog("## [Unreleased]\n### Added\n",
                                            "## [Unreleased]\n### Added\n- x\n");
    size_t hits = 0;
    for (size_t at = out.find("- x"); at != std::string::npos; at = out.find("- x", at + 1)) ++hits;
    EXPECT_EQ(hits, 1u);
    for (const char* c : {"Added", "Changed", "Deprecated", "Removed", "Fixed", "Security"}) {
        EXPECT_NE(out.find(std::string("### ") + c), std::string::npos) << c;
    }
}
