/**
 * @file test_config.cpp
 * @brief Tests for layered merge configuration (GoogleTest)
 *
 * Precedence: built-in defaults < config file < --set overrides.
 */

#include <gtest/gtest.h>
#include "remold/Config.hpp"
#include "remold/Errors.hpp"
#include "remold/Sections.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace remold;

namespace {

// Writes `content` to a temp file named after the test, removed on scope exit.
class ScopedConfigFile {
public:
    ScopedConfigFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / ("remold_cfg_" + name)) {
        std::ofstream(path_) << content;
    }
    ~ScopedConfigFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST(MergeConfig, DefaultsMatchOptionStructs) {
    MergeConfig cfg = MergeConfig::load(LoadOptions{});
    EXPECT_EQ(cfg.changelog.section, "Unreleased");
    EXPECT_EQ(cfg.changelog.categories.size(), 6u);
    EXPECT_EQ(cfg.script.receiver, "Gem::Specification");
    EXPECT_EQ(cfg.script.anchor_field, "version");
    EXPECT_TRUE(cfg.markdown.preserve_h1);
    EXPECT_FALSE(cfg.markdown.normalize_heading_spacing);
}

TEST(MergeConfig, DefaultTreeRoundTrips) {
    const Value tree = MergeConfig::default_tree();
    EXPECT_EQ(MergeConfig::from_value(tree).to_value(), tree);
    EXPECT_EQ(tree["markdown"]["preserve_prefixes"], Value::array({"note:"}));
}

// ============================================================================
// Layers
// ============================================================================

TEST(MergeConfig, JsonFileOverridesDefaults) {
    ScopedConfigFile f("json_layer.json",
                       R"({"changelog": {"section": "Next"}, "script": {"default_param": "s"}})");
    LoadOptions opts;
    opts.file_path = f.path();
    MergeConfig cfg = MergeConfig::load(opts);

    EXPECT_EQ(cfg.changelog.section, "Next");
    EXPECT_EQ(cfg.changelog.categories.size(), 6u);
    EXPECT_EQ(cfg.script.default_param, "s");
    EXPECT_EQ(cfg.script.constructor, "new");
}

TEST(MergeConfig, TomlFileOverridesDefaults) {
    ScopedConfigFile f("toml_layer.toml",
                       "[markdown]\npreserve_sections = [\"## FAQ\"]\npreserve_h1 = false\n");
    LoadOptions opts;
    opts.file_path = f.path();
    MergeConfig cfg = MergeConfig::load(opts);

    EXPECT_EQ(cfg.markdown.preserve_sections, (std::vector<std::string>{"## FAQ"}));
    EXPECT_FALSE(cfg.markdown.preserve_h1);
}

TEST(MergeConfig, OverridesWinOverFile) {
    ScopedConfigFile f("override_layer.json", R"({"changelog": {"section": "Next"}})");
    LoadOptions opts;
    opts.file_path = f.path();
    opts.overrides = {{"changelog.section", "Upcoming"},
                      {"markdown.normalize_heading_spacing", true}};
    MergeConfig cfg = MergeConfig::load(opts);

    EXPECT_EQ(cfg.changelog.section, "Upcoming");
    EXPECT_TRUE(cfg.markdown.normalize_heading_spacing);
}

TEST(MergeConfig, MissingFileThrows) {
    LoadOptions opts;
    opts.file_path = "/nonexistent/remold.json";
    EXPECT_THROW(MergeConfig::load(opts), FileNotFoundError);
}

// ============================================================================
// Validation
// ============================================================================

TEST(MergeConfig, WrongTypeNamesTheKey) {
    LoadOptions opts;
    opts.overrides.emplace_back("markdown.preserve_h1", "yes");
    try {
        MergeConfig::load(opts);
        FAIL() << "expected ConfigValueError";
    } catch (const ConfigValueError& e) {
        EXPECT_EQ(e.key(), "markdown.preserve_h1");
        EXPECT_EQ(e.expected(), "boolean");
    }
}

TEST(MergeConfig, ListMustHoldStrings) {
    Value tree = MergeConfig::default_tree();
    tree["changelog"]["categories"] = Value::array({"Added", 3});
    EXPECT_THROW(MergeConfig::from_value(tree), ConfigValueError);
}

TEST(MergeConfig, RootMustBeObject) {
    EXPECT_THROW(MergeConfig::from_value(Value::array()), ConfigValueError);
}

// ============================================================================
// Markdown settings
// ============================================================================

TEST(MarkdownSettings, DocumentOptionsNormalizeNames) {
    MarkdownSettings md;
    md.preserve_sections = {"## Basic   Usage", "FAQ"};
    md.preserve_prefixes = {"Note:"};
    md.preserve_h1 = false;
    const DocumentMergeOptions opts = md.document_options();

    EXPECT_EQ(opts.preserved_keys, (std::set<std::string>{"basic usage", "faq"}));
    ASSERT_TRUE(static_cast<bool>(opts.preserved_predicate));
    EXPECT_TRUE(opts.preserved_predicate(section_key("### NOTE: beta")));
    EXPECT_FALSE(opts.preserve_h1);
}

TEST(MarkdownSettings, NoPrefixesMeansNoPredicate) {
    MarkdownSettings md;
    md.preserve_prefixes.clear();
    EXPECT_FALSE(static_cast<bool>(md.document_options().preserved_predicate));
}
