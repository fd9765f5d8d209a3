/**
 * @file test_loader.cpp
 * @brief Tests for configuration and text file loading
 *
 * Tests cover:
 * - JSON loading and parse-error positions
 * - TOML loading, including nested tables and arrays
 * - Extension dispatch in load_config_file
 * - Text read/write helpers
 */

#include <gtest/gtest.h>
#include "remold/Errors.hpp"
#include "remold/Loader.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

using namespace remold;

namespace {

std::string unique_name(const std::string& stem, const std::string& extension) {
    static std::mt19937 rng{std::random_device{}()};
    return "remold_test_" + stem + "_" + std::to_string(rng()) + extension;
}

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() / unique_name("file", extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJson, ParsesObject) {
    TempFile f(R"({"changelog": {"section": "Next"}, "markdown": {"preserve_h1": false}})");
    Value v = load_json_file(f.path());
    EXPECT_EQ(v["changelog"]["section"], "Next");
    EXPECT_EQ(v["markdown"]["preserve_h1"], false);
}

TEST(LoadJson, ParseErrorCarriesPosition) {
    TempFile f("{\n  \"a\": 1,\n  oops\n}");
    try {
        load_json_file(f.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), f.path());
        EXPECT_EQ(e.line(), 3);
        EXPECT_GT(e.column(), 0);
    }
}

TEST(LoadJson, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/remold.json"), FileNotFoundError);
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadToml, TablesAndArrays) {
    TempFile f(
        "[markdown]\n"
        "preserve_sections = [\"Synopsis\", \"FAQ\"]\n"
        "preserve_h1 = true\n"
        "\n"
        "[changelog]\n"
        "section = \"Unreleased\"\n"
        "\n"
        "[script]\n"
        "receiver = \"Pkg::Spec\"\n",
        ".toml");
    Value v = load_toml_file(f.path());
    EXPECT_EQ(v["markdown"]["preserve_sections"], Value::array({"Synopsis", "FAQ"}));
    EXPECT_EQ(v["markdown"]["preserve_h1"], true);
    EXPECT_EQ(v["script"]["receiver"], "Pkg::Spec");
}

TEST(LoadToml, ScalarTypes) {
    TempFile f("i = 3\nf = 1.5\nd = 2024-01-02\n", ".toml");
    Value v = load_toml_file(f.path());
    EXPECT_EQ(v["i"], 3);
    EXPECT_DOUBLE_EQ(v["f"].get<double>(), 1.5);
    EXPECT_EQ(v["d"], "2024-01-02");
}

TEST(LoadToml, ParseError) {
    TempFile f("[markdown\npreserve_h1 = true\n", ".toml");
    try {
        load_toml_file(f.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.line(), 1);
        EXPECT_FALSE(e.details().empty());
    }
}

// ============================================================================
// load_config_file
// ============================================================================

TEST(LoadConfigFile, EmptyPathIsEmptyObject) {
    Value v = load_config_file("");
    EXPECT_TRUE(v.is_object());
    EXPECT_TRUE(v.empty());
}

TEST(LoadConfigFile, DispatchesOnExtension) {
    TempFile json(R"({"a": 1})", ".JSON");
    TempFile toml("a = 2\n", ".toml");
    EXPECT_EQ(load_config_file(json.path())["a"], 1);
    EXPECT_EQ(load_config_file(toml.path())["a"], 2);
}

TEST(LoadConfigFile, RejectsUnknownExtension) {
    TempFile yaml("a: 1\n", ".yaml");
    EXPECT_THROW(load_config_file(yaml.path()), RemoldError);
    EXPECT_THROW(load_config_file("/nonexistent/remold.toml"), FileNotFoundError);
}

TEST(FileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("dir/Config.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// Text files
// ============================================================================

TEST(TextFiles, ReadKeepsBytesExactly) {
    const std::string content = "# T\r\n\xF0\x9F\x8D\xB2\n\n";
    TempFile f(content, ".md");
    EXPECT_EQ(read_text_file(f.path()), content);
}

TEST(TextFiles, ReadOrEmpty) {
    EXPECT_EQ(read_text_file_or_empty("/nonexistent/README.md"), "");
    EXPECT_THROW(read_text_file("/nonexistent/README.md"), FileNotFoundError);
}

TEST(TextFiles, WriteThenRead) {
    TempFile f("old", ".md");
    write_text_file(f.path(), "new\n");
    EXPECT_EQ(read_text_file(f.path()), "new\n");
}

TEST(TextFiles, WriteToMissingDirectoryFails) {
    EXPECT_THROW(write_text_file("/nonexistent/dir/out.md", "x"), RemoldError);
}
