/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "remold/Loader.hpp"
#include "remold/Errors.hpp"
#include "remold/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace remold {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

template <typename T>
std::string stream_to_string(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ node to nlohmann::json.
 */
Value toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Configuration files
// ============================================================================

Value load_json_file(const std::string& path) {
    const std::string content = read_text_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        // byte is 1-based; map it to line/column for the message
        const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
        const size_t upto = std::min(byte, content.size());
        int line = 1;
        int column = 1;
        for (size_t i = 0; i < upto; ++i) {
            if (content[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw ConfigParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_config_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw RemoldError("Unsupported config file type: " + ext + " (expected .json or .toml)");
}

// ============================================================================
// Text files
// ============================================================================

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string read_text_file_or_empty(const std::string& path) {
    if (!file_exists(path)) {
        return std::string();
    }
    return read_text_file(path);
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw RemoldError("Cannot write file: " + path);
    }
    file << text;
    if (!file) {
        throw RemoldError("Failed writing file: " + path);
    }
}

} // namespace remold
