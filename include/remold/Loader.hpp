/**
 * @file Loader.hpp
 * @brief File loading utilities
 *
 * Implements reading of:
 * - configuration files (JSON via nlohmann::json, TOML via toml++)
 * - plain text documents and scripts, byte for byte
 */

#ifndef REMOLD_LOADER_HPP
#define REMOLD_LOADER_HPP

#include "remold/Value.hpp"
#include <string>

namespace remold {

// ============================================================================
// Configuration files
// ============================================================================

/**
 * @brief Load a JSON file.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file; tables become nested objects.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the TOML syntax is invalid (with line/column)
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a configuration file, choosing the format by extension.
 *
 * An empty path yields an empty object.
 *
 * @throws FileNotFoundError if path is non-empty and the file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws RemoldError if the extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase), including the dot.
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Text files
// ============================================================================

/**
 * @brief Read a whole file without newline translation.
 * @throws FileNotFoundError if the file doesn't exist or can't be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Like read_text_file(), but a missing file reads as empty text.
 */
std::string read_text_file_or_empty(const std::string& path);

/**
 * @brief Write text to a file, replacing its contents.
 * @throws RemoldError if the file can't be written
 */
void write_text_file(const std::string& path, const std::string& text);

} // namespace remold

#endif // REMOLD_LOADER_HPP
