/**
 * @file Errors.hpp
 * @brief Exception types for remold
 *
 * Error taxonomy:
 * - RemoldError: Base class
 * - ContractError: Caller-level programming error (bad arguments)
 * - FileNotFoundError: Input or config file not found
 * - ConfigParseError: JSON/TOML syntax errors in a config file
 * - ConfigValueError: Known config key holds a value of the wrong type
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 *
 * The merge and splice engines never throw for malformed documents; they
 * degrade to returning one of their inputs. Only ContractError may escape
 * them.
 */

#ifndef REMOLD_ERRORS_HPP
#define REMOLD_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace remold {

/**
 * @brief Base class for all remold exceptions
 */
class RemoldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A public operation was called with arguments it forbids
 */
class ContractError : public RemoldError {
public:
    explicit ContractError(const std::string& what)
        : RemoldError("Contract violation: " + what)
    {}
};

/**
 * @brief Input or configuration file not found
 */
class FileNotFoundError : public RemoldError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : RemoldError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public RemoldError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line, or 0 if unknown
     * @param column 1-based column, or 0 if unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : RemoldError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief A known configuration key has a value of the wrong type
 */
class ConfigValueError : public RemoldError {
public:
    /**
     * @param key Dot-path of the offending key (e.g., "markdown.preserve_h1")
     * @param expected Expected type (e.g., "boolean")
     * @param actual Actual type encountered (e.g., "string")
     */
    ConfigValueError(std::string key, std::string expected, std::string actual)
        : RemoldError("Config key '" + key + "' must be " + expected +
                      " (got " + actual + ")")
        , key_(std::move(key))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& key() const noexcept { return key_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string key_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public RemoldError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "markdown.preserve_h1")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : RemoldError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., trying to set "changelog.section.name" when section is a string).
 */
class TypeError : public RemoldError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : RemoldError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace remold

#endif // REMOLD_ERRORS_HPP
