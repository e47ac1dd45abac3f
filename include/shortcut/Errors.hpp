/**
 * @file Errors.hpp
 * @brief Exception types for shortcut normalization errors
 *
 * Error taxonomy:
 * - ShortcutError: Base class
 * - ConfigurationError: Structural misdeclaration (hint cardinality,
 *   malformed shorthand text, unknown mode or type)
 * - ExpressionEvaluationError: Template expression failed to parse or
 *   evaluate
 * - FileNotFoundError: Catalog/registry file not found
 * - ConfigParseError: JSON/TOML syntax errors
 */

#ifndef SHORTCUT_ERRORS_HPP
#define SHORTCUT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace shortcut {

/**
 * @brief Base class for all shortcut exceptions
 */
class ShortcutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A shortcut declaration is structurally invalid
 *
 * The caller must reject the offending route/filter declaration rather
 * than proceed with a partial configuration.
 */
class ConfigurationError : public ShortcutError {
public:
    using ShortcutError::ShortcutError;
};

/**
 * @brief Template expression could not be parsed or evaluated
 */
class ExpressionEvaluationError : public ShortcutError {
public:
    /**
     * @brief Construct with expression text and failure details
     * @param expression The raw expression string handed to the resolver
     * @param details What went wrong
     */
    ExpressionEvaluationError(std::string expression, std::string details)
        : ShortcutError("Failed to evaluate expression '" + expression + "': " + details)
        , expression_(std::move(expression))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the expression that failed
     */
    const std::string& expression() const noexcept {
        return expression_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string expression_;
    std::string details_;
};

/**
 * @brief Catalog or registry file not found
 */
class FileNotFoundError : public ShortcutError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ShortcutError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Catalog or registry file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ShortcutError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : ShortcutError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

} // namespace shortcut

#endif // SHORTCUT_ERRORS_HPP
