/**
 * @file Errors.hpp
 * @brief Exception types for jtransform
 *
 * - TransformError: Base class
 * - ParseError: Malformed JSON/TOML input
 * - FileNotFoundError: Document file not found
 * - InvalidRegistrationCode: Custom command code is not lowercase letters
 * - PathResolutionError: Path segment not found
 * - ShapeMismatchError: Operand or traversal target has the wrong type
 *
 * ParseError, FileNotFoundError and InvalidRegistrationCode reach the
 * caller. The other two are recorded in the transformation result when
 * they escape a command.
 */

#ifndef JTRANSFORM_ERRORS_HPP
#define JTRANSFORM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace jtransform {

/**
 * @brief Base class for all jtransform exceptions
 */
class TransformError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document text could not be parsed
 */
class ParseError : public TransformError {
public:
    /**
     * @brief Construct with input name and parser details
     * @param source Name of the input (file path or "<source>")
     * @param details Detailed error message from parser
     */
    ParseError(std::string source, std::string details)
        : TransformError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public TransformError {
public:
    explicit FileNotFoundError(std::string path)
        : TransformError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Custom command code rejected at registration
 *
 * Codes must be non-empty and consist only of the letters a-z.
 */
class InvalidRegistrationCode : public TransformError {
public:
    explicit InvalidRegistrationCode(std::string code)
        : TransformError("Invalid transformation code '" + code +
                         "': only lowercase letters are allowed")
        , code_(std::move(code))
    {}

    const std::string& code() const noexcept {
        return code_;
    }

private:
    std::string code_;
};

/**
 * @brief Path segment not found during traversal
 */
class PathResolutionError : public TransformError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "items.3.name")
     * @param segment The specific segment that doesn't exist (e.g., "3")
     */
    PathResolutionError(std::string path, std::string segment)
        : TransformError("Path not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Structurally incompatible value at a path
 *
 * Raised when traversing into a scalar, or when a command's operands
 * cannot be combined (e.g. union of an array with an object).
 */
class ShapeMismatchError : public TransformError {
public:
    /**
     * @brief Construct with path, expected shape, and actual shape
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "array or object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    ShapeMismatchError(std::string path, std::string expected, std::string actual)
        : TransformError("Shape mismatch at '" + path + "': expected " +
                         expected + ", got " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace jtransform

#endif // JTRANSFORM_ERRORS_HPP
