/**
 * @file Errors.hpp
 * @brief Exception types for TOON encoding and decoding
 *
 * Error taxonomy:
 * - ToonError: Base class
 * - PositionedError: Base for errors carrying a 1-based line/column
 *   - SyntaxError: Malformed text (with context and suggestion)
 *   - IndentationError: Unexpected indentation
 *   - InvalidFormat: Declared counts do not match the content
 *   - UnexpectedEof: Input ends inside a construct
 * - TypeMismatch: Value has the wrong type for the requested binding
 * - UnsupportedType: Value or host type cannot be represented
 * - CustomError: Catch-all raised by binding code
 * - FileNotFoundError: Input file not found
 * - FileParseError: JSON/TOML syntax errors in an input file
 * - IoError: File could not be written
 */

#ifndef TOON_ERRORS_HPP
#define TOON_ERRORS_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace toon {

/**
 * @brief Base class for all toon exceptions
 */
class ToonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for errors tied to a position in the input text
 */
class PositionedError : public ToonError {
public:
    PositionedError(const std::string& what, std::size_t line, std::size_t column)
        : ToonError(what)
        , line_(line)
        , column_(column)
    {}

    /// 1-based line number
    std::size_t line() const noexcept { return line_; }

    /// 1-based column number
    std::size_t column() const noexcept { return column_; }

private:
    std::size_t line_;
    std::size_t column_;
};

/**
 * @brief Malformed TOON text
 *
 * Message layout:
 * ```
 * Syntax error at line 2, column 5: Expected ':' after key
 *   name Alice
 *       ^
 * Help: did you mean `key: value`?
 * ```
 */
class SyntaxError : public PositionedError {
public:
    /**
     * @param line 1-based line
     * @param column 1-based column
     * @param message What went wrong
     * @param context Source line with a caret marker (may be empty)
     * @param suggestion Actionable hint (may be empty)
     */
    SyntaxError(std::size_t line, std::size_t column, std::string message,
                std::string context = {}, std::string suggestion = {})
        : PositionedError(format_message(line, column, message, context, suggestion),
                          line, column)
        , message_(std::move(message))
        , context_(std::move(context))
        , suggestion_(std::move(suggestion))
    {}

    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    std::string message_;
    std::string context_;
    std::string suggestion_;

    static std::string format_message(std::size_t line, std::size_t column,
                                      const std::string& message,
                                      const std::string& context,
                                      const std::string& suggestion) {
        std::ostringstream oss;
        oss << "Syntax error at line " << line << ", column " << column << ": " << message;
        if (!context.empty()) oss << "\n" << context;
        if (!suggestion.empty()) oss << "\nHelp: " << suggestion;
        return oss.str();
    }
};

/**
 * @brief A line is indented differently than its scope allows
 */
class IndentationError : public PositionedError {
public:
    /**
     * @param expected Number of leading spaces the scope expects
     * @param found Number of leading spaces on the offending line
     */
    IndentationError(std::size_t line, std::size_t column,
                     std::size_t expected, std::size_t found,
                     std::string context = {})
        : PositionedError(format_message(line, column, expected, found, context),
                          line, column)
        , expected_(expected)
        , found_(found)
        , context_(std::move(context))
    {}

    std::size_t expected() const noexcept { return expected_; }
    std::size_t found() const noexcept { return found_; }
    const std::string& context() const noexcept { return context_; }

private:
    std::size_t expected_;
    std::size_t found_;
    std::string context_;

    static std::string format_message(std::size_t line, std::size_t column,
                                      std::size_t expected, std::size_t found,
                                      const std::string& context) {
        std::ostringstream oss;
        oss << "Indentation error at line " << line << ", column " << column
            << ": expected " << expected << " spaces, found " << found << " spaces";
        if (!context.empty()) oss << "\n" << context;
        oss << "\nHelp: nested fields must be indented consistently under their parent key";
        return oss.str();
    }
};

/**
 * @brief Text is well-formed but inconsistent (e.g. declared length mismatch)
 */
class InvalidFormat : public PositionedError {
public:
    InvalidFormat(std::size_t line, std::size_t column, std::string message)
        : PositionedError("Invalid format at line " + std::to_string(line) +
                          ", column " + std::to_string(column) + ": " + message,
                          line, column)
        , message_(std::move(message))
    {}

    const std::string& message() const noexcept { return message_; }

private:
    std::string message_;
};

/**
 * @brief Input ended while a construct was still open
 */
class UnexpectedEof : public PositionedError {
public:
    /**
     * @param expected What the parser was waiting for
     */
    UnexpectedEof(std::size_t line, std::size_t column, std::string expected,
                  std::string context = {})
        : PositionedError(format_message(line, column, expected, context), line, column)
        , expected_(std::move(expected))
        , context_(std::move(context))
    {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& context() const noexcept { return context_; }

private:
    std::string expected_;
    std::string context_;

    static std::string format_message(std::size_t line, std::size_t column,
                                      const std::string& expected,
                                      const std::string& context) {
        std::ostringstream oss;
        oss << "Unexpected end of input at line " << line << ", column " << column
            << ": expected " << expected;
        if (!context.empty()) oss << "\n" << context;
        return oss.str();
    }
};

/**
 * @brief Value does not have the type a binding asked for
 *
 * The path locates the value inside the tree in dot notation
 * (e.g. "users.1.id"); it is empty for the root.
 */
class TypeMismatch : public ToonError {
public:
    TypeMismatch(std::string path, std::string expected, std::string found)
        : ToonError(format_message(path, expected, found))
        , path_(std::move(path))
        , expected_(std::move(expected))
        , found_(std::move(found))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& found() const noexcept { return found_; }

    /**
     * @brief Same error relocated under a parent segment
     *
     * ```cpp
     * TypeMismatch("id", "integer", "string").nested_in("users.1")
     * // path() == "users.1.id"
     * ```
     */
    TypeMismatch nested_in(const std::string& segment) const {
        return TypeMismatch(path_.empty() ? segment : segment + "." + path_,
                            expected_, found_);
    }

private:
    std::string path_;
    std::string expected_;
    std::string found_;

    static std::string format_message(const std::string& path,
                                      const std::string& expected,
                                      const std::string& found) {
        std::ostringstream oss;
        oss << "Type mismatch";
        if (!path.empty()) oss << " at '" << path << "'";
        oss << ": expected " << expected << ", found " << found;
        return oss.str();
    }
};

/**
 * @brief Value or host construct that has no TOON representation
 */
class UnsupportedType : public ToonError {
public:
    explicit UnsupportedType(std::string description)
        : ToonError("Unsupported type: " + description)
        , description_(std::move(description))
    {}

    const std::string& description() const noexcept { return description_; }

private:
    std::string description_;
};

/**
 * @brief Free-form error raised by binding code
 */
class CustomError : public ToonError {
public:
    using ToonError::ToonError;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public ToonError {
public:
    /**
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ToonError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief JSON or TOML syntax error in an input file
 */
class FileParseError : public ToonError {
public:
    /**
     * @param file Path to the file with the parse error
     * @param details Message from the underlying parser
     */
    FileParseError(std::string file, std::string details)
        : ToonError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief File could not be read or written
 */
class IoError : public ToonError {
public:
    IoError(std::string path, std::string details)
        : ToonError("I/O error on '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::string details_;
};

} // namespace toon

#endif // TOON_ERRORS_HPP
