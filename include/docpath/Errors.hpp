/**
 * @file Errors.hpp
 * @brief Exception types for path resolution and document I/O
 *
 * Error taxonomy:
 * - DocpathError: Base class
 * - PathError: Base for resolution failures, carries the offending name
 *   - PropertyNotExist: A named segment is absent at the current level
 *   - NotAnArray: An indexed segment targets a non-sequence value
 *   - IndexOutOfRange: Index outside the sequence bounds
 *   - InvalidIndexType: Bracketed index token is not a usable integer
 *   - AlreadyExists: create() on a path that already resolves
 * - TypeError: Tree root is not a mapping
 * - FileNotFoundError / DocumentParseError / UnsupportedFormatError: Loader
 */

#ifndef DOCPATH_ERRORS_HPP
#define DOCPATH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace docpath {

/**
 * @brief Base class for all docpath exceptions
 */
class DocpathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for failures while resolving a path
 *
 * name() is the property name (or, for AlreadyExists, the path) the
 * failure refers to.
 */
class PathError : public DocpathError {
public:
    PathError(std::string name, const std::string& message)
        : DocpathError(message)
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief A named segment is absent at the current level
 */
class PropertyNotExist : public PathError {
public:
    explicit PropertyNotExist(std::string name)
        : PathError(name, "Property " + name + " does not exist")
    {}
};

/**
 * @brief An indexed segment targets a value that is not a sequence
 */
class NotAnArray : public PathError {
public:
    explicit NotAnArray(std::string name)
        : PathError(name, name + ": is not an array")
    {}
};

/**
 * @brief Index outside the valid range of a sequence
 *
 * The message reports the sequence length as the upper bound.
 */
class IndexOutOfRange : public PathError {
public:
    IndexOutOfRange(std::string name, std::size_t length)
        : PathError(name, name + ": Min index is 0, Max index is " + std::to_string(length))
        , length_(length)
    {}

    /**
     * @brief Length of the sequence at the time of the failure
     */
    std::size_t length() const noexcept {
        return length_;
    }

private:
    std::size_t length_;
};

/**
 * @brief Bracketed index token failed integer parsing
 */
class InvalidIndexType : public PathError {
public:
    InvalidIndexType(std::string name, std::string token)
        : PathError(name, name + "[" + token + "] must be of type number")
        , token_(std::move(token))
    {}

    const std::string& token() const noexcept {
        return token_;
    }

private:
    std::string token_;
};

/**
 * @brief create() invoked on a path that currently resolves
 */
class AlreadyExists : public PathError {
public:
    explicit AlreadyExists(std::string path)
        : PathError(path, "Property " + path + " already exists")
    {}

    /**
     * @brief The full path passed to create()
     */
    const std::string& path() const noexcept {
        return name();
    }
};

/**
 * @brief A tree or document root has the wrong node type
 */
class TypeError : public DocpathError {
public:
    /**
     * @brief Construct with context, expected type, and actual type
     * @param where What was being checked (e.g., a file path or "tree")
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "array")
     */
    TypeError(std::string where, std::string expected, std::string actual)
        : DocpathError("Expected " + expected + " but found " + actual +
                       " at '" + where + "'")
        , where_(std::move(where))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& where() const noexcept {
        return where_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string where_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DocpathError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DocpathError("Document file not found: " + path)
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
 * @brief Document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public DocpathError {
public:
    /**
     * @brief Construct with source, position and error details
     * @param file Path of the file (or "<string>" for in-memory text)
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : DocpathError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief File extension not handled by the loader
 */
class UnsupportedFormatError : public DocpathError {
public:
    explicit UnsupportedFormatError(std::string extension)
        : DocpathError("Unsupported document file type: '" + extension +
                       "' (expected .json or .toml)")
        , extension_(std::move(extension))
    {}

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string extension_;
};

} // namespace docpath

#endif // DOCPATH_ERRORS_HPP
