/**
 * @file Errors.hpp
 * @brief Exception types for shapeql
 *
 * Tree construction errors:
 * - SchemaMismatch: field, type condition or fragment does not resolve
 * - DuplicateDeferLabel: two deferrals share a label in one operation
 * - FieldMergeConflict: same response key, incompatible fields
 * - FragmentMergeConflict: same fragment name, different type conditions
 *
 * Codec errors (all carry the field path, see FieldPathError):
 * - ScalarCoercionError, NonNullViolation, UnhandledTypeCondition,
 *   MissingRequiredField, TypeMismatch
 * - MissingVariable: referenced variable neither supplied nor defaulted
 *
 * Incremental delivery errors:
 * - UnresolvablePatchPath, DuplicatePatch, IncompleteDelivery
 *
 * Input and configuration errors:
 * - DocumentFormatError, FileNotFoundError, ParseError,
 *   MissingMandatoryConfig
 */

#ifndef SHAPEQL_ERRORS_HPP
#define SHAPEQL_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace shapeql {

/**
 * @brief Base class for all shapeql exceptions
 */
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Tree construction
// ============================================================================

/**
 * @brief A selection does not resolve against the schema
 *
 * Raised for unknown fields, unknown type conditions, unknown fragment
 * names and fragment spread cycles.
 */
class SchemaMismatch : public ShapeError {
public:
    /**
     * @param path Dot-path of the offending selection (e.g., "hero.friends.foo")
     * @param type_name Enclosing type the selection was resolved against
     * @param detail What failed to resolve
     */
    SchemaMismatch(std::string path, std::string type_name, std::string detail)
        : ShapeError("Schema mismatch at '" + path + "' on type '" + type_name +
                     "': " + detail)
        , path_(std::move(path))
        , type_name_(std::move(type_name))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string path_;
    std::string type_name_;
};

/**
 * @brief Two distinct @defer occurrences share a label within an operation
 */
class DuplicateDeferLabel : public ShapeError {
public:
    DuplicateDeferLabel(std::string label, std::string operation)
        : ShapeError("Duplicate defer label '" + label + "' in operation '" +
                     operation + "'")
        , label_(std::move(label))
        , operation_(std::move(operation))
    {}

    const std::string& label() const noexcept { return label_; }
    const std::string& operation() const noexcept { return operation_; }

private:
    std::string label_;
    std::string operation_;
};

/**
 * @brief Two fields with the same response key cannot be unified
 */
class FieldMergeConflict : public ShapeError {
public:
    FieldMergeConflict(std::string response_key, std::string detail)
        : ShapeError("Cannot merge fields for response key '" + response_key +
                     "': " + detail)
        , response_key_(std::move(response_key))
    {}

    const std::string& response_key() const noexcept { return response_key_; }

private:
    std::string response_key_;
};

/**
 * @brief Two fragments with the same name carry different type conditions
 */
class FragmentMergeConflict : public ShapeError {
public:
    FragmentMergeConflict(std::string fragment, std::string left, std::string right)
        : ShapeError("Cannot merge fragment '" + fragment + "': type condition '" +
                     left + "' conflicts with '" + right + "'")
        , fragment_(std::move(fragment))
    {}

    const std::string& fragment() const noexcept { return fragment_; }

private:
    std::string fragment_;
};

// ============================================================================
// Decode / encode
// ============================================================================

/**
 * @brief Base class for errors raised while consuming a payload
 *
 * Carries the dot-path of the field being decoded or encoded
 * (e.g., "computers.0.screen.resolution").
 */
class FieldPathError : public ShapeError {
public:
    FieldPathError(std::string path, const std::string& message)
        : ShapeError(message + " at '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A scalar value was rejected by its coercion function
 */
class ScalarCoercionError : public FieldPathError {
public:
    ScalarCoercionError(std::string path, std::string scalar, const std::string& detail)
        : FieldPathError(std::move(path),
                         "Cannot coerce value to scalar '" + scalar + "' (" + detail + ")")
        , scalar_(std::move(scalar))
    {}

    const std::string& scalar() const noexcept { return scalar_; }

private:
    std::string scalar_;
};

/**
 * @brief null found in a non-null position
 */
class NonNullViolation : public FieldPathError {
public:
    explicit NonNullViolation(std::string path)
        : FieldPathError(std::move(path), "Null value for non-null type")
    {}
};

/**
 * @brief No variant matches the discriminator and the tree has no catch-all
 */
class UnhandledTypeCondition : public FieldPathError {
public:
    UnhandledTypeCondition(std::string path, std::string type_name)
        : FieldPathError(std::move(path),
                         "No type condition handles concrete type '" + type_name + "'")
        , type_name_(std::move(type_name))
    {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

/**
 * @brief A non-null, non-deferred field is absent
 */
class MissingRequiredField : public FieldPathError {
public:
    MissingRequiredField(std::string path, std::string field)
        : FieldPathError(std::move(path), "Missing required field '" + field + "'")
        , field_(std::move(field))
    {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @brief Payload value has the wrong JSON kind for its position
 */
class TypeMismatch : public FieldPathError {
public:
    TypeMismatch(std::string path, std::string expected, std::string actual)
        : FieldPathError(std::move(path),
                         "Expected " + expected + " but found " + actual)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A referenced variable was not supplied and has no default
 */
class MissingVariable : public ShapeError {
public:
    explicit MissingVariable(std::string name)
        : ShapeError("Missing value for variable '$" + name + "'")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// ============================================================================
// Incremental delivery
// ============================================================================

/**
 * @brief Patch path does not address a location in the current result
 */
class UnresolvablePatchPath : public ShapeError {
public:
    UnresolvablePatchPath(std::string path, std::string detail)
        : ShapeError("Cannot resolve patch path '" + path + "': " + detail)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Patch targets a deferral that is already resolved or unknown
 */
class DuplicatePatch : public ShapeError {
public:
    DuplicatePatch(std::string path, std::string label, const std::string& detail)
        : ShapeError("Rejected patch at '" + path + "'" +
                     (label.empty() ? std::string() : " (label '" + label + "')") +
                     ": " + detail)
        , path_(std::move(path))
        , label_(std::move(label))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& label() const noexcept { return label_; }

private:
    std::string path_;
    std::string label_;
};

/**
 * @brief Final patch arrived while deferrals are still pending
 */
class IncompleteDelivery : public ShapeError {
public:
    explicit IncompleteDelivery(std::vector<std::string> pending)
        : ShapeError(format_message(pending))
        , pending_(std::move(pending))
    {}

    /**
     * @brief Pending deferrals as "label at 'path'" descriptions
     */
    const std::vector<std::string>& pending() const noexcept { return pending_; }

private:
    std::vector<std::string> pending_;

    static std::string format_message(const std::vector<std::string>& pending) {
        std::ostringstream oss;
        oss << "Final patch received with pending deferrals: [";
        for (size_t i = 0; i < pending.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << pending[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

// ============================================================================
// Input and configuration
// ============================================================================

/**
 * @brief Schema or document interchange JSON is malformed
 */
class DocumentFormatError : public ShapeError {
public:
    DocumentFormatError(std::string location, const std::string& detail)
        : ShapeError("Malformed input at '" + location + "': " + detail)
        , location_(std::move(location))
    {}

    const std::string& location() const noexcept { return location_; }

private:
    std::string location_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public ShapeError {
public:
    explicit FileNotFoundError(std::string path)
        : ShapeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML syntax error in an input file
 */
class ParseError : public ShapeError {
public:
    /**
     * @param file Path to the file with the parse error
     * @param line Line number (1-based, 0 if unknown)
     * @param column Column number (1-based, 0 if unknown)
     * @param details Detailed error message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : ShapeError(format_message(file, line, column, details))
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
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Mandatory configuration keys are missing after layering
 */
class MissingMandatoryConfig : public ShapeError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ShapeError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace shapeql

#endif // SHAPEQL_ERRORS_HPP
