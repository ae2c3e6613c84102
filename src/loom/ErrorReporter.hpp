#ifndef SRC_LOOM_ERROR_REPORTER_HPP_
#define SRC_LOOM_ERROR_REPORTER_HPP_

#include <string>
#include <string_view>
#include <vector>

namespace loom {

class ErrorReporter {
public:
    enum Category { kResolution, kGraph, kValidation, kConversion, kHost, kInput };

    enum Code {
        // Resolution
        kEnumPathMalformed,
        kClassNotFound,
        kEnumNotFound,
        kUnsupportedHint,
        kUnsupportedKind,

        // Graph
        kDanglingReference,
        kDepthLimitExceeded,

        // Validation
        kSchemaInvalid,
        kValidationFailed,

        // Conversion
        kTypeMismatch,
        kExpectedIntegerGotFloat,
        kIntegerOutOfRange,
        kPropertyCountMismatch,
        kMissingProperty,
        kUnknownProperty,
        kTupleArityMismatch,
        kUnknownVariant,

        // Host
        kHostReflectionFailed,
        kHostConstructionFailed,
        kHostAssignmentFailed,

        // Input
        kJSONParseError,
        kFileError,
        kManifestInvalid
    };

    // One failed keyword as reported by the validation engine. Pointers are JSON pointer URI fragments.
    struct ValidationIssue {
        std::string keyword;
        std::string schemaPointer;
        std::string instancePointer;
    };

    struct Error {
        Code code;
        std::string message;
        std::vector<ValidationIssue> issues;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(Code code, std::string message);
    void addValidationError(std::string message, std::vector<ValidationIssue> issues);

    // Specific errors.

    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(std::string filePath);
    // Fatal error, unable to open or read file at filePath.
    void addFileReadError(std::string filePath);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }

    // True if any recorded error carries |code|.
    bool hasError(Code code) const;
    // Returns the first recorded error, or nullptr if there are none.
    const Error* firstError() const { return m_errors.size() ? &m_errors.front() : nullptr; }
    void clear() { m_errors.clear(); }

    static Category category(Code code);
    static std::string_view codeName(Code code);

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace loom

#endif // SRC_LOOM_ERROR_REPORTER_HPP_
