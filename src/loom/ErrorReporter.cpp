#include "loom/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace loom {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Code code, std::string message) {
    if (!m_suppress) {
        spdlog::error("{}: {}", codeName(code), message);
    }
    m_errors.emplace_back(Error{code, std::move(message), {}});
}

void ErrorReporter::addValidationError(std::string message, std::vector<ValidationIssue> issues) {
    if (!m_suppress) {
        spdlog::error("{}: {}", codeName(kValidationFailed), message);
        for (const auto& issue : issues) {
            spdlog::error("  keyword '{}' at schema '{}', instance '{}'", issue.keyword, issue.schemaPointer,
                          issue.instancePointer);
        }
    }
    m_errors.emplace_back(Error{kValidationFailed, std::move(message), std::move(issues)});
}

void ErrorReporter::addFileNotFoundError(std::string filePath) {
    addError(kFileError, fmt::format("File '{}' not found.", filePath));
}

void ErrorReporter::addFileReadError(std::string filePath) {
    addError(kFileError, fmt::format("Failed to read file '{}'.", filePath));
}

bool ErrorReporter::hasError(Code code) const {
    for (const auto& error : m_errors) {
        if (error.code == code) {
            return true;
        }
    }
    return false;
}

// static
ErrorReporter::Category ErrorReporter::category(Code code) {
    switch (code) {
    case kEnumPathMalformed:
    case kClassNotFound:
    case kEnumNotFound:
    case kUnsupportedHint:
    case kUnsupportedKind:
        return kResolution;

    case kDanglingReference:
    case kDepthLimitExceeded:
        return kGraph;

    case kSchemaInvalid:
    case kValidationFailed:
        return kValidation;

    case kTypeMismatch:
    case kExpectedIntegerGotFloat:
    case kIntegerOutOfRange:
    case kPropertyCountMismatch:
    case kMissingProperty:
    case kUnknownProperty:
    case kTupleArityMismatch:
    case kUnknownVariant:
        return kConversion;

    case kHostReflectionFailed:
    case kHostConstructionFailed:
    case kHostAssignmentFailed:
        return kHost;

    case kJSONParseError:
    case kFileError:
    case kManifestInvalid:
        return kInput;
    }

    return kInput;
}

// static
std::string_view ErrorReporter::codeName(Code code) {
    switch (code) {
    case kEnumPathMalformed:
        return "EnumPathMalformed";
    case kClassNotFound:
        return "ClassNotFound";
    case kEnumNotFound:
        return "EnumNotFound";
    case kUnsupportedHint:
        return "UnsupportedHint";
    case kUnsupportedKind:
        return "UnsupportedKind";
    case kDanglingReference:
        return "DanglingReference";
    case kDepthLimitExceeded:
        return "DepthLimitExceeded";
    case kSchemaInvalid:
        return "SchemaInvalid";
    case kValidationFailed:
        return "ValidationFailed";
    case kTypeMismatch:
        return "TypeMismatch";
    case kExpectedIntegerGotFloat:
        return "ExpectedIntegerGotFloat";
    case kIntegerOutOfRange:
        return "IntegerOutOfRange";
    case kPropertyCountMismatch:
        return "PropertyCountMismatch";
    case kMissingProperty:
        return "MissingProperty";
    case kUnknownProperty:
        return "UnknownProperty";
    case kTupleArityMismatch:
        return "TupleArityMismatch";
    case kUnknownVariant:
        return "UnknownVariant";
    case kHostReflectionFailed:
        return "HostReflectionFailed";
    case kHostConstructionFailed:
        return "HostConstructionFailed";
    case kHostAssignmentFailed:
        return "HostAssignmentFailed";
    case kJSONParseError:
        return "JSONParseError";
    case kFileError:
        return "FileError";
    case kManifestInvalid:
        return "ManifestInvalid";
    }

    return "Unknown";
}

} // namespace loom
