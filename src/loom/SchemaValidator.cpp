#include "loom/SchemaValidator.hpp"

#include "loom/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/pointer.h"
#include "rapidjson/schema.h"
#include "rapidjson/stringbuffer.h"
#include "spdlog/spdlog.h"

#include <string>
#include <string_view>
#include <vector>

namespace loom {

class SchemaValidator::Impl {
public:
    Impl() = default;
    ~Impl() = default;

    bool compile(std::string_view schemaJSON, ErrorReporter* errorReporter) {
        m_schema.reset();
        m_source.Parse(schemaJSON.data(), schemaJSON.size());
        if (m_source.HasParseError()) {
            errorReporter->addError(ErrorReporter::kSchemaInvalid,
                    fmt::format("Schema is not valid JSON: {} at offset {}.",
                                rapidjson::GetParseError_En(m_source.GetParseError()), m_source.GetErrorOffset()));
            return false;
        }
        if (!m_source.IsObject()) {
            errorReporter->addError(ErrorReporter::kSchemaInvalid, "Schema document is not a JSON object.");
            return false;
        }

        // The validator evaluates the emitted keywords under its own draft and must not see the dialect URI.
        m_source.RemoveMember("$schema");
        if (!encodeReferences(m_source, errorReporter)) {
            return false;
        }
        m_schema = std::make_unique<rapidjson::SchemaDocument>(m_source);
        SPDLOG_DEBUG("Compiled schema validator from {} bytes", schemaJSON.size());
        return true;
    }

    bool isCompiled() const { return m_schema != nullptr; }

    bool validate(const rapidjson::Value& json, ErrorReporter* errorReporter) const {
        if (!m_schema) {
            errorReporter->addError(ErrorReporter::kSchemaInvalid, "Validation against an uncompiled schema.");
            return false;
        }

        rapidjson::SchemaValidator validator(*m_schema);
        if (json.Accept(validator)) {
            return true;
        }

        ErrorReporter::ValidationIssue issue;
        issue.keyword = validator.GetInvalidSchemaKeyword();
        rapidjson::StringBuffer schemaPointer;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(schemaPointer);
        issue.schemaPointer = std::string(schemaPointer.GetString(), schemaPointer.GetSize());
        rapidjson::StringBuffer instancePointer;
        validator.GetInvalidDocumentPointer().StringifyUriFragment(instancePointer);
        issue.instancePointer = std::string(instancePointer.GetString(), instancePointer.GetSize());

        auto message = fmt::format("Value at '{}' fails the '{}' keyword of schema '{}'.", issue.instancePointer,
                                   issue.keyword, issue.schemaPointer);
        std::vector<ErrorReporter::ValidationIssue> issues;
        issues.emplace_back(std::move(issue));
        errorReporter->addValidationError(std::move(message), std::move(issues));
        return false;
    }

private:
    // RapidJSON reads local references as URI fragments, where characters outside the unreserved set (the '$' of
    // "$defs", the ':' of script paths) must be percent-encoded. Rewrites every local "$ref" under |json| to that form,
    // reporting kSchemaInvalid for references that don't resolve within the document.
    bool encodeReferences(rapidjson::Value& json, ErrorReporter* errorReporter) {
        if (json.IsArray()) {
            for (auto element = json.Begin(); element != json.End(); ++element) {
                if (!encodeReferences(*element, errorReporter)) {
                    return false;
                }
            }
            return true;
        }
        if (!json.IsObject()) {
            return true;
        }

        for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
            if (!member->value.IsString() || member->name != "$ref") {
                if (!encodeReferences(member->value, errorReporter)) {
                    return false;
                }
                continue;
            }

            std::string_view reference(member->value.GetString(), member->value.GetStringLength());
            if (reference.empty() || reference.front() != '#') {
                continue;
            }
            rapidjson::Pointer pointer(reference.data() + 1, reference.size() - 1);
            if (!pointer.IsValid() || !pointer.Get(m_source)) {
                errorReporter->addError(ErrorReporter::kSchemaInvalid,
                        fmt::format("Schema reference '{}' does not resolve.", reference));
                return false;
            }
            rapidjson::StringBuffer fragment;
            pointer.StringifyUriFragment(fragment);
            SPDLOG_TRACE("Encoded schema reference '{}' as '{}'", reference, fragment.GetString());
            member->value.SetString(fragment.GetString(), static_cast<rapidjson::SizeType>(fragment.GetSize()),
                                    m_source.GetAllocator());
        }
        return true;
    }

    // Owns the values the compiled schema was built from, so it must outlive m_schema.
    rapidjson::Document m_source;
    std::unique_ptr<rapidjson::SchemaDocument> m_schema;
};

SchemaValidator::SchemaValidator(): m_impl(std::make_unique<SchemaValidator::Impl>()) {}

SchemaValidator::~SchemaValidator() {}

bool SchemaValidator::compile(std::string_view schemaJSON, ErrorReporter* errorReporter) {
    return m_impl->compile(schemaJSON, errorReporter);
}

bool SchemaValidator::isCompiled() const { return m_impl->isCompiled(); }

bool SchemaValidator::validate(const rapidjson::Value& json, ErrorReporter* errorReporter) const {
    return m_impl->validate(json, errorReporter);
}

} // namespace loom
