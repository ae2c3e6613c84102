#include "loom/CompiledSchema.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/SchemaSerializer.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

namespace loom {

CompiledSchema::CompiledSchema(std::unique_ptr<RootSchema> schema, std::string json):
    m_schema(std::move(schema)), m_json(std::move(json)) {}

// static
std::shared_ptr<const CompiledSchema> CompiledSchema::compile(std::unique_ptr<RootSchema> schema,
                                                              std::shared_ptr<ErrorReporter> errorReporter) {
    SchemaSerializer serializer(errorReporter);
    if (!serializer.serialize(*schema, true)) {
        return nullptr;
    }

    std::shared_ptr<CompiledSchema> compiledSchema(new CompiledSchema(std::move(schema),
                                                                      std::string(serializer.json())));
    if (!compiledSchema->m_validator.compile(compiledSchema->m_json, errorReporter.get())) {
        return nullptr;
    }
    return compiledSchema;
}

bool CompiledSchema::compactJSON(std::string& json, std::shared_ptr<ErrorReporter> errorReporter) const {
    SchemaSerializer serializer(std::move(errorReporter));
    if (!serializer.serialize(*m_schema, false)) {
        return false;
    }
    json = serializer.json();
    return true;
}

bool CompiledSchema::responseFormat(std::string_view name, std::string& json, bool prettyPrint,
                                    std::shared_ptr<ErrorReporter> errorReporter) const {
    SchemaSerializer serializer(std::move(errorReporter));
    if (!serializer.serializeResponseFormat(*m_schema, name, prettyPrint)) {
        return false;
    }
    json = serializer.json();
    return true;
}

std::shared_ptr<const CompiledSchema> CompiledSchema::arraySchema(std::string itemName,
        std::shared_ptr<ErrorReporter> errorReporter) const {
    return compile(m_schema->arraySchema(std::move(itemName)), std::move(errorReporter));
}

bool CompiledSchema::instantiate(std::string_view inputJSON, Host* host, std::shared_ptr<ErrorReporter> errorReporter,
                                 Value& value, size_t maxDepth) const {
    rapidjson::Document document;
    document.Parse(inputJSON.data(), inputJSON.size());
    if (document.HasParseError()) {
        errorReporter->addError(ErrorReporter::kJSONParseError,
                fmt::format("Failed to parse JSON: {} at offset {}.", rapidjson::GetParseError_En(
                        document.GetParseError()), document.GetErrorOffset()));
        return false;
    }
    return instantiate(document, host, std::move(errorReporter), value, maxDepth);
}

bool CompiledSchema::instantiate(const rapidjson::Value& json, Host* host, std::shared_ptr<ErrorReporter> errorReporter,
                                 Value& value, size_t maxDepth) const {
    if (!m_validator.validate(json, errorReporter.get())) {
        return false;
    }

    const rapidjson::Value* baseJSON = &json;
    if (m_schema->isWrapped()) {
        if (!json.IsObject() || !json.HasMember("value")) {
            errorReporter->addError(ErrorReporter::kMissingProperty, "Missing property 'value'.");
            return false;
        }
        baseJSON = &json["value"];
    }

    Instantiator instantiator(host, &m_schema->defs(), std::move(errorReporter));
    instantiator.setMaxDepth(maxDepth);
    SPDLOG_TRACE("Instantiating validated JSON against schema base of kind {}",
                 static_cast<int>(m_schema->base()->kind));
    return instantiator.instantiate(*baseJSON, m_schema->base(), value);
}

} // namespace loom
