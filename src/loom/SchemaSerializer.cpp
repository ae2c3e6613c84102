#include "loom/SchemaSerializer.hpp"

#include "loom/BuiltinCatalog.hpp"
#include "loom/def/Definition.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/RootSchema.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

namespace loom {

class SchemaSerializer::Impl {
public:
    explicit Impl(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {}
    ~Impl() = default;

    bool serialize(const RootSchema& schema, bool prettyPrint) {
        rapidjson::Document document;
        if (!encodeDocument(schema, document, document.GetAllocator())) {
            return false;
        }
        return write(document, prettyPrint);
    }

    bool serializeResponseFormat(const RootSchema& schema, std::string_view name, bool prettyPrint) {
        rapidjson::Document document;
        auto& alloc = document.GetAllocator();
        rapidjson::Value schemaJSON;
        if (!encodeDocument(schema, schemaJSON, alloc)) {
            return false;
        }

        rapidjson::Value jsonSchema;
        jsonSchema.SetObject();
        rapidjson::Value nameJSON;
        nameJSON.SetString(name.data(), name.size(), alloc);
        jsonSchema.AddMember("name", nameJSON, alloc);
        jsonSchema.AddMember("schema", schemaJSON, alloc);

        document.SetObject();
        document.AddMember("type", "json_schema", alloc);
        document.AddMember("json_schema", jsonSchema, alloc);
        return write(document, prettyPrint);
    }

    bool serializeDefinition(const def::Definition& definition, bool prettyPrint) {
        rapidjson::Document document;
        definition.encode(document, document.GetAllocator());
        return write(document, prettyPrint);
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    bool encodeDocument(const RootSchema& schema, rapidjson::Value& json, JSONAllocator& alloc) {
        if (!schema.checkReferences(m_errorReporter.get())) {
            return false;
        }

        json.SetObject();

        const auto* base = schema.base();
        if (base->description) {
            rapidjson::Value description;
            description.SetString(base->description->data(), base->description->size(), alloc);
            json.AddMember("description", description, alloc);
        }
        json.AddMember("$schema", rapidjson::StringRef(kSchemaDialect), alloc);

        // Explicit definitions come first, then the catalog types reachable from the graph.
        rapidjson::Value defs;
        defs.SetObject();
        for (const auto& entry : schema.defs()) {
            rapidjson::Value name;
            name.SetString(entry.first.data(), entry.first.size(), alloc);
            rapidjson::Value definition;
            entry.second->encode(definition, alloc);
            defs.AddMember(name, definition, alloc);
        }
        auto builtins = schema.builtinClosure();
        for (auto builtinType : builtins) {
            auto builtinNameView = builtinName(builtinType);
            rapidjson::Value name;
            name.SetString(builtinNameView.data(), builtinNameView.size(), alloc);
            rapidjson::Value definition;
            builtinSourceDefinition(builtinType)->encode(definition, alloc);
            defs.AddMember(name, definition, alloc);
        }
        SPDLOG_DEBUG("Encoding schema with {} definitions and {} catalog types", schema.defs().size(),
                     builtins.size());
        json.AddMember("$defs", defs, alloc);

        if (schema.isWrapped()) {
            rapidjson::Value value;
            base->encode(value, alloc);
            rapidjson::Value properties;
            properties.SetObject();
            properties.AddMember("value", value, alloc);
            rapidjson::Value required;
            required.SetArray();
            required.PushBack("value", alloc);

            json.AddMember("type", "object", alloc);
            json.AddMember("properties", properties, alloc);
            json.AddMember("required", required, alloc);
            json.AddMember("additionalProperties", false, alloc);
        } else {
            // The base's description is already at the top of the document.
            base->encodeKeywords(json, alloc);
        }

        return true;
    }

    bool write(const rapidjson::Document& document, bool prettyPrint) {
        m_buffer.Clear();
        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = document.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = document.Accept(writer);
        }
        if (!result) {
            m_errorReporter->addError(ErrorReporter::kSchemaInvalid, "Failed to write schema document.");
        }
        return result;
    }

    std::shared_ptr<ErrorReporter> m_errorReporter;
    rapidjson::StringBuffer m_buffer;
};

SchemaSerializer::SchemaSerializer(std::shared_ptr<ErrorReporter> errorReporter):
    m_impl(std::make_unique<SchemaSerializer::Impl>(std::move(errorReporter))) {}

SchemaSerializer::~SchemaSerializer() {}

bool SchemaSerializer::serialize(const RootSchema& schema, bool prettyPrint) {
    return m_impl->serialize(schema, prettyPrint);
}

bool SchemaSerializer::serializeResponseFormat(const RootSchema& schema, std::string_view name, bool prettyPrint) {
    return m_impl->serializeResponseFormat(schema, name, prettyPrint);
}

bool SchemaSerializer::serializeDefinition(const def::Definition& definition, bool prettyPrint) {
    return m_impl->serializeDefinition(definition, prettyPrint);
}

std::string_view SchemaSerializer::json() const { return m_impl->json(); }

} // namespace loom
