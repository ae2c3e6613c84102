#ifndef SRC_LOOM_SCHEMA_SERIALIZER_HPP_
#define SRC_LOOM_SCHEMA_SERIALIZER_HPP_

#include <memory>
#include <string_view>

namespace loom {

namespace def {
struct Definition;
} // namespace def

class ErrorReporter;
class RootSchema;

static constexpr const char* kSchemaDialect = "https://json-schema.org/draft/2020-12/schema";

// Writes schema graphs out as JSON Schema documents. To avoid copying strings around this class wraps the string
// and provides access to it via the json() accessor, which is valid until the next call.
class SchemaSerializer {
public:
    SchemaSerializer() = delete;
    explicit SchemaSerializer(std::shared_ptr<ErrorReporter> errorReporter);
    ~SchemaSerializer();

    // Serializes |schema| as a complete document. Returns false if the graph has dangling references.
    bool serialize(const RootSchema& schema, bool prettyPrint);

    // Serializes the document for |schema| wrapped as a structured output response format named |name|:
    // {"type": "json_schema", "json_schema": {"name": |name|, "schema": <document>}}
    bool serializeResponseFormat(const RootSchema& schema, std::string_view name, bool prettyPrint);

    // Serializes a single definition on its own, references are left unresolved.
    bool serializeDefinition(const def::Definition& definition, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace loom

#endif // SRC_LOOM_SCHEMA_SERIALIZER_HPP_
