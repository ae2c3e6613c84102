#ifndef SRC_LOOM_COMPILED_SCHEMA_HPP_
#define SRC_LOOM_COMPILED_SCHEMA_HPP_

#include "loom/Instantiator.hpp"
#include "loom/RootSchema.hpp"
#include "loom/SchemaValidator.hpp"
#include "loom/Value.hpp"

#include "rapidjson/fwd.h"

#include <memory>
#include <string>
#include <string_view>

namespace loom {

class ErrorReporter;
class Host;

// A generated schema ready for use: the schema graph, its serialized document and a validator compiled from that
// document. Immutable once built, so one instance can be shared between threads.
class CompiledSchema {
public:
    CompiledSchema() = delete;
    ~CompiledSchema() = default;

    // Serializes |schema| and compiles its validator. Returns nullptr on failure.
    static std::shared_ptr<const CompiledSchema> compile(std::unique_ptr<RootSchema> schema,
                                                         std::shared_ptr<ErrorReporter> errorReporter);

    const RootSchema& schema() const { return *m_schema; }
    // The pretty-printed document.
    const std::string& json() const { return m_json; }

    // Serializes the document without whitespace.
    bool compactJSON(std::string& json, std::shared_ptr<ErrorReporter> errorReporter) const;

    // Serializes the document wrapped as a structured output response format named |name|.
    bool responseFormat(std::string_view name, std::string& json, bool prettyPrint,
                        std::shared_ptr<ErrorReporter> errorReporter) const;

    // Returns a compiled schema for arrays of this schema's base, registered in its definitions as |itemName|.
    std::shared_ptr<const CompiledSchema> arraySchema(std::string itemName,
                                                      std::shared_ptr<ErrorReporter> errorReporter) const;

    // Parses |inputJSON|, validates it and rebuilds it as a native value, constructing class instances through
    // |host|. Wrapped schemas take their value from the "value" member. Returns false with the reason in
    // |errorReporter| on any failure.
    bool instantiate(std::string_view inputJSON, Host* host, std::shared_ptr<ErrorReporter> errorReporter,
                     Value& value, size_t maxDepth = kDefaultMaxDepth) const;

    // Same, for an already parsed value.
    bool instantiate(const rapidjson::Value& json, Host* host, std::shared_ptr<ErrorReporter> errorReporter,
                     Value& value, size_t maxDepth = kDefaultMaxDepth) const;

private:
    CompiledSchema(std::unique_ptr<RootSchema> schema, std::string json);

    std::unique_ptr<RootSchema> m_schema;
    std::string m_json;
    SchemaValidator m_validator;
};

} // namespace loom

#endif // SRC_LOOM_COMPILED_SCHEMA_HPP_
