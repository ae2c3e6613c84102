#ifndef SRC_LOOM_TYPE_HPP_
#define SRC_LOOM_TYPE_HPP_

#include "loom/def/Definition.hpp"

#include "rapidjson/fwd.h"

#include <memory>
#include <string>
#include <string_view>

namespace loom {

class Definitions;
class ErrorReporter;

// A position in the schema graph that holds either an inline definition or a reference, by name, to an entry of a
// Definitions table.
class Type {
public:
    Type() = delete;
    ~Type() = default;

    static Type inlined(DefinitionPtr definition) { return Type(std::move(definition), std::string()); }
    static Type reference(std::string name) { return Type(nullptr, std::move(name)); }

    bool isReference() const { return m_definition == nullptr; }
    // Only valid if isReference() is true.
    const std::string& referenceName() const { return m_referenceName; }
    // Inline definition, or nullptr for references.
    const def::Definition* definition() const { return m_definition.get(); }
    const DefinitionPtr& definitionPtr() const { return m_definition; }

    // Returns the definition this type stands for, following a reference through |defs|. A reference missing from
    // |defs| is reported as kDanglingReference and returns nullptr.
    const def::Definition* resolve(const Definitions& defs, ErrorReporter* errorReporter) const;

    // Sets |json| to the inline definition, or to a {"$ref": ...} object for references.
    void encode(rapidjson::Value& json, JSONAllocator& allocator) const;

private:
    Type(DefinitionPtr definition, std::string referenceName):
        m_definition(std::move(definition)), m_referenceName(std::move(referenceName)) {}

    DefinitionPtr m_definition;
    std::string m_referenceName;
};

// Returns "#/$defs/<name>", with |name| escaped as a JSON pointer reference token.
std::string definitionPointer(std::string_view name);

} // namespace loom

#endif // SRC_LOOM_TYPE_HPP_
