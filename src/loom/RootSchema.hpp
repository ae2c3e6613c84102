#ifndef SRC_LOOM_ROOT_SCHEMA_HPP_
#define SRC_LOOM_ROOT_SCHEMA_HPP_

#include "loom/BuiltinCatalog.hpp"
#include "loom/ClassSource.hpp"
#include "loom/def/ClassDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/PropertyInfo.hpp"

#include <memory>
#include <string>
#include <vector>

namespace loom {

class ClassGenerator;
class ErrorReporter;

// A complete schema graph: the base definition the document describes, plus the table of named definitions every
// reference within it resolves through.
class RootSchema {
public:
    RootSchema() = delete;
    RootSchema(Definitions defs, DefinitionPtr base);
    ~RootSchema() = default;

    // Generates the schema of a host class. Returns nullptr on failure, with errors in the generator's reporter.
    static std::unique_ptr<RootSchema> fromClass(ClassGenerator* generator, const ClassSource& source);

    // Generates a schema for a single property descriptor. A class or enum base is taken out of the table and used
    // as the base directly.
    static std::unique_ptr<RootSchema> fromTypeInfo(ClassGenerator* generator, const PropertyInfo& property);

    // Returns a schema describing an array of this schema's base. The base is registered as |itemName| in a copy of
    // the definitions table.
    std::unique_ptr<RootSchema> arraySchema(std::string itemName) const;

    void addDefinition(std::string name, DefinitionPtr definition);
    void addClass(std::shared_ptr<const def::ClassDefinition> classDefinition);

    const Definitions& defs() const { return m_defs; }
    const def::Definition* base() const { return m_base.get(); }
    const DefinitionPtr& basePtr() const { return m_base; }

    // True if the base is neither a class nor an object, in which case the document describes {"value": <base>}.
    bool isWrapped() const;

    // Reports kDanglingReference for each reference in the graph missing from the table. Returns true if there are
    // none.
    bool checkReferences(ErrorReporter* errorReporter) const;

    // Catalog types the document must emit alongside the explicit definitions.
    std::vector<BuiltinType> builtinClosure() const;

private:
    Definitions m_defs;
    DefinitionPtr m_base;
};

} // namespace loom

#endif // SRC_LOOM_ROOT_SCHEMA_HPP_
