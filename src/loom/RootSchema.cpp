#include "loom/RootSchema.hpp"

#include "loom/BuiltinClosure.hpp"
#include "loom/ClassGenerator.hpp"
#include "loom/def/ArrayDefinition.hpp"
#include "loom/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace loom {

RootSchema::RootSchema(Definitions defs, DefinitionPtr base): m_defs(std::move(defs)), m_base(std::move(base)) {}

// static
std::unique_ptr<RootSchema> RootSchema::fromClass(ClassGenerator* generator, const ClassSource& source) {
    Definitions defs;
    auto base = generator->generate(source, defs);
    if (!base) {
        return nullptr;
    }

    // Properties referring back to the root need its entry in the table.
    const auto& name = source.id.definitionName();
    if (generator->isSelfReferenced(name)) {
        defs.insert(name, base);
    }

    SPDLOG_DEBUG("Generated schema for class '{}' with {} definitions", name, defs.size());
    return std::make_unique<RootSchema>(std::move(defs), std::move(base));
}

// static
std::unique_ptr<RootSchema> RootSchema::fromTypeInfo(ClassGenerator* generator, const PropertyInfo& property) {
    Definitions defs;
    auto type = generator->resolveProperty(property, defs);
    if (!type) {
        return nullptr;
    }

    if (!type->isReference()) {
        return std::make_unique<RootSchema>(std::move(defs), type->definitionPtr());
    }

    const auto& name = type->referenceName();
    auto base = defs.findPtr(name);
    if (!base) {
        generator->errorReporter()->addError(ErrorReporter::kDanglingReference,
                fmt::format("Reference to '{}' has no definition.", name));
        return nullptr;
    }

    // Keep the entry if anything in the graph still points at it.
    std::vector<std::string> references;
    collectReferences(base.get(), references);
    for (const auto& entry : defs) {
        if (entry.first != name) {
            collectReferences(entry.second.get(), references);
        }
    }
    if (std::find(references.begin(), references.end(), name) == references.end()) {
        defs.take(name);
    }

    return std::make_unique<RootSchema>(std::move(defs), std::move(base));
}

std::unique_ptr<RootSchema> RootSchema::arraySchema(std::string itemName) const {
    Definitions defs = m_defs;
    defs.insert(itemName, m_base);
    auto base = std::make_shared<const def::ArrayDefinition>(Type::reference(std::move(itemName)));
    return std::make_unique<RootSchema>(std::move(defs), std::move(base));
}

void RootSchema::addDefinition(std::string name, DefinitionPtr definition) {
    m_defs.insert(std::move(name), std::move(definition));
}

void RootSchema::addClass(std::shared_ptr<const def::ClassDefinition> classDefinition) {
    auto name = classDefinition->name();
    m_defs.insert(std::move(name), std::move(classDefinition));
}

bool RootSchema::isWrapped() const { return m_base->kind != def::kClass && m_base->kind != def::kObject; }

bool RootSchema::checkReferences(ErrorReporter* errorReporter) const {
    std::vector<std::string> references;
    collectReferences(m_base.get(), references);
    for (const auto& entry : m_defs) {
        collectReferences(entry.second.get(), references);
    }

    bool ok = true;
    for (const auto& name : references) {
        if (!m_defs.contains(name)) {
            errorReporter->addError(ErrorReporter::kDanglingReference,
                                    fmt::format("Reference to '{}' has no definition.", name));
            ok = false;
        }
    }
    return ok;
}

std::vector<BuiltinType> RootSchema::builtinClosure() const { return loom::builtinClosure(m_base.get(), m_defs); }

} // namespace loom
