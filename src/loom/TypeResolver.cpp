#include "loom/TypeResolver.hpp"

#include "loom/BuiltinCatalog.hpp"
#include "loom/ClassGenerator.hpp"
#include "loom/def/ArrayDefinition.hpp"
#include "loom/def/BooleanDefinition.hpp"
#include "loom/def/BuiltinDefinition.hpp"
#include "loom/def/EnumDefinition.hpp"
#include "loom/def/IntegerDefinition.hpp"
#include "loom/def/NullDefinition.hpp"
#include "loom/def/NumberDefinition.hpp"
#include "loom/def/ObjectDefinition.hpp"
#include "loom/def/StringDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Host.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace loom {

const std::array<TypeResolver::Rule, 5> TypeResolver::kRules = {{
    {"enum",
     [](const PropertyInfo& property) {
         return property.kind == VariantKind::kInt && property.hasUsage(kUsageClassIsEnum);
     },
     &TypeResolver::resolveEnumProperty},
    {"object", [](const PropertyInfo& property) { return property.kind == VariantKind::kObject; },
     &TypeResolver::resolveObjectProperty},
    {"typed array",
     [](const PropertyInfo& property) {
         return property.kind == VariantKind::kArray && property.hint == PropertyHint::kArrayType;
     },
     &TypeResolver::resolveTypedArrayProperty},
    {"untyped array", [](const PropertyInfo& property) { return property.kind == VariantKind::kArray; },
     &TypeResolver::resolveUntypedArrayProperty},
    {"kind", [](const PropertyInfo&) { return true; }, &TypeResolver::resolveKindProperty}
}};

TypeResolver::TypeResolver(ClassGenerator* classGenerator, Host* host, std::shared_ptr<ErrorReporter> errorReporter):
    m_classGenerator(classGenerator), m_host(host), m_errorReporter(std::move(errorReporter)) {}

std::optional<Type> TypeResolver::resolve(const PropertyInfo& property, Definitions& defs) {
    for (const auto& rule : kRules) {
        if (rule.matches(property)) {
            SPDLOG_TRACE("Property '{}' of kind {} resolves by {} rule", property.name,
                         variantKindName(property.kind), rule.name);
            return (this->*rule.apply)(property, defs);
        }
    }
    return std::nullopt;
}

std::optional<Type> TypeResolver::resolveHint(std::string_view hintString, Definitions& defs) {
    if (hintString.empty()) {
        return Type::inlined(std::make_shared<const def::NullDefinition>());
    }

    auto definition = definitionForSpelling(hintString);
    if (definition) {
        return Type::inlined(std::move(definition));
    }

    if (m_host->findClass(hintString)) {
        return resolveClassName(hintString, defs);
    }

    if (hintString.find('.') != std::string_view::npos) {
        return resolveEnumPath(hintString, defs);
    }

    m_errorReporter->addError(ErrorReporter::kUnsupportedHint, fmt::format("Unsupported type hint '{}'.", hintString));
    return std::nullopt;
}

std::optional<Type> TypeResolver::resolveEnumPath(std::string_view enumPath, Definitions& defs) {
    auto separator = enumPath.find('.');
    if (separator == std::string_view::npos || separator == 0 || separator == enumPath.size() - 1
        || enumPath.find('.', separator + 1) != std::string_view::npos) {
        m_errorReporter->addError(ErrorReporter::kEnumPathMalformed,
                fmt::format("Enum path '{}' is not of the form 'Class.Enum'.", enumPath));
        return std::nullopt;
    }

    std::string name(enumPath);
    if (defs.contains(name)) {
        return Type::reference(std::move(name));
    }

    auto className = enumPath.substr(0, separator);
    auto enumName = enumPath.substr(separator + 1);
    auto source = m_classGenerator->findClass(className);
    if (!source) {
        return std::nullopt;
    }

    def::EnumVariants variants;
    if (!m_host->enumVariants(*source, enumName, variants) || variants.empty()) {
        m_errorReporter->addError(ErrorReporter::kEnumNotFound,
                fmt::format("Class '{}' has no enum named '{}'.", className, enumName));
        return std::nullopt;
    }

    SPDLOG_TRACE("Registering enum '{}' with {} variants", name, variants.size());
    defs.insert(name, std::make_shared<const def::EnumDefinition>(std::move(variants)));
    return Type::reference(std::move(name));
}

// static
DefinitionPtr TypeResolver::definitionForSpelling(std::string_view spelling) {
    if (spelling == "int") {
        return std::make_shared<const def::IntegerDefinition>();
    }
    if (spelling == "float") {
        return std::make_shared<const def::NumberDefinition>();
    }
    if (spelling == "bool") {
        return std::make_shared<const def::BooleanDefinition>();
    }
    if (spelling == "String" || spelling == "StringName" || spelling == "NodePath") {
        return std::make_shared<const def::StringDefinition>();
    }
    if (spelling == "Dictionary") {
        return std::make_shared<const def::ObjectDefinition>();
    }
    if (spelling == "Array") {
        return std::make_shared<const def::ArrayDefinition>();
    }

    auto builtinType = builtinNamed(spelling);
    if (builtinType) {
        return std::make_shared<const def::BuiltinDefinition>(*builtinType);
    }

    return nullptr;
}

// static
DefinitionPtr TypeResolver::definitionForKind(VariantKind kind) {
    switch (kind) {
    case VariantKind::kBool:
        return std::make_shared<const def::BooleanDefinition>();
    case VariantKind::kInt:
        return std::make_shared<const def::IntegerDefinition>();
    case VariantKind::kFloat:
        return std::make_shared<const def::NumberDefinition>();
    case VariantKind::kString:
    case VariantKind::kStringName:
    case VariantKind::kNodePath:
        return std::make_shared<const def::StringDefinition>();
    case VariantKind::kDictionary:
        return std::make_shared<const def::ObjectDefinition>();
    case VariantKind::kArray:
        return std::make_shared<const def::ArrayDefinition>();
    default:
        break;
    }

    auto builtinType = builtinForKind(kind);
    if (builtinType) {
        return std::make_shared<const def::BuiltinDefinition>(*builtinType);
    }

    return nullptr;
}

std::optional<Type> TypeResolver::resolveEnumProperty(const PropertyInfo& property, Definitions& defs) {
    return resolveEnumPath(property.className, defs);
}

std::optional<Type> TypeResolver::resolveObjectProperty(const PropertyInfo& property, Definitions& defs) {
    if (property.className.size()) {
        return resolveClassName(property.className, defs);
    }
    return resolveHint(property.hintString, defs);
}

std::optional<Type> TypeResolver::resolveTypedArrayProperty(const PropertyInfo& property, Definitions& defs) {
    auto items = resolveHint(property.hintString, defs);
    if (!items) {
        return std::nullopt;
    }
    return Type::inlined(std::make_shared<const def::ArrayDefinition>(std::move(*items)));
}

std::optional<Type> TypeResolver::resolveUntypedArrayProperty(const PropertyInfo& /* property */,
                                                              Definitions& /* defs */) {
    return Type::inlined(std::make_shared<const def::ArrayDefinition>());
}

std::optional<Type> TypeResolver::resolveKindProperty(const PropertyInfo& property, Definitions& /* defs */) {
    auto definition = definitionForKind(property.kind);
    if (!definition) {
        m_errorReporter->addError(ErrorReporter::kUnsupportedKind,
                fmt::format("Property '{}' has unsupported kind {}.", property.name, variantKindName(property.kind)));
        return std::nullopt;
    }
    return Type::inlined(std::move(definition));
}

std::optional<Type> TypeResolver::resolveClassName(std::string_view className, Definitions& defs) {
    auto source = m_classGenerator->findClass(className);
    if (!source) {
        return std::nullopt;
    }
    return m_classGenerator->referenceClass(*source, defs);
}

} // namespace loom
