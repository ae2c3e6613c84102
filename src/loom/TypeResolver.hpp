#ifndef SRC_LOOM_TYPE_RESOLVER_HPP_
#define SRC_LOOM_TYPE_RESOLVER_HPP_

#include "loom/def/Definition.hpp"
#include "loom/PropertyInfo.hpp"
#include "loom/Type.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string_view>

namespace loom {

class ClassGenerator;
class Definitions;
class ErrorReporter;
class Host;

// Turns the host's description of one property into a schema Type. Primitives come back inline, classes and enums
// are registered in the definitions table and come back as references.
//
// The host reports properties as a coarse kind plus a usage bit field, a hint kind and a hint string. The rules
// below are tried in order and the first matching one decides how the property is read:
//   1. int with the CLASS_IS_ENUM usage flag: className is an enum path "Class.Enum".
//   2. object: className is a class name, or when empty the hint string names the type.
//   3. array with the ARRAY_TYPE hint: the hint string names the element type.
//   4. any other array: untyped.
//   5. everything else: looked up by kind.
class TypeResolver {
public:
    TypeResolver() = delete;
    TypeResolver(ClassGenerator* classGenerator, Host* host, std::shared_ptr<ErrorReporter> errorReporter);
    ~TypeResolver() = default;

    std::optional<Type> resolve(const PropertyInfo& property, Definitions& defs);

    // Decodes a type spelling taken from a hint string. Tried in order: empty (null placeholder), primitive or
    // catalog spelling, registered class name, enum path. Anything else is kUnsupportedHint.
    std::optional<Type> resolveHint(std::string_view hintString, Definitions& defs);

    // Resolves "Class.Enum" and registers the enum under that path.
    std::optional<Type> resolveEnumPath(std::string_view enumPath, Definitions& defs);

    // Returns the inline definition for spellings like "int", "String" or "Vector2", or nullptr.
    static DefinitionPtr definitionForSpelling(std::string_view spelling);

    // Returns the inline definition for a kind without further qualification, or nullptr if there is none.
    static DefinitionPtr definitionForKind(VariantKind kind);

private:
    struct Rule {
        const char* name;
        bool (*matches)(const PropertyInfo& property);
        std::optional<Type> (TypeResolver::*apply)(const PropertyInfo& property, Definitions& defs);
    };
    static const std::array<Rule, 5> kRules;

    std::optional<Type> resolveEnumProperty(const PropertyInfo& property, Definitions& defs);
    std::optional<Type> resolveObjectProperty(const PropertyInfo& property, Definitions& defs);
    std::optional<Type> resolveTypedArrayProperty(const PropertyInfo& property, Definitions& defs);
    std::optional<Type> resolveUntypedArrayProperty(const PropertyInfo& property, Definitions& defs);
    std::optional<Type> resolveKindProperty(const PropertyInfo& property, Definitions& defs);

    std::optional<Type> resolveClassName(std::string_view className, Definitions& defs);

    ClassGenerator* m_classGenerator;
    Host* m_host;
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace loom

#endif // SRC_LOOM_TYPE_RESOLVER_HPP_
