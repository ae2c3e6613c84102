#ifndef SRC_LOOM_DEF_BUILTIN_DEFINITION_HPP_
#define SRC_LOOM_DEF_BUILTIN_DEFINITION_HPP_

#include "loom/BuiltinCatalog.hpp"
#include "loom/def/Definition.hpp"

namespace loom {
namespace def {

// A use of a built-in composite type. Always serialized as a reference to the catalog entry in "$defs", which the
// root schema emits from the catalog's source definition.
struct BuiltinDefinition : public Definition {
    explicit BuiltinDefinition(BuiltinType t): Definition(kBuiltin), builtinType(t) {}
    virtual ~BuiltinDefinition() = default;

    BuiltinType builtinType;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
    std::string valueClassName() const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_BUILTIN_DEFINITION_HPP_
