#ifndef SRC_LOOM_DEF_CLASS_DEFINITION_HPP_
#define SRC_LOOM_DEF_CLASS_DEFINITION_HPP_

#include "loom/ClassSource.hpp"
#include "loom/def/Definition.hpp"
#include "loom/def/ObjectDefinition.hpp"

namespace loom {
namespace def {

// A host class. Serializes like an object with a fixed property set, instantiates by constructing an instance
// through the host and assigning each property.
struct ClassDefinition : public Definition {
    ClassDefinition(ClassSource s, Properties p, std::optional<std::string> d = std::nullopt):
        Definition(kClass, std::move(d)), source(std::move(s)), properties(std::move(p)) {}
    virtual ~ClassDefinition() = default;

    ClassSource source;
    Properties properties;

    const std::string& name() const { return source.id.definitionName(); }

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
    std::string valueClassName() const override;
    void forEachType(const std::function<void(const Type&)>& visit) const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_CLASS_DEFINITION_HPP_
