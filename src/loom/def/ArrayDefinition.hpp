#ifndef SRC_LOOM_DEF_ARRAY_DEFINITION_HPP_
#define SRC_LOOM_DEF_ARRAY_DEFINITION_HPP_

#include "loom/def/Definition.hpp"
#include "loom/Type.hpp"

#include <optional>

namespace loom {
namespace def {

// A homogeneous sequence of |items|, or without |items| a sequence of anything.
struct ArrayDefinition : public Definition {
    explicit ArrayDefinition(std::optional<Type> i = std::nullopt, std::optional<std::string> d = std::nullopt):
        Definition(kArray, std::move(d)), items(std::move(i)) {}
    virtual ~ArrayDefinition() = default;

    std::optional<Type> items;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
    void forEachType(const std::function<void(const Type&)>& visit) const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_ARRAY_DEFINITION_HPP_
