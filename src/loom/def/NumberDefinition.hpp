#ifndef SRC_LOOM_DEF_NUMBER_DEFINITION_HPP_
#define SRC_LOOM_DEF_NUMBER_DEFINITION_HPP_

#include "loom/def/Definition.hpp"

namespace loom {
namespace def {

struct NumberDefinition : public Definition {
    explicit NumberDefinition(std::optional<std::string> d = std::nullopt): Definition(kNumber, std::move(d)) {}
    virtual ~NumberDefinition() = default;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_NUMBER_DEFINITION_HPP_
