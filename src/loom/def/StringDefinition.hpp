#ifndef SRC_LOOM_DEF_STRING_DEFINITION_HPP_
#define SRC_LOOM_DEF_STRING_DEFINITION_HPP_

#include "loom/def/Definition.hpp"

namespace loom {
namespace def {

struct StringDefinition : public Definition {
    explicit StringDefinition(std::optional<std::string> d = std::nullopt): Definition(kString, std::move(d)) {}
    virtual ~StringDefinition() = default;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_STRING_DEFINITION_HPP_
