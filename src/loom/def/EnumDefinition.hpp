#ifndef SRC_LOOM_DEF_ENUM_DEFINITION_HPP_
#define SRC_LOOM_DEF_ENUM_DEFINITION_HPP_

#include "loom/def/Definition.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace loom {
namespace def {

using EnumVariants = std::vector<std::pair<std::string, std::int64_t>>;

// Named integer constants, written as their names on the wire.
struct EnumDefinition : public Definition {
    explicit EnumDefinition(EnumVariants v, std::optional<std::string> d = std::nullopt):
        Definition(kEnum, std::move(d)), variants(std::move(v)) {}
    virtual ~EnumDefinition() = default;

    EnumVariants variants;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_ENUM_DEFINITION_HPP_
