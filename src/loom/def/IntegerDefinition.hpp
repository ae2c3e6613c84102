#ifndef SRC_LOOM_DEF_INTEGER_DEFINITION_HPP_
#define SRC_LOOM_DEF_INTEGER_DEFINITION_HPP_

#include "loom/def/Definition.hpp"

#include <cstdint>
#include <limits>

namespace loom {
namespace def {

// The accepted range is a property of the native integer kind the value lands in. It is enforced during
// instantiation and not emitted.
struct IntegerDefinition : public Definition {
    explicit IntegerDefinition(std::optional<std::string> d = std::nullopt):
        Definition(kInteger, std::move(d)),
        minimum(std::numeric_limits<std::int64_t>::min()),
        maximum(std::numeric_limits<std::int64_t>::max()) {}
    IntegerDefinition(std::int64_t min, std::int64_t max): Definition(kInteger), minimum(min), maximum(max) {}
    virtual ~IntegerDefinition() = default;

    static std::shared_ptr<const IntegerDefinition> makeInt32() {
        return std::make_shared<const IntegerDefinition>(std::numeric_limits<std::int32_t>::min(),
                                                         std::numeric_limits<std::int32_t>::max());
    }
    static std::shared_ptr<const IntegerDefinition> makeUInt8() {
        return std::make_shared<const IntegerDefinition>(0, std::numeric_limits<std::uint8_t>::max());
    }
    static std::shared_ptr<const IntegerDefinition> makeNonNegative() {
        return std::make_shared<const IntegerDefinition>(0, std::numeric_limits<std::int64_t>::max());
    }

    std::int64_t minimum;
    std::int64_t maximum;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_INTEGER_DEFINITION_HPP_
