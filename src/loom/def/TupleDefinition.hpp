#ifndef SRC_LOOM_DEF_TUPLE_DEFINITION_HPP_
#define SRC_LOOM_DEF_TUPLE_DEFINITION_HPP_

#include "loom/def/Definition.hpp"
#include "loom/Type.hpp"

#include <vector>

namespace loom {
namespace def {

// Fixed-length positional sequence.
struct TupleDefinition : public Definition {
    explicit TupleDefinition(std::vector<Type> i, std::optional<std::string> d = std::nullopt):
        Definition(kTuple, std::move(d)), items(std::move(i)) {}
    virtual ~TupleDefinition() = default;

    std::vector<Type> items;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
    void forEachType(const std::function<void(const Type&)>& visit) const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_TUPLE_DEFINITION_HPP_
