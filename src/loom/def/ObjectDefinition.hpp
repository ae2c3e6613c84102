#ifndef SRC_LOOM_DEF_OBJECT_DEFINITION_HPP_
#define SRC_LOOM_DEF_OBJECT_DEFINITION_HPP_

#include "loom/def/Definition.hpp"
#include "loom/Type.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loom {
namespace def {

// Ordered name to type map, preserving the order properties were declared in.
using Properties = std::vector<std::pair<std::string, Type>>;

// Adds "properties", "required" (every name) and "additionalProperties": false to |json|.
void encodePropertyKeywords(const Properties& properties, rapidjson::Value& json, JSONAllocator& allocator);

// Returns nullptr if |name| is not declared in |properties|.
const Type* findProperty(const Properties& properties, std::string_view name);

// An object with a fixed property set, or with no properties an open string-keyed dictionary.
struct ObjectDefinition : public Definition {
    explicit ObjectDefinition(Properties p = Properties(), std::optional<std::string> d = std::nullopt):
        Definition(kObject, std::move(d)), properties(std::move(p)) {}
    virtual ~ObjectDefinition() = default;

    Properties properties;

    void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const override;
    bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const override;
    ValueType valueType() const override;
    void forEachType(const std::function<void(const Type&)>& visit) const override;
};

} // namespace def
} // namespace loom

#endif // SRC_LOOM_DEF_OBJECT_DEFINITION_HPP_
