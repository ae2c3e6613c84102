#include "loom/def/BooleanDefinition.hpp"

#include "loom/Instantiator.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void BooleanDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "boolean", allocator);
}

bool BooleanDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsBool()) {
        return instantiator->typeMismatch("boolean", json);
    }
    value = Value::makeBool(json.GetBool());
    return true;
}

ValueType BooleanDefinition::valueType() const { return kBooleanType; }

} // namespace def
} // namespace loom
