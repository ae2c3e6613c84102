#include "loom/def/NumberDefinition.hpp"

#include "loom/Instantiator.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void NumberDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "number", allocator);
}

// Integers are accepted and widened, so 1 and 1.0 instantiate to the same float.
bool NumberDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsNumber()) {
        return instantiator->typeMismatch("number", json);
    }
    value = Value::makeFloat(json.GetDouble());
    return true;
}

ValueType NumberDefinition::valueType() const { return kFloatType; }

} // namespace def
} // namespace loom
