#include "loom/def/NullDefinition.hpp"

#include "loom/Instantiator.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void NullDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "null", allocator);
}

bool NullDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsNull()) {
        return instantiator->typeMismatch("null", json);
    }
    value = Value::makeNil();
    return true;
}

ValueType NullDefinition::valueType() const { return kNilType; }

} // namespace def
} // namespace loom
