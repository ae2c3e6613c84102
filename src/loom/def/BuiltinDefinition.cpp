#include "loom/def/BuiltinDefinition.hpp"

#include "loom/Instantiator.hpp"
#include "loom/Type.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void BuiltinDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    auto pointer = definitionPointer(builtinName(builtinType));
    rapidjson::Value pointerJSON;
    pointerJSON.SetString(pointer.data(), pointer.size(), allocator);
    json.AddMember("$ref", pointerJSON, allocator);
}

bool BuiltinDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    Value sourceValue;
    if (!instantiator->instantiate(json, builtinSourceDefinition(builtinType), sourceValue)) {
        return false;
    }
    value = Value::makeBuiltin(builtinType, std::move(sourceValue));
    return true;
}

ValueType BuiltinDefinition::valueType() const { return kBuiltinType; }

std::string BuiltinDefinition::valueClassName() const { return std::string(builtinName(builtinType)); }

} // namespace def
} // namespace loom
