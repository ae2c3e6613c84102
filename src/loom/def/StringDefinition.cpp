#include "loom/def/StringDefinition.hpp"

#include "loom/Instantiator.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void StringDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "string", allocator);
}

bool StringDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsString()) {
        return instantiator->typeMismatch("string", json);
    }
    value = Value::makeString(std::string(json.GetString(), json.GetStringLength()));
    return true;
}

ValueType StringDefinition::valueType() const { return kStringType; }

} // namespace def
} // namespace loom
