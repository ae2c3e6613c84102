#include "loom/def/ArrayDefinition.hpp"

#include "loom/Instantiator.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void ArrayDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "array", allocator);
    if (items) {
        rapidjson::Value itemsJSON;
        items->encode(itemsJSON, allocator);
        json.AddMember("items", itemsJSON, allocator);
    }
}

bool ArrayDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsArray()) {
        return instantiator->typeMismatch("array", json);
    }

    if (!items) {
        std::vector<Value> elements;
        elements.reserve(json.Size());
        for (const auto& element : json.GetArray()) {
            Value elementValue;
            if (!instantiator->instantiateUntyped(element, elementValue)) {
                return false;
            }
            elements.emplace_back(std::move(elementValue));
        }
        value = Instantiator::inferArray(std::move(elements));
        return true;
    }

    auto itemDefinition = items->resolve(instantiator->defs(), instantiator->errorReporter());
    if (!itemDefinition) {
        return false;
    }

    ValueArray array;
    array.elementType = itemDefinition->valueType();
    // An array of null placeholders carries no element type.
    array.typed = array.elementType != kNilType;
    array.elementClassName = itemDefinition->valueClassName();
    array.elements.reserve(json.Size());
    for (const auto& element : json.GetArray()) {
        Value elementValue;
        if (!instantiator->instantiate(element, itemDefinition, elementValue)) {
            return false;
        }
        array.elements.emplace_back(std::move(elementValue));
    }

    value = Value::makeArray(std::move(array));
    return true;
}

ValueType ArrayDefinition::valueType() const { return kArrayType; }

void ArrayDefinition::forEachType(const std::function<void(const Type&)>& visit) const {
    if (items) {
        visit(*items);
    }
}

} // namespace def
} // namespace loom
