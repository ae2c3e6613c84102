#include "loom/def/TupleDefinition.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/Instantiator.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"

namespace loom {
namespace def {

void TupleDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "array", allocator);
    rapidjson::Value prefixItems;
    prefixItems.SetArray();
    for (const auto& item : items) {
        rapidjson::Value itemJSON;
        item.encode(itemJSON, allocator);
        prefixItems.PushBack(itemJSON, allocator);
    }
    json.AddMember("prefixItems", prefixItems, allocator);
}

bool TupleDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsArray()) {
        return instantiator->typeMismatch("array", json);
    }
    if (json.Size() != items.size()) {
        instantiator->errorReporter()->addError(ErrorReporter::kTupleArityMismatch,
                fmt::format("Expected {} items, got {}.", items.size(), json.Size()));
        return false;
    }

    ValueArray array;
    array.elements.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        Value elementValue;
        if (!instantiator->instantiate(json[static_cast<rapidjson::SizeType>(i)], items[i], elementValue)) {
            return false;
        }
        array.elements.emplace_back(std::move(elementValue));
    }

    value = Value::makeArray(std::move(array));
    return true;
}

ValueType TupleDefinition::valueType() const { return kArrayType; }

void TupleDefinition::forEachType(const std::function<void(const Type&)>& visit) const {
    for (const auto& item : items) {
        visit(item);
    }
}

} // namespace def
} // namespace loom
