#include "loom/def/ObjectDefinition.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/Instantiator.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"

namespace loom {
namespace def {

void encodePropertyKeywords(const Properties& properties, rapidjson::Value& json, JSONAllocator& allocator) {
    rapidjson::Value propertiesJSON;
    propertiesJSON.SetObject();
    rapidjson::Value requiredJSON;
    requiredJSON.SetArray();
    for (const auto& property : properties) {
        rapidjson::Value nameJSON;
        nameJSON.SetString(property.first.data(), property.first.size(), allocator);
        rapidjson::Value typeJSON;
        property.second.encode(typeJSON, allocator);
        propertiesJSON.AddMember(nameJSON, typeJSON, allocator);

        rapidjson::Value requiredName;
        requiredName.SetString(property.first.data(), property.first.size(), allocator);
        requiredJSON.PushBack(requiredName, allocator);
    }
    json.AddMember("properties", propertiesJSON, allocator);
    json.AddMember("required", requiredJSON, allocator);
    json.AddMember("additionalProperties", false, allocator);
}

const Type* findProperty(const Properties& properties, std::string_view name) {
    for (const auto& property : properties) {
        if (property.first == name) {
            return &property.second;
        }
    }
    return nullptr;
}

void ObjectDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "object", allocator);
    if (properties.size()) {
        encodePropertyKeywords(properties, json, allocator);
    }
}

bool ObjectDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsObject()) {
        return instantiator->typeMismatch("object", json);
    }

    ValueDictionary dictionary;

    if (properties.empty()) {
        for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
            Value memberValue;
            if (!instantiator->instantiateUntyped(member->value, memberValue)) {
                return false;
            }
            dictionary.entries.emplace_back(std::string(member->name.GetString(), member->name.GetStringLength()),
                                            std::move(memberValue));
        }
        value = Value::makeDictionary(std::move(dictionary));
        return true;
    }

    if (json.MemberCount() != properties.size()) {
        instantiator->errorReporter()->addError(ErrorReporter::kPropertyCountMismatch,
                fmt::format("Expected {} properties, got {}.", properties.size(), json.MemberCount()));
        return false;
    }

    for (const auto& property : properties) {
        auto member = json.FindMember(rapidjson::Value(rapidjson::StringRef(property.first.data(),
                                                                             property.first.size())));
        if (member == json.MemberEnd()) {
            instantiator->errorReporter()->addError(ErrorReporter::kMissingProperty,
                    fmt::format("Missing property '{}'.", property.first));
            return false;
        }

        Value propertyValue;
        if (!instantiator->instantiate(member->value, property.second, propertyValue)) {
            return false;
        }
        dictionary.entries.emplace_back(property.first, std::move(propertyValue));
    }

    value = Value::makeDictionary(std::move(dictionary));
    return true;
}

ValueType ObjectDefinition::valueType() const { return kDictionaryType; }

void ObjectDefinition::forEachType(const std::function<void(const Type&)>& visit) const {
    for (const auto& property : properties) {
        visit(property.second);
    }
}

} // namespace def
} // namespace loom
