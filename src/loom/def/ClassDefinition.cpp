#include "loom/def/ClassDefinition.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/Host.hpp"
#include "loom/Instantiator.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "spdlog/spdlog.h"

#include <string_view>

namespace loom {
namespace def {

void ClassDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "object", allocator);
    encodePropertyKeywords(properties, json, allocator);
}

bool ClassDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsObject()) {
        return instantiator->typeMismatch("object", json);
    }

    // The key set must match exactly before anything is constructed.
    for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
        std::string_view key(member->name.GetString(), member->name.GetStringLength());
        if (!findProperty(properties, key)) {
            instantiator->errorReporter()->addError(ErrorReporter::kUnknownProperty,
                    fmt::format("Unknown property '{}' for class '{}'.", key, name()));
            return false;
        }
    }
    for (const auto& property : properties) {
        if (!json.HasMember(rapidjson::Value(rapidjson::StringRef(property.first.data(), property.first.size())))) {
            instantiator->errorReporter()->addError(ErrorReporter::kMissingProperty,
                    fmt::format("Missing property '{}'.", property.first));
            return false;
        }
    }
    // Only reachable with duplicate keys.
    if (json.MemberCount() != properties.size()) {
        instantiator->errorReporter()->addError(ErrorReporter::kPropertyCountMismatch,
                fmt::format("Expected {} properties, got {}.", properties.size(), json.MemberCount()));
        return false;
    }

    auto object = instantiator->host()->construct(source);
    if (!object) {
        instantiator->errorReporter()->addError(ErrorReporter::kHostConstructionFailed,
                fmt::format("Host failed to construct an instance of class '{}'.", name()));
        return false;
    }

    for (const auto& property : properties) {
        const auto& propertyJSON = json[rapidjson::Value(rapidjson::StringRef(property.first.data(),
                                                                              property.first.size()))];
        Value propertyValue;
        if (!instantiator->instantiate(propertyJSON, property.second, propertyValue)) {
            return false;
        }
        if (!instantiator->host()->setProperty(object.get(), property.first, propertyValue)) {
            instantiator->errorReporter()->addError(ErrorReporter::kHostAssignmentFailed,
                    fmt::format("Host rejected assignment to property '{}' of class '{}'.", property.first, name()));
            return false;
        }
        SPDLOG_TRACE("Assigned {}.{}", name(), property.first);
    }

    value = Value::makeObject(std::move(object));
    return true;
}

ValueType ClassDefinition::valueType() const { return kObjectType; }

std::string ClassDefinition::valueClassName() const { return name(); }

void ClassDefinition::forEachType(const std::function<void(const Type&)>& visit) const {
    for (const auto& property : properties) {
        visit(property.second);
    }
}

} // namespace def
} // namespace loom
