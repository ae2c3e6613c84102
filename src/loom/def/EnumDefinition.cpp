#include "loom/def/EnumDefinition.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/Instantiator.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"

#include <string_view>

namespace loom {
namespace def {

void EnumDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "string", allocator);
    rapidjson::Value names;
    names.SetArray();
    for (const auto& variant : variants) {
        rapidjson::Value name;
        name.SetString(variant.first.data(), variant.first.size(), allocator);
        names.PushBack(name, allocator);
    }
    json.AddMember("enum", names, allocator);
}

bool EnumDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsString()) {
        return instantiator->typeMismatch("string", json);
    }

    std::string_view name(json.GetString(), json.GetStringLength());
    for (const auto& variant : variants) {
        if (variant.first == name) {
            value = Value::makeInteger(variant.second);
            return true;
        }
    }

    std::string validNames;
    for (const auto& variant : variants) {
        if (validNames.size()) {
            validNames.append(", ");
        }
        validNames.append(variant.first);
    }
    instantiator->errorReporter()->addError(ErrorReporter::kUnknownVariant,
            fmt::format("Expected one of \"{}\". Got: {}.", validNames, name));
    return false;
}

ValueType EnumDefinition::valueType() const { return kIntegerType; }

} // namespace def
} // namespace loom
