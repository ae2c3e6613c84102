#include "loom/ClassLibrary.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/internal/FileSystem.hpp"
#include "loom/SourceFile.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

namespace {

std::string_view stringView(const rapidjson::Value& value) {
    return std::string_view(value.GetString(), value.GetStringLength());
}

} // namespace

namespace loom {

ClassLibrary::Instance::Instance(const ClassEntry* classEntry): m_classEntry(classEntry) {
    m_properties.reserve(classEntry->properties.size());
    for (const auto& property : classEntry->properties) {
        m_properties.emplace_back(property.name, Value::makeNil());
    }
}

const Value* ClassLibrary::Instance::get(std::string_view name) const {
    for (const auto& property : m_properties) {
        if (property.first == name) {
            return &property.second;
        }
    }
    return nullptr;
}

bool ClassLibrary::Instance::set(std::string_view name, Value value) {
    for (auto& property : m_properties) {
        if (property.first == name) {
            property.second = std::move(value);
            return true;
        }
    }
    return false;
}

ClassLibrary::ClassLibrary(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {}

bool ClassLibrary::scanString(std::string_view input, std::string_view filename) {
    rapidjson::Document document;
    document.Parse(input.data(), input.size());
    if (document.HasParseError()) {
        m_errorReporter->addError(ErrorReporter::kJSONParseError,
                fmt::format("{}: {} at offset {}.", filename, rapidjson::GetParseError_En(document.GetParseError()),
                            document.GetErrorOffset()));
        return false;
    }

    if (!document.IsObject() || !document.HasMember("classes") || !document["classes"].IsArray()) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: manifest must be an object with a \"classes\" array.", filename));
        return false;
    }

    for (const auto& classJSON : document["classes"].GetArray()) {
        if (!scanClass(classJSON, filename)) {
            return false;
        }
    }

    SPDLOG_DEBUG("Scanned {} classes from '{}'", document["classes"].Size(), filename);
    return true;
}

bool ClassLibrary::scanFile(const std::string& path) {
    SourceFile sourceFile(path, m_errorReporter);
    if (!sourceFile.read()) {
        return false;
    }
    return scanString(sourceFile.contents(), path);
}

std::optional<ClassSource> ClassLibrary::findScript(std::string_view location) const {
    auto iter = m_scriptMap.find(std::string(location));
    if (iter == m_scriptMap.end()) {
        return std::nullopt;
    }
    return iter->second->source;
}

const ClassLibrary::ClassEntry* ClassLibrary::findEntry(const ClassId& id) const {
    auto iter = m_classMap.find(id);
    if (iter == m_classMap.end()) {
        return nullptr;
    }
    return iter->second;
}

std::optional<ClassSource> ClassLibrary::findClass(std::string_view className) {
    auto entry = findEntry(ClassId::named(std::string(className)));
    if (!entry) {
        return std::nullopt;
    }
    return entry->source;
}

bool ClassLibrary::propertyList(const ClassSource& source, std::vector<PropertyInfo>& properties) {
    auto entry = findEntry(source.id);
    if (!entry) {
        return false;
    }

    // Script classes list their script file first, the way the engine reports it.
    if (entry->source.origin == ClassSource::kScript) {
        PropertyInfo scriptProperty;
        scriptProperty.name = fs::path(entry->source.location).filename().string();
        scriptProperty.usage = kUsageNone;
        properties.emplace_back(std::move(scriptProperty));
    }

    properties.insert(properties.end(), entry->properties.begin(), entry->properties.end());
    return true;
}

bool ClassLibrary::enumVariants(const ClassSource& source, std::string_view enumName, def::EnumVariants& variants) {
    auto entry = findEntry(source.id);
    if (!entry) {
        return false;
    }

    for (const auto& enumEntry : entry->enums) {
        if (enumEntry.first == enumName) {
            variants.insert(variants.end(), enumEntry.second.begin(), enumEntry.second.end());
            return true;
        }
    }
    return false;
}

std::optional<std::string> ClassLibrary::classDescription(const ClassSource& source) {
    auto entry = findEntry(source.id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->description;
}

std::shared_ptr<HostObject> ClassLibrary::construct(const ClassSource& source) {
    auto entry = findEntry(source.id);
    if (!entry || entry->isAbstract) {
        return nullptr;
    }
    return std::make_shared<Instance>(entry);
}

bool ClassLibrary::setProperty(HostObject* object, std::string_view name, const Value& value) {
    auto instance = dynamic_cast<Instance*>(object);
    if (!instance) {
        return false;
    }
    return instance->set(name, value);
}

bool ClassLibrary::scanClass(const rapidjson::Value& classJSON, std::string_view filename) {
    if (!classJSON.IsObject()) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: class entries must be objects.", filename));
        return false;
    }

    std::optional<std::string> name;
    if (classJSON.HasMember("name")) {
        if (!classJSON["name"].IsString()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: class \"name\" must be a string.", filename));
            return false;
        }
        name = std::string(stringView(classJSON["name"]));
    }
    std::optional<std::string> script;
    if (classJSON.HasMember("script")) {
        if (!classJSON["script"].IsString()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: class \"script\" must be a string.", filename));
            return false;
        }
        script = std::string(stringView(classJSON["script"]));
    }
    if (!name && !script) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: class entry needs a \"name\" or a \"script\".", filename));
        return false;
    }

    auto id = name ? ClassId::named(*name) : ClassId::unnamed(*script);
    if (m_classMap.count(id)) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: duplicate definition of class '{}'.", filename, id.definitionName()));
        return false;
    }

    auto origin = script ? ClassSource::kScript : ClassSource::kEngine;
    auto classEntry = std::make_unique<ClassEntry>(ClassSource(origin, id, script ? *script : std::string()));
    const auto& className = id.definitionName();

    if (classJSON.HasMember("description")) {
        if (!classJSON["description"].IsString()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"description\" of class '{}' must be a string.", filename, className));
            return false;
        }
        classEntry->description = std::string(stringView(classJSON["description"]));
    }

    if (classJSON.HasMember("abstract")) {
        if (!classJSON["abstract"].IsBool()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"abstract\" of class '{}' must be a boolean.", filename, className));
            return false;
        }
        classEntry->isAbstract = classJSON["abstract"].GetBool();
    }

    if (classJSON.HasMember("properties")) {
        const auto& propertiesJSON = classJSON["properties"];
        if (!propertiesJSON.IsArray()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"properties\" of class '{}' must be an array.", filename, className));
            return false;
        }
        for (const auto& propertyJSON : propertiesJSON.GetArray()) {
            PropertyInfo property;
            if (!scanProperty(propertyJSON, filename, className, property)) {
                return false;
            }
            classEntry->properties.emplace_back(std::move(property));
        }
    }

    if (classJSON.HasMember("enums")) {
        if (!scanEnums(classJSON["enums"], filename, className, classEntry.get())) {
            return false;
        }
    }

    SPDLOG_TRACE("Scanned class '{}' with {} properties", className, classEntry->properties.size());
    auto entry = classEntry.get();
    m_classes.emplace_back(std::move(classEntry));
    m_classMap.emplace(entry->source.id, entry);
    if (script) {
        m_scriptMap.emplace(*script, entry);
    }
    return true;
}

bool ClassLibrary::scanProperty(const rapidjson::Value& propertyJSON, std::string_view filename,
                                std::string_view className, PropertyInfo& property) {
    if (!propertyJSON.IsObject() || !propertyJSON.HasMember("name") || !propertyJSON["name"].IsString()
        || !propertyJSON.HasMember("type") || !propertyJSON["type"].IsString()) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: properties of class '{}' need a string \"name\" and \"type\".", filename,
                            className));
        return false;
    }
    property.name = std::string(stringView(propertyJSON["name"]));

    auto kind = variantKindNamed(stringView(propertyJSON["type"]));
    if (!kind) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: property '{}.{}' has unknown type '{}'.", filename, className, property.name,
                            stringView(propertyJSON["type"])));
        return false;
    }
    property.kind = *kind;

    if (propertyJSON.HasMember("className")) {
        if (!propertyJSON["className"].IsString()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"className\" of property '{}.{}' must be a string.", filename, className,
                                property.name));
            return false;
        }
        property.className = std::string(stringView(propertyJSON["className"]));
    }

    if (propertyJSON.HasMember("hint")) {
        std::optional<PropertyHint> hint;
        if (propertyJSON["hint"].IsString()) {
            hint = propertyHintNamed(stringView(propertyJSON["hint"]));
        }
        if (!hint) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: property '{}.{}' has an unknown \"hint\".", filename, className,
                                property.name));
            return false;
        }
        property.hint = *hint;
    }

    if (propertyJSON.HasMember("hintString")) {
        if (!propertyJSON["hintString"].IsString()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"hintString\" of property '{}.{}' must be a string.", filename, className,
                                property.name));
            return false;
        }
        property.hintString = std::string(stringView(propertyJSON["hintString"]));
    }

    if (propertyJSON.HasMember("usage")) {
        const auto& usageJSON = propertyJSON["usage"];
        if (usageJSON.IsUint()) {
            property.usage = usageJSON.GetUint();
        } else if (usageJSON.IsArray()) {
            property.usage = kUsageNone;
            for (const auto& flagJSON : usageJSON.GetArray()) {
                std::optional<PropertyUsage> flag;
                if (flagJSON.IsString()) {
                    flag = propertyUsageNamed(stringView(flagJSON));
                }
                if (!flag) {
                    m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                            fmt::format("{}: property '{}.{}' has an unknown usage flag.", filename, className,
                                        property.name));
                    return false;
                }
                property.usage |= *flag;
            }
        } else {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: \"usage\" of property '{}.{}' must be an integer or an array of flag names.",
                                filename, className, property.name));
            return false;
        }
    }

    return true;
}

bool ClassLibrary::scanEnums(const rapidjson::Value& enumsJSON, std::string_view filename, std::string_view className,
                             ClassEntry* classEntry) {
    if (!enumsJSON.IsObject()) {
        m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                fmt::format("{}: \"enums\" of class '{}' must be an object.", filename, className));
        return false;
    }

    for (auto enumMember = enumsJSON.MemberBegin(); enumMember != enumsJSON.MemberEnd(); ++enumMember) {
        auto enumName = stringView(enumMember->name);
        if (!enumMember->value.IsObject()) {
            m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                    fmt::format("{}: enum '{}.{}' must map names to integers.", filename, className, enumName));
            return false;
        }

        def::EnumVariants variants;
        for (auto variant = enumMember->value.MemberBegin(); variant != enumMember->value.MemberEnd(); ++variant) {
            if (!variant->value.IsInt64()) {
                m_errorReporter->addError(ErrorReporter::kManifestInvalid,
                        fmt::format("{}: enum '{}.{}' must map names to integers.", filename, className, enumName));
                return false;
            }
            variants.emplace_back(std::string(stringView(variant->name)), variant->value.GetInt64());
        }
        classEntry->enums.emplace_back(std::string(enumName), std::move(variants));
    }

    return true;
}

} // namespace loom
