#include "loom/Instantiator.hpp"

#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Type.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

namespace {
constexpr size_t kMaxDescriptionLength = 64;
}

namespace loom {

Instantiator::Instantiator(Host* host, const Definitions* defs, std::shared_ptr<ErrorReporter> errorReporter):
    m_host(host),
    m_defs(defs),
    m_errorReporter(std::move(errorReporter)),
    m_depth(0),
    m_maxDepth(kDefaultMaxDepth) {}

bool Instantiator::instantiate(const rapidjson::Value& json, const def::Definition* definition, Value& value) {
    if (m_depth >= m_maxDepth) {
        m_errorReporter->addError(ErrorReporter::kDepthLimitExceeded,
                fmt::format("Instantiation exceeded the maximum nesting depth of {}.", m_maxDepth));
        return false;
    }

    ++m_depth;
    bool result = definition->instantiate(this, json, value);
    --m_depth;
    return result;
}

bool Instantiator::instantiate(const rapidjson::Value& json, const Type& type, Value& value) {
    auto definition = type.resolve(*m_defs, m_errorReporter.get());
    if (!definition) {
        return false;
    }
    return instantiate(json, definition, value);
}

bool Instantiator::instantiateUntyped(const rapidjson::Value& json, Value& value) {
    if (m_depth >= m_maxDepth) {
        m_errorReporter->addError(ErrorReporter::kDepthLimitExceeded,
                fmt::format("Instantiation exceeded the maximum nesting depth of {}.", m_maxDepth));
        return false;
    }

    switch (json.GetType()) {
    case rapidjson::kNullType:
        value = Value::makeNil();
        return true;

    case rapidjson::kFalseType:
    case rapidjson::kTrueType:
        value = Value::makeBool(json.GetBool());
        return true;

    case rapidjson::kNumberType:
        if (json.IsInt64()) {
            value = Value::makeInteger(json.GetInt64());
            return true;
        }
        if (json.IsUint64()) {
            m_errorReporter->addError(ErrorReporter::kIntegerOutOfRange,
                    fmt::format("Integer {} does not fit in a signed 64-bit integer.", json.GetUint64()));
            return false;
        }
        value = Value::makeFloat(json.GetDouble());
        return true;

    case rapidjson::kStringType:
        value = Value::makeString(std::string(json.GetString(), json.GetStringLength()));
        return true;

    case rapidjson::kArrayType: {
        std::vector<Value> elements;
        elements.reserve(json.Size());
        ++m_depth;
        for (const auto& element : json.GetArray()) {
            Value elementValue;
            if (!instantiateUntyped(element, elementValue)) {
                --m_depth;
                return false;
            }
            elements.emplace_back(std::move(elementValue));
        }
        --m_depth;
        value = inferArray(std::move(elements));
        return true;
    }

    case rapidjson::kObjectType: {
        ValueDictionary dictionary;
        ++m_depth;
        for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
            Value memberValue;
            if (!instantiateUntyped(member->value, memberValue)) {
                --m_depth;
                return false;
            }
            dictionary.entries.emplace_back(std::string(member->name.GetString(), member->name.GetStringLength()),
                                            std::move(memberValue));
        }
        --m_depth;
        value = Value::makeDictionary(std::move(dictionary));
        return true;
    }
    }

    return typeMismatch("JSON value", json);
}

bool Instantiator::typeMismatch(std::string_view expected, const rapidjson::Value& json) {
    m_errorReporter->addError(ErrorReporter::kTypeMismatch, fmt::format("Expected {}, got: {}", expected,
                                                                        describe(json)));
    return false;
}

// static
std::string Instantiator::describe(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    std::string description(buffer.GetString(), buffer.GetSize());
    if (description.size() > kMaxDescriptionLength) {
        description.resize(kMaxDescriptionLength);
        description.append("...");
    }
    return description;
}

// static
Value Instantiator::inferArray(std::vector<Value> elements) {
    ValueArray array;
    if (elements.size()) {
        auto elementType = elements.front().type();
        bool homogeneous = elementType != kNilType;
        for (const auto& element : elements) {
            if (element.type() != elementType) {
                homogeneous = false;
                break;
            }
        }
        if (homogeneous) {
            array.typed = true;
            array.elementType = elementType;
        }
    }
    array.elements = std::move(elements);
    SPDLOG_TRACE("Inferred {} array of {} elements", array.typed ? valueTypeName(array.elementType) : "untyped",
                 array.elements.size());
    return Value::makeArray(std::move(array));
}

} // namespace loom
