#include "loom/ValueDumpJSON.hpp"

#include "loom/ClassLibrary.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <cmath>

namespace loom {

class ValueDumpJSON::Impl {
public:
    ~Impl() = default;

    void dump(const Value& value, bool prettyPrint) {
        m_doc.SetNull();
        m_doc.GetAllocator().Clear();
        m_buffer.Clear();
        encodeValue(value, m_doc);

        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        if (!result) {
            SPDLOG_ERROR("Failed to write value dump");
        }
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;

    void encodeString(std::string_view string, rapidjson::Value& value) {
        value.SetString(string.data(), string.size(), m_doc.GetAllocator());
    }

    void encodeValue(const Value& nativeValue, rapidjson::Value& value) {
        auto& alloc = m_doc.GetAllocator();

        switch (nativeValue.type()) {
        case kFloatType: {
            // rapidjson silently fails to encode NaN and inf doubles.
            auto dub = nativeValue.getFloat();
            if (std::isnan(dub)) {
                value.SetString("nan");
            } else if (std::isinf(dub)) {
                value.SetString(dub > 0 ? "+inf" : "-inf");
            } else {
                value.SetDouble(dub);
            }
        } break;

        case kNilType:
            value.SetNull();
            break;

        case kIntegerType:
            value.SetInt64(nativeValue.getInteger());
            break;

        case kBooleanType:
            value.SetBool(nativeValue.getBool());
            break;

        case kStringType:
            encodeString(nativeValue.getString(), value);
            break;

        case kArrayType: {
            const auto& array = nativeValue.getArray();
            rapidjson::Value elements;
            elements.SetArray();
            for (const auto& element : array.elements) {
                rapidjson::Value elementJSON;
                encodeValue(element, elementJSON);
                elements.PushBack(elementJSON, alloc);
            }
            if (!array.typed) {
                value = elements;
                break;
            }
            value.SetObject();
            rapidjson::Value elementType;
            elementType.SetString(rapidjson::StringRef(valueTypeName(array.elementType).data(),
                                                       valueTypeName(array.elementType).size()));
            value.AddMember("_elementType", elementType, alloc);
            if (array.elementClassName.size()) {
                rapidjson::Value className;
                encodeString(array.elementClassName, className);
                value.AddMember("_className", className, alloc);
            }
            value.AddMember("_elements", elements, alloc);
        } break;

        case kDictionaryType:
            value.SetObject();
            for (const auto& entry : nativeValue.getDictionary().entries) {
                rapidjson::Value key;
                encodeString(entry.first, key);
                rapidjson::Value entryValue;
                encodeValue(entry.second, entryValue);
                value.AddMember(key, entryValue, alloc);
            }
            break;

        case kObjectType:
            encodeObject(nativeValue.getObject(), value);
            break;

        case kBuiltinType: {
            const auto& builtin = nativeValue.getBuiltin();
            value.SetObject();
            rapidjson::Value className;
            encodeString(builtinName(builtin.builtinType), className);
            value.AddMember("_className", className, alloc);
            rapidjson::Value builtinValue;
            encodeValue(builtin.value, builtinValue);
            value.AddMember("_value", builtinValue, alloc);
        } break;

        default:
            value.SetNull();
            break;
        }
    }

    void encodeObject(const HostObject* object, rapidjson::Value& value) {
        auto& alloc = m_doc.GetAllocator();
        value.SetObject();
        rapidjson::Value className;
        encodeString(object->className(), className);
        value.AddMember("_className", className, alloc);

        // Instances of other hosts are opaque, only the class is known.
        auto instance = dynamic_cast<const ClassLibrary::Instance*>(object);
        if (!instance) {
            return;
        }
        for (const auto& property : instance->properties()) {
            rapidjson::Value name;
            encodeString(property.first, name);
            rapidjson::Value propertyValue;
            encodeValue(property.second, propertyValue);
            value.AddMember(name, propertyValue, alloc);
        }
    }
};

ValueDumpJSON::ValueDumpJSON(): m_impl(std::make_unique<ValueDumpJSON::Impl>()) {}

ValueDumpJSON::~ValueDumpJSON() {}

void ValueDumpJSON::dump(const Value& value, bool prettyPrint) { m_impl->dump(value, prettyPrint); }

std::string_view ValueDumpJSON::json() const { return m_impl->json(); }

} // namespace loom
