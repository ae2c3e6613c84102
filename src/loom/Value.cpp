#include "loom/Value.hpp"

namespace loom {

std::string_view valueTypeName(ValueType type) {
    switch (type) {
    case kNilType:
        return "nil";
    case kBooleanType:
        return "boolean";
    case kIntegerType:
        return "integer";
    case kFloatType:
        return "float";
    case kStringType:
        return "string";
    case kArrayType:
        return "array";
    case kDictionaryType:
        return "dictionary";
    case kObjectType:
        return "object";
    case kBuiltinType:
        return "builtin";
    case kNumericType:
        return "numeric";
    case kContainerType:
        return "container";
    }
    return "unknown";
}

const Value* ValueDictionary::find(std::string_view key) const {
    for (const auto& entry : entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

// static
Value Value::makeArray(ValueArray array) {
    return Value(std::make_shared<const ValueArray>(std::move(array)));
}

// static
Value Value::makeDictionary(ValueDictionary dictionary) {
    return Value(std::make_shared<const ValueDictionary>(std::move(dictionary)));
}

// static
Value Value::makeBuiltin(BuiltinType builtinType, Value value) {
    return Value(std::make_shared<const BuiltinValue>(BuiltinValue{builtinType, std::move(value)}));
}

ValueType Value::type() const {
    switch (m_value.index()) {
    case 0:
        return kNilType;
    case 1:
        return kBooleanType;
    case 2:
        return kIntegerType;
    case 3:
        return kFloatType;
    case 4:
        return kStringType;
    case 5:
        return kArrayType;
    case 6:
        return kDictionaryType;
    case 7:
        return kObjectType;
    case 8:
        return kBuiltinType;
    }
    return kNilType;
}

bool Value::operator==(const Value& value) const {
    if (type() != value.type()) {
        return false;
    }

    switch (type()) {
    case kNilType:
        return true;
    case kBooleanType:
        return getBool() == value.getBool();
    case kIntegerType:
        return getInteger() == value.getInteger();
    case kFloatType:
        return getFloat() == value.getFloat();
    case kStringType:
        return getString() == value.getString();
    case kArrayType: {
        const auto& a = getArray();
        const auto& b = value.getArray();
        return a.typed == b.typed && a.elementType == b.elementType && a.elementClassName == b.elementClassName
            && a.elements == b.elements;
    }
    case kDictionaryType:
        return getDictionary().entries == value.getDictionary().entries;
    case kObjectType:
        return getObject() == value.getObject();
    case kBuiltinType:
        return getBuiltin().builtinType == value.getBuiltin().builtinType
            && getBuiltin().value == value.getBuiltin().value;
    default:
        break;
    }

    return false;
}

} // namespace loom
