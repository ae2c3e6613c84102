#ifndef SRC_LOOM_VALUE_HPP_
#define SRC_LOOM_VALUE_HPP_

#include "loom/BuiltinCatalog.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace loom {

// Native value types, as bit flags so callers can test against sets of types.
enum ValueType : std::int32_t {
    kNilType = 0x0001,
    kBooleanType = 0x0002,
    kIntegerType = 0x0004,
    kFloatType = 0x0008,
    kStringType = 0x0010,
    kArrayType = 0x0020,
    kDictionaryType = 0x0040,
    kObjectType = 0x0080,
    kBuiltinType = 0x0100,

    kNumericType = kIntegerType | kFloatType,
    kContainerType = kArrayType | kDictionaryType
};

std::string_view valueTypeName(ValueType type);

// Base class for host-owned instances produced by Host::construct().
class HostObject {
public:
    virtual ~HostObject() = default;
    virtual std::string_view className() const = 0;
};

struct BuiltinValue;
struct ValueArray;
struct ValueDictionary;

class Value {
public:
    Value() = default;
    ~Value() = default;

    static Value makeNil() { return Value(); }
    static Value makeBool(bool b) { return Value(b); }
    static Value makeInteger(std::int64_t i) { return Value(i); }
    static Value makeFloat(double d) { return Value(d); }
    static Value makeString(std::string s) { return Value(std::move(s)); }
    static Value makeArray(ValueArray array);
    static Value makeDictionary(ValueDictionary dictionary);
    static Value makeObject(std::shared_ptr<HostObject> object) { return Value(std::move(object)); }
    static Value makeBuiltin(BuiltinType builtinType, Value value);

    ValueType type() const;
    bool isNil() const { return type() == kNilType; }

    // Accessors assume the caller has checked type().
    bool getBool() const { return std::get<bool>(m_value); }
    std::int64_t getInteger() const { return std::get<std::int64_t>(m_value); }
    double getFloat() const { return std::get<double>(m_value); }
    const std::string& getString() const { return std::get<std::string>(m_value); }
    const ValueArray& getArray() const { return *std::get<std::shared_ptr<const ValueArray>>(m_value); }
    const ValueDictionary& getDictionary() const {
        return *std::get<std::shared_ptr<const ValueDictionary>>(m_value);
    }
    HostObject* getObject() const { return std::get<std::shared_ptr<HostObject>>(m_value).get(); }
    std::shared_ptr<HostObject> getObjectShared() const { return std::get<std::shared_ptr<HostObject>>(m_value); }
    const BuiltinValue& getBuiltin() const { return *std::get<std::shared_ptr<const BuiltinValue>>(m_value); }

    // Deep structural comparison. Host objects compare by identity.
    bool operator==(const Value& value) const;
    bool operator!=(const Value& value) const { return !(*this == value); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                 std::shared_ptr<const ValueArray>, std::shared_ptr<const ValueDictionary>,
                                 std::shared_ptr<HostObject>, std::shared_ptr<const BuiltinValue>>;

    template <typename T> explicit Value(T value): m_value(std::move(value)) {}

    Storage m_value;
};

struct ValueArray {
    // Untyped arrays accept any element. Typed arrays record the single element type and, for object and builtin
    // elements, the class or catalog name.
    bool typed = false;
    ValueType elementType = kNilType;
    std::string elementClassName;
    std::vector<Value> elements;
};

struct ValueDictionary {
    std::vector<std::pair<std::string, Value>> entries;

    // Returns nullptr if |key| is absent.
    const Value* find(std::string_view key) const;
};

// A built-in composite value, such as a Vector2, kept as its tag plus the structural value read from its source
// definition.
struct BuiltinValue {
    BuiltinType builtinType;
    Value value;
};

} // namespace loom

#endif // SRC_LOOM_VALUE_HPP_
