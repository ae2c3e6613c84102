#include "loom/Value.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Value scalars") {
    CHECK(Value().isNil());
    CHECK_EQ(Value::makeBool(true).type(), kBooleanType);
    CHECK_EQ(Value::makeInteger(43).getInteger(), 43);
    CHECK_EQ(Value::makeFloat(1.0).type(), kFloatType);
    CHECK_EQ(Value::makeString("John Doe").getString(), "John Doe");

    CHECK_EQ(Value::makeInteger(1), Value::makeInteger(1));
    CHECK_NE(Value::makeInteger(1), Value::makeFloat(1.0));
    CHECK_NE(Value::makeString("a"), Value::makeString("b"));
}

TEST_CASE("Value containers compare deeply") {
    ValueArray a;
    a.typed = true;
    a.elementType = kIntegerType;
    a.elements = {Value::makeInteger(1), Value::makeInteger(2)};
    ValueArray b = a;
    CHECK_EQ(Value::makeArray(a), Value::makeArray(b));
    b.typed = false;
    CHECK_NE(Value::makeArray(a), Value::makeArray(b));

    ValueDictionary d;
    d.entries.emplace_back("x", Value::makeFloat(1.5));
    d.entries.emplace_back("y", Value::makeArray(a));
    auto dictionary = Value::makeDictionary(d);
    REQUIRE(dictionary.getDictionary().find("y"));
    CHECK_EQ(*dictionary.getDictionary().find("y"), Value::makeArray(a));
    CHECK(dictionary.getDictionary().find("z") == nullptr);

    auto vector = Value::makeBuiltin(BuiltinType::kVector2, dictionary);
    CHECK_EQ(vector.type(), kBuiltinType);
    CHECK_EQ(vector.getBuiltin().builtinType, BuiltinType::kVector2);
    CHECK_EQ(vector, Value::makeBuiltin(BuiltinType::kVector2, dictionary));
    CHECK_NE(vector, Value::makeBuiltin(BuiltinType::kVector2i, dictionary));
}

} // namespace loom
