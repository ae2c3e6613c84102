#include "loom/ValueDumpJSON.hpp"

#include "loom/HostTestFixture.hpp"

#include "doctest/doctest.h"

#include <limits>

namespace loom {

TEST_CASE("ValueDumpJSON scalars") {
    ValueDumpJSON dump;
    dump.dump(Value(), false);
    CHECK_EQ(dump.json(), "null");
    dump.dump(Value::makeInteger(-7), false);
    CHECK_EQ(dump.json(), "-7");
    dump.dump(Value::makeString("hi"), false);
    CHECK_EQ(dump.json(), "\"hi\"");
    dump.dump(Value::makeFloat(std::numeric_limits<double>::quiet_NaN()), false);
    CHECK_EQ(dump.json(), "\"nan\"");
    dump.dump(Value::makeFloat(-std::numeric_limits<double>::infinity()), false);
    CHECK_EQ(dump.json(), "\"-inf\"");
}

TEST_CASE("ValueDumpJSON containers") {
    ValueDumpJSON dump;

    SUBCASE("untyped arrays are plain") {
        ValueArray array;
        array.elements = {Value::makeInteger(1), Value::makeString("a")};
        dump.dump(Value::makeArray(array), false);
        CHECK_EQ(dump.json(), "[1,\"a\"]");
    }
    SUBCASE("typed arrays carry their element type") {
        ValueArray array;
        array.typed = true;
        array.elementType = kIntegerType;
        array.elements = {Value::makeInteger(1)};
        dump.dump(Value::makeArray(array), false);
        CHECK_EQ(dump.json(), "{\"_elementType\":\"integer\",\"_elements\":[1]}");
    }
    SUBCASE("builtins") {
        ValueDictionary fields;
        fields.entries.emplace_back("x", Value::makeFloat(1.5));
        fields.entries.emplace_back("y", Value::makeFloat(2.0));
        dump.dump(Value::makeBuiltin(BuiltinType::kVector2, Value::makeDictionary(fields)), false);
        CHECK_EQ(dump.json(), "{\"_className\":\"Vector2\",\"_value\":{\"x\":1.5,\"y\":2.0}}");
    }
}

class ValueDumpJSONTestFixture : public HostTestFixture {};

TEST_CASE_FIXTURE(ValueDumpJSONTestFixture, "ValueDumpJSON instances") {
    REQUIRE(scan(R"({"classes": [
        {"name": "Person", "properties": [{"name": "name", "type": "String"}, {"name": "age", "type": "int"}]}
    ]})"));
    auto schema = compile("Person");
    REQUIRE(schema);
    Value value;
    REQUIRE(schema->instantiate(R"({"name": "John Doe", "age": 43})", classLibrary(), errorReporter(), value));

    ValueDumpJSON dump;
    dump.dump(value, false);
    CHECK_EQ(dump.json(), "{\"_className\":\"Person\",\"name\":\"John Doe\",\"age\":43}");
}

} // namespace loom
