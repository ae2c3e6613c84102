#include "loom/Instantiator.hpp"

#include "loom/ClassGenerator.hpp"
#include "loom/ClassLibrary.hpp"
#include "loom/HostTestFixture.hpp"
#include "loom/RootSchema.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person",
     "properties": [
         {"name": "name", "type": "String"},
         {"name": "age", "type": "int"},
         {"name": "height", "type": "float"},
         {"name": "gender", "type": "int", "className": "Person.Gender", "usage": ["CLASS_IS_ENUM"]}
     ],
     "enums": {"Gender": {"MALE": 0, "FEMALE": 1}}},
    {"name": "Shape", "abstract": true, "properties": [{"name": "sides", "type": "int"}]},
    {"name": "Contact", "properties": [{"name": "name", "type": "String"}, {"name": "age", "type": "int"}]}
]})";
} // namespace

namespace loom {

class InstantiatorTestFixture : public HostTestFixture {
public:
    InstantiatorTestFixture(): m_maxDepth(kDefaultMaxDepth) { REQUIRE(scan(kManifest)); }

protected:
    std::unique_ptr<RootSchema> typeInfo(VariantKind kind, std::string hintString = std::string()) {
        PropertyInfo property;
        property.name = "value";
        property.kind = kind;
        if (hintString.size()) {
            property.hint = PropertyHint::kArrayType;
            property.hintString = hintString;
        }
        ClassGenerator generator(classLibrary(), errorReporter());
        return RootSchema::fromTypeInfo(&generator, property);
    }

    bool instantiate(const RootSchema& schema, std::string_view json, Value& value) {
        rapidjson::Document document;
        document.Parse(json.data(), json.size());
        REQUIRE(!document.HasParseError());
        Instantiator instantiator(classLibrary(), &schema.defs(), errorReporter());
        instantiator.setMaxDepth(m_maxDepth);
        return instantiator.instantiate(document, schema.base(), value);
    }

    const ClassLibrary::Instance* instance(const Value& value) {
        REQUIRE_EQ(value.type(), kObjectType);
        auto object = dynamic_cast<const ClassLibrary::Instance*>(value.getObject());
        REQUIRE(object);
        return object;
    }

    std::string firstMessage() {
        auto error = errorReporter()->firstError();
        return error ? error->message : std::string();
    }

    size_t m_maxDepth;
};

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator classes") {
    auto schema = generate("Person");
    REQUIRE(schema);
    Value value;

    SUBCASE("valid instance") {
        REQUIRE(instantiate(*schema, R"({"name": "John Doe", "age": 43, "height": 1, "gender": "FEMALE"})", value));
        CHECK(errorReporter()->ok());
        auto person = instance(value);
        CHECK_EQ(person->className(), "Person");
        CHECK_EQ(*person->get("name"), Value::makeString("John Doe"));
        CHECK_EQ(*person->get("age"), Value::makeInteger(43));
        CHECK_EQ(*person->get("height"), Value::makeFloat(1.0));
        CHECK_EQ(*person->get("gender"), Value::makeInteger(1));
    }
    SUBCASE("missing property") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "height": 1.8, "gender": "MALE"})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kMissingProperty));
        CHECK_EQ(firstMessage(), "Missing property 'age'.");
    }
    SUBCASE("unknown property") {
        CHECK(!instantiate(*schema,
                R"({"name": "John Doe", "age": 43, "height": 1.8, "gender": "MALE", "weight": 80})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kUnknownProperty));
    }
    SUBCASE("float for an integer") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "age": 1.5, "height": 1.8, "gender": "MALE"})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kExpectedIntegerGotFloat));
    }
    SUBCASE("string for an integer") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "age": "43", "height": 1.8, "gender": "MALE"})",
                           value));
        CHECK(errorReporter()->hasError(ErrorReporter::kTypeMismatch));
        CHECK_EQ(firstMessage(), "Expected integer, got: \"43\"");
    }
    SUBCASE("unknown enum variant") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "age": 43, "height": 1.8, "gender": "OTHER"})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kUnknownVariant));
        CHECK_EQ(firstMessage(), "Expected one of \"MALE, FEMALE\". Got: OTHER.");
    }
    SUBCASE("not an object") {
        CHECK(!instantiate(*schema, "[]", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kTypeMismatch));
    }
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator two property class") {
    auto schema = generate("Contact");
    REQUIRE(schema);
    Value value;

    SUBCASE("exact keys") {
        REQUIRE(instantiate(*schema, R"({"name": "John Doe", "age": 43})", value));
        CHECK_EQ(*instance(value)->get("age"), Value::makeInteger(43));
    }
    SUBCASE("missing key") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe"})", value));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_EQ(errorReporter()->firstError()->code, ErrorReporter::kMissingProperty);
        CHECK_EQ(firstMessage(), "Missing property 'age'.");
    }
    SUBCASE("extra key") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "age": 43, "email": "j@d.org"})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kUnknownProperty));
    }
    SUBCASE("duplicate key") {
        CHECK(!instantiate(*schema, R"({"name": "John Doe", "age": 43, "age": 44})", value));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_EQ(errorReporter()->firstError()->code, ErrorReporter::kPropertyCountMismatch);
        CHECK_EQ(firstMessage(), "Expected 2 properties, got 3.");
    }
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator host failures") {
    auto schema = generate("Shape");
    REQUIRE(schema);
    Value value;
    CHECK(!instantiate(*schema, R"({"sides": 3})", value));
    CHECK(errorReporter()->hasError(ErrorReporter::kHostConstructionFailed));
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator numbers") {
    Value value;

    SUBCASE("integers widen to floats") {
        auto schema = typeInfo(VariantKind::kFloat);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "1", value));
        CHECK_EQ(value, Value::makeFloat(1.0));
        REQUIRE(instantiate(*schema, "1.0", value));
        CHECK_EQ(value, Value::makeFloat(1.0));
    }
    SUBCASE("integer precision") {
        auto schema = typeInfo(VariantKind::kInt);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "-9223372036854775808", value));
        CHECK_EQ(value, Value::makeInteger(std::numeric_limits<std::int64_t>::min()));
        CHECK(!instantiate(*schema, "9223372036854775808", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kIntegerOutOfRange));
    }
    SUBCASE("32-bit components") {
        auto schema = typeInfo(VariantKind::kVector2i);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, R"({"x": -2147483648, "y": 2147483647})", value));
        CHECK(!instantiate(*schema, R"({"x": 0, "y": 2147483648})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kIntegerOutOfRange));
    }
    SUBCASE("bytes") {
        auto schema = typeInfo(VariantKind::kPackedByteArray);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "[0, 255]", value));
        CHECK(!instantiate(*schema, "[256]", value));
        CHECK(!instantiate(*schema, "[-1]", value));
        CHECK_EQ(errorReporter()->errorCount(), 2);
    }
    SUBCASE("RID") {
        auto schema = typeInfo(VariantKind::kRID);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "12", value));
        CHECK(!instantiate(*schema, "-12", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kIntegerOutOfRange));
    }
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator builtins") {
    Value value;

    SUBCASE("Vector2") {
        auto schema = typeInfo(VariantKind::kVector2);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, R"({"x": 1, "y": 2.5})", value));
        REQUIRE_EQ(value.type(), kBuiltinType);
        CHECK_EQ(value.getBuiltin().builtinType, BuiltinType::kVector2);
        const auto& fields = value.getBuiltin().value.getDictionary();
        REQUIRE(fields.find("x"));
        CHECK_EQ(*fields.find("x"), Value::makeFloat(1.0));
        CHECK_EQ(*fields.find("y"), Value::makeFloat(2.5));
    }
    SUBCASE("property count") {
        auto schema = typeInfo(VariantKind::kVector2);
        REQUIRE(schema);
        CHECK(!instantiate(*schema, R"({"x": 1})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kPropertyCountMismatch));
        CHECK_EQ(firstMessage(), "Expected 2 properties, got 1.");
    }
    SUBCASE("wrong key with the right count") {
        auto schema = typeInfo(VariantKind::kVector2);
        REQUIRE(schema);
        CHECK(!instantiate(*schema, R"({"x": 1, "z": 2})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kMissingProperty));
        CHECK_EQ(firstMessage(), "Missing property 'y'.");
    }
    SUBCASE("tuple arity") {
        auto schema = typeInfo(VariantKind::kBasis);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema,
                R"({"rows": [{"x": 1, "y": 0, "z": 0}, {"x": 0, "y": 1, "z": 0}, {"x": 0, "y": 0, "z": 1}]})",
                value));
        CHECK(!instantiate(*schema, R"({"rows": [{"x": 1, "y": 0, "z": 0}, {"x": 0, "y": 1, "z": 0}]})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kTupleArityMismatch));
        CHECK_EQ(firstMessage(), "Expected 3 items, got 2.");
    }
    SUBCASE("nested builtins") {
        auto schema = typeInfo(VariantKind::kRect2);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, R"({"position": {"x": 0, "y": 0}, "size": {"x": 4, "y": 3}})", value));
        const auto& size = *value.getBuiltin().value.getDictionary().find("size");
        REQUIRE_EQ(size.type(), kBuiltinType);
        CHECK_EQ(size.getBuiltin().builtinType, BuiltinType::kVector2);
    }
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator arrays") {
    Value value;

    SUBCASE("typed primitives") {
        auto schema = typeInfo(VariantKind::kArray, "int");
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "[1, 2, 3]", value));
        const auto& array = value.getArray();
        CHECK(array.typed);
        CHECK_EQ(array.elementType, kIntegerType);
        CHECK_EQ(array.elements.size(), 3);
        CHECK(!instantiate(*schema, "[1, 2.5]", value));
    }
    SUBCASE("typed classes") {
        auto schema = typeInfo(VariantKind::kArray, "Person");
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, R"([{"name": "A", "age": 1, "height": 1.5, "gender": "MALE"}])", value));
        const auto& array = value.getArray();
        CHECK(array.typed);
        CHECK_EQ(array.elementType, kObjectType);
        CHECK_EQ(array.elementClassName, "Person");
        REQUIRE_EQ(array.elements.size(), 1);
        CHECK_EQ(*instance(array.elements[0])->get("name"), Value::makeString("A"));
    }
    SUBCASE("typed builtins") {
        auto schema = typeInfo(VariantKind::kArray, "Vector2");
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, R"([{"x": 1, "y": 2}])", value));
        CHECK_EQ(value.getArray().elementType, kBuiltinType);
        CHECK_EQ(value.getArray().elementClassName, "Vector2");
    }
    SUBCASE("null placeholders") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kArray;
        property.hint = PropertyHint::kArrayType;
        ClassGenerator generator(classLibrary(), errorReporter());
        auto schema = RootSchema::fromTypeInfo(&generator, property);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "[null, null]", value));
        CHECK(!value.getArray().typed);
        CHECK_EQ(value.getArray().elements.size(), 2);
        CHECK(!instantiate(*schema, "[1]", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kTypeMismatch));
    }
    SUBCASE("untyped inference") {
        auto schema = typeInfo(VariantKind::kArray);
        REQUIRE(schema);
        REQUIRE(instantiate(*schema, "[1, 2]", value));
        CHECK(value.getArray().typed);
        CHECK_EQ(value.getArray().elementType, kIntegerType);
        REQUIRE(instantiate(*schema, R"([1, "two"])", value));
        CHECK(!value.getArray().typed);
        REQUIRE(instantiate(*schema, "[]", value));
        CHECK(!value.getArray().typed);
    }
}

TEST_CASE_FIXTURE(InstantiatorTestFixture, "Instantiator dictionaries") {
    auto schema = typeInfo(VariantKind::kDictionary);
    REQUIRE(schema);
    Value value;

    SUBCASE("open keys") {
        REQUIRE(instantiate(*schema, R"({"a": 1, "b": [true, false], "c": {"d": null}})", value));
        const auto& dictionary = value.getDictionary();
        REQUIRE_EQ(dictionary.entries.size(), 3);
        CHECK_EQ(dictionary.entries[0].first, "a");
        CHECK_EQ(dictionary.entries[0].second, Value::makeInteger(1));
        CHECK_EQ(dictionary.find("b")->getArray().elementType, kBooleanType);
        CHECK(dictionary.find("c")->getDictionary().find("d")->isNil());
    }
    SUBCASE("unsigned overflow") {
        CHECK(!instantiate(*schema, R"({"a": 18446744073709551615})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kIntegerOutOfRange));
    }
    SUBCASE("depth limit") {
        m_maxDepth = 3;
        REQUIRE(instantiate(*schema, R"({"a": {"b": 1}})", value));
        CHECK(!instantiate(*schema, R"({"a": {"b": {"c": 1}}})", value));
        CHECK(errorReporter()->hasError(ErrorReporter::kDepthLimitExceeded));
    }
}

// Rejects every assignment to properties named "age".
class AgelessLibrary : public ClassLibrary {
public:
    explicit AgelessLibrary(std::shared_ptr<ErrorReporter> errorReporter): ClassLibrary(std::move(errorReporter)) {}

    bool setProperty(HostObject* object, std::string_view name, const Value& value) override {
        if (name == "age") {
            return false;
        }
        return ClassLibrary::setProperty(object, name, value);
    }
};

TEST_CASE("Instantiator host assignment") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AgelessLibrary library(errorReporter);
    REQUIRE(library.scanString(kManifest, "test"));
    auto source = library.findClass("Contact");
    REQUIRE(source);
    ClassGenerator generator(&library, errorReporter);
    auto schema = RootSchema::fromClass(&generator, *source);
    REQUIRE(schema);

    rapidjson::Document document;
    document.Parse(R"({"name": "John Doe", "age": 43})");
    REQUIRE(!document.HasParseError());
    Instantiator instantiator(&library, &schema->defs(), errorReporter);
    Value value;
    CHECK(!instantiator.instantiate(document, schema->base(), value));
    REQUIRE_EQ(errorReporter->errorCount(), 1);
    CHECK_EQ(errorReporter->firstError()->code, ErrorReporter::kHostAssignmentFailed);
    CHECK_EQ(errorReporter->firstError()->message, "Host rejected assignment to property 'age' of class 'Contact'.");
}

TEST_CASE("Instantiator describe") {
    rapidjson::Document document;
    document.Parse(R"({"key": "a long value that keeps going and going well past the description limit"})");
    auto description = Instantiator::describe(document);
    CHECK_EQ(description.size(), 67);
    CHECK_EQ(description.substr(64), "...");
}

} // namespace loom
