#include "loom/CompiledSchema.hpp"

#include "loom/ClassGenerator.hpp"
#include "loom/ClassLibrary.hpp"
#include "loom/HostTestFixture.hpp"

#include "doctest/doctest.h"

#include <string>

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person",
     "properties": [
         {"name": "name", "type": "String"},
         {"name": "age", "type": "int"},
         {"name": "gender", "type": "int", "className": "Person.Gender", "usage": ["CLASS_IS_ENUM"]}
     ],
     "enums": {"Gender": {"MALE": 0, "FEMALE": 1}}},
    {"name": "Node",
     "properties": [
         {"name": "label", "type": "String"},
         {"name": "children", "type": "Array", "hint": "ARRAY_TYPE", "hintString": "Node"}
     ]},
    {"script": "res://enemy.gd", "properties": [{"name": "health", "type": "int"}]}
]})";
} // namespace

namespace loom {

class CompiledSchemaTestFixture : public HostTestFixture {
public:
    CompiledSchemaTestFixture() { REQUIRE(scan(kManifest)); }
};

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema end to end") {
    auto schema = compile("Person");
    REQUIRE(schema);
    CHECK(errorReporter()->ok());
    Value value;

    SUBCASE("valid input") {
        REQUIRE(schema->instantiate(R"({"name": "John Doe", "age": 43, "gender": "MALE"})", classLibrary(),
                                    errorReporter(), value));
        auto person = dynamic_cast<const ClassLibrary::Instance*>(value.getObject());
        REQUIRE(person);
        CHECK_EQ(*person->get("age"), Value::makeInteger(43));
        CHECK_EQ(*person->get("gender"), Value::makeInteger(0));
    }
    SUBCASE("validation runs first") {
        CHECK(!schema->instantiate(R"({"name": "John Doe"})", classLibrary(), errorReporter(), value));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        const auto* error = errorReporter()->firstError();
        CHECK_EQ(error->code, ErrorReporter::kValidationFailed);
        REQUIRE_EQ(error->issues.size(), 1);
        CHECK_EQ(error->issues[0].keyword, "required");
        CHECK_EQ(error->issues[0].instancePointer, "#");
    }
    SUBCASE("extra properties fail validation") {
        CHECK(!schema->instantiate(R"({"name": "John Doe", "age": 43, "gender": "MALE", "pet": "cat"})",
                                   classLibrary(), errorReporter(), value));
        REQUIRE(errorReporter()->firstError());
        CHECK_EQ(errorReporter()->firstError()->issues[0].keyword, "additionalProperties");
    }
    SUBCASE("floats fail integer validation") {
        CHECK(!schema->instantiate(R"({"name": "John Doe", "age": 1.5, "gender": "MALE"})", classLibrary(),
                                   errorReporter(), value));
        REQUIRE(errorReporter()->firstError());
        CHECK_EQ(errorReporter()->firstError()->code, ErrorReporter::kValidationFailed);
        CHECK_EQ(errorReporter()->firstError()->issues[0].keyword, "type");
        CHECK_EQ(errorReporter()->firstError()->issues[0].instancePointer, "#/age");
    }
    SUBCASE("unknown variants fail validation") {
        CHECK(!schema->instantiate(R"({"name": "John Doe", "age": 43, "gender": "OTHER"})", classLibrary(),
                                   errorReporter(), value));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_EQ(errorReporter()->firstError()->code, ErrorReporter::kValidationFailed);
        CHECK_EQ(errorReporter()->firstError()->issues[0].keyword, "enum");
        CHECK_EQ(errorReporter()->firstError()->issues[0].instancePointer, "#/gender");
    }
    SUBCASE("malformed input") {
        CHECK(!schema->instantiate("{\"name\": ", classLibrary(), errorReporter(), value));
        CHECK(errorReporter()->hasError(ErrorReporter::kJSONParseError));
    }
}

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema documents") {
    auto schema = compile("Person");
    REQUIRE(schema);

    SUBCASE("pretty and compact") {
        CHECK(schema->json().find('\n') != std::string::npos);
        std::string compact;
        REQUIRE(schema->compactJSON(compact, errorReporter()));
        CHECK(compact.find('\n') == std::string::npos);
        CHECK_EQ(compact.find("{\"$schema\":"), 0);
    }
    SUBCASE("response format") {
        std::string json;
        REQUIRE(schema->responseFormat("person", json, false, errorReporter()));
        CHECK_EQ(json.find("{\"type\":\"json_schema\",\"json_schema\":{\"name\":\"person\",\"schema\":{"), 0);
    }
}

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema wrapped values") {
    PropertyInfo property;
    property.name = "value";
    property.kind = VariantKind::kColor;
    ClassGenerator generator(classLibrary(), errorReporter());
    auto schema = CompiledSchema::compile(RootSchema::fromTypeInfo(&generator, property), errorReporter());
    REQUIRE(schema);
    Value value;

    REQUIRE(schema->instantiate(R"({"value": {"r": 1, "g": 0.5, "b": 0, "a": 1}})", classLibrary(),
                                errorReporter(), value));
    REQUIRE_EQ(value.type(), kBuiltinType);
    CHECK_EQ(value.getBuiltin().builtinType, BuiltinType::kColor);

    CHECK(!schema->instantiate(R"({"r": 1, "g": 0.5, "b": 0, "a": 1})", classLibrary(), errorReporter(), value));
    CHECK(errorReporter()->hasError(ErrorReporter::kValidationFailed));
}

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema recursive classes") {
    auto schema = compile("Node");
    REQUIRE(schema);
    Value value;

    REQUIRE(schema->instantiate(
            R"({"label": "root", "children": [{"label": "leaf", "children": []}]})", classLibrary(),
            errorReporter(), value));
    auto root = dynamic_cast<const ClassLibrary::Instance*>(value.getObject());
    REQUIRE(root);
    const auto& children = root->get("children")->getArray();
    CHECK_EQ(children.elementClassName, "Node");
    REQUIRE_EQ(children.elements.size(), 1);

    CHECK(!schema->instantiate(R"({"label": "root", "children": [{"label": "leaf"}]})", classLibrary(),
                               errorReporter(), value));
    REQUIRE(errorReporter()->firstError());
    CHECK_EQ(errorReporter()->firstError()->issues[0].keyword, "required");

    errorReporter()->clear();
    CHECK(!schema->instantiate(
            R"({"label": "a", "children": [{"label": "b", "children": [{"label": "c", "children": []}]}]})",
            classLibrary(), errorReporter(), value, 2));
    CHECK(errorReporter()->hasError(ErrorReporter::kDepthLimitExceeded));
}

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema array schemas") {
    auto schema = compile("Person");
    REQUIRE(schema);
    auto arraySchema = schema->arraySchema("Person", errorReporter());
    REQUIRE(arraySchema);
    Value value;

    REQUIRE(arraySchema->instantiate(
            R"({"value": [{"name": "A", "age": 1, "gender": "MALE"}, {"name": "B", "age": 2, "gender": "FEMALE"}]})",
            classLibrary(), errorReporter(), value));
    const auto& array = value.getArray();
    CHECK(array.typed);
    CHECK_EQ(array.elementType, kObjectType);
    CHECK_EQ(array.elementClassName, "Person");
    CHECK_EQ(array.elements.size(), 2);

    CHECK(!arraySchema->instantiate(R"({"value": [{"name": "A"}]})", classLibrary(), errorReporter(), value));
    CHECK(errorReporter()->hasError(ErrorReporter::kValidationFailed));
}

TEST_CASE_FIXTURE(CompiledSchemaTestFixture, "CompiledSchema script path references") {
    auto source = classLibrary()->findScript("res://enemy.gd");
    REQUIRE(source);
    ClassGenerator generator(classLibrary(), errorReporter());
    auto schema = CompiledSchema::compile(RootSchema::fromClass(&generator, *source), errorReporter());
    REQUIRE(schema);
    auto arraySchema = schema->arraySchema(source->id.definitionName(), errorReporter());
    REQUIRE(arraySchema);
    CHECK(errorReporter()->ok());
    CHECK_NE(arraySchema->json().find("#/$defs/res:~1~1enemy.gd"), std::string::npos);
    Value value;

    REQUIRE(arraySchema->instantiate(R"({"value": [{"health": 10}, {"health": 3}]})", classLibrary(),
                                     errorReporter(), value));
    CHECK_EQ(value.getArray().elements.size(), 2);

    CHECK(!arraySchema->instantiate(R"({"value": [{"health": 10}, {"health": "full"}]})", classLibrary(),
                                    errorReporter(), value));
    REQUIRE(errorReporter()->firstError());
    CHECK_EQ(errorReporter()->firstError()->code, ErrorReporter::kValidationFailed);
    CHECK_EQ(errorReporter()->firstError()->issues[0].instancePointer, "#/value/1/health");
}

} // namespace loom
