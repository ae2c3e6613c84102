#include "loom/SchemaSerializer.hpp"

#include "loom/ClassGenerator.hpp"
#include "loom/def/ArrayDefinition.hpp"
#include "loom/def/EnumDefinition.hpp"
#include "loom/HostTestFixture.hpp"
#include "loom/RootSchema.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <string>
#include <vector>

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person",
     "properties": [
         {"name": "name", "type": "String"},
         {"name": "age", "type": "int"}
     ]},
    {"name": "Citizen",
     "description": "A person with papers.",
     "properties": [
         {"name": "gender", "type": "int", "className": "Citizen.Gender", "usage": ["CLASS_IS_ENUM"]},
         {"name": "home", "type": "Transform3D"}
     ],
     "enums": {"Gender": {"MALE": 0, "FEMALE": 1}}},
    {"name": "Node",
     "properties": [{"name": "next", "type": "Array", "hint": "ARRAY_TYPE", "hintString": "Node"}]}
]})";

std::vector<std::string> memberNames(const rapidjson::Value& object) {
    std::vector<std::string> names;
    for (auto member = object.MemberBegin(); member != object.MemberEnd(); ++member) {
        names.emplace_back(member->name.GetString());
    }
    return names;
}
} // namespace

namespace loom {

class SchemaSerializerTestFixture : public HostTestFixture {
public:
    SchemaSerializerTestFixture() { REQUIRE(scan(kManifest)); }

protected:
    std::unique_ptr<RootSchema> typeInfo(VariantKind kind) {
        PropertyInfo property;
        property.name = "value";
        property.kind = kind;
        ClassGenerator generator(classLibrary(), errorReporter());
        return RootSchema::fromTypeInfo(&generator, property);
    }
};

TEST_CASE_FIXTURE(SchemaSerializerTestFixture, "SchemaSerializer class documents") {
    SUBCASE("plain class") {
        auto schema = generate("Person");
        REQUIRE(schema);
        CHECK_EQ(serialize(*schema),
                 "{\"$schema\":\"https://json-schema.org/draft/2020-12/schema\",\"$defs\":{},\"type\":\"object\","
                 "\"properties\":{\"name\":{\"type\":\"string\"},\"age\":{\"type\":\"integer\"}},"
                 "\"required\":[\"name\",\"age\"],\"additionalProperties\":false}");
    }
    SUBCASE("description, enums and catalog types") {
        auto schema = generate("Citizen");
        REQUIRE(schema);
        auto json = serialize(*schema);
        rapidjson::Document document;
        document.Parse(json.data(), json.size());
        REQUIRE(!document.HasParseError());

        CHECK_EQ(memberNames(document), std::vector<std::string>(
                {"description", "$schema", "$defs", "type", "properties", "required", "additionalProperties"}));
        CHECK_EQ(std::string(document["description"].GetString()), "A person with papers.");
        CHECK_EQ(memberNames(document["$defs"]),
                 std::vector<std::string>({"Citizen.Gender", "Basis", "Transform3D", "Vector3"}));

        const auto& gender = document["$defs"]["Citizen.Gender"];
        CHECK_EQ(std::string(gender["type"].GetString()), "string");
        REQUIRE_EQ(gender["enum"].Size(), 2);
        CHECK_EQ(std::string(gender["enum"][0].GetString()), "MALE");
        CHECK_EQ(std::string(gender["enum"][1].GetString()), "FEMALE");

        const auto& properties = document["properties"];
        CHECK_EQ(std::string(properties["gender"]["$ref"].GetString()), "#/$defs/Citizen.Gender");
        CHECK_EQ(std::string(properties["home"]["$ref"].GetString()), "#/$defs/Transform3D");
    }
    SUBCASE("self reference") {
        auto schema = generate("Node");
        REQUIRE(schema);
        CHECK_EQ(serialize(*schema),
                 "{\"$schema\":\"https://json-schema.org/draft/2020-12/schema\",\"$defs\":{\"Node\":{"
                 "\"type\":\"object\",\"properties\":{\"next\":{\"type\":\"array\",\"items\":{\"$ref\":"
                 "\"#/$defs/Node\"}}},\"required\":[\"next\"],\"additionalProperties\":false}},\"type\":\"object\","
                 "\"properties\":{\"next\":{\"type\":\"array\",\"items\":{\"$ref\":\"#/$defs/Node\"}}},"
                 "\"required\":[\"next\"],\"additionalProperties\":false}");
    }
}

TEST_CASE_FIXTURE(SchemaSerializerTestFixture, "SchemaSerializer wrapped documents") {
    SUBCASE("integer") {
        auto schema = typeInfo(VariantKind::kInt);
        REQUIRE(schema);
        CHECK_EQ(serialize(*schema),
                 "{\"$schema\":\"https://json-schema.org/draft/2020-12/schema\",\"$defs\":{},\"type\":\"object\","
                 "\"properties\":{\"value\":{\"type\":\"integer\"}},\"required\":[\"value\"],"
                 "\"additionalProperties\":false}");
    }
    SUBCASE("builtin") {
        auto schema = typeInfo(VariantKind::kRect2);
        REQUIRE(schema);
        auto json = serialize(*schema);
        rapidjson::Document document;
        document.Parse(json.data(), json.size());
        REQUIRE(!document.HasParseError());
        CHECK_EQ(memberNames(document["$defs"]), std::vector<std::string>({"Rect2", "Vector2"}));
        CHECK_EQ(std::string(document["properties"]["value"]["$ref"].GetString()), "#/$defs/Rect2");
    }
    SUBCASE("dictionary is not wrapped") {
        auto schema = typeInfo(VariantKind::kDictionary);
        REQUIRE(schema);
        CHECK_EQ(serialize(*schema),
                 "{\"$schema\":\"https://json-schema.org/draft/2020-12/schema\",\"$defs\":{},"
                 "\"type\":\"object\"}");
    }
}

TEST_CASE_FIXTURE(SchemaSerializerTestFixture, "SchemaSerializer response format") {
    auto schema = generate("Person");
    REQUIRE(schema);
    SchemaSerializer serializer(errorReporter());
    REQUIRE(serializer.serializeResponseFormat(*schema, "person", false));
    CHECK_EQ(serializer.json(),
             "{\"type\":\"json_schema\",\"json_schema\":{\"name\":\"person\",\"schema\":{"
             "\"$schema\":\"https://json-schema.org/draft/2020-12/schema\",\"$defs\":{},\"type\":\"object\","
             "\"properties\":{\"name\":{\"type\":\"string\"},\"age\":{\"type\":\"integer\"}},"
             "\"required\":[\"name\",\"age\"],\"additionalProperties\":false}}}");
}

TEST_CASE_FIXTURE(SchemaSerializerTestFixture, "SchemaSerializer dangling references") {
    RootSchema schema(Definitions(), std::make_shared<const def::ArrayDefinition>(Type::reference("Ghost")));
    SchemaSerializer serializer(errorReporter());
    CHECK(!serializer.serialize(schema, false));
    CHECK(errorReporter()->hasError(ErrorReporter::kDanglingReference));

    errorReporter()->clear();
    schema.addDefinition("Ghost", std::make_shared<const def::EnumDefinition>(def::EnumVariants{{"BOO", 0}}));
    CHECK(serializer.serialize(schema, false));
    CHECK(errorReporter()->ok());
}

TEST_CASE_FIXTURE(SchemaSerializerTestFixture, "SchemaSerializer pretty printing") {
    auto schema = generate("Person");
    REQUIRE(schema);
    SchemaSerializer serializer(errorReporter());
    REQUIRE(serializer.serialize(*schema, true));
    std::string pretty(serializer.json());
    CHECK(pretty.find('\n') != std::string::npos);

    rapidjson::Document prettyDocument;
    prettyDocument.Parse(pretty.data(), pretty.size());
    auto compact = serialize(*schema);
    rapidjson::Document compactDocument;
    compactDocument.Parse(compact.data(), compact.size());
    const rapidjson::Value& prettyValue = prettyDocument;
    const rapidjson::Value& compactValue = compactDocument;
    CHECK(prettyValue == compactValue);
}

} // namespace loom
