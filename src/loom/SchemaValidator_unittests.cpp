#include "loom/SchemaValidator.hpp"

#include "loom/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <string_view>

namespace {

rapidjson::Document parse(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    REQUIRE(!document.HasParseError());
    return document;
}

} // namespace

namespace loom {

TEST_CASE("SchemaValidator compile") {
    ErrorReporter errorReporter(true);
    SchemaValidator validator;
    CHECK(!validator.isCompiled());

    SUBCASE("not JSON") {
        CHECK(!validator.compile("{\"type\": ", &errorReporter));
        CHECK(!validator.isCompiled());
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.firstError()->code, ErrorReporter::kSchemaInvalid);
    }

    SUBCASE("not an object") {
        CHECK(!validator.compile("[1, 2, 3]", &errorReporter));
        CHECK(!validator.isCompiled());
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.firstError()->message, "Schema document is not a JSON object.");
    }

    SUBCASE("uncompiled validation") {
        auto document = parse("{}");
        CHECK(!validator.validate(document, &errorReporter));
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.firstError()->code, ErrorReporter::kSchemaInvalid);
    }

    SUBCASE("unresolved reference") {
        CHECK(!validator.compile(R"({"$defs": {}, "type": "object", "properties": {"a": {"$ref": "#/$defs/Ghost"}}})",
                                 &errorReporter));
        CHECK(!validator.isCompiled());
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.firstError()->code, ErrorReporter::kSchemaInvalid);
        CHECK_EQ(errorReporter.firstError()->message, "Schema reference '#/$defs/Ghost' does not resolve.");
    }

    SUBCASE("dialect member is accepted") {
        CHECK(validator.compile(R"({"$schema": "https://json-schema.org/draft/2020-12/schema", "type": "integer"})",
                                &errorReporter));
        CHECK(validator.isCompiled());
        CHECK(errorReporter.ok());
    }
}

TEST_CASE("SchemaValidator validate") {
    ErrorReporter errorReporter(true);
    SchemaValidator validator;
    REQUIRE(validator.compile(R"({"$defs": {"Point": {"type": "object",
                                                      "properties": {"x": {"type": "number"}},
                                                      "required": ["x"], "additionalProperties": false}},
                                  "type": "object",
                                  "properties": {"at": {"$ref": "#/$defs/Point"}, "tag": {"enum": ["A", "B"]}},
                                  "required": ["at", "tag"], "additionalProperties": false})",
                              &errorReporter));

    SUBCASE("passes") {
        auto document = parse(R"({"at": {"x": 1.5}, "tag": "B"})");
        CHECK(validator.validate(document, &errorReporter));
        CHECK(errorReporter.ok());
    }

    SUBCASE("missing required member") {
        auto document = parse(R"({"at": {"x": 1.5}})");
        CHECK(!validator.validate(document, &errorReporter));
        auto error = errorReporter.firstError();
        REQUIRE(error);
        CHECK_EQ(error->code, ErrorReporter::kValidationFailed);
        REQUIRE_EQ(error->issues.size(), 1);
        CHECK_EQ(error->issues[0].keyword, "required");
        CHECK_EQ(error->issues[0].instancePointer, "#");
    }

    SUBCASE("nested through reference") {
        auto document = parse(R"({"at": {"x": "left"}, "tag": "A"})");
        CHECK(!validator.validate(document, &errorReporter));
        auto error = errorReporter.firstError();
        REQUIRE(error);
        REQUIRE_EQ(error->issues.size(), 1);
        CHECK_EQ(error->issues[0].keyword, "type");
        CHECK_EQ(error->issues[0].instancePointer, "#/at/x");
    }

    SUBCASE("enum") {
        auto document = parse(R"({"at": {"x": 0}, "tag": "C"})");
        CHECK(!validator.validate(document, &errorReporter));
        REQUIRE(errorReporter.firstError());
        CHECK_EQ(errorReporter.firstError()->issues[0].keyword, "enum");
        CHECK_EQ(errorReporter.firstError()->issues[0].instancePointer, "#/tag");
    }

    SUBCASE("reusable across calls") {
        auto bad = parse(R"({"at": {"x": 0}, "tag": "C", "extra": true})");
        CHECK(!validator.validate(bad, &errorReporter));
        auto good = parse(R"({"at": {"x": 0}, "tag": "A"})");
        CHECK(validator.validate(good, &errorReporter));
        CHECK_EQ(errorReporter.errorCount(), 1);
    }
}

TEST_CASE("SchemaValidator script path references") {
    ErrorReporter errorReporter(true);
    SchemaValidator validator;
    REQUIRE(validator.compile(R"({"$defs": {"res://node.gd": {"type": "object",
                                                              "properties": {
                                                                  "children": {"type": "array",
                                                                               "items": {"$ref": "#/$defs/res:~1~1node.gd"}},
                                                                  "weight": {"type": "integer"}},
                                                              "required": ["children", "weight"],
                                                              "additionalProperties": false}},
                                  "type": "object",
                                  "properties": {"head": {"$ref": "#/$defs/res:~1~1node.gd"}},
                                  "required": ["head"]})",
                              &errorReporter));
    CHECK(errorReporter.ok());

    auto good = parse(R"({"head": {"children": [{"children": [], "weight": 2}], "weight": 1}})");
    CHECK(validator.validate(good, &errorReporter));
    CHECK(errorReporter.ok());

    auto bad = parse(R"({"head": {"children": [{"children": [], "weight": "heavy"}], "weight": 1}})");
    CHECK(!validator.validate(bad, &errorReporter));
    REQUIRE(errorReporter.firstError());
    CHECK_EQ(errorReporter.firstError()->code, ErrorReporter::kValidationFailed);
    CHECK_EQ(errorReporter.firstError()->issues[0].keyword, "type");
    CHECK_EQ(errorReporter.firstError()->issues[0].instancePointer, "#/head/children/0/weight");
}

} // namespace loom
