#include "loom/ClassLibrary.hpp"

#include "loom/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace loom {

TEST_CASE("ClassLibrary scanning") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    ClassLibrary classLibrary(errorReporter);

    SUBCASE("named and script classes") {
        REQUIRE(classLibrary.scanString(R"({"classes": [
            {"name": "Person", "description": "Someone.", "properties": [
                {"name": "name", "type": "String"},
                {"name": "tags", "type": "Array", "hint": "ARRAY_TYPE", "hintString": "String"},
                {"name": "mood", "type": "int", "className": "Person.Mood", "usage": 65538}
            ], "enums": {"Mood": {"HAPPY": 3, "SAD": 7}}},
            {"name": "Enemy", "script": "res://enemy.gd", "properties": [{"name": "health", "type": "int"}]},
            {"script": "res://helper.gd"}
        ]})", "test"));
        CHECK(errorReporter->ok());
        CHECK_EQ(classLibrary.numberOfClasses(), 3);

        auto person = classLibrary.findClass("Person");
        REQUIRE(person);
        CHECK_EQ(person->origin, ClassSource::kEngine);
        CHECK_EQ(classLibrary.classDescription(*person), std::optional<std::string>("Someone."));

        std::vector<PropertyInfo> properties;
        REQUIRE(classLibrary.propertyList(*person, properties));
        REQUIRE_EQ(properties.size(), 3);
        CHECK_EQ(properties[1].hint, PropertyHint::kArrayType);
        CHECK_EQ(properties[1].hintString, "String");
        CHECK(properties[2].hasUsage(kUsageClassIsEnum));
        CHECK(properties[2].hasUsage(kUsageStorage));

        def::EnumVariants variants;
        REQUIRE(classLibrary.enumVariants(*person, "Mood", variants));
        REQUIRE_EQ(variants.size(), 2);
        CHECK_EQ(variants[1].first, "SAD");
        CHECK_EQ(variants[1].second, 7);
        CHECK(!classLibrary.enumVariants(*person, "Gender", variants));

        auto enemy = classLibrary.findClass("Enemy");
        REQUIRE(enemy);
        CHECK_EQ(enemy->origin, ClassSource::kScript);
        CHECK_EQ(enemy->location, "res://enemy.gd");
        properties.clear();
        REQUIRE(classLibrary.propertyList(*enemy, properties));
        REQUIRE_EQ(properties.size(), 2);
        CHECK_EQ(properties[0].name, "enemy.gd");
        CHECK_EQ(properties[1].name, "health");

        auto helper = classLibrary.findScript("res://helper.gd");
        REQUIRE(helper);
        CHECK(!helper->id.isNamed());
        CHECK(!classLibrary.findClass("res://helper.gd"));
    }
    SUBCASE("malformed JSON") {
        CHECK(!classLibrary.scanString("{\"classes\": [", "test"));
        CHECK(errorReporter->hasError(ErrorReporter::kJSONParseError));
    }
    SUBCASE("malformed manifests") {
        CHECK(!classLibrary.scanString(R"({"types": []})", "test"));
        CHECK(!classLibrary.scanString(R"({"classes": [{"properties": []}]})", "test"));
        CHECK(!classLibrary.scanString(R"({"classes": [{"name": "A", "properties": [{"name": "x"}]}]})", "test"));
        CHECK(!classLibrary.scanString(
                R"({"classes": [{"name": "A", "properties": [{"name": "x", "type": "Integer"}]}]})", "test"));
        CHECK(!classLibrary.scanString(
                R"({"classes": [{"name": "A", "properties": [{"name": "x", "type": "int", "hint": "FANCY"}]}]})",
                "test"));
        CHECK(!classLibrary.scanString(
                R"({"classes": [{"name": "A", "properties": [{"name": "x", "type": "int", "usage": ["LOUD"]}]}]})",
                "test"));
        CHECK(!classLibrary.scanString(R"({"classes": [{"name": "A", "enums": {"E": {"X": "one"}}}]})", "test"));
        CHECK_EQ(errorReporter->errorCount(), 7);
        for (const auto& error : errorReporter->errors()) {
            CHECK_EQ(error.code, ErrorReporter::kManifestInvalid);
        }
        CHECK_EQ(classLibrary.numberOfClasses(), 0);
    }
    SUBCASE("duplicate classes") {
        CHECK(!classLibrary.scanString(R"({"classes": [{"name": "A"}, {"name": "A"}]})", "test"));
        CHECK(errorReporter->hasError(ErrorReporter::kManifestInvalid));
        CHECK_EQ(classLibrary.numberOfClasses(), 1);
    }
    SUBCASE("missing file") {
        CHECK(!classLibrary.scanFile("no/such/manifest.json"));
        CHECK(errorReporter->hasError(ErrorReporter::kFileError));
    }
}

TEST_CASE("ClassLibrary instances") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    ClassLibrary classLibrary(errorReporter);
    REQUIRE(classLibrary.scanString(R"({"classes": [
        {"name": "Point", "properties": [{"name": "x", "type": "float"}, {"name": "y", "type": "float"}]},
        {"name": "Shape", "abstract": true}
    ]})", "test"));

    auto point = classLibrary.findClass("Point");
    REQUIRE(point);
    auto object = classLibrary.construct(*point);
    REQUIRE(object);
    CHECK_EQ(object->className(), "Point");

    auto instance = dynamic_cast<ClassLibrary::Instance*>(object.get());
    REQUIRE(instance);
    CHECK(instance->get("x")->isNil());
    CHECK(classLibrary.setProperty(object.get(), "x", Value::makeFloat(2.0)));
    CHECK_EQ(*instance->get("x"), Value::makeFloat(2.0));
    CHECK(!classLibrary.setProperty(object.get(), "z", Value::makeFloat(2.0)));
    CHECK(instance->get("z") == nullptr);

    auto shape = classLibrary.findClass("Shape");
    REQUIRE(shape);
    CHECK(classLibrary.construct(*shape) == nullptr);
}

} // namespace loom
