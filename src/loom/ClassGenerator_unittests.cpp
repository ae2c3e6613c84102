#include "loom/ClassGenerator.hpp"

#include "loom/Definitions.hpp"
#include "loom/HostTestFixture.hpp"
#include "loom/RootSchema.hpp"

#include "doctest/doctest.h"

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person",
     "description": "Someone with a name.",
     "properties": [
         {"name": "name", "type": "String"},
         {"name": "age", "type": "int"},
         {"name": "gender", "type": "int", "className": "Person.Gender", "usage": ["STORAGE", "CLASS_IS_ENUM"]}
     ],
     "enums": {"Gender": {"MALE": 0, "FEMALE": 1}}},
    {"name": "Team",
     "properties": [
         {"name": "lead", "type": "Object", "className": "Person"},
         {"name": "members", "type": "Array", "hint": "ARRAY_TYPE", "hintString": "Person"}
     ]},
    {"name": "Node",
     "properties": [
         {"name": "children", "type": "Array", "hint": "ARRAY_TYPE", "hintString": "Node"}
     ]},
    {"name": "Left", "properties": [{"name": "right", "type": "Object", "className": "Right"}]},
    {"name": "Right", "properties": [{"name": "left", "type": "Object", "className": "Left"}]},
    {"name": "Broken",
     "properties": [
         {"name": "fine", "type": "int"},
         {"name": "friend", "type": "Object", "className": "Ghost"}
     ]},
    {"name": "Tagged", "properties": [{"name": "tag.gd", "type": "String"}]},
    {"script": "res://enemy.gd",
     "properties": [{"name": "health", "type": "int"}, {"name": "helper.gd", "type": "String"}]},
    {"name": "Outer", "properties": [{"name": "middle", "type": "Object", "className": "Middle"}]},
    {"name": "Middle", "properties": [{"name": "inner", "type": "Object", "className": "Inner"}]},
    {"name": "Inner", "properties": [{"name": "value", "type": "int"}]}
]})";
} // namespace

namespace loom {

class ClassGeneratorTestFixture : public HostTestFixture {
public:
    ClassGeneratorTestFixture() { REQUIRE(scan(kManifest)); }

protected:
    std::vector<std::string> propertyNames(const def::ClassDefinition* classDefinition) {
        std::vector<std::string> names;
        for (const auto& property : classDefinition->properties) {
            names.emplace_back(property.first);
        }
        return names;
    }
};

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "ClassGenerator declaration order") {
    ClassGenerator generator(classLibrary(), errorReporter());
    Definitions defs;
    auto person = generator.generate(*classLibrary()->findClass("Person"), defs);
    REQUIRE(person);
    CHECK(errorReporter()->ok());
    CHECK_EQ(person->name(), "Person");
    REQUIRE(person->description);
    CHECK_EQ(*person->description, "Someone with a name.");
    CHECK_EQ(propertyNames(person.get()), std::vector<std::string>({"name", "age", "gender"}));
    CHECK(person->properties[2].second.isReference());
    CHECK_EQ(defs.size(), 1);
    CHECK(defs.contains("Person.Gender"));
}

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "ClassGenerator nested classes") {
    SUBCASE("shared classes are registered once") {
        auto schema = generate("Team");
        REQUIRE(schema);
        CHECK_EQ(schema->defs().size(), 2);
        CHECK(schema->defs().contains("Person"));
        CHECK(schema->defs().contains("Person.Gender"));
        CHECK(!schema->defs().contains("Team"));
    }
    SUBCASE("nesting within the depth limit") {
        ClassGenerator generator(classLibrary(), errorReporter());
        generator.setMaxDepth(3);
        auto schema = RootSchema::fromClass(&generator, *classLibrary()->findClass("Outer"));
        REQUIRE(schema);
        CHECK(schema->defs().contains("Middle"));
        CHECK(schema->defs().contains("Inner"));
    }
    SUBCASE("nesting past the depth limit") {
        ClassGenerator generator(classLibrary(), errorReporter());
        generator.setMaxDepth(2);
        CHECK(!RootSchema::fromClass(&generator, *classLibrary()->findClass("Outer")));
        CHECK(errorReporter()->hasError(ErrorReporter::kDepthLimitExceeded));
    }
}

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "ClassGenerator cycles") {
    SUBCASE("self reference registers the root") {
        auto schema = generate("Node");
        REQUIRE(schema);
        CHECK(errorReporter()->ok());
        REQUIRE_EQ(schema->defs().size(), 1);
        CHECK_EQ(schema->defs().find("Node"), schema->base());
        CHECK(schema->checkReferences(errorReporter().get()));
    }
    SUBCASE("mutual reference") {
        auto schema = generate("Left");
        REQUIRE(schema);
        CHECK_EQ(schema->defs().size(), 2);
        CHECK(schema->defs().contains("Left"));
        CHECK(schema->defs().contains("Right"));
        CHECK(schema->checkReferences(errorReporter().get()));
    }
    SUBCASE("acyclic root stays out of the table") {
        auto schema = generate("Person");
        REQUIRE(schema);
        CHECK(!schema->defs().contains("Person"));
    }
    SUBCASE("self reference flags reset between generations") {
        ClassGenerator generator(classLibrary(), errorReporter());
        auto left = RootSchema::fromClass(&generator, *classLibrary()->findClass("Left"));
        REQUIRE(left);
        CHECK(generator.isSelfReferenced("Left"));

        auto person = RootSchema::fromClass(&generator, *classLibrary()->findClass("Person"));
        REQUIRE(person);
        CHECK(!generator.isSelfReferenced("Left"));
        CHECK(!person->defs().contains("Person"));

        auto right = RootSchema::fromClass(&generator, *classLibrary()->findClass("Right"));
        REQUIRE(right);
        CHECK(generator.isSelfReferenced("Right"));
        CHECK(!generator.isSelfReferenced("Left"));
    }
}

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "ClassGenerator failures") {
    SUBCASE("no partial class") {
        ClassGenerator generator(classLibrary(), errorReporter());
        Definitions defs;
        CHECK(!generator.generate(*classLibrary()->findClass("Broken"), defs));
        CHECK(errorReporter()->hasError(ErrorReporter::kClassNotFound));
        CHECK(!generate("Broken"));
    }
    SUBCASE("unknown class") {
        ClassGenerator generator(classLibrary(), errorReporter());
        Definitions defs;
        ClassSource source(ClassSource::kEngine, ClassId::named("Ghost"));
        CHECK(!generator.generate(source, defs));
        CHECK(errorReporter()->hasError(ErrorReporter::kHostReflectionFailed));
    }
}

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "ClassGenerator script properties") {
    SUBCASE("script bookkeeping is excluded") {
        auto source = classLibrary()->findScript("res://enemy.gd");
        REQUIRE(source);
        ClassGenerator generator(classLibrary(), errorReporter());
        Definitions defs;
        auto enemy = generator.generate(*source, defs);
        REQUIRE(enemy);
        CHECK_EQ(enemy->name(), "res://enemy.gd");
        CHECK_EQ(propertyNames(enemy.get()), std::vector<std::string>({"health"}));
    }
    SUBCASE("custom suffixes") {
        auto source = classLibrary()->findScript("res://enemy.gd");
        REQUIRE(source);
        ClassGenerator generator(classLibrary(), errorReporter());
        generator.setExcludedPropertySuffixes({"enemy.gd"});
        Definitions defs;
        auto enemy = generator.generate(*source, defs);
        REQUIRE(enemy);
        CHECK_EQ(propertyNames(enemy.get()), std::vector<std::string>({"health", "helper.gd"}));
    }
    SUBCASE("engine classes keep every property") {
        auto schema = generate("Tagged");
        REQUIRE(schema);
        auto tagged = static_cast<const def::ClassDefinition*>(schema->base());
        CHECK_EQ(propertyNames(tagged), std::vector<std::string>({"tag.gd"}));
    }
}

TEST_CASE_FIXTURE(ClassGeneratorTestFixture, "RootSchema from type info") {
    ClassGenerator generator(classLibrary(), errorReporter());

    SUBCASE("scalars are wrapped") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kInt;
        auto schema = RootSchema::fromTypeInfo(&generator, property);
        REQUIRE(schema);
        CHECK(schema->isWrapped());
        CHECK(schema->defs().empty());
    }
    SUBCASE("a class base is taken out of the table") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kObject;
        property.className = "Person";
        auto schema = RootSchema::fromTypeInfo(&generator, property);
        REQUIRE(schema);
        CHECK(!schema->isWrapped());
        CHECK_EQ(schema->base()->kind, def::kClass);
        CHECK(!schema->defs().contains("Person"));
        CHECK(schema->defs().contains("Person.Gender"));
    }
    SUBCASE("a cyclic class base stays in the table") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kObject;
        property.className = "Node";
        auto schema = RootSchema::fromTypeInfo(&generator, property);
        REQUIRE(schema);
        CHECK(schema->defs().contains("Node"));
        CHECK(schema->checkReferences(errorReporter().get()));
    }
    SUBCASE("an enum base is wrapped") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kInt;
        property.className = "Person.Gender";
        property.usage |= kUsageClassIsEnum;
        auto schema = RootSchema::fromTypeInfo(&generator, property);
        REQUIRE(schema);
        CHECK(schema->isWrapped());
        CHECK_EQ(schema->base()->kind, def::kEnum);
        CHECK(schema->defs().empty());
    }
    SUBCASE("array schema registers the item") {
        auto schema = generate("Person");
        REQUIRE(schema);
        auto arraySchema = schema->arraySchema("Person");
        REQUIRE(arraySchema);
        CHECK_EQ(arraySchema->base()->kind, def::kArray);
        CHECK(arraySchema->isWrapped());
        CHECK(arraySchema->defs().contains("Person"));
        CHECK(arraySchema->defs().contains("Person.Gender"));
        CHECK(arraySchema->checkReferences(errorReporter().get()));
    }
}

} // namespace loom
