#include "loom/Type.hpp"

#include "loom/def/IntegerDefinition.hpp"
#include "loom/def/StringDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace loom {

TEST_CASE("Type definition pointers") {
    CHECK_EQ(definitionPointer("Person"), "#/$defs/Person");
    CHECK_EQ(definitionPointer("Person.Gender"), "#/$defs/Person.Gender");
    CHECK_EQ(definitionPointer("res://enemy.gd"), "#/$defs/res:~1~1enemy.gd");
    CHECK_EQ(definitionPointer("a~b"), "#/$defs/a~0b");
}

TEST_CASE("Type resolution") {
    ErrorReporter er(true);
    Definitions defs;
    auto string = std::make_shared<const def::StringDefinition>();
    defs.insert("Name", string);

    SUBCASE("inline definitions resolve to themselves") {
        auto integer = std::make_shared<const def::IntegerDefinition>();
        auto type = Type::inlined(integer);
        CHECK(!type.isReference());
        CHECK_EQ(type.resolve(defs, &er), integer.get());
        CHECK(er.ok());
    }
    SUBCASE("references resolve through the table") {
        auto type = Type::reference("Name");
        CHECK(type.isReference());
        CHECK_EQ(type.referenceName(), "Name");
        CHECK_EQ(type.resolve(defs, &er), string.get());
        CHECK(er.ok());
    }
    SUBCASE("dangling references are reported") {
        auto type = Type::reference("Ghost");
        CHECK(type.resolve(defs, &er) == nullptr);
        CHECK(er.hasError(ErrorReporter::kDanglingReference));
    }
}

TEST_CASE("Definitions table") {
    Definitions defs;
    CHECK(defs.empty());
    defs.insert("b", std::make_shared<const def::StringDefinition>());
    defs.insert("a", std::make_shared<const def::IntegerDefinition>());
    REQUIRE_EQ(defs.size(), 2);
    CHECK_EQ(defs.begin()->first, "a");
    CHECK(defs.contains("b"));
    CHECK(defs.find("c") == nullptr);
    REQUIRE(defs.find("a"));
    CHECK_EQ(defs.find("a")->kind, def::kInteger);

    auto taken = defs.take("b");
    REQUIRE(taken);
    CHECK_EQ(taken->kind, def::kString);
    CHECK(!defs.contains("b"));
    CHECK(defs.take("b") == nullptr);
}

} // namespace loom
