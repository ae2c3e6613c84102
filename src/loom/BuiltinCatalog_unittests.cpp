#include "loom/BuiltinCatalog.hpp"

#include "loom/BuiltinClosure.hpp"
#include "loom/def/ArrayDefinition.hpp"
#include "loom/def/BuiltinDefinition.hpp"
#include "loom/def/ObjectDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/SchemaSerializer.hpp"
#include "loom/Type.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace loom {

namespace {
std::string encode(const def::Definition* definition) {
    SchemaSerializer serializer(std::make_shared<ErrorReporter>(true));
    REQUIRE(serializer.serializeDefinition(*definition, false));
    return std::string(serializer.json());
}
} // namespace

TEST_CASE("BuiltinCatalog names") {
    SUBCASE("name lookup is consistent") {
        for (std::int32_t i = 0; i <= static_cast<std::int32_t>(BuiltinType::kPackedVector4Array); ++i) {
            auto type = static_cast<BuiltinType>(i);
            auto named = builtinNamed(builtinName(type));
            REQUIRE(named);
            CHECK_EQ(*named, type);
            CHECK(builtinSourceDefinition(type) != nullptr);
        }
    }
    SUBCASE("spellings") {
        CHECK_EQ(builtinName(BuiltinType::kAABB), "AABB");
        CHECK_EQ(builtinName(BuiltinType::kRID), "RID");
        CHECK(!builtinNamed("Vector5"));
        CHECK(!builtinNamed("vector2"));
    }
    SUBCASE("kinds") {
        CHECK_EQ(*builtinForKind(VariantKind::kTransform3D), BuiltinType::kTransform3D);
        CHECK_EQ(*builtinForKind(VariantKind::kPackedColorArray), BuiltinType::kPackedColorArray);
        CHECK(!builtinForKind(VariantKind::kInt));
        CHECK(!builtinForKind(VariantKind::kObject));
    }
}

TEST_CASE("BuiltinCatalog source definitions") {
    SUBCASE("Vector2") {
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kVector2)),
                 "{\"type\":\"object\",\"properties\":{\"x\":{\"type\":\"number\"},\"y\":{\"type\":\"number\"}},"
                 "\"required\":[\"x\",\"y\"],\"additionalProperties\":false}");
    }
    SUBCASE("Rect2 refers to Vector2") {
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kRect2)),
                 "{\"type\":\"object\",\"properties\":{\"position\":{\"$ref\":\"#/$defs/Vector2\"},"
                 "\"size\":{\"$ref\":\"#/$defs/Vector2\"}},\"required\":[\"position\",\"size\"],"
                 "\"additionalProperties\":false}");
    }
    SUBCASE("Basis rows are a tuple") {
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kBasis)),
                 "{\"type\":\"object\",\"properties\":{\"rows\":{\"type\":\"array\",\"prefixItems\":["
                 "{\"$ref\":\"#/$defs/Vector3\"},{\"$ref\":\"#/$defs/Vector3\"},{\"$ref\":\"#/$defs/Vector3\"}]}},"
                 "\"required\":[\"rows\"],\"additionalProperties\":false}");
    }
    SUBCASE("RID is an integer") {
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kRID)), "{\"type\":\"integer\"}");
    }
    SUBCASE("packed arrays") {
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kPackedStringArray)),
                 "{\"type\":\"array\",\"items\":{\"type\":\"string\"}}");
        CHECK_EQ(encode(builtinSourceDefinition(BuiltinType::kPackedVector3Array)),
                 "{\"type\":\"array\",\"items\":{\"$ref\":\"#/$defs/Vector3\"}}");
    }
}

TEST_CASE("BuiltinCatalog dependencies") {
    SUBCASE("leaf types have none") {
        CHECK(builtinDependencies(BuiltinType::kVector3).empty());
        CHECK(builtinDependencies(BuiltinType::kColor).empty());
    }
    SUBCASE("insertion recurses and may duplicate") {
        std::vector<BuiltinType> builtins;
        insertBuiltinDefinitions(BuiltinType::kTransform3D, builtins);
        REQUIRE_EQ(builtins.size(), 4);
        CHECK_EQ(builtins[0], BuiltinType::kTransform3D);
        CHECK_EQ(builtins[1], BuiltinType::kVector3);
        CHECK_EQ(builtins[2], BuiltinType::kBasis);
        CHECK_EQ(builtins[3], BuiltinType::kVector3);
    }
}

TEST_CASE("BuiltinClosure") {
    SUBCASE("closure is sorted and unique") {
        def::Properties properties;
        properties.emplace_back("transform",
                Type::inlined(std::make_shared<const def::BuiltinDefinition>(BuiltinType::kTransform3D)));
        properties.emplace_back("position",
                Type::inlined(std::make_shared<const def::BuiltinDefinition>(BuiltinType::kVector3)));
        def::ObjectDefinition base(std::move(properties));
        Definitions defs;
        auto closure = builtinClosure(&base, defs);
        REQUIRE_EQ(closure.size(), 3);
        CHECK_EQ(closure[0], BuiltinType::kBasis);
        CHECK_EQ(closure[1], BuiltinType::kTransform3D);
        CHECK_EQ(closure[2], BuiltinType::kVector3);
    }
    SUBCASE("types nested in table entries are found") {
        def::ObjectDefinition base;
        Definitions defs;
        defs.insert("Path", std::make_shared<const def::ArrayDefinition>(
                Type::inlined(std::make_shared<const def::BuiltinDefinition>(BuiltinType::kColor))));
        auto closure = builtinClosure(&base, defs);
        REQUIRE_EQ(closure.size(), 1);
        CHECK_EQ(closure[0], BuiltinType::kColor);
    }
    SUBCASE("explicit entries take precedence") {
        def::ArrayDefinition base(
                Type::inlined(std::make_shared<const def::BuiltinDefinition>(BuiltinType::kRect2)));
        Definitions defs;
        defs.insert("Vector2", std::make_shared<const def::ObjectDefinition>());
        auto closure = builtinClosure(&base, defs);
        REQUIRE_EQ(closure.size(), 1);
        CHECK_EQ(closure[0], BuiltinType::kRect2);
    }
    SUBCASE("references are collected but not followed") {
        def::ArrayDefinition base(Type::reference("Person"));
        std::vector<std::string> names;
        collectReferences(&base, names);
        REQUIRE_EQ(names.size(), 1);
        CHECK_EQ(names[0], "Person");
        CHECK(builtinClosure(&base, Definitions()).empty());
    }
}

} // namespace loom
