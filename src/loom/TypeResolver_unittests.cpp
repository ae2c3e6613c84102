#include "loom/TypeResolver.hpp"

#include "loom/ClassGenerator.hpp"
#include "loom/def/ArrayDefinition.hpp"
#include "loom/def/BuiltinDefinition.hpp"
#include "loom/def/EnumDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/HostTestFixture.hpp"

#include "doctest/doctest.h"

#include <optional>

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person",
     "properties": [
         {"name": "name", "type": "String"},
         {"name": "age", "type": "int"}
     ],
     "enums": {"Gender": {"MALE": 0, "FEMALE": 1}, "Empty": {}}}
]})";
} // namespace

namespace loom {

class TypeResolverTestFixture : public HostTestFixture {
public:
    TypeResolverTestFixture() { REQUIRE(scan(kManifest)); }

protected:
    std::optional<Type> resolve(PropertyInfo property) {
        ClassGenerator generator(classLibrary(), errorReporter());
        return generator.resolveProperty(property, m_defs);
    }

    PropertyInfo property(VariantKind kind, std::string className = std::string()) {
        PropertyInfo info;
        info.name = "value";
        info.kind = kind;
        info.className = className;
        return info;
    }

    PropertyInfo arrayOf(std::string hintString) {
        auto info = property(VariantKind::kArray);
        info.hint = PropertyHint::kArrayType;
        info.hintString = hintString;
        return info;
    }

    PropertyInfo enumProperty(std::string enumPath) {
        auto info = property(VariantKind::kInt, enumPath);
        info.usage |= kUsageClassIsEnum;
        return info;
    }

    const def::Definition* items(const Type& type) {
        REQUIRE(!type.isReference());
        REQUIRE_EQ(type.definition()->kind, def::kArray);
        auto array = static_cast<const def::ArrayDefinition*>(type.definition());
        if (!array->items) {
            return nullptr;
        }
        return array->items->resolve(m_defs, errorReporter().get());
    }

    Definitions m_defs;
};

TEST_CASE_FIXTURE(TypeResolverTestFixture, "TypeResolver kinds") {
    SUBCASE("scalars") {
        CHECK_EQ(resolve(property(VariantKind::kBool))->definition()->kind, def::kBoolean);
        CHECK_EQ(resolve(property(VariantKind::kInt))->definition()->kind, def::kInteger);
        CHECK_EQ(resolve(property(VariantKind::kFloat))->definition()->kind, def::kNumber);
        CHECK_EQ(resolve(property(VariantKind::kString))->definition()->kind, def::kString);
        CHECK_EQ(resolve(property(VariantKind::kStringName))->definition()->kind, def::kString);
        CHECK_EQ(resolve(property(VariantKind::kNodePath))->definition()->kind, def::kString);
        CHECK_EQ(resolve(property(VariantKind::kDictionary))->definition()->kind, def::kObject);
        CHECK(errorReporter()->ok());
        CHECK(m_defs.empty());
    }
    SUBCASE("builtins") {
        auto type = resolve(property(VariantKind::kTransform3D));
        REQUIRE(type);
        REQUIRE_EQ(type->definition()->kind, def::kBuiltin);
        CHECK_EQ(static_cast<const def::BuiltinDefinition*>(type->definition())->builtinType,
                 BuiltinType::kTransform3D);
        // Catalog types are emitted by the serializer, not registered during resolution.
        CHECK(m_defs.empty());
    }
    SUBCASE("unsupported kind") {
        CHECK(!resolve(property(VariantKind::kCallable)));
        CHECK(errorReporter()->hasError(ErrorReporter::kUnsupportedKind));
    }
}

TEST_CASE_FIXTURE(TypeResolverTestFixture, "TypeResolver objects") {
    SUBCASE("class name resolves to a reference") {
        auto type = resolve(property(VariantKind::kObject, "Person"));
        REQUIRE(type);
        CHECK(type->isReference());
        CHECK_EQ(type->referenceName(), "Person");
        REQUIRE(m_defs.find("Person"));
        CHECK_EQ(m_defs.find("Person")->kind, def::kClass);
    }
    SUBCASE("missing class") {
        CHECK(!resolve(property(VariantKind::kObject, "Ghost")));
        CHECK(errorReporter()->hasError(ErrorReporter::kClassNotFound));
    }
    SUBCASE("object without class falls back to the hint") {
        auto info = property(VariantKind::kObject);
        info.hintString = "Person";
        auto type = resolve(info);
        REQUIRE(type);
        CHECK_EQ(type->referenceName(), "Person");
    }
}

TEST_CASE_FIXTURE(TypeResolverTestFixture, "TypeResolver arrays") {
    SUBCASE("untyped") {
        auto type = resolve(property(VariantKind::kArray));
        REQUIRE(type);
        CHECK(items(*type) == nullptr);
    }
    SUBCASE("empty hint is a null placeholder") {
        auto type = resolve(arrayOf(""));
        REQUIRE(type);
        REQUIRE(items(*type));
        CHECK_EQ(items(*type)->kind, def::kNull);
    }
    SUBCASE("primitive spellings") {
        CHECK_EQ(items(*resolve(arrayOf("int")))->kind, def::kInteger);
        CHECK_EQ(items(*resolve(arrayOf("float")))->kind, def::kNumber);
        CHECK_EQ(items(*resolve(arrayOf("bool")))->kind, def::kBoolean);
        CHECK_EQ(items(*resolve(arrayOf("String")))->kind, def::kString);
        CHECK_EQ(items(*resolve(arrayOf("Vector2")))->kind, def::kBuiltin);
        CHECK_EQ(items(*resolve(arrayOf("Color")))->kind, def::kBuiltin);
    }
    SUBCASE("class items") {
        auto type = resolve(arrayOf("Person"));
        REQUIRE(type);
        REQUIRE(items(*type));
        CHECK_EQ(items(*type)->kind, def::kClass);
        CHECK(m_defs.contains("Person"));
    }
    SUBCASE("enum items") {
        auto type = resolve(arrayOf("Person.Gender"));
        REQUIRE(type);
        REQUIRE(items(*type));
        CHECK_EQ(items(*type)->kind, def::kEnum);
    }
    SUBCASE("unknown spelling") {
        CHECK(!resolve(arrayOf("Sprocket")));
        CHECK(errorReporter()->hasError(ErrorReporter::kUnsupportedHint));
    }
}

TEST_CASE_FIXTURE(TypeResolverTestFixture, "TypeResolver enums") {
    SUBCASE("registered under the full path") {
        auto type = resolve(enumProperty("Person.Gender"));
        REQUIRE(type);
        CHECK_EQ(type->referenceName(), "Person.Gender");
        auto definition = m_defs.find("Person.Gender");
        REQUIRE(definition);
        REQUIRE_EQ(definition->kind, def::kEnum);
        const auto& variants = static_cast<const def::EnumDefinition*>(definition)->variants;
        REQUIRE_EQ(variants.size(), 2);
        CHECK_EQ(variants[0].first, "MALE");
        CHECK_EQ(variants[0].second, 0);
        CHECK_EQ(variants[1].first, "FEMALE");
        CHECK_EQ(variants[1].second, 1);
        CHECK(!m_defs.contains("Person"));
    }
    SUBCASE("malformed paths") {
        CHECK(!resolve(enumProperty("PersonGender")));
        CHECK(!resolve(enumProperty(".Gender")));
        CHECK(!resolve(enumProperty("Person.")));
        CHECK(!resolve(enumProperty("Person.Gender.Extra")));
        CHECK_EQ(errorReporter()->errorCount(), 4);
        for (const auto& error : errorReporter()->errors()) {
            CHECK_EQ(error.code, ErrorReporter::kEnumPathMalformed);
        }
    }
    SUBCASE("missing class") {
        CHECK(!resolve(enumProperty("Ghost.Gender")));
        CHECK(errorReporter()->hasError(ErrorReporter::kClassNotFound));
    }
    SUBCASE("missing or empty enum") {
        CHECK(!resolve(enumProperty("Person.Mood")));
        CHECK(!resolve(enumProperty("Person.Empty")));
        CHECK_EQ(errorReporter()->errorCount(), 2);
        CHECK(errorReporter()->hasError(ErrorReporter::kEnumNotFound));
    }
    SUBCASE("int without enum usage stays an integer") {
        auto type = resolve(property(VariantKind::kInt, "Person.Gender"));
        REQUIRE(type);
        CHECK_EQ(type->definition()->kind, def::kInteger);
    }
}

TEST_CASE("TypeResolver spellings") {
    CHECK(TypeResolver::definitionForSpelling("int"));
    CHECK(TypeResolver::definitionForSpelling("PackedInt32Array"));
    CHECK(TypeResolver::definitionForSpelling("Dictionary"));
    CHECK(!TypeResolver::definitionForSpelling("Integer"));
    CHECK(!TypeResolver::definitionForSpelling("Object"));
    CHECK(!TypeResolver::definitionForKind(VariantKind::kNil));
    CHECK(!TypeResolver::definitionForKind(VariantKind::kObject));
    CHECK(!TypeResolver::definitionForKind(VariantKind::kSignal));
}

} // namespace loom
