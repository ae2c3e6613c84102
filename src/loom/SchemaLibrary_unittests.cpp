#include "loom/SchemaLibrary.hpp"

#include "loom/HostTestFixture.hpp"

#include "doctest/doctest.h"

#include <thread>
#include <vector>

namespace {
const char* kManifest = R"({"classes": [
    {"name": "Person", "properties": [{"name": "name", "type": "String"}, {"name": "age", "type": "int"}]},
    {"name": "Broken", "properties": [{"name": "friend", "type": "Object", "className": "Ghost"}]},
    {"script": "res://person.gd", "properties": [{"name": "nickname", "type": "String"}]}
]})";
} // namespace

namespace loom {

class SchemaLibraryTestFixture : public HostTestFixture {
public:
    SchemaLibraryTestFixture(): m_schemaLibrary(classLibrary()) { REQUIRE(scan(kManifest)); }

protected:
    SchemaLibrary m_schemaLibrary;
};

TEST_CASE_FIXTURE(SchemaLibraryTestFixture, "SchemaLibrary caching") {
    SUBCASE("generation caches by identity") {
        auto schema = m_schemaLibrary.generateNamedClassSchema("Person", errorReporter());
        REQUIRE(schema);
        CHECK_EQ(m_schemaLibrary.size(), 1);
        CHECK_EQ(m_schemaLibrary.findClassSchema(ClassId::named("Person")), schema);
        CHECK(m_schemaLibrary.findClassSchema(ClassId::unnamed("Person")) == nullptr);

        auto source = classLibrary()->findClass("Person");
        REQUIRE(source);
        CHECK_EQ(m_schemaLibrary.classSchema(*source, errorReporter()), schema);

        auto regenerated = m_schemaLibrary.generateClassSchema(*source, errorReporter());
        REQUIRE(regenerated);
        CHECK_NE(regenerated, schema);
        CHECK_EQ(m_schemaLibrary.findClassSchema(ClassId::named("Person")), regenerated);
        CHECK_EQ(m_schemaLibrary.size(), 1);

        m_schemaLibrary.clear();
        CHECK_EQ(m_schemaLibrary.size(), 0);
    }
    SUBCASE("unnamed script classes") {
        auto source = classLibrary()->findScript("res://person.gd");
        REQUIRE(source);
        auto schema = m_schemaLibrary.classSchema(*source, errorReporter());
        REQUIRE(schema);
        CHECK_EQ(m_schemaLibrary.findClassSchema(ClassId::unnamed("res://person.gd")), schema);
        CHECK(m_schemaLibrary.findClassSchema(ClassId::named("res://person.gd")) == nullptr);
    }
    SUBCASE("failures are not cached") {
        CHECK(!m_schemaLibrary.generateNamedClassSchema("Broken", errorReporter()));
        CHECK(errorReporter()->hasError(ErrorReporter::kClassNotFound));
        CHECK_EQ(m_schemaLibrary.size(), 0);
        CHECK(!m_schemaLibrary.generateNamedClassSchema("Ghost", errorReporter()));
        CHECK_EQ(m_schemaLibrary.size(), 0);
    }
    SUBCASE("type info schemas are not cached") {
        PropertyInfo property;
        property.name = "value";
        property.kind = VariantKind::kObject;
        property.className = "Person";
        auto schema = m_schemaLibrary.generateTypeInfoSchema(property, errorReporter());
        REQUIRE(schema);
        CHECK(!schema->schema().isWrapped());
        CHECK_EQ(m_schemaLibrary.size(), 0);
    }
}

TEST_CASE_FIXTURE(SchemaLibraryTestFixture, "SchemaLibrary shared use") {
    auto source = classLibrary()->findClass("Person");
    REQUIRE(source);
    auto schema = m_schemaLibrary.classSchema(*source, errorReporter());
    REQUIRE(schema);

    constexpr int kNumberOfThreads = 4;
    std::vector<std::thread> threads;
    std::vector<int> results(kNumberOfThreads, 0);
    for (int i = 0; i < kNumberOfThreads; ++i) {
        threads.emplace_back([this, &source, &results, i]() {
            auto threadErrors = std::make_shared<ErrorReporter>(true);
            auto cached = m_schemaLibrary.classSchema(*source, threadErrors);
            Value value;
            results[i] = cached && cached->instantiate(R"({"name": "Ada", "age": 36})", classLibrary(), threadErrors,
                                                       value);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (auto result : results) {
        CHECK(result);
    }
    CHECK_EQ(m_schemaLibrary.size(), 1);
}

} // namespace loom
