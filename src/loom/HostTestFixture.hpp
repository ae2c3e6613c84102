#ifndef SRC_LOOM_HOST_TEST_FIXTURE_HPP_
#define SRC_LOOM_HOST_TEST_FIXTURE_HPP_

#include "loom/ClassGenerator.hpp"
#include "loom/ClassLibrary.hpp"
#include "loom/CompiledSchema.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/RootSchema.hpp"
#include "loom/SchemaSerializer.hpp"

#include <memory>
#include <string>
#include <string_view>

// For consumption by unittests only, a test fixture that creates a manifest-backed host with a quiet error reporter.
namespace loom {

class HostTestFixture {
public:
    HostTestFixture():
        m_errorReporter(std::make_shared<ErrorReporter>(true)),
        m_classLibrary(std::make_unique<ClassLibrary>(m_errorReporter)) {}
    virtual ~HostTestFixture() = default;

protected:
    bool scan(std::string_view manifest) { return m_classLibrary->scanString(manifest, "test"); }

    std::unique_ptr<RootSchema> generate(std::string_view className) {
        auto source = m_classLibrary->findClass(className);
        if (!source) {
            return nullptr;
        }
        ClassGenerator generator(m_classLibrary.get(), m_errorReporter);
        return RootSchema::fromClass(&generator, *source);
    }

    std::shared_ptr<const CompiledSchema> compile(std::string_view className) {
        auto schema = generate(className);
        if (!schema) {
            return nullptr;
        }
        return CompiledSchema::compile(std::move(schema), m_errorReporter);
    }

    // Compact serialization of |schema|, or an empty string on failure.
    std::string serialize(const RootSchema& schema) {
        SchemaSerializer serializer(m_errorReporter);
        if (!serializer.serialize(schema, false)) {
            return std::string();
        }
        return std::string(serializer.json());
    }

    ClassLibrary* classLibrary() { return m_classLibrary.get(); }
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unique_ptr<ClassLibrary> m_classLibrary;
};

} // namespace loom

#endif // SRC_LOOM_HOST_TEST_FIXTURE_HPP_
