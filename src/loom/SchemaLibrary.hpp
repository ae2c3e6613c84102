#ifndef SRC_LOOM_SCHEMA_LIBRARY_HPP_
#define SRC_LOOM_SCHEMA_LIBRARY_HPP_

#include "loom/ClassSource.hpp"
#include "loom/CompiledSchema.hpp"
#include "loom/Instantiator.hpp"
#include "loom/PropertyInfo.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace loom {

class ErrorReporter;
class Host;

// Generates and caches compiled schemas for host classes, keyed by class identity. Generation runs under the
// library's lock, cached schemas are immutable and may be used concurrently.
class SchemaLibrary {
public:
    SchemaLibrary() = delete;
    explicit SchemaLibrary(Host* host);
    ~SchemaLibrary() = default;

    void setMaxDepth(size_t maxDepth);

    // Generates the schema for the class registered as |className|, replacing any cached one. Returns nullptr on
    // failure, in which case the cache is unchanged.
    std::shared_ptr<const CompiledSchema> generateNamedClassSchema(std::string_view className,
                                                                   std::shared_ptr<ErrorReporter> errorReporter);
    std::shared_ptr<const CompiledSchema> generateClassSchema(const ClassSource& source,
                                                              std::shared_ptr<ErrorReporter> errorReporter);

    // Generates an uncached schema for one property descriptor.
    std::shared_ptr<const CompiledSchema> generateTypeInfoSchema(const PropertyInfo& property,
                                                                 std::shared_ptr<ErrorReporter> errorReporter);

    // Returns the cached schema, or nullptr if there is none.
    std::shared_ptr<const CompiledSchema> findClassSchema(const ClassId& id) const;

    // Returns the cached schema for |source|, generating it on a miss.
    std::shared_ptr<const CompiledSchema> classSchema(const ClassSource& source,
                                                      std::shared_ptr<ErrorReporter> errorReporter);

    size_t size() const;
    void clear();

private:
    std::shared_ptr<const CompiledSchema> generateLocked(const ClassSource& source,
                                                         std::shared_ptr<ErrorReporter> errorReporter);

    Host* m_host;
    size_t m_maxDepth;
    mutable std::mutex m_mutex;
    std::unordered_map<ClassId, std::shared_ptr<const CompiledSchema>> m_schemas;
};

} // namespace loom

#endif // SRC_LOOM_SCHEMA_LIBRARY_HPP_
