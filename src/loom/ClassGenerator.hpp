#ifndef SRC_LOOM_CLASS_GENERATOR_HPP_
#define SRC_LOOM_CLASS_GENERATOR_HPP_

#include "loom/ClassSource.hpp"
#include "loom/def/ClassDefinition.hpp"
#include "loom/Instantiator.hpp"
#include "loom/Type.hpp"
#include "loom/TypeResolver.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace loom {

class Definitions;
class ErrorReporter;
class Host;

// Builds class definitions from the host's reflective property lists. One generator may serve many generations. Besides
// its configuration it keeps the self-reference flags of the last top-level generation, for RootSchema to query.
class ClassGenerator {
public:
    ClassGenerator() = delete;
    ClassGenerator(Host* host, std::shared_ptr<ErrorReporter> errorReporter);
    ~ClassGenerator() = default;

    void setMaxDepth(size_t maxDepth) { m_maxDepth = maxDepth; }
    size_t maxDepth() const { return m_maxDepth; }

    // Script classes carry bookkeeping properties the host adds, identified by name suffix. Defaults to ".gd".
    void setExcludedPropertySuffixes(std::vector<std::string> suffixes) { m_excludedSuffixes = std::move(suffixes); }

    // Builds the definition of |source|, registering every class and enum it depends on in |defs|. Returns nullptr
    // if any property fails to resolve, in which case |defs| may hold some dependencies and should be discarded.
    std::shared_ptr<const def::ClassDefinition> generate(const ClassSource& source, Definitions& defs);

    // Returns a reference to |source|. Generates and registers the class first, unless it is already in |defs| or is
    // still being generated further up the stack, which is how cyclic class graphs close.
    std::optional<Type> referenceClass(const ClassSource& source, Definitions& defs);

    // Resolves one property descriptor outside of any class.
    std::optional<Type> resolveProperty(const PropertyInfo& property, Definitions& defs);

    // Looks up a class by name, reporting kClassNotFound if the host has none.
    std::optional<ClassSource> findClass(std::string_view className);

    // True if the class named |name| was referred to from within its own generation. Reset by each top-level
    // generate().
    bool isSelfReferenced(const std::string& name) const { return m_selfReferenced.count(name) > 0; }

    Host* host() const { return m_host; }
    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    bool isExcluded(const ClassSource& source, const PropertyInfo& property) const;

    Host* m_host;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    TypeResolver m_typeResolver;
    std::unordered_set<std::string> m_inProgress;
    std::unordered_set<std::string> m_selfReferenced;
    size_t m_depth;
    size_t m_maxDepth;
    std::vector<std::string> m_excludedSuffixes;
};

} // namespace loom

#endif // SRC_LOOM_CLASS_GENERATOR_HPP_
