#ifndef SRC_LOOM_INSTANTIATOR_HPP_
#define SRC_LOOM_INSTANTIATOR_HPP_

#include "loom/Value.hpp"

#include "rapidjson/fwd.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

namespace def {
struct Definition;
} // namespace def

class Definitions;
class ErrorReporter;
class Host;
class Type;

static constexpr size_t kDefaultMaxDepth = 64;

// Rebuilds native values from JSON, walking the JSON alongside a schema graph. Each definition kind converts its own
// JSON, this class carries the shared state of one conversion: the definitions table references resolve through,
// the host that constructs class instances, the error reporter and the nesting depth.
class Instantiator {
public:
    Instantiator() = delete;
    Instantiator(Host* host, const Definitions* defs, std::shared_ptr<ErrorReporter> errorReporter);
    ~Instantiator() = default;

    void setMaxDepth(size_t maxDepth) { m_maxDepth = maxDepth; }

    // Converts |json| to |value| as described by |definition|. Returns false on failure with the reason reported.
    bool instantiate(const rapidjson::Value& json, const def::Definition* definition, Value& value);
    // Resolves |type| through the definitions table, then converts as above.
    bool instantiate(const rapidjson::Value& json, const Type& type, Value& value);

    // Maps |json| by its own kind, for open dictionaries and untyped arrays. Integers that don't fit a signed 64-bit
    // integer are kIntegerOutOfRange.
    bool instantiateUntyped(const rapidjson::Value& json, Value& value);

    // Reports kTypeMismatch for |json| and returns false.
    bool typeMismatch(std::string_view expected, const rapidjson::Value& json);

    Host* host() const { return m_host; }
    const Definitions& defs() const { return *m_defs; }
    ErrorReporter* errorReporter() const { return m_errorReporter.get(); }

    // Compact JSON rendering of |json| for error messages, truncated when long.
    static std::string describe(const rapidjson::Value& json);

    // Builds an array from converted elements, typed when all elements share one type.
    static Value inferArray(std::vector<Value> elements);

private:
    Host* m_host;
    const Definitions* m_defs;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    size_t m_depth;
    size_t m_maxDepth;
};

} // namespace loom

#endif // SRC_LOOM_INSTANTIATOR_HPP_
