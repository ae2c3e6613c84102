#ifndef SRC_LOOM_DEF_DEFINITION_HPP_
#define SRC_LOOM_DEF_DEFINITION_HPP_

#include "loom/Value.hpp"

#include "rapidjson/fwd.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace loom {

class Instantiator;
class Type;

using JSONAllocator = rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>;

namespace def {

enum Kind {
    kNull,
    kBoolean,
    kInteger,
    kNumber,
    kString,
    kObject,
    kArray,
    kTuple,
    kEnum,
    kClass,
    kBuiltin
};

// A node of the schema graph. Definitions are immutable once built and shared between graphs, nested classes and
// enums are held by name in a Definitions table and reached through Type references, which keeps every Definition a
// finite tree even when the classes it describes are cyclic.
struct Definition {
    Definition() = delete;
    virtual ~Definition() = default;
    Kind kind;

    // Human-readable description, emitted as the "description" keyword.
    std::optional<std::string> description;

    // Sets |json| to a JSON Schema object for this definition, starting with the description if there is one.
    void encode(rapidjson::Value& json, JSONAllocator& allocator) const;

    // Adds the "type" keyword and any kind-specific keywords to |json|, which is already an object.
    virtual void encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const = 0;

    // Converts |json| into |value| following this definition. On failure reports the reason to the error reporter
    // of |instantiator| and returns false.
    virtual bool instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const = 0;

    // The native type instantiate() produces, recorded as the element type of typed arrays.
    virtual ValueType valueType() const = 0;

    // For definitions producing objects or builtins, the class or catalog name that typed arrays carry.
    virtual std::string valueClassName() const { return std::string(); }

    // Calls |visit| with each Type nested directly within this definition.
    virtual void forEachType(const std::function<void(const Type&)>& /* visit */) const {}

protected:
    explicit Definition(Kind k): kind(k) {}
    Definition(Kind k, std::optional<std::string> d): kind(k), description(std::move(d)) {}
};

} // namespace def

using DefinitionPtr = std::shared_ptr<const def::Definition>;

} // namespace loom

#endif // SRC_LOOM_DEF_DEFINITION_HPP_
