#ifndef SRC_LOOM_BUILTIN_CATALOG_HPP_
#define SRC_LOOM_BUILTIN_CATALOG_HPP_

#include "loom/PropertyInfo.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace loom {

namespace def {
struct Definition;
} // namespace def

// The host's built-in composite value types. These are emitted once each into "$defs" and referred to by name.
enum class BuiltinType : std::int32_t {
    kVector2,
    kVector2i,
    kRect2,
    kRect2i,
    kVector3,
    kVector3i,
    kTransform2D,
    kVector4,
    kVector4i,
    kPlane,
    kQuaternion,
    kAABB,
    kBasis,
    kTransform3D,
    kProjection,
    kColor,
    kRID,
    kPackedByteArray,
    kPackedInt32Array,
    kPackedInt64Array,
    kPackedFloat32Array,
    kPackedFloat64Array,
    kPackedStringArray,
    kPackedVector2Array,
    kPackedVector3Array,
    kPackedColorArray,
    kPackedVector4Array
};

// Canonical schema name, used as the "$defs" key.
std::string_view builtinName(BuiltinType type);
std::optional<BuiltinType> builtinNamed(std::string_view name);
std::optional<BuiltinType> builtinForKind(VariantKind kind);

// Catalog types named directly by the source definition of |type|.
const std::vector<BuiltinType>& builtinDependencies(BuiltinType type);

// The structural definition of |type|, used for its "$defs" entry and for instantiation. Built once, never null.
const def::Definition* builtinSourceDefinition(BuiltinType type);

// Appends |type| to |builtins|, then recursively its dependencies. May append duplicates.
void insertBuiltinDefinitions(BuiltinType type, std::vector<BuiltinType>& builtins);

} // namespace loom

#endif // SRC_LOOM_BUILTIN_CATALOG_HPP_
