#ifndef SRC_LOOM_PROPERTY_INFO_HPP_
#define SRC_LOOM_PROPERTY_INFO_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace loom {

// Coarse value kinds as the host runtime reports them for a property. Numeric values match the host engine.
enum class VariantKind : std::int32_t {
    kNil = 0,
    kBool = 1,
    kInt = 2,
    kFloat = 3,
    kString = 4,
    kVector2 = 5,
    kVector2i = 6,
    kRect2 = 7,
    kRect2i = 8,
    kVector3 = 9,
    kVector3i = 10,
    kTransform2D = 11,
    kVector4 = 12,
    kVector4i = 13,
    kPlane = 14,
    kQuaternion = 15,
    kAABB = 16,
    kBasis = 17,
    kTransform3D = 18,
    kProjection = 19,
    kColor = 20,
    kStringName = 21,
    kNodePath = 22,
    kRID = 23,
    kObject = 24,
    kCallable = 25,
    kSignal = 26,
    kDictionary = 27,
    kArray = 28,
    kPackedByteArray = 29,
    kPackedInt32Array = 30,
    kPackedInt64Array = 31,
    kPackedFloat32Array = 32,
    kPackedFloat64Array = 33,
    kPackedStringArray = 34,
    kPackedVector2Array = 35,
    kPackedVector3Array = 36,
    kPackedColorArray = 37,
    kPackedVector4Array = 38
};

enum class PropertyHint : std::int32_t {
    kNone = 0,
    kRange = 1,
    kEnum = 2,
    kResourceType = 17,
    kArrayType = 31
};

// Property usage bit flags.
enum PropertyUsage : std::uint32_t {
    kUsageNone = 0,
    kUsageStorage = 1 << 1,
    kUsageEditor = 1 << 2,
    kUsageScriptVariable = 1 << 12,
    kUsageClassIsEnum = 1 << 16,
    kUsageDefault = kUsageStorage | kUsageEditor
};

// One entry of a class's reflective property list.
struct PropertyInfo {
    std::string name;
    VariantKind kind = VariantKind::kNil;
    // For kObject a class name, for enum-valued kInt an enum path "Class.Enum".
    std::string className;
    PropertyHint hint = PropertyHint::kNone;
    // For kArrayType the element type spelling.
    std::string hintString;
    std::uint32_t usage = kUsageDefault;

    bool hasUsage(PropertyUsage flag) const { return (usage & flag) != 0; }
};

std::string_view variantKindName(VariantKind kind);
std::optional<VariantKind> variantKindNamed(std::string_view name);
std::optional<PropertyHint> propertyHintNamed(std::string_view name);
std::optional<PropertyUsage> propertyUsageNamed(std::string_view name);

} // namespace loom

#endif // SRC_LOOM_PROPERTY_INFO_HPP_
