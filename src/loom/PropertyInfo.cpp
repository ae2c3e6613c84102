#include "loom/PropertyInfo.hpp"

#include <array>
#include <utility>

namespace loom {

namespace {

constexpr std::array<std::pair<VariantKind, std::string_view>, 39> kVariantKindNames = {{
    {VariantKind::kNil, "Nil"},
    {VariantKind::kBool, "bool"},
    {VariantKind::kInt, "int"},
    {VariantKind::kFloat, "float"},
    {VariantKind::kString, "String"},
    {VariantKind::kVector2, "Vector2"},
    {VariantKind::kVector2i, "Vector2i"},
    {VariantKind::kRect2, "Rect2"},
    {VariantKind::kRect2i, "Rect2i"},
    {VariantKind::kVector3, "Vector3"},
    {VariantKind::kVector3i, "Vector3i"},
    {VariantKind::kTransform2D, "Transform2D"},
    {VariantKind::kVector4, "Vector4"},
    {VariantKind::kVector4i, "Vector4i"},
    {VariantKind::kPlane, "Plane"},
    {VariantKind::kQuaternion, "Quaternion"},
    {VariantKind::kAABB, "AABB"},
    {VariantKind::kBasis, "Basis"},
    {VariantKind::kTransform3D, "Transform3D"},
    {VariantKind::kProjection, "Projection"},
    {VariantKind::kColor, "Color"},
    {VariantKind::kStringName, "StringName"},
    {VariantKind::kNodePath, "NodePath"},
    {VariantKind::kRID, "RID"},
    {VariantKind::kObject, "Object"},
    {VariantKind::kCallable, "Callable"},
    {VariantKind::kSignal, "Signal"},
    {VariantKind::kDictionary, "Dictionary"},
    {VariantKind::kArray, "Array"},
    {VariantKind::kPackedByteArray, "PackedByteArray"},
    {VariantKind::kPackedInt32Array, "PackedInt32Array"},
    {VariantKind::kPackedInt64Array, "PackedInt64Array"},
    {VariantKind::kPackedFloat32Array, "PackedFloat32Array"},
    {VariantKind::kPackedFloat64Array, "PackedFloat64Array"},
    {VariantKind::kPackedStringArray, "PackedStringArray"},
    {VariantKind::kPackedVector2Array, "PackedVector2Array"},
    {VariantKind::kPackedVector3Array, "PackedVector3Array"},
    {VariantKind::kPackedColorArray, "PackedColorArray"},
    {VariantKind::kPackedVector4Array, "PackedVector4Array"}
}};

} // namespace

std::string_view variantKindName(VariantKind kind) {
    for (const auto& entry : kVariantKindNames) {
        if (entry.first == kind) {
            return entry.second;
        }
    }
    return "Unknown";
}

std::optional<VariantKind> variantKindNamed(std::string_view name) {
    for (const auto& entry : kVariantKindNames) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<PropertyHint> propertyHintNamed(std::string_view name) {
    if (name == "NONE") {
        return PropertyHint::kNone;
    }
    if (name == "RANGE") {
        return PropertyHint::kRange;
    }
    if (name == "ENUM") {
        return PropertyHint::kEnum;
    }
    if (name == "RESOURCE_TYPE") {
        return PropertyHint::kResourceType;
    }
    if (name == "ARRAY_TYPE") {
        return PropertyHint::kArrayType;
    }
    return std::nullopt;
}

std::optional<PropertyUsage> propertyUsageNamed(std::string_view name) {
    if (name == "NONE") {
        return kUsageNone;
    }
    if (name == "STORAGE") {
        return kUsageStorage;
    }
    if (name == "EDITOR") {
        return kUsageEditor;
    }
    if (name == "SCRIPT_VARIABLE") {
        return kUsageScriptVariable;
    }
    if (name == "CLASS_IS_ENUM") {
        return kUsageClassIsEnum;
    }
    if (name == "DEFAULT") {
        return kUsageDefault;
    }
    return std::nullopt;
}

} // namespace loom
