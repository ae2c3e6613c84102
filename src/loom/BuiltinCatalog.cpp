#include "loom/BuiltinCatalog.hpp"

#include "loom/def/ArrayDefinition.hpp"
#include "loom/def/BuiltinDefinition.hpp"
#include "loom/def/IntegerDefinition.hpp"
#include "loom/def/NumberDefinition.hpp"
#include "loom/def/ObjectDefinition.hpp"
#include "loom/def/StringDefinition.hpp"
#include "loom/def/TupleDefinition.hpp"
#include "loom/Type.hpp"

#include <array>
#include <initializer_list>
#include <memory>

namespace loom {

namespace {

struct CatalogEntry {
    BuiltinType type;
    std::string_view name;
    VariantKind kind;
    std::vector<BuiltinType> dependencies;
};

const std::array<CatalogEntry, 27>& catalog() {
    static const std::array<CatalogEntry, 27> entries = {{
        {BuiltinType::kVector2, "Vector2", VariantKind::kVector2, {}},
        {BuiltinType::kVector2i, "Vector2i", VariantKind::kVector2i, {}},
        {BuiltinType::kRect2, "Rect2", VariantKind::kRect2, {BuiltinType::kVector2}},
        {BuiltinType::kRect2i, "Rect2i", VariantKind::kRect2i, {BuiltinType::kVector2i}},
        {BuiltinType::kVector3, "Vector3", VariantKind::kVector3, {}},
        {BuiltinType::kVector3i, "Vector3i", VariantKind::kVector3i, {}},
        {BuiltinType::kTransform2D, "Transform2D", VariantKind::kTransform2D, {BuiltinType::kVector2}},
        {BuiltinType::kVector4, "Vector4", VariantKind::kVector4, {}},
        {BuiltinType::kVector4i, "Vector4i", VariantKind::kVector4i, {}},
        {BuiltinType::kPlane, "Plane", VariantKind::kPlane, {BuiltinType::kVector3}},
        {BuiltinType::kQuaternion, "Quaternion", VariantKind::kQuaternion, {}},
        {BuiltinType::kAABB, "AABB", VariantKind::kAABB, {BuiltinType::kVector3}},
        {BuiltinType::kBasis, "Basis", VariantKind::kBasis, {BuiltinType::kVector3}},
        {BuiltinType::kTransform3D, "Transform3D", VariantKind::kTransform3D,
         {BuiltinType::kVector3, BuiltinType::kBasis}},
        {BuiltinType::kProjection, "Projection", VariantKind::kProjection, {BuiltinType::kVector4}},
        {BuiltinType::kColor, "Color", VariantKind::kColor, {}},
        {BuiltinType::kRID, "RID", VariantKind::kRID, {}},
        {BuiltinType::kPackedByteArray, "PackedByteArray", VariantKind::kPackedByteArray, {}},
        {BuiltinType::kPackedInt32Array, "PackedInt32Array", VariantKind::kPackedInt32Array, {}},
        {BuiltinType::kPackedInt64Array, "PackedInt64Array", VariantKind::kPackedInt64Array, {}},
        {BuiltinType::kPackedFloat32Array, "PackedFloat32Array", VariantKind::kPackedFloat32Array, {}},
        {BuiltinType::kPackedFloat64Array, "PackedFloat64Array", VariantKind::kPackedFloat64Array, {}},
        {BuiltinType::kPackedStringArray, "PackedStringArray", VariantKind::kPackedStringArray, {}},
        {BuiltinType::kPackedVector2Array, "PackedVector2Array", VariantKind::kPackedVector2Array,
         {BuiltinType::kVector2}},
        {BuiltinType::kPackedVector3Array, "PackedVector3Array", VariantKind::kPackedVector3Array,
         {BuiltinType::kVector3}},
        {BuiltinType::kPackedColorArray, "PackedColorArray", VariantKind::kPackedColorArray, {BuiltinType::kColor}},
        {BuiltinType::kPackedVector4Array, "PackedVector4Array", VariantKind::kPackedVector4Array,
         {BuiltinType::kVector4}}
    }};
    return entries;
}

const CatalogEntry& entryFor(BuiltinType type) { return catalog()[static_cast<size_t>(type)]; }

Type number() { return Type::inlined(std::make_shared<const def::NumberDefinition>()); }
Type int32() { return Type::inlined(def::IntegerDefinition::makeInt32()); }
Type builtin(BuiltinType type) { return Type::inlined(std::make_shared<const def::BuiltinDefinition>(type)); }

DefinitionPtr fields(std::initializer_list<std::pair<std::string, Type>> properties) {
    return std::make_shared<const def::ObjectDefinition>(def::Properties(properties));
}

DefinitionPtr arrayOf(Type items) { return std::make_shared<const def::ArrayDefinition>(std::move(items)); }

DefinitionPtr buildSourceDefinition(BuiltinType type) {
    switch (type) {
    case BuiltinType::kVector2:
        return fields({{"x", number()}, {"y", number()}});
    case BuiltinType::kVector2i:
        return fields({{"x", int32()}, {"y", int32()}});
    case BuiltinType::kRect2:
        return fields({{"position", builtin(BuiltinType::kVector2)}, {"size", builtin(BuiltinType::kVector2)}});
    case BuiltinType::kRect2i:
        return fields({{"position", builtin(BuiltinType::kVector2i)}, {"size", builtin(BuiltinType::kVector2i)}});
    case BuiltinType::kVector3:
        return fields({{"x", number()}, {"y", number()}, {"z", number()}});
    case BuiltinType::kVector3i:
        return fields({{"x", int32()}, {"y", int32()}, {"z", int32()}});
    case BuiltinType::kTransform2D:
        return fields({{"a", builtin(BuiltinType::kVector2)}, {"b", builtin(BuiltinType::kVector2)},
                       {"origin", builtin(BuiltinType::kVector2)}});
    case BuiltinType::kVector4:
        return fields({{"x", number()}, {"y", number()}, {"z", number()}, {"w", number()}});
    case BuiltinType::kVector4i:
        return fields({{"x", int32()}, {"y", int32()}, {"z", int32()}, {"w", int32()}});
    case BuiltinType::kPlane:
        return fields({{"normal", builtin(BuiltinType::kVector3)}, {"d", number()}});
    case BuiltinType::kQuaternion:
        return fields({{"x", number()}, {"y", number()}, {"z", number()}, {"w", number()}});
    case BuiltinType::kAABB:
        return fields({{"position", builtin(BuiltinType::kVector3)}, {"size", builtin(BuiltinType::kVector3)}});
    case BuiltinType::kBasis: {
        std::vector<Type> rows(3, builtin(BuiltinType::kVector3));
        return fields({{"rows", Type::inlined(std::make_shared<const def::TupleDefinition>(std::move(rows)))}});
    }
    case BuiltinType::kTransform3D:
        return fields({{"basis", builtin(BuiltinType::kBasis)}, {"origin", builtin(BuiltinType::kVector3)}});
    case BuiltinType::kProjection: {
        std::vector<Type> cols(4, builtin(BuiltinType::kVector4));
        return fields({{"cols", Type::inlined(std::make_shared<const def::TupleDefinition>(std::move(cols)))}});
    }
    case BuiltinType::kColor:
        return fields({{"r", number()}, {"g", number()}, {"b", number()}, {"a", number()}});
    case BuiltinType::kRID:
        return def::IntegerDefinition::makeNonNegative();
    case BuiltinType::kPackedByteArray:
        return arrayOf(Type::inlined(def::IntegerDefinition::makeUInt8()));
    case BuiltinType::kPackedInt32Array:
        return arrayOf(int32());
    case BuiltinType::kPackedInt64Array:
        return arrayOf(Type::inlined(std::make_shared<const def::IntegerDefinition>()));
    case BuiltinType::kPackedFloat32Array:
    case BuiltinType::kPackedFloat64Array:
        return arrayOf(number());
    case BuiltinType::kPackedStringArray:
        return arrayOf(Type::inlined(std::make_shared<const def::StringDefinition>()));
    case BuiltinType::kPackedVector2Array:
        return arrayOf(builtin(BuiltinType::kVector2));
    case BuiltinType::kPackedVector3Array:
        return arrayOf(builtin(BuiltinType::kVector3));
    case BuiltinType::kPackedColorArray:
        return arrayOf(builtin(BuiltinType::kColor));
    case BuiltinType::kPackedVector4Array:
        return arrayOf(builtin(BuiltinType::kVector4));
    }

    return nullptr;
}

} // namespace

std::string_view builtinName(BuiltinType type) { return entryFor(type).name; }

std::optional<BuiltinType> builtinNamed(std::string_view name) {
    for (const auto& entry : catalog()) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<BuiltinType> builtinForKind(VariantKind kind) {
    for (const auto& entry : catalog()) {
        if (entry.kind == kind) {
            return entry.type;
        }
    }
    return std::nullopt;
}

const std::vector<BuiltinType>& builtinDependencies(BuiltinType type) { return entryFor(type).dependencies; }

const def::Definition* builtinSourceDefinition(BuiltinType type) {
    static const std::vector<DefinitionPtr> sourceDefinitions = []() {
        std::vector<DefinitionPtr> definitions;
        definitions.reserve(catalog().size());
        for (const auto& entry : catalog()) {
            definitions.emplace_back(buildSourceDefinition(entry.type));
        }
        return definitions;
    }();
    return sourceDefinitions[static_cast<size_t>(type)].get();
}

void insertBuiltinDefinitions(BuiltinType type, std::vector<BuiltinType>& builtins) {
    builtins.emplace_back(type);
    for (auto dependency : builtinDependencies(type)) {
        insertBuiltinDefinitions(dependency, builtins);
    }
}

} // namespace loom
