#include "loom/BuiltinClosure.hpp"

#include "loom/def/BuiltinDefinition.hpp"
#include "loom/Definitions.hpp"
#include "loom/Type.hpp"

#include <algorithm>

namespace loom {

void collectBuiltins(const def::Definition* definition, std::vector<BuiltinType>& builtins) {
    if (definition->kind == def::kBuiltin) {
        insertBuiltinDefinitions(static_cast<const def::BuiltinDefinition*>(definition)->builtinType, builtins);
        return;
    }

    definition->forEachType([&builtins](const Type& type) {
        if (!type.isReference()) {
            collectBuiltins(type.definition(), builtins);
        }
    });
}

std::vector<BuiltinType> builtinClosure(const def::Definition* base, const Definitions& defs) {
    std::vector<BuiltinType> builtins;
    collectBuiltins(base, builtins);
    for (const auto& entry : defs) {
        collectBuiltins(entry.second.get(), builtins);
    }

    builtins.erase(std::remove_if(builtins.begin(), builtins.end(),
                                  [&defs](BuiltinType type) { return defs.contains(builtinName(type)); }),
                   builtins.end());
    std::sort(builtins.begin(), builtins.end(),
              [](BuiltinType a, BuiltinType b) { return builtinName(a) < builtinName(b); });
    builtins.erase(std::unique(builtins.begin(), builtins.end()), builtins.end());
    return builtins;
}

void collectReferences(const def::Definition* definition, std::vector<std::string>& names) {
    definition->forEachType([&names](const Type& type) {
        if (type.isReference()) {
            names.emplace_back(type.referenceName());
        } else {
            collectReferences(type.definition(), names);
        }
    });
}

} // namespace loom
