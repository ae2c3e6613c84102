#include "loom/Definitions.hpp"

namespace loom {

const def::Definition* Definitions::find(std::string_view name) const {
    auto iter = m_definitions.find(name);
    if (iter == m_definitions.end()) {
        return nullptr;
    }
    return iter->second.get();
}

DefinitionPtr Definitions::findPtr(std::string_view name) const {
    auto iter = m_definitions.find(name);
    if (iter == m_definitions.end()) {
        return nullptr;
    }
    return iter->second;
}

DefinitionPtr Definitions::take(std::string_view name) {
    auto iter = m_definitions.find(name);
    if (iter == m_definitions.end()) {
        return nullptr;
    }
    auto definition = std::move(iter->second);
    m_definitions.erase(iter);
    return definition;
}

} // namespace loom
