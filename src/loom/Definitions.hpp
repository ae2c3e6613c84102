#ifndef SRC_LOOM_DEFINITIONS_HPP_
#define SRC_LOOM_DEFINITIONS_HPP_

#include "loom/def/Definition.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace loom {

// The table of named definitions shared by one schema graph. Iteration is in sorted name order, so anything emitted
// from it is deterministic.
class Definitions {
public:
    using Map = std::map<std::string, DefinitionPtr, std::less<>>;

    Definitions() = default;
    ~Definitions() = default;

    // Inserting an existing name replaces the entry, callers only ever re-insert equivalent definitions.
    void insert(std::string name, DefinitionPtr definition) { m_definitions[std::move(name)] = std::move(definition); }

    // Returns nullptr if |name| is not present.
    const def::Definition* find(std::string_view name) const;
    DefinitionPtr findPtr(std::string_view name) const;
    bool contains(std::string_view name) const { return m_definitions.find(name) != m_definitions.end(); }

    // Removes the entry named |name| and returns it, or nullptr if absent.
    DefinitionPtr take(std::string_view name);

    size_t size() const { return m_definitions.size(); }
    bool empty() const { return m_definitions.empty(); }
    Map::const_iterator begin() const { return m_definitions.begin(); }
    Map::const_iterator end() const { return m_definitions.end(); }

private:
    Map m_definitions;
};

} // namespace loom

#endif // SRC_LOOM_DEFINITIONS_HPP_
