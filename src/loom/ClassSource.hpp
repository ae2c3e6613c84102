#ifndef SRC_LOOM_CLASS_SOURCE_HPP_
#define SRC_LOOM_CLASS_SOURCE_HPP_

#include "loom/Hash.hpp"

#include <functional>
#include <string>

namespace loom {

// Stable identity of a host class. Named classes are identified by their registered name, unnamed (script-only)
// classes by the storage location of the defining script.
class ClassId {
public:
    enum Kind { kNamed, kUnnamed };

    ClassId() = delete;
    ~ClassId() = default;

    static ClassId named(std::string className) { return ClassId(kNamed, std::move(className)); }
    static ClassId unnamed(std::string location) { return ClassId(kUnnamed, std::move(location)); }

    Kind kind() const { return m_kind; }
    bool isNamed() const { return m_kind == kNamed; }

    // The key used for this class in a definitions table and in "$ref" pointers.
    const std::string& definitionName() const { return m_name; }

    Hash hash() const;

    bool operator==(const ClassId& id) const { return m_kind == id.m_kind && m_name == id.m_name; }
    bool operator!=(const ClassId& id) const { return !(*this == id); }

private:
    ClassId(Kind kind, std::string name): m_kind(kind), m_name(std::move(name)) {}

    Kind m_kind;
    std::string m_name;
};

// Everything the core needs to know about a host class in order to ask the host about it.
struct ClassSource {
    enum Origin { kEngine, kScript };

    ClassSource(Origin o, ClassId i, std::string l = std::string()): origin(o), id(std::move(i)), location(std::move(l)) {}
    ~ClassSource() = default;

    Origin origin;
    ClassId id;
    // Path of the defining script, empty for engine classes.
    std::string location;
};

} // namespace loom

namespace std {
template <> struct hash<loom::ClassId> {
    size_t operator()(const loom::ClassId& id) const { return id.hash(); }
};
} // namespace std

#endif // SRC_LOOM_CLASS_SOURCE_HPP_
