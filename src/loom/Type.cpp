#include "loom/Type.hpp"

#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"

namespace loom {

const def::Definition* Type::resolve(const Definitions& defs, ErrorReporter* errorReporter) const {
    if (m_definition) {
        return m_definition.get();
    }

    auto definition = defs.find(m_referenceName);
    if (!definition) {
        errorReporter->addError(ErrorReporter::kDanglingReference,
                                fmt::format("Reference to '{}' has no definition.", m_referenceName));
    }
    return definition;
}

void Type::encode(rapidjson::Value& json, JSONAllocator& allocator) const {
    if (m_definition) {
        m_definition->encode(json, allocator);
        return;
    }

    json.SetObject();
    auto pointer = definitionPointer(m_referenceName);
    rapidjson::Value pointerJSON;
    pointerJSON.SetString(pointer.data(), pointer.size(), allocator);
    json.AddMember("$ref", pointerJSON, allocator);
}

std::string definitionPointer(std::string_view name) {
    std::string pointer("#/$defs/");
    pointer.reserve(pointer.size() + name.size());
    for (auto c : name) {
        if (c == '~') {
            pointer.append("~0");
        } else if (c == '/') {
            pointer.append("~1");
        } else {
            pointer.push_back(c);
        }
    }
    return pointer;
}

} // namespace loom
