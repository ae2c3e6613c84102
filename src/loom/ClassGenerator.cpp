#include "loom/ClassGenerator.hpp"

#include "loom/Definitions.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Host.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace loom {

ClassGenerator::ClassGenerator(Host* host, std::shared_ptr<ErrorReporter> errorReporter):
    m_host(host),
    m_errorReporter(errorReporter),
    m_typeResolver(this, host, errorReporter),
    m_depth(0),
    m_maxDepth(kDefaultMaxDepth),
    m_excludedSuffixes({".gd"}) {}

std::shared_ptr<const def::ClassDefinition> ClassGenerator::generate(const ClassSource& source, Definitions& defs) {
    const auto& name = source.id.definitionName();
    if (m_depth == 0) {
        m_selfReferenced.clear();
    }
    if (m_depth >= m_maxDepth) {
        m_errorReporter->addError(ErrorReporter::kDepthLimitExceeded,
                fmt::format("Generating class '{}' exceeded the maximum nesting depth of {}.", name, m_maxDepth));
        return nullptr;
    }

    std::vector<PropertyInfo> propertyList;
    if (!m_host->propertyList(source, propertyList)) {
        m_errorReporter->addError(ErrorReporter::kHostReflectionFailed,
                fmt::format("Host failed to list the properties of class '{}'.", name));
        return nullptr;
    }

    SPDLOG_DEBUG("Generating class '{}' from {} properties", name, propertyList.size());
    m_inProgress.emplace(name);
    ++m_depth;

    def::Properties properties;
    bool ok = true;
    for (const auto& property : propertyList) {
        if (isExcluded(source, property)) {
            SPDLOG_TRACE("Skipping property '{}' of class '{}'", property.name, name);
            continue;
        }

        auto type = m_typeResolver.resolve(property, defs);
        if (!type) {
            SPDLOG_DEBUG("Failed to resolve property '{}' of class '{}'", property.name, name);
            ok = false;
            break;
        }
        properties.emplace_back(property.name, std::move(*type));
    }

    --m_depth;
    m_inProgress.erase(name);
    if (!ok) {
        return nullptr;
    }

    return std::make_shared<const def::ClassDefinition>(source, std::move(properties),
                                                        m_host->classDescription(source));
}

std::optional<Type> ClassGenerator::referenceClass(const ClassSource& source, Definitions& defs) {
    const auto& name = source.id.definitionName();
    if (defs.contains(name)) {
        return Type::reference(name);
    }
    if (m_inProgress.count(name)) {
        SPDLOG_TRACE("Class '{}' refers back to itself", name);
        m_selfReferenced.emplace(name);
        return Type::reference(name);
    }

    auto classDefinition = generate(source, defs);
    if (!classDefinition) {
        return std::nullopt;
    }
    defs.insert(name, std::move(classDefinition));
    return Type::reference(name);
}

std::optional<Type> ClassGenerator::resolveProperty(const PropertyInfo& property, Definitions& defs) {
    return m_typeResolver.resolve(property, defs);
}

std::optional<ClassSource> ClassGenerator::findClass(std::string_view className) {
    auto source = m_host->findClass(className);
    if (!source) {
        m_errorReporter->addError(ErrorReporter::kClassNotFound, fmt::format("No class named '{}'.", className));
    }
    return source;
}

bool ClassGenerator::isExcluded(const ClassSource& source, const PropertyInfo& property) const {
    if (source.origin != ClassSource::kScript) {
        return false;
    }
    for (const auto& suffix : m_excludedSuffixes) {
        if (property.name.size() >= suffix.size()
            && property.name.compare(property.name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace loom
