#include "loom/SchemaLibrary.hpp"

#include "loom/ClassGenerator.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Host.hpp"
#include "loom/RootSchema.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace loom {

SchemaLibrary::SchemaLibrary(Host* host): m_host(host), m_maxDepth(kDefaultMaxDepth) {}

void SchemaLibrary::setMaxDepth(size_t maxDepth) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxDepth = maxDepth;
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::generateNamedClassSchema(std::string_view className,
        std::shared_ptr<ErrorReporter> errorReporter) {
    auto source = m_host->findClass(className);
    if (!source) {
        errorReporter->addError(ErrorReporter::kClassNotFound, fmt::format("No class named '{}'.", className));
        return nullptr;
    }
    return generateClassSchema(*source, std::move(errorReporter));
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::generateClassSchema(const ClassSource& source,
        std::shared_ptr<ErrorReporter> errorReporter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return generateLocked(source, std::move(errorReporter));
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::generateTypeInfoSchema(const PropertyInfo& property,
        std::shared_ptr<ErrorReporter> errorReporter) {
    size_t maxDepth;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        maxDepth = m_maxDepth;
    }

    ClassGenerator generator(m_host, errorReporter);
    generator.setMaxDepth(maxDepth);
    auto schema = RootSchema::fromTypeInfo(&generator, property);
    if (!schema) {
        return nullptr;
    }
    return CompiledSchema::compile(std::move(schema), std::move(errorReporter));
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::findClassSchema(const ClassId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_schemas.find(id);
    if (iter == m_schemas.end()) {
        return nullptr;
    }
    return iter->second;
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::classSchema(const ClassSource& source,
        std::shared_ptr<ErrorReporter> errorReporter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_schemas.find(source.id);
    if (iter != m_schemas.end()) {
        return iter->second;
    }
    return generateLocked(source, std::move(errorReporter));
}

size_t SchemaLibrary::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_schemas.size();
}

void SchemaLibrary::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_schemas.clear();
}

std::shared_ptr<const CompiledSchema> SchemaLibrary::generateLocked(const ClassSource& source,
        std::shared_ptr<ErrorReporter> errorReporter) {
    ClassGenerator generator(m_host, errorReporter);
    generator.setMaxDepth(m_maxDepth);
    auto schema = RootSchema::fromClass(&generator, source);
    if (!schema) {
        return nullptr;
    }

    auto compiledSchema = CompiledSchema::compile(std::move(schema), std::move(errorReporter));
    if (!compiledSchema) {
        return nullptr;
    }

    SPDLOG_DEBUG("Caching schema for class '{}'", source.id.definitionName());
    m_schemas.insert_or_assign(source.id, compiledSchema);
    return compiledSchema;
}

} // namespace loom
