#ifndef SRC_LOOM_CLASS_LIBRARY_HPP_
#define SRC_LOOM_CLASS_LIBRARY_HPP_

#include "loom/ClassSource.hpp"
#include "loom/Host.hpp"

#include "rapidjson/fwd.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loom {

class ErrorReporter;

// A Host whose classes are read from JSON class manifests, and whose instances are plain property bags. Backs the
// command line tool and serves as the reference host in tests.
class ClassLibrary : public Host {
public:
    struct ClassEntry {
        ClassEntry(ClassSource s): source(std::move(s)), isAbstract(false) {}

        ClassSource source;
        std::optional<std::string> description;
        bool isAbstract;
        std::vector<PropertyInfo> properties;
        std::vector<std::pair<std::string, def::EnumVariants>> enums;
    };

    // Instances constructed from manifest classes. Properties start out nil.
    class Instance : public HostObject {
    public:
        explicit Instance(const ClassEntry* classEntry);
        virtual ~Instance() = default;

        std::string_view className() const override { return m_classEntry->source.id.definitionName(); }
        const ClassEntry* classEntry() const { return m_classEntry; }

        const std::vector<std::pair<std::string, Value>>& properties() const { return m_properties; }
        // Returns nullptr if the class declares no property |name|.
        const Value* get(std::string_view name) const;
        bool set(std::string_view name, Value value);

    private:
        const ClassEntry* m_classEntry;
        std::vector<std::pair<std::string, Value>> m_properties;
    };

    ClassLibrary() = delete;
    explicit ClassLibrary(std::shared_ptr<ErrorReporter> errorReporter);
    virtual ~ClassLibrary() = default;

    // Reads class definitions from manifest |input|. |filename| is only used in error messages. Reports
    // kManifestInvalid and returns false on malformed input, classes read before the error stay registered.
    bool scanString(std::string_view input, std::string_view filename);
    bool scanFile(const std::string& path);

    // Looks up a script class, named or not, by the path of its script.
    std::optional<ClassSource> findScript(std::string_view location) const;
    const ClassEntry* findEntry(const ClassId& id) const;
    size_t numberOfClasses() const { return m_classes.size(); }

    // Host
    std::optional<ClassSource> findClass(std::string_view className) override;
    bool propertyList(const ClassSource& source, std::vector<PropertyInfo>& properties) override;
    bool enumVariants(const ClassSource& source, std::string_view enumName, def::EnumVariants& variants) override;
    std::optional<std::string> classDescription(const ClassSource& source) override;
    std::shared_ptr<HostObject> construct(const ClassSource& source) override;
    bool setProperty(HostObject* object, std::string_view name, const Value& value) override;

private:
    bool scanClass(const rapidjson::Value& classJSON, std::string_view filename);
    bool scanProperty(const rapidjson::Value& propertyJSON, std::string_view filename, std::string_view className,
                      PropertyInfo& property);
    bool scanEnums(const rapidjson::Value& enumsJSON, std::string_view filename, std::string_view className,
                   ClassEntry* classEntry);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<std::unique_ptr<ClassEntry>> m_classes;
    std::unordered_map<ClassId, ClassEntry*> m_classMap;
    std::unordered_map<std::string, ClassEntry*> m_scriptMap;
};

} // namespace loom

#endif // SRC_LOOM_CLASS_LIBRARY_HPP_
