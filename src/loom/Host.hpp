#ifndef SRC_LOOM_HOST_HPP_
#define SRC_LOOM_HOST_HPP_

#include "loom/ClassSource.hpp"
#include "loom/def/EnumDefinition.hpp"
#include "loom/PropertyInfo.hpp"
#include "loom/Value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

// The reflective object runtime whose classes are described by schemas. Generation only reflects on classes,
// instantiation also constructs them. Failures are reported by return value, callers turn them into errors.
class Host {
public:
    virtual ~Host() = default;

    // Returns std::nullopt if no class is registered under |className|.
    virtual std::optional<ClassSource> findClass(std::string_view className) = 0;

    // Appends the properties of |source| to |properties| in declaration order. Returns false if the host can't
    // reflect on the class.
    virtual bool propertyList(const ClassSource& source, std::vector<PropertyInfo>& properties) = 0;

    // Appends the named constants of |enumName|, declared in |source|, to |variants|. Returns false if there is no
    // such enum.
    virtual bool enumVariants(const ClassSource& source, std::string_view enumName, def::EnumVariants& variants) = 0;

    virtual std::optional<std::string> classDescription(const ClassSource& /* source */) { return std::nullopt; }

    // Returns a blank instance of |source|, or nullptr if the class can't be constructed.
    virtual std::shared_ptr<HostObject> construct(const ClassSource& source) = 0;

    // Assigns |value| to property |name| of |object|. Returns false if the host rejects the assignment.
    virtual bool setProperty(HostObject* object, std::string_view name, const Value& value) = 0;
};

} // namespace loom

#endif // SRC_LOOM_HOST_HPP_
