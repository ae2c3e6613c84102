#ifndef SRC_LOOM_SCHEMA_VALIDATOR_HPP_
#define SRC_LOOM_SCHEMA_VALIDATOR_HPP_

#include "rapidjson/fwd.h"

#include <memory>
#include <string_view>

namespace loom {

class ErrorReporter;

// Checks JSON values against an emitted schema document using RapidJSON's schema validator. Once compiled the
// validator is immutable and validate() may be called from several threads at once.
class SchemaValidator {
public:
    SchemaValidator();
    ~SchemaValidator();

    // Compiles the document in |schemaJSON|. Reports kSchemaInvalid and returns false if it is not a JSON object.
    bool compile(std::string_view schemaJSON, ErrorReporter* errorReporter);

    bool isCompiled() const;

    // Returns true if |json| satisfies the compiled schema. Otherwise reports kValidationFailed with the failing
    // keyword and pointers.
    bool validate(const rapidjson::Value& json, ErrorReporter* errorReporter) const;

private:
    // pImpl pattern to keep the RapidJSON schema headers out of the rest of the build.
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace loom

#endif // SRC_LOOM_SCHEMA_VALIDATOR_HPP_
