#include "loom/def/IntegerDefinition.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/Instantiator.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"

namespace loom {
namespace def {

void IntegerDefinition::encodeKeywords(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.AddMember("type", "integer", allocator);
}

bool IntegerDefinition::instantiate(Instantiator* instantiator, const rapidjson::Value& json, Value& value) const {
    if (!json.IsNumber()) {
        return instantiator->typeMismatch("integer", json);
    }

    if (json.IsInt64()) {
        auto integer = json.GetInt64();
        if (integer < minimum || integer > maximum) {
            instantiator->errorReporter()->addError(ErrorReporter::kIntegerOutOfRange,
                    fmt::format("Integer {} is outside of the range [{}, {}].", integer, minimum, maximum));
            return false;
        }
        value = Value::makeInteger(integer);
        return true;
    }

    // Parsed as an unsigned integer only when it does not fit in a signed 64-bit integer.
    if (json.IsUint64()) {
        instantiator->errorReporter()->addError(ErrorReporter::kIntegerOutOfRange,
                fmt::format("Integer {} is outside of the range [{}, {}].", json.GetUint64(), minimum, maximum));
        return false;
    }

    instantiator->errorReporter()->addError(ErrorReporter::kExpectedIntegerGotFloat,
            fmt::format("Expected integer, got: {}", Instantiator::describe(json)));
    return false;
}

ValueType IntegerDefinition::valueType() const { return kIntegerType; }

} // namespace def
} // namespace loom
