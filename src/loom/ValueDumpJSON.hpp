#ifndef SRC_LOOM_VALUE_DUMP_JSON_HPP_
#define SRC_LOOM_VALUE_DUMP_JSON_HPP_

#include "loom/Value.hpp"

#include <memory>
#include <string_view>

namespace loom {

// Debug dump of native values. Objects and builtins are written with a "_className" member, typed arrays with an
// "_elementType" member and their elements under "_elements".
// To avoid copying strings around this class wraps the string and provides access to it via the json() accessor.
class ValueDumpJSON {
public:
    ValueDumpJSON();
    ~ValueDumpJSON();

    void dump(const Value& value, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace loom

#endif // SRC_LOOM_VALUE_DUMP_JSON_HPP_
