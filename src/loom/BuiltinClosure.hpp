#ifndef SRC_LOOM_BUILTIN_CLOSURE_HPP_
#define SRC_LOOM_BUILTIN_CLOSURE_HPP_

#include "loom/BuiltinCatalog.hpp"

#include <string>
#include <vector>

namespace loom {

namespace def {
struct Definition;
} // namespace def

class Definitions;
class Type;

// Appends every catalog type used within |definition|, including those nested in inline children, plus their
// catalog dependencies. References are not followed, callers walk each table entry themselves.
void collectBuiltins(const def::Definition* definition, std::vector<BuiltinType>& builtins);

// Returns the catalog types reachable from |base| and every entry of |defs|, sorted by name and without duplicates,
// leaving out any whose name already has an explicit entry in |defs|.
std::vector<BuiltinType> builtinClosure(const def::Definition* base, const Definitions& defs);

// Appends the name of every reference within |definition| and its inline children to |names|.
void collectReferences(const def::Definition* definition, std::vector<std::string>& names);

} // namespace loom

#endif // SRC_LOOM_BUILTIN_CLOSURE_HPP_
