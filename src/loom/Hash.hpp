#ifndef SRC_LOOM_HASH_HPP_
#define SRC_LOOM_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace loom {

using Hash = std::uint32_t;

Hash hash(std::string_view key, Hash seed = 0);
Hash hash(const char* key, size_t length, Hash seed = 0);

} // namespace loom

#endif // SRC_LOOM_HASH_HPP_
