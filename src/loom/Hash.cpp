#include "loom/Hash.hpp"

#include "xxhash.h"

namespace loom {

Hash hash(std::string_view key, Hash seed) {
    return hash(key.data(), key.size(), seed);
}

Hash hash(const char* key, size_t length, Hash seed) {
    return XXH32(key, length, seed);
}

} // namespace loom
