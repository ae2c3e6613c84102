#include "loom/ClassSource.hpp"

namespace loom {

Hash ClassId::hash() const {
    // Seed by kind so a class named "res://a.gd" never collides with the unnamed class stored at that path.
    return loom::hash(m_name, static_cast<Hash>(m_kind));
}

} // namespace loom
