#include "loom/def/Definition.hpp"

#include "rapidjson/document.h"

namespace loom {
namespace def {

void Definition::encode(rapidjson::Value& json, JSONAllocator& allocator) const {
    json.SetObject();
    if (description) {
        rapidjson::Value descriptionJSON;
        descriptionJSON.SetString(description->data(), description->size(), allocator);
        json.AddMember("description", descriptionJSON, allocator);
    }
    encodeKeywords(json, allocator);
}

} // namespace def
} // namespace loom
