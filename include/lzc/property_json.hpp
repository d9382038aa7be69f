#pragma once

#include "lzc/classify.hpp"
#include "lzc/failure.hpp"
#include "lzc/property.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// JSON Form
// ============================================================================
//
//   null                          Absent
//   true / false                  bool
//   "text"                        std::string
//   {...}                         PropertyMap (key order preserved)
//   [...]                         PropertyArray
//   non-negative integer          uint64_t
//   negative integer              int64_t
//   {"$type": "uint32", "value": 5}
//                                 any other width, or "byte"
//
// Floating point numbers have no property form.

template <typename T>
struct JsonParseResult {
    bool ok = false;
    std::string error;
    T value{};
    std::vector<std::string> warnings;
};

// Key order of the document is kept; callers holding a nlohmann::json
// (sorted keys) get sorted order
JsonParseResult<PropertyMap> property_map_from_json(const nlohmann::ordered_json& j);
JsonParseResult<PropertyMap> parse_property_map(const std::string& json_str);

nlohmann::ordered_json property_map_to_json(const PropertyMap& props);
nlohmann::ordered_json property_value_to_json(const PropertyValue& value);

// {"pool/fs@snap": 17, "N_MORE_ERRORS": 4}; statuses may be numbers in int
// range or errno names ("EEXIST"). Anything else is skipped with an
// "invalid_status:<key>" warning.
JsonParseResult<ItemErrors> parse_item_errors(const std::string& json_str);

nlohmann::ordered_json failure_to_json(const ClassifiedFailure& failure);

} // namespace lzc
