#include "lzc/property_json.hpp"
#include "lzc/type_registry.hpp"

#include <limits>
#include <stdexcept>
#include <type_traits>

namespace lzc {

namespace {

constexpr const char* kTypeKey = "$type";
constexpr const char* kValueKey = "value";

// Conversion failures unwind to the public entry points as this
struct JsonShapeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string at(const std::string& path) {
    return path.empty() ? "<root>" : path;
}

template <typename Int>
Int checked_integer(const nlohmann::ordered_json& j, const std::string& path) {
    if (!j.is_number_integer()) {
        throw JsonShapeError(at(path) + ": tagged value must be an integer");
    }
    if (j.is_number_unsigned()) {
        auto v = j.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
            throw JsonShapeError(at(path) + ": value out of range");
        }
        return static_cast<Int>(v);
    }
    auto v = j.get<std::int64_t>();
    if constexpr (std::is_unsigned_v<Int>) {
        if (v < 0) throw JsonShapeError(at(path) + ": value out of range");
        if (static_cast<std::uint64_t>(v) > std::numeric_limits<Int>::max()) {
            throw JsonShapeError(at(path) + ": value out of range");
        }
    } else {
        if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max()) {
            throw JsonShapeError(at(path) + ": value out of range");
        }
    }
    return static_cast<Int>(v);
}

PropertyValue value_from_json(const nlohmann::ordered_json& j, const std::string& path);

PropertyMap map_from_json(const nlohmann::ordered_json& j, const std::string& path) {
    PropertyMap props;
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string here = path.empty() ? it.key() : path + "." + it.key();
        props.set(it.key(), value_from_json(it.value(), here));
    }
    return props;
}

PropertyValue tagged_from_json(const nlohmann::ordered_json& j, const std::string& path) {
    if (!j[kTypeKey].is_string() || !j.contains(kValueKey)) {
        throw JsonShapeError(at(path) + ": tagged value needs string $type and a value");
    }
    auto type = parse_data_type(j[kTypeKey].get<std::string>());
    if (!type) {
        throw JsonShapeError(at(path) + ": unknown $type " + j[kTypeKey].get<std::string>());
    }

    const auto& v = j[kValueKey];
    switch (*type) {
        case DataType::byte: return static_cast<std::byte>(checked_integer<std::uint8_t>(v, path));
        case DataType::int8: return checked_integer<std::int8_t>(v, path);
        case DataType::uint8: return checked_integer<std::uint8_t>(v, path);
        case DataType::int16: return checked_integer<std::int16_t>(v, path);
        case DataType::uint16: return checked_integer<std::uint16_t>(v, path);
        case DataType::int32: return checked_integer<std::int32_t>(v, path);
        case DataType::uint32: return checked_integer<std::uint32_t>(v, path);
        case DataType::int64: return checked_integer<std::int64_t>(v, path);
        case DataType::uint64: return checked_integer<std::uint64_t>(v, path);
        default: break;
    }

    // Array forms: {"$type": "uint32_array", "value": [1, 2]}
    const TypeInfo* info = find_type_info(*type);
    if (info && info->is_array &&
        (is_integer_type(info->element) || info->element == DataType::byte)) {
        if (!v.is_array()) throw JsonShapeError(at(path) + ": array $type needs an array value");
        PropertyArray out;
        nlohmann::ordered_json element = {{kTypeKey, data_type_to_string(info->element)}};
        for (std::size_t i = 0; i < v.size(); ++i) {
            element[kValueKey] = v[i];
            out.push_back(tagged_from_json(element, path + "[" + std::to_string(i) + "]"));
        }
        return out;
    }
    throw JsonShapeError(at(path) + ": $type " + data_type_to_string(*type) +
                         " can not be tagged");
}

PropertyValue value_from_json(const nlohmann::ordered_json& j, const std::string& path) {
    switch (j.type()) {
        case nlohmann::ordered_json::value_t::null: return Absent{};
        case nlohmann::ordered_json::value_t::boolean: return j.get<bool>();
        case nlohmann::ordered_json::value_t::string: return j.get<std::string>();
        case nlohmann::ordered_json::value_t::number_unsigned: return j.get<std::uint64_t>();
        case nlohmann::ordered_json::value_t::number_integer: {
            auto v = j.get<std::int64_t>();
            if (v >= 0) return static_cast<std::uint64_t>(v);
            return v;
        }
        case nlohmann::ordered_json::value_t::object:
            if (j.contains(kTypeKey)) return tagged_from_json(j, path);
            return map_from_json(j, path);
        case nlohmann::ordered_json::value_t::array: {
            PropertyArray out;
            out.reserve(j.size());
            for (std::size_t i = 0; i < j.size(); ++i) {
                out.push_back(value_from_json(j[i], path + "[" + std::to_string(i) + "]"));
            }
            return out;
        }
        case nlohmann::ordered_json::value_t::number_float:
            throw JsonShapeError(at(path) + ": floating point values are not supported");
        default:
            break;
    }
    throw JsonShapeError(at(path) + ": unsupported JSON value");
}

nlohmann::ordered_json tagged(const char* type, nlohmann::ordered_json value) {
    nlohmann::ordered_json j;
    j[kTypeKey] = type;
    j[kValueKey] = std::move(value);
    return j;
}

} // namespace

JsonParseResult<PropertyMap> property_map_from_json(const nlohmann::ordered_json& j) {
    JsonParseResult<PropertyMap> result;
    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }
    try {
        result.value = map_from_json(j, "");
        result.ok = true;
    } catch (const JsonShapeError& e) {
        result.error = e.what();
    }
    return result;
}

JsonParseResult<PropertyMap> parse_property_map(const std::string& json_str) {
    JsonParseResult<PropertyMap> result;
    try {
        // Parsed as ordered_json so key order survives into the map
        auto j = nlohmann::ordered_json::parse(json_str);
        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        result.value = map_from_json(j, "");
        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    } catch (const JsonShapeError& e) {
        result.error = e.what();
    }
    return result;
}

nlohmann::ordered_json property_value_to_json(const PropertyValue& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Absent>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                                 std::is_same_v<T, std::uint64_t>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                if (v < 0) return v;
                return tagged("int64", v);
            } else if constexpr (std::is_same_v<T, std::byte>) {
                return tagged("byte", static_cast<unsigned>(v));
            } else if constexpr (std::is_same_v<T, PropertyMap>) {
                return property_map_to_json(v);
            } else if constexpr (std::is_same_v<T, PropertyArray>) {
                nlohmann::ordered_json arr = nlohmann::ordered_json::array();
                for (const auto& element : v) {
                    arr.push_back(property_value_to_json(element));
                }
                return arr;
            } else {
                return tagged(PropertyValue(v).type_name(), static_cast<std::int64_t>(v));
            }
        },
        value.variant());
}

nlohmann::ordered_json property_map_to_json(const PropertyMap& props) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [key, value] : props) {
        j[key] = property_value_to_json(value);
    }
    return j;
}

JsonParseResult<ItemErrors> parse_item_errors(const std::string& json_str) {
    JsonParseResult<ItemErrors> result;
    try {
        auto j = nlohmann::ordered_json::parse(json_str);
        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            std::optional<int> status;
            if (it.value().is_number_unsigned()) {
                auto v = it.value().get<std::uint64_t>();
                if (v <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                    status = static_cast<int>(v);
                }
            } else if (it.value().is_number_integer()) {
                auto v = it.value().get<std::int64_t>();
                if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) {
                    status = static_cast<int>(v);
                }
            } else if (it.value().is_string()) {
                status = parse_errno(it.value().get<std::string>());
            }
            if (!status) {
                result.warnings.push_back("invalid_status:" + it.key());
                continue;
            }
            if (it.key() == N_MORE_ERRORS) {
                result.value.suppressed = *status;
                result.value.has_more = true;
            } else {
                result.value.items.emplace_back(it.key(), *status);
            }
        }
        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }
    return result;
}

nlohmann::ordered_json failure_to_json(const ClassifiedFailure& failure) {
    nlohmann::ordered_json j;
    j["kind"] = failure_kind_to_string(failure.kind);
    j["status"] = failure.status;
    j["errno"] = errno_to_string(failure.status);
    j["name"] = failure.name ? nlohmann::ordered_json(*failure.name) : nlohmann::ordered_json();
    j["message"] = failure.message;
    if (failure.is_batch()) {
        nlohmann::ordered_json errors = nlohmann::ordered_json::array();
        for (const auto& e : failure.errors) {
            errors.push_back(failure_to_json(e));
        }
        j["errors"] = std::move(errors);
        j["suppressed"] = failure.suppressed;
    }
    return j;
}

} // namespace lzc
