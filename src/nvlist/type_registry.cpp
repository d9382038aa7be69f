#include "lzc/type_registry.hpp"

#include <algorithm>

namespace lzc {

namespace {

const std::vector<TypeInfo> kTypeTable = {
    {DataType::boolean,       DataType::boolean,       DataType::unknown,       false, "absent"},
    {DataType::boolean_value, DataType::boolean_value, DataType::boolean_array, false, "boolean_value"},
    {DataType::byte,          DataType::byte,          DataType::byte_array,    false, "byte"},
    {DataType::int8,          DataType::int8,          DataType::int8_array,    false, "int8"},
    {DataType::uint8,         DataType::uint8,         DataType::uint8_array,   false, "uint8"},
    {DataType::int16,         DataType::int16,         DataType::int16_array,   false, "int16"},
    {DataType::uint16,        DataType::uint16,        DataType::uint16_array,  false, "uint16"},
    {DataType::int32,         DataType::int32,         DataType::int32_array,   false, "int32"},
    {DataType::uint32,        DataType::uint32,        DataType::uint32_array,  false, "uint32"},
    {DataType::int64,         DataType::int64,         DataType::int64_array,   false, "int64"},
    {DataType::uint64,        DataType::uint64,        DataType::uint64_array,  false, "uint64"},
    {DataType::string,        DataType::string,        DataType::string_array,  false, "string"},
    {DataType::nvlist,        DataType::nvlist,        DataType::nvlist_array,  false, "nvlist"},
    {DataType::boolean_array, DataType::boolean_value, DataType::boolean_array, true,  "array"},
    {DataType::byte_array,    DataType::byte,          DataType::byte_array,    true,  "array"},
    {DataType::int8_array,    DataType::int8,          DataType::int8_array,    true,  "array"},
    {DataType::uint8_array,   DataType::uint8,         DataType::uint8_array,   true,  "array"},
    {DataType::int16_array,   DataType::int16,         DataType::int16_array,   true,  "array"},
    {DataType::uint16_array,  DataType::uint16,        DataType::uint16_array,  true,  "array"},
    {DataType::int32_array,   DataType::int32,         DataType::int32_array,   true,  "array"},
    {DataType::uint32_array,  DataType::uint32,        DataType::uint32_array,  true,  "array"},
    {DataType::int64_array,   DataType::int64,         DataType::int64_array,   true,  "array"},
    {DataType::uint64_array,  DataType::uint64,        DataType::uint64_array,  true,  "array"},
    {DataType::string_array,  DataType::string,        DataType::string_array,  true,  "array"},
    {DataType::nvlist_array,  DataType::nvlist,        DataType::nvlist_array,  true,  "array"},
};

// Scalar tag per PropertyValue alternative, in variant order
constexpr DataType kScalarTags[] = {
    DataType::boolean,       // Absent
    DataType::boolean_value, // bool
    DataType::byte,
    DataType::int8,
    DataType::uint8,
    DataType::int16,
    DataType::uint16,
    DataType::int32,
    DataType::uint32,
    DataType::int64,
    DataType::uint64,
    DataType::string,
    DataType::nvlist,
    DataType::unknown,       // PropertyArray
};

static_assert(sizeof(kScalarTags) / sizeof(kScalarTags[0]) ==
                  std::variant_size_v<PropertyValue::variant_type>,
              "scalar tag table out of sync with PropertyValue alternatives");

} // namespace

const std::vector<TypeInfo>& type_table() {
    return kTypeTable;
}

const TypeInfo* find_type_info(DataType tag) {
    auto it = std::find_if(kTypeTable.begin(), kTypeTable.end(),
                           [tag](const TypeInfo& info) { return info.tag == tag; });
    return it == kTypeTable.end() ? nullptr : &*it;
}

bool is_integer_type(DataType tag) {
    switch (tag) {
        case DataType::int8:
        case DataType::uint8:
        case DataType::int16:
        case DataType::uint16:
        case DataType::int32:
        case DataType::uint32:
        case DataType::int64:
        case DataType::uint64:
            return true;
        default:
            return false;
    }
}

std::optional<DataType> wire_type_of(const PropertyValue& value) {
    const auto* array = value.get_if<PropertyArray>();
    if (!array) {
        return kScalarTags[value.index()];
    }
    if (array->empty()) return std::nullopt;

    DataType element = kScalarTags[array->front().index()];
    const TypeInfo* info = find_type_info(element);
    if (!info || info->array == DataType::unknown) return std::nullopt;
    return info->array;
}

IntegerWidthTable::IntegerWidthTable() {
    widths_["rewind-request"] = DataType::uint32;
    widths_["type"] = DataType::uint32;
    widths_[N_MORE_ERRORS] = DataType::int32;
    widths_["pool_context"] = DataType::int32;
}

const IntegerWidthTable& IntegerWidthTable::builtin() {
    static const IntegerWidthTable table;
    return table;
}

bool IntegerWidthTable::add(const std::string& key, DataType width) {
    if (!is_integer_type(width)) return false;
    if (builtin().find(key)) return false;
    widths_[key] = width;
    return true;
}

std::optional<DataType> IntegerWidthTable::find(const std::string& key) const {
    auto it = widths_.find(key);
    if (it == widths_.end()) return std::nullopt;
    return it->second;
}

} // namespace lzc
