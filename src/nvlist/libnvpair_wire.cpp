#include "lzc/libnvpair_wire.hpp"

#include <libnvpair.h>

namespace lzc {

static_assert(static_cast<int>(DataType::unknown) == DATA_TYPE_UNKNOWN, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::boolean) == DATA_TYPE_BOOLEAN, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::byte) == DATA_TYPE_BYTE, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int16) == DATA_TYPE_INT16, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint16) == DATA_TYPE_UINT16, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int32) == DATA_TYPE_INT32, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint32) == DATA_TYPE_UINT32, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int64) == DATA_TYPE_INT64, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint64) == DATA_TYPE_UINT64, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::string) == DATA_TYPE_STRING, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::byte_array) == DATA_TYPE_BYTE_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int16_array) == DATA_TYPE_INT16_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint16_array) == DATA_TYPE_UINT16_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int32_array) == DATA_TYPE_INT32_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint32_array) == DATA_TYPE_UINT32_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int64_array) == DATA_TYPE_INT64_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint64_array) == DATA_TYPE_UINT64_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::string_array) == DATA_TYPE_STRING_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::hrtime) == DATA_TYPE_HRTIME, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::nvlist) == DATA_TYPE_NVLIST, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::nvlist_array) == DATA_TYPE_NVLIST_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::boolean_value) == DATA_TYPE_BOOLEAN_VALUE, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int8) == DATA_TYPE_INT8, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint8) == DATA_TYPE_UINT8, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::boolean_array) == DATA_TYPE_BOOLEAN_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::int8_array) == DATA_TYPE_INT8_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::uint8_array) == DATA_TYPE_UINT8_ARRAY, "data_type_t mismatch");
static_assert(static_cast<int>(DataType::double_value) == DATA_TYPE_DOUBLE, "data_type_t mismatch");

namespace {

nvlist_t* nvl(wire_list* list) {
    return reinterpret_cast<nvlist_t*>(list);
}

nvpair_t* nvp(wire_pair* pair) {
    return reinterpret_cast<nvpair_t*>(pair);
}

wire_list* wl(nvlist_t* list) {
    return reinterpret_cast<wire_list*>(list);
}

// Copies a libnvpair-owned array into out; Elem is the libnvpair element type
template <typename Elem, typename Out, typename Pair>
int copy_array(int (*fn)(Pair*, Elem**, uint_t*), nvpair_t* pair, std::vector<Out>* out) {
    Elem* values = nullptr;
    uint_t count = 0;
    int rc = fn(pair, &values, &count);
    if (rc != 0) return rc;
    out->assign(values, values + count);
    return 0;
}

// String accessors take char** or const char** depending on the OpenZFS
// release; the pointer type is deduced from the function itself.
template <typename Pair, typename Str>
int read_string(int (*fn)(Pair*, Str*), nvpair_t* pair, std::string* out) {
    Str value = nullptr;
    int rc = fn(pair, &value);
    if (rc != 0) return rc;
    *out = value;
    return 0;
}

template <typename Pair, typename StrArray>
int read_string_array(int (*fn)(Pair*, StrArray*, uint_t*), nvpair_t* pair,
                      std::vector<std::string>* out) {
    StrArray values = nullptr;
    uint_t count = 0;
    int rc = fn(pair, &values, &count);
    if (rc != 0) return rc;
    out->clear();
    out->reserve(count);
    for (uint_t i = 0; i < count; ++i) {
        out->emplace_back(values[i]);
    }
    return 0;
}

} // namespace

int LibnvpairWire::alloc(wire_list** out) {
    nvlist_t* list = nullptr;
    int rc = nvlist_alloc(&list, NV_UNIQUE_NAME, 0);
    if (rc != 0) return rc;
    *out = wl(list);
    return 0;
}

void LibnvpairWire::free(wire_list* list) {
    nvlist_free(nvl(list));
}

int LibnvpairWire::packed_size(wire_list* list, std::size_t* size) {
    return nvlist_size(nvl(list), size, NV_ENCODE_XDR);
}

int LibnvpairWire::add_boolean(wire_list* list, const char* name) {
    return nvlist_add_boolean(nvl(list), name);
}

int LibnvpairWire::add_boolean_value(wire_list* list, const char* name, bool value) {
    return nvlist_add_boolean_value(nvl(list), name, value ? B_TRUE : B_FALSE);
}

int LibnvpairWire::add_byte(wire_list* list, const char* name, std::uint8_t value) {
    return nvlist_add_byte(nvl(list), name, static_cast<uchar_t>(value));
}

int LibnvpairWire::add_int8(wire_list* list, const char* name, std::int8_t value) {
    return nvlist_add_int8(nvl(list), name, value);
}

int LibnvpairWire::add_uint8(wire_list* list, const char* name, std::uint8_t value) {
    return nvlist_add_uint8(nvl(list), name, value);
}

int LibnvpairWire::add_int16(wire_list* list, const char* name, std::int16_t value) {
    return nvlist_add_int16(nvl(list), name, value);
}

int LibnvpairWire::add_uint16(wire_list* list, const char* name, std::uint16_t value) {
    return nvlist_add_uint16(nvl(list), name, value);
}

int LibnvpairWire::add_int32(wire_list* list, const char* name, std::int32_t value) {
    return nvlist_add_int32(nvl(list), name, value);
}

int LibnvpairWire::add_uint32(wire_list* list, const char* name, std::uint32_t value) {
    return nvlist_add_uint32(nvl(list), name, value);
}

int LibnvpairWire::add_int64(wire_list* list, const char* name, std::int64_t value) {
    return nvlist_add_int64(nvl(list), name, value);
}

int LibnvpairWire::add_uint64(wire_list* list, const char* name, std::uint64_t value) {
    return nvlist_add_uint64(nvl(list), name, value);
}

int LibnvpairWire::add_string(wire_list* list, const char* name, const std::string& value) {
    return nvlist_add_string(nvl(list), name, value.c_str());
}

int LibnvpairWire::add_nvlist(wire_list* list, const char* name, wire_list* value) {
    return nvlist_add_nvlist(nvl(list), name, nvl(value));
}

int LibnvpairWire::add_boolean_array(wire_list* list, const char* name,
                                     const std::vector<bool>& values) {
    std::vector<boolean_t> raw;
    raw.reserve(values.size());
    for (bool v : values) {
        raw.push_back(v ? B_TRUE : B_FALSE);
    }
    return nvlist_add_boolean_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_byte_array(wire_list* list, const char* name,
                                  const std::vector<std::uint8_t>& values) {
    std::vector<uchar_t> raw(values.begin(), values.end());
    return nvlist_add_byte_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_int8_array(wire_list* list, const char* name,
                                  const std::vector<std::int8_t>& values) {
    std::vector<std::int8_t> raw(values);
    return nvlist_add_int8_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_uint8_array(wire_list* list, const char* name,
                                   const std::vector<std::uint8_t>& values) {
    std::vector<std::uint8_t> raw(values);
    return nvlist_add_uint8_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_int16_array(wire_list* list, const char* name,
                                   const std::vector<std::int16_t>& values) {
    std::vector<std::int16_t> raw(values);
    return nvlist_add_int16_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_uint16_array(wire_list* list, const char* name,
                                    const std::vector<std::uint16_t>& values) {
    std::vector<std::uint16_t> raw(values);
    return nvlist_add_uint16_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_int32_array(wire_list* list, const char* name,
                                   const std::vector<std::int32_t>& values) {
    std::vector<std::int32_t> raw(values);
    return nvlist_add_int32_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_uint32_array(wire_list* list, const char* name,
                                    const std::vector<std::uint32_t>& values) {
    std::vector<std::uint32_t> raw(values);
    return nvlist_add_uint32_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_int64_array(wire_list* list, const char* name,
                                   const std::vector<std::int64_t>& values) {
    std::vector<std::int64_t> raw(values);
    return nvlist_add_int64_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_uint64_array(wire_list* list, const char* name,
                                    const std::vector<std::uint64_t>& values) {
    std::vector<std::uint64_t> raw(values);
    return nvlist_add_uint64_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_string_array(wire_list* list, const char* name,
                                    const std::vector<std::string>& values) {
    std::vector<char*> raw;
    raw.reserve(values.size());
    for (const auto& v : values) {
        raw.push_back(const_cast<char*>(v.c_str()));
    }
    return nvlist_add_string_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

int LibnvpairWire::add_nvlist_array(wire_list* list, const char* name,
                                    const std::vector<wire_list*>& values) {
    std::vector<nvlist_t*> raw;
    raw.reserve(values.size());
    for (wire_list* v : values) {
        raw.push_back(nvl(v));
    }
    return nvlist_add_nvlist_array(nvl(list), name, raw.data(), static_cast<uint_t>(raw.size()));
}

wire_pair* LibnvpairWire::next_pair(wire_list* list, wire_pair* prev) {
    return reinterpret_cast<wire_pair*>(nvlist_next_nvpair(nvl(list), nvp(prev)));
}

const char* LibnvpairWire::pair_name(wire_pair* pair) {
    return nvpair_name(nvp(pair));
}

DataType LibnvpairWire::pair_type(wire_pair* pair) {
    return static_cast<DataType>(nvpair_type(nvp(pair)));
}

bool LibnvpairWire::pair_is_array(wire_pair* pair) {
    return nvpair_type_is_array(nvp(pair)) != 0;
}

int LibnvpairWire::value_boolean_value(wire_pair* pair, bool* out) {
    boolean_t value = B_FALSE;
    int rc = nvpair_value_boolean_value(nvp(pair), &value);
    if (rc == 0) *out = value == B_TRUE;
    return rc;
}

int LibnvpairWire::value_byte(wire_pair* pair, std::uint8_t* out) {
    uchar_t value = 0;
    int rc = nvpair_value_byte(nvp(pair), &value);
    if (rc == 0) *out = static_cast<std::uint8_t>(value);
    return rc;
}

int LibnvpairWire::value_int8(wire_pair* pair, std::int8_t* out) {
    return nvpair_value_int8(nvp(pair), out);
}

int LibnvpairWire::value_uint8(wire_pair* pair, std::uint8_t* out) {
    return nvpair_value_uint8(nvp(pair), out);
}

int LibnvpairWire::value_int16(wire_pair* pair, std::int16_t* out) {
    return nvpair_value_int16(nvp(pair), out);
}

int LibnvpairWire::value_uint16(wire_pair* pair, std::uint16_t* out) {
    return nvpair_value_uint16(nvp(pair), out);
}

int LibnvpairWire::value_int32(wire_pair* pair, std::int32_t* out) {
    return nvpair_value_int32(nvp(pair), out);
}

int LibnvpairWire::value_uint32(wire_pair* pair, std::uint32_t* out) {
    return nvpair_value_uint32(nvp(pair), out);
}

int LibnvpairWire::value_int64(wire_pair* pair, std::int64_t* out) {
    return nvpair_value_int64(nvp(pair), out);
}

int LibnvpairWire::value_uint64(wire_pair* pair, std::uint64_t* out) {
    return nvpair_value_uint64(nvp(pair), out);
}

int LibnvpairWire::value_string(wire_pair* pair, std::string* out) {
    return read_string(&nvpair_value_string, nvp(pair), out);
}

int LibnvpairWire::value_nvlist(wire_pair* pair, wire_list** out) {
    nvlist_t* value = nullptr;
    int rc = nvpair_value_nvlist(nvp(pair), &value);
    if (rc == 0) *out = wl(value);
    return rc;
}

int LibnvpairWire::value_boolean_array(wire_pair* pair, std::vector<bool>* out) {
    std::vector<boolean_t> raw;
    int rc = copy_array(&nvpair_value_boolean_array, nvp(pair), &raw);
    if (rc != 0) return rc;
    out->clear();
    for (boolean_t v : raw) {
        out->push_back(v == B_TRUE);
    }
    return 0;
}

int LibnvpairWire::value_byte_array(wire_pair* pair, std::vector<std::uint8_t>* out) {
    return copy_array(&nvpair_value_byte_array, nvp(pair), out);
}

int LibnvpairWire::value_int8_array(wire_pair* pair, std::vector<std::int8_t>* out) {
    return copy_array(&nvpair_value_int8_array, nvp(pair), out);
}

int LibnvpairWire::value_uint8_array(wire_pair* pair, std::vector<std::uint8_t>* out) {
    return copy_array(&nvpair_value_uint8_array, nvp(pair), out);
}

int LibnvpairWire::value_int16_array(wire_pair* pair, std::vector<std::int16_t>* out) {
    return copy_array(&nvpair_value_int16_array, nvp(pair), out);
}

int LibnvpairWire::value_uint16_array(wire_pair* pair, std::vector<std::uint16_t>* out) {
    return copy_array(&nvpair_value_uint16_array, nvp(pair), out);
}

int LibnvpairWire::value_int32_array(wire_pair* pair, std::vector<std::int32_t>* out) {
    return copy_array(&nvpair_value_int32_array, nvp(pair), out);
}

int LibnvpairWire::value_uint32_array(wire_pair* pair, std::vector<std::uint32_t>* out) {
    return copy_array(&nvpair_value_uint32_array, nvp(pair), out);
}

int LibnvpairWire::value_int64_array(wire_pair* pair, std::vector<std::int64_t>* out) {
    return copy_array(&nvpair_value_int64_array, nvp(pair), out);
}

int LibnvpairWire::value_uint64_array(wire_pair* pair, std::vector<std::uint64_t>* out) {
    return copy_array(&nvpair_value_uint64_array, nvp(pair), out);
}

int LibnvpairWire::value_string_array(wire_pair* pair, std::vector<std::string>* out) {
    return read_string_array(&nvpair_value_string_array, nvp(pair), out);
}

int LibnvpairWire::value_nvlist_array(wire_pair* pair, std::vector<wire_list*>* out) {
    nvlist_t** values = nullptr;
    uint_t count = 0;
    int rc = nvpair_value_nvlist_array(nvp(pair), &values, &count);
    if (rc != 0) return rc;
    out->clear();
    for (uint_t i = 0; i < count; ++i) {
        out->push_back(wl(values[i]));
    }
    return 0;
}

} // namespace lzc
