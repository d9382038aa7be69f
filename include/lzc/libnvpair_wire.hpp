#pragma once

#include "lzc/wire.hpp"

namespace lzc {

// ============================================================================
// libnvpair Binding
// ============================================================================
//
// Wire implementation over the system libnvpair. Containers are allocated
// with NV_UNIQUE_NAME, so adding an existing name replaces it.

class LibnvpairWire : public Wire {
public:
    int alloc(wire_list** out) override;
    void free(wire_list* list) override;
    int packed_size(wire_list* list, std::size_t* size) override;

    int add_boolean(wire_list* list, const char* name) override;
    int add_boolean_value(wire_list* list, const char* name, bool value) override;
    int add_byte(wire_list* list, const char* name, std::uint8_t value) override;
    int add_int8(wire_list* list, const char* name, std::int8_t value) override;
    int add_uint8(wire_list* list, const char* name, std::uint8_t value) override;
    int add_int16(wire_list* list, const char* name, std::int16_t value) override;
    int add_uint16(wire_list* list, const char* name, std::uint16_t value) override;
    int add_int32(wire_list* list, const char* name, std::int32_t value) override;
    int add_uint32(wire_list* list, const char* name, std::uint32_t value) override;
    int add_int64(wire_list* list, const char* name, std::int64_t value) override;
    int add_uint64(wire_list* list, const char* name, std::uint64_t value) override;
    int add_string(wire_list* list, const char* name, const std::string& value) override;
    int add_nvlist(wire_list* list, const char* name, wire_list* value) override;

    int add_boolean_array(wire_list* list, const char* name,
                          const std::vector<bool>& values) override;
    int add_byte_array(wire_list* list, const char* name,
                       const std::vector<std::uint8_t>& values) override;
    int add_int8_array(wire_list* list, const char* name,
                       const std::vector<std::int8_t>& values) override;
    int add_uint8_array(wire_list* list, const char* name,
                        const std::vector<std::uint8_t>& values) override;
    int add_int16_array(wire_list* list, const char* name,
                        const std::vector<std::int16_t>& values) override;
    int add_uint16_array(wire_list* list, const char* name,
                         const std::vector<std::uint16_t>& values) override;
    int add_int32_array(wire_list* list, const char* name,
                        const std::vector<std::int32_t>& values) override;
    int add_uint32_array(wire_list* list, const char* name,
                         const std::vector<std::uint32_t>& values) override;
    int add_int64_array(wire_list* list, const char* name,
                        const std::vector<std::int64_t>& values) override;
    int add_uint64_array(wire_list* list, const char* name,
                         const std::vector<std::uint64_t>& values) override;
    int add_string_array(wire_list* list, const char* name,
                         const std::vector<std::string>& values) override;
    int add_nvlist_array(wire_list* list, const char* name,
                         const std::vector<wire_list*>& values) override;

    wire_pair* next_pair(wire_list* list, wire_pair* prev) override;
    const char* pair_name(wire_pair* pair) override;
    DataType pair_type(wire_pair* pair) override;
    bool pair_is_array(wire_pair* pair) override;

    int value_boolean_value(wire_pair* pair, bool* out) override;
    int value_byte(wire_pair* pair, std::uint8_t* out) override;
    int value_int8(wire_pair* pair, std::int8_t* out) override;
    int value_uint8(wire_pair* pair, std::uint8_t* out) override;
    int value_int16(wire_pair* pair, std::int16_t* out) override;
    int value_uint16(wire_pair* pair, std::uint16_t* out) override;
    int value_int32(wire_pair* pair, std::int32_t* out) override;
    int value_uint32(wire_pair* pair, std::uint32_t* out) override;
    int value_int64(wire_pair* pair, std::int64_t* out) override;
    int value_uint64(wire_pair* pair, std::uint64_t* out) override;
    int value_string(wire_pair* pair, std::string* out) override;
    int value_nvlist(wire_pair* pair, wire_list** out) override;

    int value_boolean_array(wire_pair* pair, std::vector<bool>* out) override;
    int value_byte_array(wire_pair* pair, std::vector<std::uint8_t>* out) override;
    int value_int8_array(wire_pair* pair, std::vector<std::int8_t>* out) override;
    int value_uint8_array(wire_pair* pair, std::vector<std::uint8_t>* out) override;
    int value_int16_array(wire_pair* pair, std::vector<std::int16_t>* out) override;
    int value_uint16_array(wire_pair* pair, std::vector<std::uint16_t>* out) override;
    int value_int32_array(wire_pair* pair, std::vector<std::int32_t>* out) override;
    int value_uint32_array(wire_pair* pair, std::vector<std::uint32_t>* out) override;
    int value_int64_array(wire_pair* pair, std::vector<std::int64_t>* out) override;
    int value_uint64_array(wire_pair* pair, std::vector<std::uint64_t>* out) override;
    int value_string_array(wire_pair* pair, std::vector<std::string>* out) override;
    int value_nvlist_array(wire_pair* pair, std::vector<wire_list*>* out) override;
};

} // namespace lzc
