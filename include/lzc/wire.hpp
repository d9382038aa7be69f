#pragma once

#include "lzc/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Wire Boundary
// ============================================================================
//
// Abstract view of the nvlist container library. Handles are opaque; a
// wire_list* returned by alloc() must be released with free() exactly once.
// Every int-returning call follows the libnvpair convention: 0 on success,
// an errno value otherwise.
//
// value_nvlist() and value_nvlist_array() return borrowed handles owned by
// the enclosing list; they must not be freed.

struct wire_list;
struct wire_pair;

class Wire {
public:
    virtual ~Wire() = default;

    virtual int alloc(wire_list** out) = 0;
    virtual void free(wire_list* list) = 0;

    // Packed (XDR) size of the list
    virtual int packed_size(wire_list* list, std::size_t* size) = 0;

    // Add accessors. The list keeps its own copy of every value, nested
    // lists included.
    virtual int add_boolean(wire_list* list, const char* name) = 0;
    virtual int add_boolean_value(wire_list* list, const char* name, bool value) = 0;
    virtual int add_byte(wire_list* list, const char* name, std::uint8_t value) = 0;
    virtual int add_int8(wire_list* list, const char* name, std::int8_t value) = 0;
    virtual int add_uint8(wire_list* list, const char* name, std::uint8_t value) = 0;
    virtual int add_int16(wire_list* list, const char* name, std::int16_t value) = 0;
    virtual int add_uint16(wire_list* list, const char* name, std::uint16_t value) = 0;
    virtual int add_int32(wire_list* list, const char* name, std::int32_t value) = 0;
    virtual int add_uint32(wire_list* list, const char* name, std::uint32_t value) = 0;
    virtual int add_int64(wire_list* list, const char* name, std::int64_t value) = 0;
    virtual int add_uint64(wire_list* list, const char* name, std::uint64_t value) = 0;
    virtual int add_string(wire_list* list, const char* name, const std::string& value) = 0;
    virtual int add_nvlist(wire_list* list, const char* name, wire_list* value) = 0;

    virtual int add_boolean_array(wire_list* list, const char* name,
                                  const std::vector<bool>& values) = 0;
    virtual int add_byte_array(wire_list* list, const char* name,
                               const std::vector<std::uint8_t>& values) = 0;
    virtual int add_int8_array(wire_list* list, const char* name,
                               const std::vector<std::int8_t>& values) = 0;
    virtual int add_uint8_array(wire_list* list, const char* name,
                                const std::vector<std::uint8_t>& values) = 0;
    virtual int add_int16_array(wire_list* list, const char* name,
                                const std::vector<std::int16_t>& values) = 0;
    virtual int add_uint16_array(wire_list* list, const char* name,
                                 const std::vector<std::uint16_t>& values) = 0;
    virtual int add_int32_array(wire_list* list, const char* name,
                                const std::vector<std::int32_t>& values) = 0;
    virtual int add_uint32_array(wire_list* list, const char* name,
                                 const std::vector<std::uint32_t>& values) = 0;
    virtual int add_int64_array(wire_list* list, const char* name,
                                const std::vector<std::int64_t>& values) = 0;
    virtual int add_uint64_array(wire_list* list, const char* name,
                                 const std::vector<std::uint64_t>& values) = 0;
    virtual int add_string_array(wire_list* list, const char* name,
                                 const std::vector<std::string>& values) = 0;
    virtual int add_nvlist_array(wire_list* list, const char* name,
                                 const std::vector<wire_list*>& values) = 0;

    // Iteration in insertion order; next_pair(list, nullptr) yields the first
    virtual wire_pair* next_pair(wire_list* list, wire_pair* prev) = 0;
    virtual const char* pair_name(wire_pair* pair) = 0;
    virtual DataType pair_type(wire_pair* pair) = 0;
    virtual bool pair_is_array(wire_pair* pair) = 0;

    // Value accessors
    virtual int value_boolean_value(wire_pair* pair, bool* out) = 0;
    virtual int value_byte(wire_pair* pair, std::uint8_t* out) = 0;
    virtual int value_int8(wire_pair* pair, std::int8_t* out) = 0;
    virtual int value_uint8(wire_pair* pair, std::uint8_t* out) = 0;
    virtual int value_int16(wire_pair* pair, std::int16_t* out) = 0;
    virtual int value_uint16(wire_pair* pair, std::uint16_t* out) = 0;
    virtual int value_int32(wire_pair* pair, std::int32_t* out) = 0;
    virtual int value_uint32(wire_pair* pair, std::uint32_t* out) = 0;
    virtual int value_int64(wire_pair* pair, std::int64_t* out) = 0;
    virtual int value_uint64(wire_pair* pair, std::uint64_t* out) = 0;
    virtual int value_string(wire_pair* pair, std::string* out) = 0;
    virtual int value_nvlist(wire_pair* pair, wire_list** out) = 0;

    virtual int value_boolean_array(wire_pair* pair, std::vector<bool>* out) = 0;
    virtual int value_byte_array(wire_pair* pair, std::vector<std::uint8_t>* out) = 0;
    virtual int value_int8_array(wire_pair* pair, std::vector<std::int8_t>* out) = 0;
    virtual int value_uint8_array(wire_pair* pair, std::vector<std::uint8_t>* out) = 0;
    virtual int value_int16_array(wire_pair* pair, std::vector<std::int16_t>* out) = 0;
    virtual int value_uint16_array(wire_pair* pair, std::vector<std::uint16_t>* out) = 0;
    virtual int value_int32_array(wire_pair* pair, std::vector<std::int32_t>* out) = 0;
    virtual int value_uint32_array(wire_pair* pair, std::vector<std::uint32_t>* out) = 0;
    virtual int value_int64_array(wire_pair* pair, std::vector<std::int64_t>* out) = 0;
    virtual int value_uint64_array(wire_pair* pair, std::vector<std::uint64_t>* out) = 0;
    virtual int value_string_array(wire_pair* pair, std::vector<std::string>* out) = 0;
    virtual int value_nvlist_array(wire_pair* pair, std::vector<wire_list*>* out) = 0;
};

// ============================================================================
// Accessor Traits
// ============================================================================
//
// wire_traits<T> binds a PropertyValue scalar alternative to its wire tags
// and to the add/value accessor pair for its scalar and array forms.
// wire_type is the element type the accessors take (std::byte travels as
// uint8_t).

template <typename T>
struct wire_traits;

#define LZC_WIRE_TRAITS(HOST, WIRE, SCALAR, ARRAY)                                     \
    template <>                                                                        \
    struct wire_traits<HOST> {                                                         \
        using wire_type = WIRE;                                                        \
        static constexpr DataType type = DataType::SCALAR;                             \
        static constexpr DataType array_type = DataType::ARRAY;                        \
        static int add(Wire& w, wire_list* l, const char* n, const wire_type& v) {     \
            return w.add_##SCALAR(l, n, v);                                            \
        }                                                                              \
        static int add_array(Wire& w, wire_list* l, const char* n,                     \
                             const std::vector<wire_type>& v) {                        \
            return w.add_##ARRAY(l, n, v);                                             \
        }                                                                              \
        static int value(Wire& w, wire_pair* p, wire_type* out) {                      \
            return w.value_##SCALAR(p, out);                                           \
        }                                                                              \
        static int value_array(Wire& w, wire_pair* p, std::vector<wire_type>* out) {   \
            return w.value_##ARRAY(p, out);                                            \
        }                                                                              \
    }

LZC_WIRE_TRAITS(bool, bool, boolean_value, boolean_array);
LZC_WIRE_TRAITS(std::byte, std::uint8_t, byte, byte_array);
LZC_WIRE_TRAITS(std::int8_t, std::int8_t, int8, int8_array);
LZC_WIRE_TRAITS(std::uint8_t, std::uint8_t, uint8, uint8_array);
LZC_WIRE_TRAITS(std::int16_t, std::int16_t, int16, int16_array);
LZC_WIRE_TRAITS(std::uint16_t, std::uint16_t, uint16, uint16_array);
LZC_WIRE_TRAITS(std::int32_t, std::int32_t, int32, int32_array);
LZC_WIRE_TRAITS(std::uint32_t, std::uint32_t, uint32, uint32_array);
LZC_WIRE_TRAITS(std::int64_t, std::int64_t, int64, int64_array);
LZC_WIRE_TRAITS(std::uint64_t, std::uint64_t, uint64, uint64_array);
LZC_WIRE_TRAITS(std::string, std::string, string, string_array);

#undef LZC_WIRE_TRAITS

} // namespace lzc
