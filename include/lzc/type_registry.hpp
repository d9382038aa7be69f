#pragma once

#include "lzc/property.hpp"
#include "lzc/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Wire Type Table
// ============================================================================

struct TypeInfo {
    DataType tag;
    DataType element;       // scalar form of the tag (the tag itself for scalars)
    DataType array;         // array form, unknown when the scalar has none
    bool is_array;
    const char* host_type;  // PropertyValue alternative produced on decode
};

// Every tag that has a host form; hrtime, double and unknown are absent.
const std::vector<TypeInfo>& type_table();

// nullptr when the tag has no host form
const TypeInfo* find_type_info(DataType tag);

bool is_integer_type(DataType tag);

// Wire tag a value encodes to, ignoring width overrides. nullopt for values
// with no wire form (empty arrays, arrays of absent or of arrays).
std::optional<DataType> wire_type_of(const PropertyValue& value);

// ============================================================================
// Integer Width Overrides
// ============================================================================
//
// Keys whose integer values must reach the wire at a fixed width even when
// the host carries them as int64_t/uint64_t.

class IntegerWidthTable {
public:
    // Built-ins: rewind-request uint32, type uint32, N_MORE_ERRORS int32,
    // pool_context int32
    IntegerWidthTable();

    static const IntegerWidthTable& builtin();

    // Registers an extra key. Returns false for non-integer or array tags
    // and for built-in keys, which can not be changed.
    bool add(const std::string& key, DataType width);

    std::optional<DataType> find(const std::string& key) const;

    const std::map<std::string, DataType>& entries() const { return widths_; }

private:
    std::map<std::string, DataType> widths_;
};

} // namespace lzc
