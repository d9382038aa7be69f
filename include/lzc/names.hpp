#pragma once

#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Name Syntax
// ============================================================================
//
// filesystem: one or more '/'-separated components
// snapshot:   filesystem@component
// bookmark:   filesystem#component
//
// A component is non-empty and built from letters, digits and "-_.: ".

enum class NameType {
    Invalid,
    Filesystem,
    Snapshot,
    Bookmark,
};

inline const char* name_type_to_string(NameType t) {
    switch (t) {
        case NameType::Invalid: return "invalid";
        case NameType::Filesystem: return "filesystem";
        case NameType::Snapshot: return "snapshot";
        case NameType::Bookmark: return "bookmark";
    }
    return "invalid";
}

bool is_valid_name_component(const std::string& component);
bool is_valid_fs_name(const std::string& name);
bool is_valid_snap_name(const std::string& name);
bool is_valid_bmark_name(const std::string& name);

// True when the name exceeds MAXNAMELEN.
bool is_name_too_long(const std::string& name);

// Classify a name by its syntax; Invalid when it matches none of the forms.
NameType name_type(const std::string& name);

// Leading segment up to the first '/', '@' or '#'.
std::string pool_name(const std::string& name);

// Everything before the first '@' or '#'.
std::string fs_name(const std::string& name);

// True when every name shares the pool of the first one (vacuously true when empty).
bool same_pool(const std::vector<std::string>& names);

} // namespace lzc
