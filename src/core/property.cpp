#include "lzc/property.hpp"

#include <algorithm>
#include <stdexcept>

namespace lzc {

PropertyMap::PropertyMap(std::initializer_list<value_type> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

const PropertyValue* PropertyMap::find(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const value_type& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

PropertyValue* PropertyMap::find(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const value_type& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

const PropertyValue& PropertyMap::at(const std::string& key) const {
    if (const auto* value = find(key)) {
        return *value;
    }
    throw std::out_of_range("Key " + key + " does not exist in property map");
}

void PropertyMap::set(const std::string& key, PropertyValue value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool PropertyMap::erase(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const value_type& e) { return e.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool PropertyMap::operator==(const PropertyMap& other) const {
    return entries_ == other.entries_;
}

const char* PropertyValue::type_name() const {
    // Indexed by variant_type alternative order
    static const char* const names[] = {
        "absent", "boolean_value", "byte",   "int8",  "uint8",
        "int16",  "uint16",        "int32",  "uint32", "int64",
        "uint64", "string",        "nvlist", "array",
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<variant_type>,
                  "type_name table out of sync with PropertyValue alternatives");
    return names[value_.index()];
}

} // namespace lzc
