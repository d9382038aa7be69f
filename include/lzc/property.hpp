#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lzc {

// ============================================================================
// Property Values
// ============================================================================
//
// A PropertyMap is the host-side form of an nvlist: an insertion-ordered
// mapping from unique string keys to PropertyValue. A PropertyValue is one of
// a closed set of alternatives, each with exactly one wire representation:
//
//   Absent          presence-only boolean (DATA_TYPE_BOOLEAN)
//   bool            boolean_value
//   std::byte       byte
//   [u]intN_t       explicitly sized integers
//   std::string     string
//   PropertyMap     nested nvlist
//   PropertyArray   homogeneous array of any of the above except Absent
//                   and PropertyArray

// Presence-only boolean: the key exists, carries no value.
struct Absent {
    bool operator==(const Absent&) const { return true; }
    bool operator!=(const Absent&) const { return false; }
};

class PropertyValue;

using PropertyArray = std::vector<PropertyValue>;

class PropertyMap {
public:
    using value_type = std::pair<std::string, PropertyValue>;
    using const_iterator = std::vector<value_type>::const_iterator;

    PropertyMap() = default;
    PropertyMap(std::initializer_list<value_type> entries);

    bool empty() const;
    std::size_t size() const;

    const_iterator begin() const;
    const_iterator end() const;

    // Returns nullptr when the key is not present
    const PropertyValue* find(const std::string& key) const;
    PropertyValue* find(const std::string& key);

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Throws std::out_of_range when the key is not present
    const PropertyValue& at(const std::string& key) const;

    // Replaces the value in place when the key exists, appends otherwise
    void set(const std::string& key, PropertyValue value);

    // Returns true if the key was present
    bool erase(const std::string& key);

    void clear();

    bool operator==(const PropertyMap& other) const;
    bool operator!=(const PropertyMap& other) const;

private:
    std::vector<value_type> entries_;
};

class PropertyValue {
public:
    using variant_type = std::variant<Absent,
                                      bool,
                                      std::byte,
                                      std::int8_t,
                                      std::uint8_t,
                                      std::int16_t,
                                      std::uint16_t,
                                      std::int32_t,
                                      std::uint32_t,
                                      std::int64_t,
                                      std::uint64_t,
                                      std::string,
                                      PropertyMap,
                                      PropertyArray>;

    PropertyValue() : value_(Absent{}) {}
    PropertyValue(Absent v) : value_(v) {}
    PropertyValue(bool v) : value_(v) {}
    PropertyValue(std::byte v) : value_(v) {}
    PropertyValue(std::int8_t v) : value_(v) {}
    PropertyValue(std::uint8_t v) : value_(v) {}
    PropertyValue(std::int16_t v) : value_(v) {}
    PropertyValue(std::uint16_t v) : value_(v) {}
    PropertyValue(std::int32_t v) : value_(v) {}
    PropertyValue(std::uint32_t v) : value_(v) {}
    PropertyValue(std::int64_t v) : value_(v) {}
    PropertyValue(std::uint64_t v) : value_(v) {}
    PropertyValue(const char* v) : value_(std::string(v)) {}
    PropertyValue(std::string v) : value_(std::move(v)) {}
    PropertyValue(PropertyMap v) : value_(std::move(v)) {}
    PropertyValue(PropertyArray v) : value_(std::move(v)) {}

    template <typename T>
    bool holds() const {
        return std::holds_alternative<T>(value_);
    }

    template <typename T>
    const T& get() const {
        return std::get<T>(value_);
    }

    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&value_);
    }

    const variant_type& variant() const { return value_; }
    std::size_t index() const { return value_.index(); }

    // Short name of the held alternative ("uint32", "string", "nvlist", "array", ...)
    const char* type_name() const;

    bool operator==(const PropertyValue& other) const { return value_ == other.value_; }
    bool operator!=(const PropertyValue& other) const { return !(*this == other); }

private:
    variant_type value_;
};

inline bool PropertyMap::empty() const { return entries_.empty(); }
inline std::size_t PropertyMap::size() const { return entries_.size(); }
inline PropertyMap::const_iterator PropertyMap::begin() const { return entries_.begin(); }
inline PropertyMap::const_iterator PropertyMap::end() const { return entries_.end(); }
inline void PropertyMap::clear() { entries_.clear(); }
inline bool PropertyMap::operator!=(const PropertyMap& other) const { return !(*this == other); }

} // namespace lzc
