#pragma once

#include "lzc/property.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Property Map Builder
// ============================================================================
//
// Fluent construction of request maps with explicit wire widths:
//
//   auto props = lzc::properties()
//       .uint64("compression", 2)
//       .string("mountpoint", "/mnt/data")
//       .presence("force")
//       .build();

class PropertyMapBuilder {
public:
    PropertyMapBuilder& presence(const std::string& key);
    PropertyMapBuilder& boolean(const std::string& key, bool value);
    PropertyMapBuilder& byte(const std::string& key, std::uint8_t value);
    PropertyMapBuilder& int8(const std::string& key, std::int8_t value);
    PropertyMapBuilder& uint8(const std::string& key, std::uint8_t value);
    PropertyMapBuilder& int16(const std::string& key, std::int16_t value);
    PropertyMapBuilder& uint16(const std::string& key, std::uint16_t value);
    PropertyMapBuilder& int32(const std::string& key, std::int32_t value);
    PropertyMapBuilder& uint32(const std::string& key, std::uint32_t value);
    PropertyMapBuilder& int64(const std::string& key, std::int64_t value);
    PropertyMapBuilder& uint64(const std::string& key, std::uint64_t value);
    PropertyMapBuilder& string(const std::string& key, const std::string& value);
    PropertyMapBuilder& nvlist(const std::string& key, PropertyMap value);

    PropertyMapBuilder& uint64_array(const std::string& key,
                                     const std::vector<std::uint64_t>& values);
    PropertyMapBuilder& string_array(const std::string& key,
                                     const std::vector<std::string>& values);
    PropertyMapBuilder& nvlist_array(const std::string& key,
                                     const std::vector<PropertyMap>& values);

    // Any value, including arrays of other widths
    PropertyMapBuilder& value(const std::string& key, PropertyValue value);

    PropertyMap build() const { return map_; }

private:
    PropertyMap map_;
};

// Factory function for fluent building
inline PropertyMapBuilder properties() {
    return PropertyMapBuilder();
}

} // namespace lzc
