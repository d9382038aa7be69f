#include "lzc/property_builder.hpp"

#include <utility>

namespace lzc {

namespace {

template <typename T>
PropertyArray to_array(const std::vector<T>& values) {
    PropertyArray out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.emplace_back(v);
    }
    return out;
}

} // namespace

PropertyMapBuilder& PropertyMapBuilder::presence(const std::string& key) {
    map_.set(key, Absent{});
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::boolean(const std::string& key, bool value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::byte(const std::string& key, std::uint8_t value) {
    map_.set(key, static_cast<std::byte>(value));
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::int8(const std::string& key, std::int8_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::uint8(const std::string& key, std::uint8_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::int16(const std::string& key, std::int16_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::uint16(const std::string& key, std::uint16_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::int32(const std::string& key, std::int32_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::uint32(const std::string& key, std::uint32_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::int64(const std::string& key, std::int64_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::uint64(const std::string& key, std::uint64_t value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::string(const std::string& key, const std::string& value) {
    map_.set(key, value);
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::nvlist(const std::string& key, PropertyMap value) {
    map_.set(key, std::move(value));
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::uint64_array(const std::string& key,
                                                     const std::vector<std::uint64_t>& values) {
    map_.set(key, to_array(values));
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::string_array(const std::string& key,
                                                     const std::vector<std::string>& values) {
    map_.set(key, to_array(values));
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::nvlist_array(const std::string& key,
                                                     const std::vector<PropertyMap>& values) {
    map_.set(key, to_array(values));
    return *this;
}

PropertyMapBuilder& PropertyMapBuilder::value(const std::string& key, PropertyValue value) {
    map_.set(key, std::move(value));
    return *this;
}

} // namespace lzc
