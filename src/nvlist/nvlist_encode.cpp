#include "lzc/log.hpp"
#include "lzc/nvlist.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace lzc {

namespace {

std::string child_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string element_path(const std::string& path, std::size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

// ============================================================================
// Validation
// ============================================================================

void validate_map(const PropertyMap& props, const std::string& path);

void validate_array(const PropertyArray& values, const std::string& path) {
    if (values.empty()) {
        throw CodecError(CodecErrorKind::unsupported_type, path,
                         "empty array has no element type");
    }

    const PropertyValue& first = values.front();
    if (first.holds<Absent>() || first.holds<PropertyArray>()) {
        throw CodecError(CodecErrorKind::unsupported_type, path,
                         std::string("arrays of ") + first.type_name() + " have no wire form");
    }

    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i].index() != first.index()) {
            throw CodecError(CodecErrorKind::type_mismatch, path,
                             std::string("array mixes ") + first.type_name() + " and " +
                                 values[i].type_name(),
                             0, i);
        }
    }

    if (first.holds<PropertyMap>()) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            validate_map(values[i].get<PropertyMap>(), element_path(path, i));
        }
    }
}

void validate_map(const PropertyMap& props, const std::string& path) {
    for (const auto& [key, value] : props) {
        const std::string here = child_path(path, key);
        if (const auto* array = value.get_if<PropertyArray>()) {
            validate_array(*array, here);
        } else if (const auto* nested = value.get_if<PropertyMap>()) {
            validate_map(*nested, here);
        }
    }
}

// ============================================================================
// Encoding
// ============================================================================

void check_add(int status, const std::string& path) {
    if (status != 0) {
        throw CodecError(CodecErrorKind::add_failed, path, "wire rejected value", status);
    }
}

NvlistHandle allocate(Wire& wire, const std::string& path) {
    wire_list* raw = nullptr;
    int status = wire.alloc(&raw);
    if (status != 0) {
        throw CodecError(CodecErrorKind::allocation_failed, path, "container allocation failed",
                         status);
    }
    return NvlistHandle(wire, raw);
}

template <typename T>
typename wire_traits<T>::wire_type to_wire(const T& value) {
    return static_cast<typename wire_traits<T>::wire_type>(value);
}

template <typename Int>
int add_forced(Wire& wire, wire_list* list, const char* name, DataType width, Int value) {
    switch (width) {
        case DataType::int8: return wire.add_int8(list, name, static_cast<std::int8_t>(value));
        case DataType::uint8: return wire.add_uint8(list, name, static_cast<std::uint8_t>(value));
        case DataType::int16: return wire.add_int16(list, name, static_cast<std::int16_t>(value));
        case DataType::uint16: return wire.add_uint16(list, name, static_cast<std::uint16_t>(value));
        case DataType::int32: return wire.add_int32(list, name, static_cast<std::int32_t>(value));
        case DataType::uint32: return wire.add_uint32(list, name, static_cast<std::uint32_t>(value));
        case DataType::int64: return wire.add_int64(list, name, static_cast<std::int64_t>(value));
        case DataType::uint64: return wire.add_uint64(list, name, static_cast<std::uint64_t>(value));
        default: break;
    }
    return wire_traits<Int>::add(wire, list, name, value);
}

template <typename To, typename From>
std::vector<To> narrow_all(const std::vector<From>& values) {
    std::vector<To> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(static_cast<To>(v));
    }
    return out;
}

template <typename Int>
int add_forced_array(Wire& wire, wire_list* list, const char* name, DataType width,
                     const std::vector<Int>& values) {
    switch (width) {
        case DataType::int8: return wire.add_int8_array(list, name, narrow_all<std::int8_t>(values));
        case DataType::uint8: return wire.add_uint8_array(list, name, narrow_all<std::uint8_t>(values));
        case DataType::int16: return wire.add_int16_array(list, name, narrow_all<std::int16_t>(values));
        case DataType::uint16: return wire.add_uint16_array(list, name, narrow_all<std::uint16_t>(values));
        case DataType::int32: return wire.add_int32_array(list, name, narrow_all<std::int32_t>(values));
        case DataType::uint32: return wire.add_uint32_array(list, name, narrow_all<std::uint32_t>(values));
        case DataType::int64: return wire.add_int64_array(list, name, narrow_all<std::int64_t>(values));
        case DataType::uint64: return wire.add_uint64_array(list, name, narrow_all<std::uint64_t>(values));
        default: break;
    }
    return wire_traits<Int>::add_array(wire, list, name, values);
}

template <typename T>
constexpr bool is_natural_int_v =
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>;

class Encoder {
public:
    Encoder(Wire& wire, const IntegerWidthTable& widths) : wire_(wire), widths_(widths) {}

    void encode_map(wire_list* list, const PropertyMap& props, const std::string& path) {
        for (const auto& [key, value] : props) {
            encode_value(list, key, value, child_path(path, key));
        }
    }

private:
    void encode_value(wire_list* list, const std::string& key, const PropertyValue& value,
                      const std::string& path) {
        const char* name = key.c_str();
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Absent>) {
                    check_add(wire_.add_boolean(list, name), path);
                } else if constexpr (std::is_same_v<T, PropertyMap>) {
                    NvlistHandle child = allocate(wire_, path);
                    encode_map(child.get(), v, path);
                    check_add(wire_.add_nvlist(list, name, child.get()), path);
                } else if constexpr (std::is_same_v<T, PropertyArray>) {
                    encode_array(list, key, v, path);
                } else if constexpr (is_natural_int_v<T>) {
                    if (auto width = widths_.find(key)) {
                        log::logger()->trace("encoding '{}' at forced width {}", path,
                                             data_type_to_string(*width));
                        check_add(add_forced(wire_, list, name, *width, v), path);
                    } else {
                        check_add(wire_traits<T>::add(wire_, list, name, v), path);
                    }
                } else {
                    check_add(wire_traits<T>::add(wire_, list, name, to_wire(v)), path);
                }
            },
            value.variant());
    }

    void encode_array(wire_list* list, const std::string& key, const PropertyArray& values,
                      const std::string& path) {
        const char* name = key.c_str();
        std::visit(
            [&](const auto& first) {
                using T = std::decay_t<decltype(first)>;
                if constexpr (std::is_same_v<T, Absent> || std::is_same_v<T, PropertyArray>) {
                    throw CodecError(CodecErrorKind::unsupported_type, path,
                                     "array element has no wire form");
                } else if constexpr (std::is_same_v<T, PropertyMap>) {
                    encode_map_array(list, name, values, path);
                } else {
                    using wire_type = typename wire_traits<T>::wire_type;
                    std::vector<wire_type> raw;
                    raw.reserve(values.size());
                    for (const auto& element : values) {
                        raw.push_back(to_wire(element.get<T>()));
                    }
                    if constexpr (is_natural_int_v<T>) {
                        if (auto width = widths_.find(key)) {
                            check_add(add_forced_array(wire_, list, name, *width, raw), path);
                            return;
                        }
                    }
                    check_add(wire_traits<T>::add_array(wire_, list, name, raw), path);
                }
            },
            values.front().variant());
    }

    void encode_map_array(wire_list* list, const char* name, const PropertyArray& values,
                          const std::string& path) {
        // All containers are allocated up front; on failure the ones already
        // allocated are released by their owners.
        std::vector<NvlistHandle> children;
        children.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            wire_list* raw = nullptr;
            int status = wire_.alloc(&raw);
            if (status != 0) {
                log::logger()->debug("allocation of element {} of '{}' failed, releasing {}", i,
                                     path, children.size());
                throw CodecError(CodecErrorKind::allocation_failed, path,
                                 "container allocation failed", status, i);
            }
            children.emplace_back(wire_, raw);
        }

        std::vector<wire_list*> raw_lists;
        raw_lists.reserve(children.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            encode_map(children[i].get(), values[i].get<PropertyMap>(), element_path(path, i));
            raw_lists.push_back(children[i].get());
        }
        check_add(wire_.add_nvlist_array(list, name, raw_lists), path);
    }

    Wire& wire_;
    const IntegerWidthTable& widths_;
};

} // namespace

void validate(const PropertyMap& props) {
    validate_map(props, "");
}

NvlistHandle encode(Wire& wire, const PropertyMap& props, const IntegerWidthTable& widths) {
    validate(props);

    NvlistHandle root = allocate(wire, "");
    Encoder(wire, widths).encode_map(root.get(), props, "");
    log::logger()->debug("encoded {} top-level properties", props.size());
    return root;
}

} // namespace lzc
