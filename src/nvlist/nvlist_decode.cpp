#include "lzc/log.hpp"
#include "lzc/nvlist.hpp"

#include <vector>

namespace lzc {

namespace {

void check_value(int status, const std::string& path) {
    if (status != 0) {
        throw CodecError(CodecErrorKind::decode_failed, path, "value accessor failed", status);
    }
}

void decode_into(Wire& wire, wire_list* list, PropertyMap& props, const std::string& path);

template <typename T>
PropertyValue decode_typed(Wire& wire, wire_pair* pair, bool is_array, const std::string& path) {
    using traits = wire_traits<T>;
    using wire_type = typename traits::wire_type;

    if (is_array) {
        std::vector<wire_type> raw;
        check_value(traits::value_array(wire, pair, &raw), path);
        PropertyArray out;
        out.reserve(raw.size());
        for (auto v : raw) {
            out.emplace_back(static_cast<T>(v));
        }
        return out;
    }

    wire_type raw{};
    check_value(traits::value(wire, pair, &raw), path);
    return PropertyValue(static_cast<T>(raw));
}

PropertyValue decode_nested(Wire& wire, wire_pair* pair, bool is_array, const std::string& path) {
    if (is_array) {
        std::vector<wire_list*> lists;
        check_value(wire.value_nvlist_array(pair, &lists), path);
        PropertyArray out;
        out.reserve(lists.size());
        for (std::size_t i = 0; i < lists.size(); ++i) {
            PropertyMap nested;
            decode_into(wire, lists[i], nested, path + "[" + std::to_string(i) + "]");
            out.emplace_back(std::move(nested));
        }
        return out;
    }

    wire_list* borrowed = nullptr;
    check_value(wire.value_nvlist(pair, &borrowed), path);
    PropertyMap nested;
    decode_into(wire, borrowed, nested, path);
    return nested;
}

PropertyValue decode_pair(Wire& wire, wire_pair* pair, const std::string& path) {
    DataType tag = wire.pair_type(pair);
    const TypeInfo* info = find_type_info(tag);
    if (!info) {
        throw CodecError(CodecErrorKind::unsupported_wire_type, path,
                         std::string("no host form for ") + data_type_to_string(tag));
    }

    bool is_array = wire.pair_is_array(pair);
    switch (info->element) {
        case DataType::boolean: return Absent{};
        case DataType::boolean_value: return decode_typed<bool>(wire, pair, is_array, path);
        case DataType::byte: return decode_typed<std::byte>(wire, pair, is_array, path);
        case DataType::int8: return decode_typed<std::int8_t>(wire, pair, is_array, path);
        case DataType::uint8: return decode_typed<std::uint8_t>(wire, pair, is_array, path);
        case DataType::int16: return decode_typed<std::int16_t>(wire, pair, is_array, path);
        case DataType::uint16: return decode_typed<std::uint16_t>(wire, pair, is_array, path);
        case DataType::int32: return decode_typed<std::int32_t>(wire, pair, is_array, path);
        case DataType::uint32: return decode_typed<std::uint32_t>(wire, pair, is_array, path);
        case DataType::int64: return decode_typed<std::int64_t>(wire, pair, is_array, path);
        case DataType::uint64: return decode_typed<std::uint64_t>(wire, pair, is_array, path);
        case DataType::string: return decode_typed<std::string>(wire, pair, is_array, path);
        case DataType::nvlist: return decode_nested(wire, pair, is_array, path);
        default: break;
    }
    throw CodecError(CodecErrorKind::unsupported_wire_type, path,
                     std::string("no host form for ") + data_type_to_string(tag));
}

void decode_into(Wire& wire, wire_list* list, PropertyMap& props, const std::string& path) {
    if (!list) return;

    for (wire_pair* pair = wire.next_pair(list, nullptr); pair != nullptr;
         pair = wire.next_pair(list, pair)) {
        std::string name = wire.pair_name(pair);
        std::string here = path.empty() ? name : path + "." + name;
        props.set(name, decode_pair(wire, pair, here));
    }
}

} // namespace

void decode(Wire& wire, wire_list* list, PropertyMap& props) {
    props.clear();
    decode_into(wire, list, props, "");
    log::logger()->debug("decoded {} top-level properties", props.size());
}

} // namespace lzc
