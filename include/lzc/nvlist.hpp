#pragma once

#include "lzc/property.hpp"
#include "lzc/type_registry.hpp"
#include "lzc/wire.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace lzc {

// ============================================================================
// Codec Errors
// ============================================================================

enum class CodecErrorKind {
    type_mismatch,          // array elements of different alternatives
    unsupported_type,       // host value with no wire form
    unsupported_wire_type,  // wire tag with no host form
    allocation_failed,
    add_failed,
    decode_failed,
};

inline const char* codec_error_kind_to_string(CodecErrorKind kind) {
    switch (kind) {
        case CodecErrorKind::type_mismatch: return "type_mismatch";
        case CodecErrorKind::unsupported_type: return "unsupported_type";
        case CodecErrorKind::unsupported_wire_type: return "unsupported_wire_type";
        case CodecErrorKind::allocation_failed: return "allocation_failed";
        case CodecErrorKind::add_failed: return "add_failed";
        case CodecErrorKind::decode_failed: return "decode_failed";
    }
    return "unknown";
}

class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrorKind kind, const std::string& key, const std::string& detail,
               int status = 0, std::optional<std::size_t> index = std::nullopt);

    CodecErrorKind kind() const { return kind_; }

    // Dotted path of the offending key ("props.user:tags"); empty for the root
    const std::string& key() const { return key_; }
    int status() const { return status_; }
    std::optional<std::size_t> index() const { return index_; }

private:
    CodecErrorKind kind_;
    std::string key_;
    int status_;
    std::optional<std::size_t> index_;
};

// ============================================================================
// Container Ownership
// ============================================================================

// Move-only owner of one wire_list*; frees it on destruction.
class NvlistHandle {
public:
    NvlistHandle() = default;
    NvlistHandle(Wire& wire, wire_list* list) : wire_(&wire), list_(list) {}
    ~NvlistHandle() { reset(); }

    NvlistHandle(const NvlistHandle&) = delete;
    NvlistHandle& operator=(const NvlistHandle&) = delete;

    NvlistHandle(NvlistHandle&& other) noexcept;
    NvlistHandle& operator=(NvlistHandle&& other) noexcept;

    wire_list* get() const { return list_; }
    explicit operator bool() const { return list_ != nullptr; }

    // Gives up ownership without freeing
    wire_list* release();

    void reset();

private:
    Wire* wire_ = nullptr;
    wire_list* list_ = nullptr;
};

// ============================================================================
// Encode / Decode
// ============================================================================

// Encode a property map into a freshly allocated container. The map is
// validated in full before anything is allocated. Throws CodecError.
NvlistHandle encode(Wire& wire, const PropertyMap& props,
                    const IntegerWidthTable& widths = IntegerWidthTable::builtin());

// Decode a container into props (cleared first). A null list decodes to an
// empty map. The list stays owned by the caller. Throws CodecError.
void decode(Wire& wire, wire_list* list, PropertyMap& props);

// Throws CodecError(type_mismatch / unsupported_type) for values that can not
// be encoded.
void validate(const PropertyMap& props);

// Output container for calls that allocate a result list into a slot.
class NvlistOut {
public:
    explicit NvlistOut(Wire& wire) : wire_(&wire) {}
    ~NvlistOut();

    NvlistOut(const NvlistOut&) = delete;
    NvlistOut& operator=(const NvlistOut&) = delete;

    wire_list** slot() { return &list_; }

    // Decodes whatever the call placed in the slot into props and frees the
    // container, also when decoding throws.
    void finish(PropertyMap& props);

private:
    Wire* wire_;
    wire_list* list_ = nullptr;
};

// Run fn(wire_list*) with an encoded copy of props; returns fn's status.
template <typename Fn>
int with_nvlist_in(Wire& wire, const PropertyMap& props, Fn&& fn,
                   const IntegerWidthTable& widths = IntegerWidthTable::builtin()) {
    NvlistHandle handle = encode(wire, props, widths);
    return fn(handle.get());
}

// Run fn(wire_list**) and decode its output into props; returns fn's status.
template <typename Fn>
int with_nvlist_out(Wire& wire, PropertyMap& props, Fn&& fn) {
    NvlistOut out(wire);
    int status = fn(out.slot());
    out.finish(props);
    return status;
}

} // namespace lzc
