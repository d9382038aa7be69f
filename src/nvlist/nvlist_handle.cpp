#include "lzc/log.hpp"
#include "lzc/nvlist.hpp"

#include <utility>

namespace lzc {

namespace {

std::string describe(CodecErrorKind kind, const std::string& key, const std::string& detail,
                     std::optional<std::size_t> index) {
    std::string msg = codec_error_kind_to_string(kind);
    if (!key.empty()) {
        msg += " at '" + key + "'";
    }
    if (index) {
        msg += "[" + std::to_string(*index) + "]";
    }
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    return msg;
}

} // namespace

CodecError::CodecError(CodecErrorKind kind, const std::string& key, const std::string& detail,
                       int status, std::optional<std::size_t> index)
    : std::runtime_error(describe(kind, key, detail, index)),
      kind_(kind),
      key_(key),
      status_(status),
      index_(index) {}

NvlistHandle::NvlistHandle(NvlistHandle&& other) noexcept
    : wire_(other.wire_), list_(other.list_) {
    other.list_ = nullptr;
}

NvlistHandle& NvlistHandle::operator=(NvlistHandle&& other) noexcept {
    if (this != &other) {
        reset();
        wire_ = other.wire_;
        list_ = std::exchange(other.list_, nullptr);
    }
    return *this;
}

wire_list* NvlistHandle::release() {
    return std::exchange(list_, nullptr);
}

void NvlistHandle::reset() {
    if (list_ && wire_) {
        wire_->free(list_);
    }
    list_ = nullptr;
}

NvlistOut::~NvlistOut() {
    if (list_) {
        log::logger()->trace("releasing unconsumed output container");
        wire_->free(list_);
    }
}

void NvlistOut::finish(PropertyMap& props) {
    NvlistHandle owned(*wire_, std::exchange(list_, nullptr));
    decode(*wire_, owned.get(), props);
}

} // namespace lzc
