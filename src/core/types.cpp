#include "lzc/types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <optional>
#include <stdexcept>
#include <string>

namespace lzc {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

struct ErrnoName {
    int value;
    const char* name;
};

const ErrnoName kErrnoNames[] = {
    {EPERM, "EPERM"},
    {ENOENT, "ENOENT"},
    {EIO, "EIO"},
    {E2BIG, "E2BIG"},
    {EBADF, "EBADF"},
    {EAGAIN, "EAGAIN"},
    {ENOMEM, "ENOMEM"},
    {EACCES, "EACCES"},
    {EFAULT, "EFAULT"},
    {EBUSY, "EBUSY"},
    {EEXIST, "EEXIST"},
    {EXDEV, "EXDEV"},
    {ENODEV, "ENODEV"},
    {EINVAL, "EINVAL"},
    {ETXTBSY, "ETXTBSY"},
    {EFBIG, "EFBIG"},
    {ENOSPC, "ENOSPC"},
    {EROFS, "EROFS"},
    {ENAMETOOLONG, "ENAMETOOLONG"},
    {ENOTEMPTY, "ENOTEMPTY"},
    {ENOTSUP, "ENOTSUP"},
    {EDQUOT, "EDQUOT"},
};

} // namespace

const char* data_type_to_string(DataType type) {
    switch (type) {
        case DataType::unknown: return "unknown";
        case DataType::boolean: return "boolean";
        case DataType::byte: return "byte";
        case DataType::int16: return "int16";
        case DataType::uint16: return "uint16";
        case DataType::int32: return "int32";
        case DataType::uint32: return "uint32";
        case DataType::int64: return "int64";
        case DataType::uint64: return "uint64";
        case DataType::string: return "string";
        case DataType::byte_array: return "byte_array";
        case DataType::int16_array: return "int16_array";
        case DataType::uint16_array: return "uint16_array";
        case DataType::int32_array: return "int32_array";
        case DataType::uint32_array: return "uint32_array";
        case DataType::int64_array: return "int64_array";
        case DataType::uint64_array: return "uint64_array";
        case DataType::string_array: return "string_array";
        case DataType::hrtime: return "hrtime";
        case DataType::nvlist: return "nvlist";
        case DataType::nvlist_array: return "nvlist_array";
        case DataType::boolean_value: return "boolean_value";
        case DataType::int8: return "int8";
        case DataType::uint8: return "uint8";
        case DataType::boolean_array: return "boolean_array";
        case DataType::int8_array: return "int8_array";
        case DataType::uint8_array: return "uint8_array";
        case DataType::double_value: return "double";
    }
    return "unknown";
}

std::optional<DataType> parse_data_type(const std::string& s) {
    std::string lower = to_lower(s);

    for (int i = static_cast<int>(DataType::boolean);
         i <= static_cast<int>(DataType::double_value); ++i) {
        auto type = static_cast<DataType>(i);
        if (lower == data_type_to_string(type)) return type;
    }
    return std::nullopt;
}

const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::name_invalid: return "name_invalid";
        case FailureKind::name_too_long: return "name_too_long";
        case FailureKind::property_invalid: return "property_invalid";
        case FailureKind::pools_differ: return "pools_differ";
        case FailureKind::filesystem_exists: return "filesystem_exists";
        case FailureKind::snapshot_exists: return "snapshot_exists";
        case FailureKind::dataset_exists: return "dataset_exists";
        case FailureKind::hold_exists: return "hold_exists";
        case FailureKind::bookmark_exists: return "bookmark_exists";
        case FailureKind::filesystem_not_found: return "filesystem_not_found";
        case FailureKind::dataset_not_found: return "dataset_not_found";
        case FailureKind::snapshot_not_found: return "snapshot_not_found";
        case FailureKind::pool_not_found: return "pool_not_found";
        case FailureKind::parent_not_found: return "parent_not_found";
        case FailureKind::hold_not_found: return "hold_not_found";
        case FailureKind::duplicate_snapshots: return "duplicate_snapshots";
        case FailureKind::snapshot_is_cloned: return "snapshot_is_cloned";
        case FailureKind::snapshot_is_held: return "snapshot_is_held";
        case FailureKind::dataset_busy: return "dataset_busy";
        case FailureKind::snapshot_mismatch: return "snapshot_mismatch";
        case FailureKind::bookmark_mismatch: return "bookmark_mismatch";
        case FailureKind::bookmark_not_supported: return "bookmark_not_supported";
        case FailureKind::feature_not_supported: return "feature_not_supported";
        case FailureKind::stream_feature_not_supported: return "stream_feature_not_supported";
        case FailureKind::bad_hold_cleanup_fd: return "bad_hold_cleanup_fd";
        case FailureKind::quota_exceeded: return "quota_exceeded";
        case FailureKind::no_space: return "no_space";
        case FailureKind::read_only_pool: return "read_only_pool";
        case FailureKind::suspended_pool: return "suspended_pool";
        case FailureKind::stream_mismatch: return "stream_mismatch";
        case FailureKind::bad_stream: return "bad_stream";
        case FailureKind::destination_modified: return "destination_modified";
        case FailureKind::generic: return "generic";
        case FailureKind::snapshot_failure: return "snapshot_failure";
        case FailureKind::snapshot_destruction_failure: return "snapshot_destruction_failure";
        case FailureKind::hold_failure: return "hold_failure";
        case FailureKind::hold_release_failure: return "hold_release_failure";
        case FailureKind::bookmark_failure: return "bookmark_failure";
        case FailureKind::bookmark_destruction_failure: return "bookmark_destruction_failure";
    }
    return "unknown";
}

std::optional<FailureKind> parse_failure_kind(const std::string& s) {
    std::string lower = to_lower(s);

    for (int i = static_cast<int>(FailureKind::name_invalid);
         i <= static_cast<int>(FailureKind::bookmark_destruction_failure); ++i) {
        auto kind = static_cast<FailureKind>(i);
        if (lower == failure_kind_to_string(kind)) return kind;
    }
    return std::nullopt;
}

const char* failure_kind_message(FailureKind kind) {
    switch (kind) {
        case FailureKind::name_invalid: return "Invalid name";
        case FailureKind::name_too_long: return "Name too long";
        case FailureKind::property_invalid: return "Invalid property or property value";
        case FailureKind::pools_differ: return "The names belong to different pools";
        case FailureKind::filesystem_exists: return "Filesystem already exists";
        case FailureKind::snapshot_exists: return "Snapshot already exists";
        case FailureKind::dataset_exists: return "Dataset already exists";
        case FailureKind::hold_exists: return "Hold with a given tag already exists on snapshot";
        case FailureKind::bookmark_exists: return "Bookmark already exists";
        case FailureKind::filesystem_not_found: return "Filesystem not found";
        case FailureKind::dataset_not_found: return "Dataset not found";
        case FailureKind::snapshot_not_found: return "Snapshot not found";
        case FailureKind::pool_not_found: return "No such pool";
        case FailureKind::parent_not_found: return "Parent not found";
        case FailureKind::hold_not_found: return "Hold with a given tag does not exist on snapshot";
        case FailureKind::duplicate_snapshots: return "Requested multiple snapshots of the same filesystem";
        case FailureKind::snapshot_is_cloned: return "Snapshot is cloned";
        case FailureKind::snapshot_is_held: return "Snapshot is held";
        case FailureKind::dataset_busy: return "Dataset is busy";
        case FailureKind::snapshot_mismatch: return "Snapshot is not descendant of source snapshot";
        case FailureKind::bookmark_mismatch: return "Bookmark is not in snapshot's filesystem";
        case FailureKind::bookmark_not_supported: return "Bookmark feature is not supported";
        case FailureKind::feature_not_supported: return "Feature is not supported in this version";
        case FailureKind::stream_feature_not_supported: return "Stream contains unsupported feature";
        case FailureKind::bad_hold_cleanup_fd: return "Bad file descriptor as cleanup file descriptor";
        case FailureKind::quota_exceeded: return "Quota exceeded";
        case FailureKind::no_space: return "Not enough space";
        case FailureKind::read_only_pool: return "Pool is read-only";
        case FailureKind::suspended_pool: return "Pool is suspended";
        case FailureKind::stream_mismatch: return "Stream is not applicable to destination dataset";
        case FailureKind::bad_stream: return "Bad backup stream";
        case FailureKind::destination_modified:
            return "Destination dataset has modifications that can not be undone";
        case FailureKind::generic: return "Operation failed";
        case FailureKind::snapshot_failure:
            return "Creation of snapshot(s) failed for one or more reasons";
        case FailureKind::snapshot_destruction_failure:
            return "Destruction of snapshot(s) failed for one or more reasons";
        case FailureKind::hold_failure:
            return "Placement of hold(s) failed for one or more reasons";
        case FailureKind::hold_release_failure:
            return "Release of hold(s) failed for one or more reasons";
        case FailureKind::bookmark_failure:
            return "Creation of bookmark(s) failed for one or more reasons";
        case FailureKind::bookmark_destruction_failure:
            return "Destruction of bookmark(s) failed for one or more reasons";
    }
    return "Operation failed";
}

int failure_kind_errno(FailureKind kind) {
    switch (kind) {
        case FailureKind::name_invalid:
        case FailureKind::property_invalid:
        case FailureKind::bookmark_mismatch:
        case FailureKind::bad_stream:
            return EINVAL;
        case FailureKind::name_too_long:
            return ENAMETOOLONG;
        case FailureKind::pools_differ:
        case FailureKind::duplicate_snapshots:
            return EXDEV;
        case FailureKind::filesystem_exists:
        case FailureKind::snapshot_exists:
        case FailureKind::dataset_exists:
        case FailureKind::hold_exists:
        case FailureKind::bookmark_exists:
        case FailureKind::snapshot_is_cloned:
            return EEXIST;
        case FailureKind::filesystem_not_found:
        case FailureKind::dataset_not_found:
        case FailureKind::snapshot_not_found:
        case FailureKind::pool_not_found:
        case FailureKind::parent_not_found:
        case FailureKind::hold_not_found:
            return ENOENT;
        case FailureKind::snapshot_is_held:
        case FailureKind::dataset_busy:
            return EBUSY;
        case FailureKind::snapshot_mismatch:
        case FailureKind::stream_mismatch:
            return ENODEV;
        case FailureKind::bookmark_not_supported:
        case FailureKind::feature_not_supported:
        case FailureKind::stream_feature_not_supported:
            return ENOTSUP;
        case FailureKind::bad_hold_cleanup_fd:
            return EBADF;
        case FailureKind::quota_exceeded:
            return EDQUOT;
        case FailureKind::no_space:
            return ENOSPC;
        case FailureKind::read_only_pool:
            return EROFS;
        case FailureKind::suspended_pool:
            return EAGAIN;
        case FailureKind::destination_modified:
            return ETXTBSY;
        case FailureKind::generic:
        case FailureKind::snapshot_failure:
        case FailureKind::snapshot_destruction_failure:
        case FailureKind::hold_failure:
        case FailureKind::hold_release_failure:
        case FailureKind::bookmark_failure:
        case FailureKind::bookmark_destruction_failure:
            return 0;
    }
    return 0;
}

std::optional<Operation> parse_operation(const std::string& s) {
    std::string lower = to_lower(s);

    for (int i = static_cast<int>(Operation::create);
         i <= static_cast<int>(Operation::receive); ++i) {
        auto op = static_cast<Operation>(i);
        if (lower == operation_to_string(op)) return op;
    }
    return std::nullopt;
}

std::string errno_to_string(int status) {
    for (const auto& entry : kErrnoNames) {
        if (entry.value == status) return entry.name;
    }
    return std::to_string(status);
}

std::optional<int> parse_errno(const std::string& s) {
    if (s.empty()) return std::nullopt;

    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return std::stoi(s);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::string upper = to_upper(s);
    if (upper == "EOPNOTSUPP") return ENOTSUP;
    for (const auto& entry : kErrnoNames) {
        if (upper == entry.name) return entry.value;
    }
    return std::nullopt;
}

} // namespace lzc
