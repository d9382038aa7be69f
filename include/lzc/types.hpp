#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace lzc {

// ============================================================================
// Constants
// ============================================================================

// Maximum length of any ZFS name.
constexpr std::size_t MAXNAMELEN = 255;

// Key carrying the number of per-item errors not enumerated in an error list.
constexpr const char* N_MORE_ERRORS = "N_MORE_ERRORS";

// ============================================================================
// Wire Data Types (libnvpair data_type_t numbering)
// ============================================================================

enum class DataType : int {
    unknown = 0,
    boolean = 1,
    byte = 2,
    int16 = 3,
    uint16 = 4,
    int32 = 5,
    uint32 = 6,
    int64 = 7,
    uint64 = 8,
    string = 9,
    byte_array = 10,
    int16_array = 11,
    uint16_array = 12,
    int32_array = 13,
    uint32_array = 14,
    int64_array = 15,
    uint64_array = 16,
    string_array = 17,
    hrtime = 18,
    nvlist = 19,
    nvlist_array = 20,
    boolean_value = 21,
    int8 = 22,
    uint8 = 23,
    boolean_array = 24,
    int8_array = 25,
    uint8_array = 26,
    double_value = 27,
};

// Accessor suffix used by libnvpair for this tag ("uint32", "nvlist_array", ...)
const char* data_type_to_string(DataType type);

// Parse an accessor suffix back to its tag (case-insensitive)
std::optional<DataType> parse_data_type(const std::string& s);

// ============================================================================
// Failure Kinds
// ============================================================================

enum class FailureKind {
    name_invalid,
    name_too_long,
    property_invalid,
    pools_differ,
    filesystem_exists,
    snapshot_exists,
    dataset_exists,
    hold_exists,
    bookmark_exists,
    filesystem_not_found,
    dataset_not_found,
    snapshot_not_found,
    pool_not_found,
    parent_not_found,
    hold_not_found,
    duplicate_snapshots,
    snapshot_is_cloned,
    snapshot_is_held,
    dataset_busy,
    snapshot_mismatch,
    bookmark_mismatch,
    bookmark_not_supported,
    feature_not_supported,
    stream_feature_not_supported,
    bad_hold_cleanup_fd,
    quota_exceeded,
    no_space,
    read_only_pool,
    suspended_pool,
    stream_mismatch,
    bad_stream,
    destination_modified,
    generic,

    // Batch kinds wrap a list of per-item failures
    snapshot_failure,
    snapshot_destruction_failure,
    hold_failure,
    hold_release_failure,
    bookmark_failure,
    bookmark_destruction_failure,
};

// Canonical lowercase snake_case name
const char* failure_kind_to_string(FailureKind kind);

// Parse a failure kind name (case-insensitive)
std::optional<FailureKind> parse_failure_kind(const std::string& s);

// Fixed human-readable message for a kind
const char* failure_kind_message(FailureKind kind);

// Errno conventionally associated with a kind (0 for batch kinds)
int failure_kind_errno(FailureKind kind);

inline bool is_batch_kind(FailureKind kind) {
    switch (kind) {
        case FailureKind::snapshot_failure:
        case FailureKind::snapshot_destruction_failure:
        case FailureKind::hold_failure:
        case FailureKind::hold_release_failure:
        case FailureKind::bookmark_failure:
        case FailureKind::bookmark_destruction_failure:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Operations
// ============================================================================

enum class Operation {
    create,
    clone,
    rollback,
    snapshot,
    destroy_snaps,
    bookmark,
    get_bookmarks,
    destroy_bookmarks,
    snaprange_space,
    hold,
    release,
    get_holds,
    send,
    send_space,
    receive,
};

inline const char* operation_to_string(Operation op) {
    switch (op) {
        case Operation::create: return "create";
        case Operation::clone: return "clone";
        case Operation::rollback: return "rollback";
        case Operation::snapshot: return "snapshot";
        case Operation::destroy_snaps: return "destroy_snaps";
        case Operation::bookmark: return "bookmark";
        case Operation::get_bookmarks: return "get_bookmarks";
        case Operation::destroy_bookmarks: return "destroy_bookmarks";
        case Operation::snaprange_space: return "snaprange_space";
        case Operation::hold: return "hold";
        case Operation::release: return "release";
        case Operation::get_holds: return "get_holds";
        case Operation::send: return "send";
        case Operation::send_space: return "send_space";
        case Operation::receive: return "receive";
    }
    return "unknown";
}

std::optional<Operation> parse_operation(const std::string& s);

// ============================================================================
// Errno Names
// ============================================================================

// Symbolic name of an errno value ("EINVAL"), or its decimal form if unknown
std::string errno_to_string(int status);

// Parse "EINVAL", "einval" or "22"
std::optional<int> parse_errno(const std::string& s);

} // namespace lzc
