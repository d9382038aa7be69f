#include "lzc/classify.hpp"
#include "lzc/log.hpp"
#include "lzc/names.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace lzc {

namespace {

using Name = std::optional<std::string>;

std::optional<ClassifiedFailure> result(Operation op, ClassifiedFailure failure) {
    log::logger()->debug("{}: {} classified as {}", operation_to_string(op),
                         errno_to_string(failure.status), failure_kind_to_string(failure.kind));
    return failure;
}

ClassifiedFailure fail(FailureKind kind, int status, Name name) {
    return make_failure(kind, status, std::move(name));
}

ClassifiedFailure strerror_failure(int status, Name name) {
    return make_generic_failure(status, std::move(name), std::strerror(status));
}

bool too_long(const std::string& name) {
    return is_name_too_long(name);
}

bool any_pool_differs(const std::string& name, const NameList& names) {
    const std::string pool = pool_name(name);
    return std::any_of(names.begin(), names.end(),
                       [&pool](const std::string& n) { return pool_name(n) != pool; });
}

template <typename Pairs>
NameList keys_of(const Pairs& pairs) {
    NameList keys;
    keys.reserve(pairs.size());
    for (const auto& entry : pairs) {
        keys.push_back(entry.first);
    }
    return keys;
}

template <typename Pairs>
const typename Pairs::value_type* find_entry(const Pairs& pairs, const std::string& name) {
    auto it = std::find_if(pairs.begin(), pairs.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    return it == pairs.end() ? nullptr : &*it;
}

// First target failing snapshot syntax, for list-level EINVAL
std::optional<ClassifiedFailure> first_invalid(const NameList& names, int status,
                                               bool (*valid)(const std::string&)) {
    for (const auto& n : names) {
        if (!valid(n)) {
            return fail(FailureKind::name_invalid, status, n);
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Single-Target Operations
// ============================================================================

std::optional<ClassifiedFailure> classify_create(int status, const std::string& name) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::create;

    if (status == EINVAL) {
        if (!is_valid_fs_name(name)) return result(op, fail(FailureKind::name_invalid, status, name));
        if (too_long(name)) return result(op, fail(FailureKind::name_too_long, status, name));
        return result(op, fail(FailureKind::property_invalid, status, name));
    }
    switch (status) {
        case EEXIST: return result(op, fail(FailureKind::filesystem_exists, status, name));
        case ENOENT: return result(op, fail(FailureKind::parent_not_found, status, name));
        default: break;
    }
    return result(op, make_generic_failure(status, name, "Failed to create filesystem"));
}

std::optional<ClassifiedFailure> classify_clone(int status, const std::string& name,
                                                const std::string& origin) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::clone;

    if (status == EINVAL) {
        if (!is_valid_fs_name(name)) return result(op, fail(FailureKind::name_invalid, status, name));
        if (!is_valid_snap_name(origin)) return result(op, fail(FailureKind::name_invalid, status, origin));
        if (too_long(name)) return result(op, fail(FailureKind::name_too_long, status, name));
        if (too_long(origin)) return result(op, fail(FailureKind::name_too_long, status, origin));
        if (pool_name(name) != pool_name(origin)) {
            return result(op, fail(FailureKind::pools_differ, status, name));
        }
        return result(op, fail(FailureKind::property_invalid, status, name));
    }
    switch (status) {
        case EEXIST: return result(op, fail(FailureKind::filesystem_exists, status, name));
        case ENOENT: return result(op, fail(FailureKind::dataset_not_found, status, name));
        default: break;
    }
    return result(op, make_generic_failure(status, name, "Failed to create clone"));
}

std::optional<ClassifiedFailure> classify_rollback(int status, const std::string& name) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::rollback;

    if (status == EINVAL) {
        if (!is_valid_fs_name(name)) return result(op, fail(FailureKind::name_invalid, status, name));
        if (too_long(name)) return result(op, fail(FailureKind::name_too_long, status, name));
        return result(op, fail(FailureKind::snapshot_not_found, status, name));
    }
    if (status == ENOENT) {
        if (!is_valid_fs_name(name)) return result(op, fail(FailureKind::name_invalid, status, name));
        return result(op, fail(FailureKind::filesystem_not_found, status, name));
    }
    return result(op, make_generic_failure(status, name, "Failed to rollback"));
}

std::optional<ClassifiedFailure> classify_get_bookmarks(int status, const std::string& fsname) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::get_bookmarks;

    if (status == ENOENT) return result(op, fail(FailureKind::filesystem_not_found, status, fsname));
    return result(op, make_generic_failure(status, fsname, "Failed to list bookmarks"));
}

std::optional<ClassifiedFailure> classify_snaprange_space(int status, const std::string& firstsnap,
                                                          const std::string& lastsnap) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::snaprange_space;

    if (status == EINVAL) {
        if (!is_valid_snap_name(firstsnap)) {
            return result(op, fail(FailureKind::name_invalid, status, firstsnap));
        }
        if (!is_valid_snap_name(lastsnap)) {
            return result(op, fail(FailureKind::name_invalid, status, lastsnap));
        }
        if (too_long(firstsnap)) return result(op, fail(FailureKind::name_too_long, status, firstsnap));
        if (too_long(lastsnap)) return result(op, fail(FailureKind::name_too_long, status, lastsnap));
        if (pool_name(firstsnap) != pool_name(lastsnap)) {
            return result(op, fail(FailureKind::pools_differ, status, lastsnap));
        }
        return result(op, fail(FailureKind::snapshot_mismatch, status, lastsnap));
    }
    if (status == ENOENT) return result(op, fail(FailureKind::snapshot_not_found, status, lastsnap));
    return result(op, make_generic_failure(status, lastsnap,
                                           "Failed to calculate space used by range of snapshots"));
}

std::optional<ClassifiedFailure> classify_get_holds(int status, const std::string& snapname) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::get_holds;

    if (status == EINVAL) {
        if (!is_valid_snap_name(snapname)) {
            return result(op, fail(FailureKind::name_invalid, status, snapname));
        }
        if (too_long(snapname)) return result(op, fail(FailureKind::name_too_long, status, snapname));
    }
    switch (status) {
        case ENOENT: return result(op, fail(FailureKind::snapshot_not_found, status, snapname));
        case ENOTSUP:
            return result(op, fail(FailureKind::feature_not_supported, status, pool_name(snapname)));
        default: break;
    }
    return result(op, make_generic_failure(status, snapname, "Failed to get holds on snapshot"));
}

std::optional<ClassifiedFailure> classify_send(int status, const std::string& snapname,
                                               const std::optional<std::string>& fromsnap) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::send;

    auto from_invalid = [&fromsnap] {
        return fromsnap && !is_valid_snap_name(*fromsnap) && !is_valid_bmark_name(*fromsnap);
    };

    if (status == EXDEV && fromsnap) {
        if (pool_name(*fromsnap) != pool_name(snapname)) {
            return result(op, fail(FailureKind::pools_differ, status, snapname));
        }
        return result(op, fail(FailureKind::snapshot_mismatch, status, snapname));
    }
    if (status == EINVAL) {
        if (from_invalid()) return result(op, fail(FailureKind::name_invalid, status, *fromsnap));
        if (!is_valid_snap_name(snapname) && !is_valid_fs_name(snapname)) {
            return result(op, fail(FailureKind::name_invalid, status, snapname));
        }
        if (fromsnap && too_long(*fromsnap)) {
            return result(op, fail(FailureKind::name_too_long, status, *fromsnap));
        }
        if (too_long(snapname)) return result(op, fail(FailureKind::name_too_long, status, snapname));
        if (fromsnap && pool_name(*fromsnap) != pool_name(snapname)) {
            return result(op, fail(FailureKind::pools_differ, status, snapname));
        }
    } else if (status == ENOENT) {
        if (from_invalid()) return result(op, fail(FailureKind::name_invalid, status, *fromsnap));
        return result(op, fail(FailureKind::snapshot_not_found, status, snapname));
    } else if (status == ENAMETOOLONG) {
        if (fromsnap && too_long(*fromsnap)) {
            return result(op, fail(FailureKind::name_too_long, status, *fromsnap));
        }
        return result(op, fail(FailureKind::name_too_long, status, snapname));
    }
    return result(op, strerror_failure(status, snapname));
}

std::optional<ClassifiedFailure> classify_send_space(int status, const std::string& snapname,
                                                     const std::optional<std::string>& fromsnap) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::send_space;

    if (status == EXDEV && fromsnap) {
        if (pool_name(*fromsnap) != pool_name(snapname)) {
            return result(op, fail(FailureKind::pools_differ, status, snapname));
        }
        return result(op, fail(FailureKind::snapshot_mismatch, status, snapname));
    }
    if (status == EINVAL) {
        if (fromsnap && !is_valid_snap_name(*fromsnap)) {
            return result(op, fail(FailureKind::name_invalid, status, *fromsnap));
        }
        if (!is_valid_snap_name(snapname)) {
            return result(op, fail(FailureKind::name_invalid, status, snapname));
        }
        if (fromsnap && too_long(*fromsnap)) {
            return result(op, fail(FailureKind::name_too_long, status, *fromsnap));
        }
        if (too_long(snapname)) return result(op, fail(FailureKind::name_too_long, status, snapname));
        if (fromsnap && pool_name(*fromsnap) != pool_name(snapname)) {
            return result(op, fail(FailureKind::pools_differ, status, snapname));
        }
    } else if (status == ENOENT && fromsnap && !is_valid_snap_name(*fromsnap)) {
        return result(op, fail(FailureKind::name_invalid, status, *fromsnap));
    }
    if (status == ENOENT) return result(op, fail(FailureKind::snapshot_not_found, status, snapname));
    return result(op, make_generic_failure(status, snapname, "Failed to estimate backup stream size"));
}

std::optional<ClassifiedFailure> classify_receive(int status, const std::string& snapname,
                                                  const std::optional<std::string>& origin) {
    if (status == 0) return std::nullopt;
    const auto op = Operation::receive;

    if (status == EINVAL) {
        if (!is_valid_snap_name(snapname)) {
            return result(op, fail(FailureKind::name_invalid, status, snapname));
        }
        if (too_long(snapname)) return result(op, fail(FailureKind::name_too_long, status, snapname));
        if (origin && !is_valid_snap_name(*origin)) {
            return result(op, fail(FailureKind::name_invalid, status, *origin));
        }
        return result(op, fail(FailureKind::bad_stream, status, std::nullopt));
    }
    if (status == ENOENT) {
        if (!is_valid_snap_name(snapname)) {
            return result(op, fail(FailureKind::name_invalid, status, snapname));
        }
        return result(op, fail(FailureKind::dataset_not_found, status, snapname));
    }

    const std::string fs = fs_name(snapname);
    const std::string pool = pool_name(snapname);
    switch (status) {
        case EEXIST: return result(op, fail(FailureKind::dataset_exists, status, snapname));
        case ENOTSUP:
            return result(op, fail(FailureKind::stream_feature_not_supported, status, std::nullopt));
        case ENODEV: return result(op, fail(FailureKind::stream_mismatch, status, fs));
        case ETXTBSY: return result(op, fail(FailureKind::destination_modified, status, fs));
        case EBUSY: return result(op, fail(FailureKind::dataset_busy, status, fs));
        case ENOSPC: return result(op, fail(FailureKind::no_space, status, fs));
        case EDQUOT: return result(op, fail(FailureKind::quota_exceeded, status, fs));
        case ENAMETOOLONG: return result(op, fail(FailureKind::name_too_long, status, snapname));
        case EROFS: return result(op, fail(FailureKind::read_only_pool, status, pool));
        case EAGAIN: return result(op, fail(FailureKind::suspended_pool, status, pool));
        default: break;
    }
    return result(op, strerror_failure(status, snapname));
}

// ============================================================================
// Batch Operations
// ============================================================================

std::optional<ClassifiedFailure> classify_snapshot(int status, const ItemErrors& errors,
                                                   const NameList& snaps) {
    if (status == 0) return std::nullopt;

    auto mapper = [&snaps](int item_status, const Name& name) {
        if (item_status == EXDEV) {
            return same_pool(snaps) ? fail(FailureKind::duplicate_snapshots, item_status, name)
                                    : fail(FailureKind::pools_differ, item_status, name);
        }
        if (item_status == EINVAL) {
            if (std::any_of(snaps.begin(), snaps.end(),
                            [](const std::string& s) { return !is_valid_snap_name(s); })) {
                return fail(FailureKind::name_invalid, item_status, name);
            }
            if (std::any_of(snaps.begin(), snaps.end(), too_long)) {
                return fail(FailureKind::name_too_long, item_status, name);
            }
            return fail(FailureKind::property_invalid, item_status, name);
        }
        switch (item_status) {
            case EEXIST: return fail(FailureKind::snapshot_exists, item_status, name);
            case ENOENT: return fail(FailureKind::filesystem_not_found, item_status, name);
            default: break;
        }
        return make_generic_failure(item_status, name, "Failed to create snapshot");
    };
    return result(Operation::snapshot,
                  classify_error_list(status, errors, snaps, FailureKind::snapshot_failure, mapper));
}

std::optional<ClassifiedFailure> classify_destroy_snaps(int status, const ItemErrors& errors,
                                                        const NameList& snaps) {
    if (status == 0) return std::nullopt;

    auto mapper = [](int item_status, const Name& name) {
        switch (item_status) {
            case EEXIST: return fail(FailureKind::snapshot_is_cloned, item_status, name);
            case ENOENT: return fail(FailureKind::pool_not_found, item_status, name);
            case EBUSY: return fail(FailureKind::snapshot_is_held, item_status, name);
            default: break;
        }
        return make_generic_failure(item_status, name, "Failed to destroy snapshot");
    };
    return result(Operation::destroy_snaps,
                  classify_error_list(status, errors, snaps,
                                      FailureKind::snapshot_destruction_failure, mapper));
}

std::optional<ClassifiedFailure> classify_bookmark(int status, const ItemErrors& errors,
                                                   const NamePairs& bookmarks) {
    if (status == 0) return std::nullopt;
    const NameList names = keys_of(bookmarks);

    auto mapper = [&bookmarks, &names](int item_status, const Name& name) -> ClassifiedFailure {
        if (item_status == EINVAL) {
            if (name) {
                const auto* entry = find_entry(bookmarks, *name);
                if (!is_valid_bmark_name(*name)) {
                    return fail(FailureKind::name_invalid, item_status, name);
                }
                if (entry && !is_valid_snap_name(entry->second)) {
                    return fail(FailureKind::name_invalid, item_status, entry->second);
                }
                if (too_long(*name)) return fail(FailureKind::name_too_long, item_status, name);
                if (entry && too_long(entry->second)) {
                    return fail(FailureKind::name_too_long, item_status, entry->second);
                }
                if (entry && fs_name(*name) != fs_name(entry->second)) {
                    return fail(FailureKind::bookmark_mismatch, item_status, name);
                }
                if (any_pool_differs(*name, names)) {
                    return fail(FailureKind::pools_differ, item_status, name);
                }
            } else if (auto invalid = first_invalid(names, item_status, is_valid_bmark_name)) {
                return *invalid;
            }
        }
        switch (item_status) {
            case EEXIST: return fail(FailureKind::bookmark_exists, item_status, name);
            case ENOENT: return fail(FailureKind::snapshot_not_found, item_status, name);
            case ENOTSUP: return fail(FailureKind::bookmark_not_supported, item_status, name);
            default: break;
        }
        return make_generic_failure(item_status, name, "Failed to create bookmark");
    };
    return result(Operation::bookmark,
                  classify_error_list(status, errors, names, FailureKind::bookmark_failure, mapper));
}

std::optional<ClassifiedFailure> classify_destroy_bookmarks(int status, const ItemErrors& errors,
                                                            const NameList& bookmarks) {
    if (status == 0) return std::nullopt;

    auto mapper = [](int item_status, const Name& name) {
        if (item_status == EINVAL) return fail(FailureKind::name_invalid, item_status, name);
        return make_generic_failure(item_status, name, "Failed to destroy bookmark");
    };
    return result(Operation::destroy_bookmarks,
                  classify_error_list(status, errors, bookmarks,
                                      FailureKind::bookmark_destruction_failure, mapper));
}

std::optional<ClassifiedFailure> classify_hold(int status, const ItemErrors& errors,
                                               const NamePairs& holds) {
    if (status == 0) return std::nullopt;

    // A bad cleanup descriptor fails the whole request, not individual holds
    if (status == EBADF) {
        return result(Operation::hold, fail(FailureKind::bad_hold_cleanup_fd, status, std::nullopt));
    }

    const NameList names = keys_of(holds);
    auto mapper = [&holds, &names](int item_status, const Name& name) -> ClassifiedFailure {
        const auto* entry = name ? find_entry(holds, *name) : nullptr;

        if (item_status == EXDEV) return fail(FailureKind::pools_differ, item_status, name);
        if (item_status == EINVAL) {
            if (name) {
                if (!is_valid_snap_name(*name)) return fail(FailureKind::name_invalid, item_status, name);
                if (too_long(*name)) return fail(FailureKind::name_too_long, item_status, name);
                if (entry && too_long(entry->second)) {
                    return fail(FailureKind::name_too_long, item_status, entry->second);
                }
                if (any_pool_differs(*name, names)) {
                    return fail(FailureKind::pools_differ, item_status, name);
                }
            } else if (auto invalid = first_invalid(names, item_status, is_valid_snap_name)) {
                return *invalid;
            }
        }

        Name fs;
        Name pool;
        Name tag;
        if (name) {
            fs = fs_name(*name);
            pool = pool_name(*name);
        }
        if (entry) {
            tag = entry->second;
        }
        switch (item_status) {
            case ENOENT: return fail(FailureKind::filesystem_not_found, item_status, fs);
            case EEXIST: return fail(FailureKind::hold_exists, item_status, name);
            case E2BIG: return fail(FailureKind::name_too_long, item_status, tag);
            case ENOTSUP: return fail(FailureKind::feature_not_supported, item_status, pool);
            default: break;
        }
        return make_generic_failure(item_status, name, "Failed to hold snapshot");
    };
    return result(Operation::hold,
                  classify_error_list(status, errors, names, FailureKind::hold_failure, mapper));
}

std::optional<ClassifiedFailure> classify_release(int status, const ItemErrors& errors,
                                                  const HoldReleases& holds) {
    if (status == 0) return std::nullopt;

    const NameList names = keys_of(holds);
    auto mapper = [&holds, &names](int item_status, const Name& name) -> ClassifiedFailure {
        const auto* entry = name ? find_entry(holds, *name) : nullptr;

        auto first_long_tag = [entry]() -> Name {
            if (!entry) return std::nullopt;
            for (const auto& tag : entry->second) {
                if (too_long(tag)) return tag;
            }
            return std::nullopt;
        };

        switch (item_status) {
            case EXDEV: return fail(FailureKind::pools_differ, item_status, name);
            case EINVAL:
                if (name) {
                    if (!is_valid_snap_name(*name)) {
                        return fail(FailureKind::name_invalid, item_status, name);
                    }
                    if (too_long(*name)) return fail(FailureKind::name_too_long, item_status, name);
                    if (auto tag = first_long_tag()) {
                        return fail(FailureKind::name_too_long, item_status, tag);
                    }
                    if (any_pool_differs(*name, names)) {
                        return fail(FailureKind::pools_differ, item_status, name);
                    }
                } else if (auto invalid = first_invalid(names, item_status, is_valid_snap_name)) {
                    return *invalid;
                }
                break;
            case ENOENT: return fail(FailureKind::hold_not_found, item_status, name);
            case E2BIG: {
                auto tag = first_long_tag();
                return fail(FailureKind::name_too_long, item_status, tag ? tag : name);
            }
            case ENOTSUP: {
                Name pool;
                if (name) pool = pool_name(*name);
                return fail(FailureKind::feature_not_supported, item_status, pool);
            }
            default: break;
        }
        return make_generic_failure(item_status, name, "Failed to release snapshot hold");
    };
    return result(Operation::release,
                  classify_error_list(status, errors, names, FailureKind::hold_release_failure,
                                      mapper));
}

// ============================================================================
// Dispatch
// ============================================================================

namespace {

const std::string& first_name(const ClassifyRequest& request) {
    if (request.names.empty()) {
        throw std::invalid_argument(std::string(operation_to_string(request.operation)) +
                                    " requires a name");
    }
    return request.names.front();
}

const std::string& required_other(const ClassifyRequest& request, const char* what) {
    if (!request.other) {
        throw std::invalid_argument(std::string(operation_to_string(request.operation)) +
                                    " requires " + what);
    }
    return *request.other;
}

NamePairs paired(const ClassifyRequest& request) {
    if (request.values.size() != request.names.size()) {
        throw std::invalid_argument(std::string(operation_to_string(request.operation)) +
                                    " requires one value per name");
    }
    NamePairs pairs;
    for (std::size_t i = 0; i < request.names.size(); ++i) {
        auto it = std::find_if(pairs.begin(), pairs.end(), [&](const auto& entry) {
            return entry.first == request.names[i];
        });
        if (it == pairs.end()) {
            pairs.emplace_back(request.names[i], request.values[i]);
        } else {
            it->second = request.values[i];
        }
    }
    return pairs;
}

HoldReleases grouped(const ClassifyRequest& request) {
    if (request.values.size() != request.names.size()) {
        throw std::invalid_argument("release requires one tag per name");
    }
    HoldReleases releases;
    for (std::size_t i = 0; i < request.names.size(); ++i) {
        auto it = std::find_if(releases.begin(), releases.end(), [&](const auto& entry) {
            return entry.first == request.names[i];
        });
        if (it == releases.end()) {
            releases.emplace_back(request.names[i], std::vector<std::string>{request.values[i]});
        } else {
            it->second.push_back(request.values[i]);
        }
    }
    return releases;
}

} // namespace

std::optional<ClassifiedFailure> classify(const ClassifyRequest& request) {
    const int status = request.status;
    switch (request.operation) {
        case Operation::create: return classify_create(status, first_name(request));
        case Operation::clone:
            return classify_clone(status, first_name(request), required_other(request, "an origin"));
        case Operation::rollback: return classify_rollback(status, first_name(request));
        case Operation::snapshot: return classify_snapshot(status, request.errors, request.names);
        case Operation::destroy_snaps:
            return classify_destroy_snaps(status, request.errors, request.names);
        case Operation::bookmark: return classify_bookmark(status, request.errors, paired(request));
        case Operation::get_bookmarks: return classify_get_bookmarks(status, first_name(request));
        case Operation::destroy_bookmarks:
            return classify_destroy_bookmarks(status, request.errors, request.names);
        case Operation::snaprange_space:
            return classify_snaprange_space(status, first_name(request),
                                            required_other(request, "a last snapshot"));
        case Operation::hold: return classify_hold(status, request.errors, paired(request));
        case Operation::release: return classify_release(status, request.errors, grouped(request));
        case Operation::get_holds: return classify_get_holds(status, first_name(request));
        case Operation::send: return classify_send(status, first_name(request), request.other);
        case Operation::send_space:
            return classify_send_space(status, first_name(request), request.other);
        case Operation::receive: return classify_receive(status, first_name(request), request.other);
    }
    throw std::invalid_argument("unknown operation");
}

} // namespace lzc
