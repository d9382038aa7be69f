#pragma once

#include "lzc/failure.hpp"
#include "lzc/property.hpp"
#include "lzc/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lzc {

// ============================================================================
// Request Context
// ============================================================================

using NameList = std::vector<std::string>;

// snapshot -> tag (hold), bookmark -> snapshot (bookmark)
using NamePairs = std::vector<std::pair<std::string, std::string>>;

// snapshot -> tags (release)
using HoldReleases = std::vector<std::pair<std::string, std::vector<std::string>>>;

// Per-item errors of a batch operation, in response order. has_more is set
// when the error map carried N_MORE_ERRORS; such a map is not empty even
// without items.
struct ItemErrors {
    std::vector<std::pair<std::string, int>> items;
    int suppressed = 0;
    bool has_more = false;

    bool empty() const { return items.empty() && !has_more && suppressed == 0; }
};

// Builds ItemErrors from a decoded error map. N_MORE_ERRORS becomes the
// suppressed count (zero when missing); entries without an integer value
// are skipped.
ItemErrors item_errors_from_properties(const PropertyMap& errlist);

// ============================================================================
// Batch Helper
// ============================================================================

using ItemMapper =
    std::function<ClassifiedFailure(int status, const std::optional<std::string>& name)>;

// With no item errors, maps the aggregate status against the single requested
// name (or no name when several were requested). Otherwise maps each item
// against its own name. Both paths yield batch_kind.
ClassifiedFailure classify_error_list(int status, const ItemErrors& errors,
                                      const NameList& names, FailureKind batch_kind,
                                      const ItemMapper& mapper);

// ============================================================================
// Per-Operation Classification
// ============================================================================
//
// Each returns nullopt for status 0.

std::optional<ClassifiedFailure> classify_create(int status, const std::string& name);
std::optional<ClassifiedFailure> classify_clone(int status, const std::string& name,
                                                const std::string& origin);
std::optional<ClassifiedFailure> classify_rollback(int status, const std::string& name);
std::optional<ClassifiedFailure> classify_snapshot(int status, const ItemErrors& errors,
                                                   const NameList& snaps);
std::optional<ClassifiedFailure> classify_destroy_snaps(int status, const ItemErrors& errors,
                                                        const NameList& snaps);
std::optional<ClassifiedFailure> classify_bookmark(int status, const ItemErrors& errors,
                                                   const NamePairs& bookmarks);
std::optional<ClassifiedFailure> classify_get_bookmarks(int status, const std::string& fsname);
std::optional<ClassifiedFailure> classify_destroy_bookmarks(int status, const ItemErrors& errors,
                                                            const NameList& bookmarks);
std::optional<ClassifiedFailure> classify_snaprange_space(int status, const std::string& firstsnap,
                                                          const std::string& lastsnap);
std::optional<ClassifiedFailure> classify_hold(int status, const ItemErrors& errors,
                                               const NamePairs& holds);
std::optional<ClassifiedFailure> classify_release(int status, const ItemErrors& errors,
                                                  const HoldReleases& holds);
std::optional<ClassifiedFailure> classify_get_holds(int status, const std::string& snapname);
std::optional<ClassifiedFailure> classify_send(int status, const std::string& snapname,
                                               const std::optional<std::string>& fromsnap);
std::optional<ClassifiedFailure> classify_send_space(int status, const std::string& snapname,
                                                     const std::optional<std::string>& fromsnap);
std::optional<ClassifiedFailure> classify_receive(int status, const std::string& snapname,
                                                  const std::optional<std::string>& origin);

// ============================================================================
// Dispatch
// ============================================================================

// Operation-independent request description, used by tooling
struct ClassifyRequest {
    Operation operation = Operation::create;
    int status = 0;
    NameList names;                    // targets, in request order
    std::optional<std::string> other;  // origin / fromsnap / lastsnap
    std::vector<std::string> values;   // per-target tag or snapshot, parallel to names
    ItemErrors errors;
};

std::optional<ClassifiedFailure> classify(const ClassifyRequest& request);

} // namespace lzc
