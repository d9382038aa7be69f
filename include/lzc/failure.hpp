#pragma once

#include "lzc/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Classified Failures
// ============================================================================

struct ClassifiedFailure {
    FailureKind kind = FailureKind::generic;
    int status = 0;
    std::optional<std::string> name;
    std::string message;

    // Batch kinds only
    std::vector<ClassifiedFailure> errors;
    int suppressed = 0;

    bool is_batch() const { return is_batch_kind(kind); }

    // "snapshot_exists: Snapshot already exists: pool/fs@snap (EEXIST)"
    std::string to_string() const;
};

// Failure carrying the kind's fixed message
ClassifiedFailure make_failure(FailureKind kind, int status,
                               std::optional<std::string> name = std::nullopt);

// Unrecognized status; description names the operation that failed
ClassifiedFailure make_generic_failure(int status, std::optional<std::string> name,
                                       const std::string& description);

ClassifiedFailure make_batch_failure(FailureKind kind, int status,
                                     std::vector<ClassifiedFailure> errors, int suppressed);

class OperationError : public std::runtime_error {
public:
    explicit OperationError(ClassifiedFailure failure);

    const ClassifiedFailure& failure() const { return failure_; }
    FailureKind kind() const { return failure_.kind; }
    int status() const { return failure_.status; }

private:
    ClassifiedFailure failure_;
};

// Throws OperationError when a failure is present
void throw_if_failed(const std::optional<ClassifiedFailure>& failure);

} // namespace lzc
