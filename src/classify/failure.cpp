#include "lzc/failure.hpp"

#include <utility>

namespace lzc {

std::string ClassifiedFailure::to_string() const {
    std::string out = failure_kind_to_string(kind);
    out += ": ";
    out += message;
    if (name) {
        out += ": " + *name;
    }
    if (status != 0) {
        out += " (" + errno_to_string(status) + ")";
    }
    if (is_batch()) {
        out += " [" + std::to_string(errors.size()) + " error(s)";
        if (suppressed > 0) {
            out += ", " + std::to_string(suppressed) + " suppressed";
        }
        out += "]";
    }
    return out;
}

ClassifiedFailure make_failure(FailureKind kind, int status, std::optional<std::string> name) {
    ClassifiedFailure failure;
    failure.kind = kind;
    failure.status = status;
    failure.name = std::move(name);
    failure.message = failure_kind_message(kind);
    return failure;
}

ClassifiedFailure make_generic_failure(int status, std::optional<std::string> name,
                                       const std::string& description) {
    ClassifiedFailure failure;
    failure.kind = FailureKind::generic;
    failure.status = status;
    failure.name = std::move(name);
    failure.message = description;
    return failure;
}

ClassifiedFailure make_batch_failure(FailureKind kind, int status,
                                     std::vector<ClassifiedFailure> errors, int suppressed) {
    ClassifiedFailure failure = make_failure(kind, status);
    failure.errors = std::move(errors);
    failure.suppressed = suppressed;
    return failure;
}

OperationError::OperationError(ClassifiedFailure failure)
    : std::runtime_error(failure.to_string()), failure_(std::move(failure)) {}

void throw_if_failed(const std::optional<ClassifiedFailure>& failure) {
    if (failure) {
        throw OperationError(*failure);
    }
}

} // namespace lzc
