#include "lzc/classify.hpp"
#include "lzc/log.hpp"

#include <type_traits>
#include <variant>

namespace lzc {

namespace {

// Integer alternatives widen to int; anything else has no status
std::optional<int> to_status(const PropertyValue& value) {
    return std::visit(
        [](const auto& v) -> std::optional<int> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                return static_cast<int>(v);
            } else {
                return std::nullopt;
            }
        },
        value.variant());
}

} // namespace

ItemErrors item_errors_from_properties(const PropertyMap& errlist) {
    ItemErrors errors;
    for (const auto& [name, value] : errlist) {
        auto status = to_status(value);
        if (!status) {
            log::logger()->warn("ignoring error entry '{}' with non-integer value ({})", name,
                                value.type_name());
            continue;
        }
        if (name == N_MORE_ERRORS) {
            errors.suppressed = *status;
            errors.has_more = true;
        } else {
            errors.items.emplace_back(name, *status);
        }
    }
    return errors;
}

ClassifiedFailure classify_error_list(int status, const ItemErrors& errors,
                                      const NameList& names, FailureKind batch_kind,
                                      const ItemMapper& mapper) {
    std::vector<ClassifiedFailure> failures;
    int suppressed = 0;

    if (errors.empty()) {
        std::optional<std::string> name;
        if (names.size() == 1) {
            name = names.front();
        }
        failures.push_back(mapper(status, name));
    } else {
        suppressed = errors.suppressed;
        for (const auto& [name, item_status] : errors.items) {
            failures.push_back(mapper(item_status, name));
        }
    }

    log::logger()->debug("{}: {} item failure(s), {} suppressed",
                         failure_kind_to_string(batch_kind), failures.size(), suppressed);
    return make_batch_failure(batch_kind, status, std::move(failures), suppressed);
}

} // namespace lzc
