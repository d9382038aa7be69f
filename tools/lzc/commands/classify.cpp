/**
 * lzc CLI - classify command
 *
 * Run the error classifier for one operation and print the failure.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <lzc/classify.hpp>
#include <lzc/property_json.hpp>

#include <stdexcept>
#include <vector>

namespace lzc::cli::commands {

namespace {

struct ClassifyOptions {
    std::string operation;
    std::string status;
    std::vector<std::string> names;
    std::vector<std::string> values;
    std::string other;
    std::string errors_file;
};

void print_failure(const ClassifiedFailure& failure, int indent) {
    std::string pad(static_cast<std::size_t>(indent), ' ');
    std::cout << pad << failure_kind_to_string(failure.kind) << ": " << failure.message;
    if (failure.name) {
        std::cout << ": " << *failure.name;
    }
    std::cout << " (" << errno_to_string(failure.status) << ")" << std::endl;
    for (const auto& item : failure.errors) {
        print_failure(item, indent + 2);
    }
    if (failure.suppressed > 0) {
        std::cout << pad << "  ... and " << failure.suppressed << " more" << std::endl;
    }
}

int cmd_classify(const GlobalOptions& opts, const ClassifyOptions& classify_opts) {
    if (!init_runtime(opts)) return 1;

    ClassifyRequest request;

    auto op = parse_operation(classify_opts.operation);
    if (!op) {
        print_error("Unknown operation: " + classify_opts.operation, opts.json);
        return 1;
    }
    request.operation = *op;

    auto status = parse_errno(classify_opts.status);
    if (!status) {
        print_error("Unknown status: " + classify_opts.status, opts.json);
        return 1;
    }
    request.status = *status;
    request.names = classify_opts.names;
    request.values = classify_opts.values;
    if (!classify_opts.other.empty()) {
        request.other = classify_opts.other;
    }

    if (!classify_opts.errors_file.empty()) {
        auto content = read_file(classify_opts.errors_file);
        if (!content) {
            print_error("Failed to read " + classify_opts.errors_file, opts.json);
            return 1;
        }
        auto parsed = parse_item_errors(*content);
        if (!parsed.ok) {
            print_error(parsed.error, opts.json);
            return 1;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(w, opts.json);
        }
        request.errors = parsed.value;
    }

    std::optional<ClassifiedFailure> failure;
    try {
        failure = classify(request);
    } catch (const std::invalid_argument& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = true;
        j["operation"] = operation_to_string(request.operation);
        j["failure"] = failure ? failure_to_json(*failure) : nlohmann::ordered_json();
        output_json(j);
    } else if (failure) {
        print_failure(*failure, 0);
    } else {
        std::cout << "success" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_classify(CLI::App* app, GlobalOptions& opts) {
    static ClassifyOptions classify_opts;

    app->add_option("operation", classify_opts.operation, "Operation (create, snapshot, hold, ...)")
        ->required();
    app->add_option("status", classify_opts.status, "Status code (22 or EINVAL)")->required();
    app->add_option("-n,--name", classify_opts.names, "Target name (repeatable)");
    app->add_option("--value", classify_opts.values,
                    "Per-target hold tag or bookmark source snapshot (repeatable)");
    app->add_option("--other", classify_opts.other, "Origin, from-snapshot or last snapshot");
    app->add_option("--errors", classify_opts.errors_file, "JSON file with per-item errors");

    app->callback([&opts]() {
        std::exit(cmd_classify(opts, classify_opts));
    });
}

} // namespace lzc::cli::commands
