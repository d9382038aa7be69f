/**
 * lzc CLI - Entry Point
 *
 * Inspection tool for libzfs_core request maps and error classification.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace lzc::cli::commands {
    void setup_names(CLI::App* app, GlobalOptions& opts);
    void setup_classify(CLI::App* app, GlobalOptions& opts);
    void setup_nvlist(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace lzc::cli;

    CLI::App app{"lzc - libzfs_core request codec and error classifier"};
    app.set_version_flag("-V,--version", LZC_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_option("--config", opts.config, "Configuration file (default: $LZC_CONFIG)");
    app.add_option("--log-level", opts.log_level, "trace|debug|info|warn|error|off");

    // Commands
    auto* names_cmd = app.add_subcommand("names", "Check dataset, snapshot and bookmark names");
    commands::setup_names(names_cmd, opts);

    auto* classify_cmd = app.add_subcommand("classify", "Classify an operation's error status");
    commands::setup_classify(classify_cmd, opts);

    auto* nvlist_cmd = app.add_subcommand("nvlist", "Round-trip a JSON property map through libnvpair");
    commands::setup_nvlist(nvlist_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
