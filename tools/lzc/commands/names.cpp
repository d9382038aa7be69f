/**
 * lzc CLI - names command
 *
 * Report the syntactic type and decomposition of ZFS names.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <lzc/names.hpp>
#include <lzc/types.hpp>

#include <vector>

namespace lzc::cli::commands {

namespace {

struct NamesOptions {
    std::vector<std::string> names;
};

int cmd_names(const GlobalOptions& opts, const NamesOptions& names_opts) {
    if (!init_runtime(opts)) return 1;

    bool all_valid = true;
    nlohmann::json out = nlohmann::json::array();

    for (const auto& name : names_opts.names) {
        NameType type = name_type(name);
        bool too_long = is_name_too_long(name);
        bool valid = type != NameType::Invalid && !too_long;
        all_valid = all_valid && valid;

        if (opts.json) {
            nlohmann::json j;
            j["name"] = name;
            j["type"] = name_type_to_string(type);
            j["valid"] = valid;
            j["too_long"] = too_long;
            j["length"] = name.size();
            j["pool"] = pool_name(name);
            j["filesystem"] = fs_name(name);
            out.push_back(j);
        } else {
            std::cout << name << std::endl;
            std::cout << "  Type: " << name_type_to_string(type) << std::endl;
            std::cout << "  Pool: " << pool_name(name) << std::endl;
            std::cout << "  Filesystem: " << fs_name(name) << std::endl;
            if (too_long) {
                std::cout << "  Length: " << name.size() << " (exceeds " << MAXNAMELEN << ")"
                          << std::endl;
            }
        }
    }

    if (opts.json) {
        output_json(out);
    }
    return all_valid ? 0 : 1;
}

} // anonymous namespace

void setup_names(CLI::App* app, GlobalOptions& opts) {
    static NamesOptions names_opts;

    app->add_option("names", names_opts.names, "Names to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_names(opts, names_opts));
    });
}

} // namespace lzc::cli::commands
