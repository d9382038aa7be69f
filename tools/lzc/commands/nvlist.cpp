/**
 * lzc CLI - nvlist command
 *
 * Encode a JSON property map with libnvpair and decode it back.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <lzc/libnvpair_wire.hpp>
#include <lzc/nvlist.hpp>
#include <lzc/property_json.hpp>

namespace lzc::cli::commands {

namespace {

struct NvlistOptions {
    std::string file;
};

int cmd_nvlist(const GlobalOptions& opts, const NvlistOptions& nvlist_opts) {
    auto config = init_runtime(opts);
    if (!config) return 1;

    auto content = read_file(nvlist_opts.file);
    if (!content) {
        print_error("Failed to read " + nvlist_opts.file, opts.json);
        return 1;
    }

    auto parsed = parse_property_map(*content);
    if (!parsed.ok) {
        print_error(parsed.error, opts.json);
        return 1;
    }

    std::vector<std::string> warnings;
    IntegerWidthTable widths = make_width_table(*config, &warnings);
    for (const auto& w : warnings) {
        print_warning(w, opts.json);
    }

    LibnvpairWire wire;
    PropertyMap decoded;
    std::size_t packed = 0;
    try {
        NvlistHandle handle = encode(wire, parsed.value, widths);
        int rc = wire.packed_size(handle.get(), &packed);
        if (rc != 0) {
            print_error("Failed to size nvlist: " + errno_to_string(rc), opts.json);
            return 1;
        }
        decode(wire, handle.get(), decoded);
    } catch (const CodecError& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::ordered_json j;
        j["ok"] = true;
        j["packed_size"] = packed;
        j["properties"] = property_map_to_json(decoded);
        output_json(j);
    } else {
        std::cout << "Packed size: " << packed << " bytes" << std::endl;
        std::cout << property_map_to_json(decoded).dump(2) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_nvlist(CLI::App* app, GlobalOptions& opts) {
    static NvlistOptions nvlist_opts;

    app->add_option("file", nvlist_opts.file, "JSON property map")->required()->check(CLI::ExistingFile);

    app->callback([&opts]() {
        std::exit(cmd_nvlist(opts, nvlist_opts));
    });
}

} // namespace lzc::cli::commands
