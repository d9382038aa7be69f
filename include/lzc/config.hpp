#pragma once

#include "lzc/type_registry.hpp"
#include "lzc/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lzc {

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string schema;  // "lzc.config.v1"
    std::string log_level = "warn";

    // Extra forced integer widths, on top of the built-in keys
    std::map<std::string, DataType> integer_widths;

    // Source path for diagnostics
    std::string source_path;
};

Config get_builtin_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Reads and parses the file; a missing file is an error
ConfigParseResult load_config(const std::string& path);

// --config value, else $LZC_CONFIG, else nullopt
std::optional<std::string> resolve_config_path(const std::optional<std::string>& cli_path);

// Built-in widths plus the configured ones; keys the table refuses are
// reported in warnings
IntegerWidthTable make_width_table(const Config& config,
                                   std::vector<std::string>* warnings = nullptr);

} // namespace lzc
