/**
 * lzc CLI - Common utilities and types
 */

#pragma once

#include <lzc/config.hpp>
#include <lzc/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace lzc::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;          // --json
    std::string config;         // --config
    std::string log_level;      // --log-level
};

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * Output utilities.
 */
template <typename Json>
inline void output_json(const Json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(j);
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cerr << "Warning: " << msg << std::endl;
    }
}

/**
 * Load the configuration and apply the log level.
 * Level priority: --log-level > LZC_LOG_LEVEL > config file > warn.
 * Returns nullopt after reporting the error when the config can not be used.
 */
inline std::optional<Config> init_runtime(const GlobalOptions& opts) {
    Config config = get_builtin_config();

    auto path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    if (path) {
        auto result = load_config(*path);
        if (!result.ok) {
            print_error(*path + ": " + result.error, opts.json);
            return std::nullopt;
        }
        for (const auto& w : result.warnings) {
            print_warning(w, opts.json);
        }
        config = result.config;
    }

    std::string level = config.log_level;
    if (const char* env = std::getenv("LZC_LOG_LEVEL")) {
        if (*env != '\0') level = env;
    }
    if (!opts.log_level.empty()) {
        level = opts.log_level;
    }
    if (!log::set_level(level)) {
        print_warning("unknown log level: " + level, opts.json);
    }
    return config;
}

} // namespace lzc::cli
