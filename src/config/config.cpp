#include "lzc/config.hpp"
#include "lzc/log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace lzc {

namespace {

constexpr const char* kSchema = "lzc.config.v1";

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

Config get_builtin_config() {
    Config config;
    config.schema = kSchema;
    config.log_level = "warn";
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = *schema;
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kSchema) {
            result.error = std::string("$schema mismatch: expected ") + kSchema;
            return result;
        }

        if (auto level = get_string(j, "log_level")) {
            if (log::parse_level(*level)) {
                result.config.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            }
        }

        if (j.contains("integer_widths") && j["integer_widths"].is_object()) {
            for (auto& [key, val] : j["integer_widths"].items()) {
                std::optional<DataType> width;
                if (val.is_string()) {
                    width = parse_data_type(val.get<std::string>());
                }
                if (width && is_integer_type(*width)) {
                    result.config.integer_widths[key] = *width;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_integer_width:" + key);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "failed to open config file: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path);
}

std::optional<std::string> resolve_config_path(const std::optional<std::string>& cli_path) {
    if (cli_path && !cli_path->empty()) return cli_path;
    if (const char* env = std::getenv("LZC_CONFIG")) {
        if (*env != '\0') return std::string(env);
    }
    return std::nullopt;
}

IntegerWidthTable make_width_table(const Config& config, std::vector<std::string>* warnings) {
    IntegerWidthTable table;
    for (const auto& [key, width] : config.integer_widths) {
        if (!table.add(key, width)) {
            log::logger()->warn("ignoring integer width override for '{}'", key);
            if (warnings) {
                warnings->push_back("invalid_configuration:builtin_integer_width:" + key);
            }
        }
    }
    return table;
}

} // namespace lzc
