#include "lzc/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace lzc::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get("lzc")) {
            auto created = spdlog::stderr_color_mt("lzc");
            created->set_level(spdlog::level::warn);
            created->set_pattern("[%n] [%l] %v");
        }
    });
    return spdlog::get("lzc");
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

bool set_level(const std::string& s) {
    auto level = parse_level(s);
    if (!level) return false;
    logger()->set_level(*level);
    return true;
}

} // namespace lzc::log
