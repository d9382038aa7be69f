#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace lzc::log {

// The "lzc" logger (stderr), created on first use at level warn.
std::shared_ptr<spdlog::logger> logger();

// trace|debug|info|warn|error|off (case-insensitive)
std::optional<spdlog::level::level_enum> parse_level(const std::string& s);

// Returns false and leaves the level unchanged when s is not a level name
bool set_level(const std::string& s);

} // namespace lzc::log
