#include "lzc/names.hpp"
#include "lzc/types.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace lzc {

namespace {

constexpr const char* kComponentPunctuation = "-_.: ";

bool is_component_char(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return c != '\0' && std::strchr(kComponentPunctuation, c) != nullptr;
}

// Unlike std::getline, keeps a trailing empty part so "pool/" yields {"pool", ""}.
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool is_valid_suffixed_name(const std::string& name, char delim) {
    auto parts = split(name, delim);
    return parts.size() == 2 && is_valid_fs_name(parts[0]) &&
           is_valid_name_component(parts[1]);
}

} // namespace

bool is_valid_name_component(const std::string& component) {
    return !component.empty() &&
           std::all_of(component.begin(), component.end(), is_component_char);
}

bool is_valid_fs_name(const std::string& name) {
    if (name.empty()) return false;
    auto components = split(name, '/');
    return std::all_of(components.begin(), components.end(), is_valid_name_component);
}

bool is_valid_snap_name(const std::string& name) {
    return is_valid_suffixed_name(name, '@');
}

bool is_valid_bmark_name(const std::string& name) {
    return is_valid_suffixed_name(name, '#');
}

bool is_name_too_long(const std::string& name) {
    return name.size() > MAXNAMELEN;
}

NameType name_type(const std::string& name) {
    if (is_valid_fs_name(name)) return NameType::Filesystem;
    if (is_valid_snap_name(name)) return NameType::Snapshot;
    if (is_valid_bmark_name(name)) return NameType::Bookmark;
    return NameType::Invalid;
}

std::string pool_name(const std::string& name) {
    return name.substr(0, name.find_first_of("/@#"));
}

std::string fs_name(const std::string& name) {
    return name.substr(0, name.find_first_of("@#"));
}

bool same_pool(const std::vector<std::string>& names) {
    if (names.empty()) return true;
    const std::string first = pool_name(names.front());
    return std::all_of(names.begin(), names.end(),
                       [&first](const std::string& n) { return pool_name(n) == first; });
}

} // namespace lzc
