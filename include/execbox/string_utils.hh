#pragma once

#include <string_view>

namespace execbox {

// Returns true iff @p path is non-empty, relative and has no empty, "." or ".." components
[[nodiscard]] constexpr bool is_safe_relative_path(std::string_view path) noexcept {
    if (path.empty() or path.front() == '/') {
        return false;
    }
    size_t beg = 0;
    for (;;) {
        size_t end = path.find('/', beg);
        auto component = path.substr(beg, end == std::string_view::npos ? end : end - beg);
        if (component.empty() or component == "." or component == "..") {
            return false;
        }
        if (end == std::string_view::npos) {
            return true;
        }
        beg = end + 1;
    }
}

// [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] constexpr bool is_valid_env_name(std::string_view name) noexcept {
    if (name.empty() or (name.front() >= '0' and name.front() <= '9')) {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or
            (c >= '0' and c <= '9') or c == '_';
        if (not ok) {
            return false;
        }
    }
    return true;
}

// [A-Za-z0-9_-]+
[[nodiscard]] constexpr bool is_valid_request_id(std::string_view id) noexcept {
    if (id.empty()) {
        return false;
    }
    for (char c : id) {
        bool ok = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or
            (c >= '0' and c <= '9') or c == '_' or c == '-';
        if (not ok) {
            return false;
        }
    }
    return true;
}

} // namespace execbox
