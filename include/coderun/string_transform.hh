#pragma once

#include <string_view>

constexpr bool is_blank(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f';
}

// Returns @p str without leading and trailing white-spaces
constexpr std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() and is_blank(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() and is_blank(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}
