#pragma once

#include <array>
#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
constexpr inline bool is_string_like_v =
    std::is_convertible_v<const T&, std::string_view> and not std::is_same_v<T, std::nullptr_t>;

// Converts @p x to something appendable to std::string
template <class T>
auto stringify(T&& x) {
    using Type = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<Type, char>) {
        return std::string(1, x);
    } else if constexpr (std::is_same_v<Type, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_arithmetic_v<Type>) {
        // Enough for every integer and for the shortest representation of a double
        std::array<char, 32> buff{};
        auto [ptr, ec] = std::to_chars(buff.data(), buff.data() + buff.size(), x);
        (void)ec; // buff is always big enough
        return std::string(buff.data(), ptr);
    } else {
        static_assert(is_string_like_v<Type>, "argument cannot be concatenated");
        return std::string_view{x};
    }
}

} // namespace detail

template <class T>
constexpr inline bool is_string_argument = detail::is_string_like_v<
    std::remove_cv_t<std::remove_reference_t<T>>> or
    std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::string_view{str});
        return res;
    }(detail::stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve((str.size() + ... + std::string_view{xx}.size()));
        return (str += ... += std::string_view{xx});
    }(detail::stringify(std::forward<Args>(args))...);
}
