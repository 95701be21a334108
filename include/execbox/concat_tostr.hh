#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template <class T>
constexpr inline bool is_string_argument =
    std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>> or
    std::is_convertible_v<T, std::string_view>;

// Converts @p x to something appendable to std::string
template <class T>
decltype(auto) stringify(T&& x) {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, char>) {
        return std::string(1, x);
    } else if constexpr (std::is_same_v<U, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_arithmetic_v<U>) {
        return std::to_string(x);
    } else {
        return std::string_view{std::forward<T>(x)};
    }
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (size_t{0} + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::forward<decltype(str)>(str));
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve((str.size() + ... + std::string_view{xx}.size()));
        return (str += ... += std::forward<decltype(xx)>(xx));
    }(stringify(std::forward<Args>(args))...);
}
