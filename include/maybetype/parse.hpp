/**
 * parse.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Locale-independent integer conversion into a maybe.
 */

#ifndef MAYBETYPE_PARSE_HPP
#define MAYBETYPE_PARSE_HPP

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include "maybe.hpp"
#include "utils/macros.hpp"

namespace maybetype {
namespace detail {

[[nodiscard]] constexpr bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n'
        || c == '\v' || c == '\f' || c == '\r';
}

[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/**
 * The int conversion as a function object, so it can be passed around
 * (map_maybe(parse_int, ...)) despite having overloads.
 */
class parse_int_fn {
public:
    /**
     * Accepts surrounding whitespace, an optional sign and decimal digits,
     * where single underscores may separate digits ("1_000").
     */
    [[nodiscard]] maybe<int> operator()(std::string_view text) const {
        while (!text.empty() && is_ascii_space(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && is_ascii_space(text.back())) {
            text.remove_suffix(1);
        }

        std::string digits;
        digits.reserve(text.size());
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            if (text.front() == '-') {
                digits.push_back('-');
            }
            text.remove_prefix(1);
        }

        bool after_digit = false;
        for (char c : text) {
            if (is_ascii_digit(c)) {
                digits.push_back(c);
                after_digit = true;
            }
            else if (c == '_' && after_digit) {
                after_digit = false;
            }
            else {
                return nothing;
            }
        }
        // Empty, or ends in a separator
        if (!after_digit) {
            return nothing;
        }

        int value = 0;
        auto const* last = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(digits.data(), last, value);
        if (ec != std::errc() || ptr != last) {
            return nothing;
        }
        return some(value);
    }

    [[nodiscard]] maybe<int> operator()(char c) const {
        return (*this)(std::string_view(&c, 1));
    }

    template <typename Int,
        MAYBETYPE_REQUIRES(
            std::is_integral_v<Int> && !std::is_same_v<Int, char>
        )>
    [[nodiscard]] constexpr maybe<int> operator()(Int value) const noexcept {
        using limits = std::numeric_limits<int>;

        if constexpr (std::is_signed_v<Int>) {
            auto const wide = static_cast<long long>(value);
            if (wide < limits::min() || wide > limits::max()) {
                return nothing;
            }
        }
        else {
            auto const wide = static_cast<unsigned long long>(value);
            if (wide > static_cast<unsigned long long>(limits::max())) {
                return nothing;
            }
        }
        return some(static_cast<int>(value));
    }

    /**
     * Truncates toward zero.
     */
    template <typename Float,
        MAYBETYPE_REQUIRES(std::is_floating_point_v<Float>)>
    [[nodiscard]] maybe<int> operator()(Float value) const noexcept {
        using limits = std::numeric_limits<int>;

        if (!std::isfinite(value)) {
            return nothing;
        }
        auto const truncated = static_cast<long double>(std::trunc(value));
        if (truncated < limits::min() || truncated > limits::max()) {
            return nothing;
        }
        return some(static_cast<int>(truncated));
    }
};

} /* namespace detail */

/**
 * Converts strings, characters and numbers to an int. Never throws on bad
 * input, the result is simply empty.
 */
inline constexpr detail::parse_int_fn parse_int{};

} /* namespace maybetype */

#endif /* MAYBETYPE_PARSE_HPP */
