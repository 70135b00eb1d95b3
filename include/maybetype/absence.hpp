/**
 * absence.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Decides when a raw, possibly-absent value is actually absent and what the
 * payload of a present one is. This is the single place that knows about the
 * language's many "null" spellings. Specialize absence_traits for your own
 * nullable types.
 */

#ifndef MAYBETYPE_ABSENCE_HPP
#define MAYBETYPE_ABSENCE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include "detail/traits.hpp"
#include "utils/macros.hpp"

namespace maybetype {
namespace detail {

/**
 * Types whose absent state is spelled nullptr.
 */
template <typename T>
inline constexpr bool is_null_sentinel_v =
       std::is_pointer_v<T>
    || std::is_member_pointer_v<T>
    || std::is_null_pointer_v<T>
    || is_specialization_v<T, std::shared_ptr>
    || is_specialization_v<T, std::unique_ptr>
    || is_specialization_v<T, std::function>;

template <typename T, typename = void>
struct default_absence_traits {
    using value_type = T;

    static constexpr bool nullable = false;

    template <typename U>
    [[nodiscard]] static constexpr bool is_absent(U const&) noexcept {
        return false;
    }

    template <typename TFwd>
    [[nodiscard]] static constexpr TFwd&& payload(TFwd&& raw) noexcept {
        return MAYBETYPE_FWD(raw);
    }
};

template <typename T>
struct default_absence_traits<T, std::enable_if_t<is_null_sentinel_v<T>>> {
    using value_type = T;

    static constexpr bool nullable = true;

    [[nodiscard]] static constexpr bool is_absent(T const& raw) noexcept {
        return raw == nullptr;
    }

    template <typename TFwd>
    [[nodiscard]] static constexpr TFwd&& payload(TFwd&& raw) noexcept {
        return MAYBETYPE_FWD(raw);
    }
};

// Arrays (string literals) are held as a pointer to their first element
template <typename T>
struct default_absence_traits<T, std::enable_if_t<std::is_array_v<T>>> {
    using value_type = std::remove_extent_t<T> const*;

    static constexpr bool nullable = false;

    [[nodiscard]] static constexpr bool is_absent(T const&) noexcept {
        return false;
    }

    template <typename TFwd>
    [[nodiscard]] static constexpr TFwd&& payload(TFwd&& raw) noexcept {
        return MAYBETYPE_FWD(raw);
    }
};

} /* namespace detail */

/**
 * The customization point. A specialization provides:
 *  - value_type: the payload type of a present value,
 *  - nullable: whether the type has an absent state at all,
 *  - is_absent(raw): whether the given value is absent,
 *  - payload(raw): the payload of a present value, forwarding the value
 *    category of raw.
 */
template <typename T>
struct absence_traits : detail::default_absence_traits<T> {};

template <typename U>
struct absence_traits<std::optional<U>> {
    using value_type = U;

    static constexpr bool nullable = true;

    [[nodiscard]]
    static constexpr bool is_absent(std::optional<U> const& raw) noexcept {
        return !raw.has_value();
    }

    template <typename TFwd>
    [[nodiscard]] static constexpr decltype(auto) payload(TFwd&& raw) {
        return *MAYBETYPE_FWD(raw);
    }
};

template <>
struct absence_traits<std::nullopt_t> {
    using value_type = std::nullopt_t;

    static constexpr bool nullable = true;

    [[nodiscard]]
    static constexpr bool is_absent(std::nullopt_t const&) noexcept {
        return true;
    }
};

} /* namespace maybetype */

#endif /* MAYBETYPE_ABSENCE_HPP */
