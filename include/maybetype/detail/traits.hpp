/**
 * traits.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Type-level helpers used across the library: cvref-stripping, the detector
 * idiom and the queries the maybe combinators dispatch on.
 */

#ifndef MAYBETYPE_DETAIL_TRAITS_HPP
#define MAYBETYPE_DETAIL_TRAITS_HPP

#include <iterator>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace maybetype {

template <typename T>
class maybe;

namespace detail {

/**
 * @see https://en.cppreference.com/w/cpp/types/remove_cvref
 */
template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename, template <typename...> typename>
struct is_specialization : std::false_type {};

template <template <typename...> typename T, typename... Ts>
struct is_specialization<T<Ts...>, T> : std::true_type {};

template <typename T, template <typename...> typename Templ>
inline constexpr bool is_specialization_v = is_specialization<T, Templ>::value;

/**
 * @see https://en.cppreference.com/w/cpp/experimental/nonesuch
 */
struct nonesuch {
    ~nonesuch()                     = delete;
    nonesuch(nonesuch const&)       = delete;
    void operator=(nonesuch const&) = delete;
};

template <typename Default, typename AlwaysVoid,
    template <typename...> typename Op, typename... Args>
struct detector {
    using value_t = std::false_type;
    using type = Default;
};

template <typename Default,
    template <typename...> typename Op, typename... Args>
struct detector<Default, std::void_t<Op<Args...>>, Op, Args...> {
    using value_t = std::true_type;
    using type = Op<Args...>;
};

template <template <typename...> typename Op, typename... Args>
inline constexpr bool is_detected_v =
    detector<nonesuch, void, Op, Args...>::value_t::value;

template <template <typename...> typename Op, typename... Args>
using detected_t = typename detector<nonesuch, void, Op, Args...>::type;

/**
 * Marks a template argument that should be deduced from the call instead of
 * given explicitly.
 */
struct deduce {};

template <typename T>
inline constexpr bool is_maybe_v = is_specialization_v<remove_cvref_t<T>, maybe>;

template <typename T>
inline constexpr bool is_optional_v =
    is_specialization_v<remove_cvref_t<T>, std::optional>;

// Indexed or keyed access, the way the standard containers provide it
template <typename T, typename Key>
using at_t = decltype(std::declval<T>().at(std::declval<Key>()));

template <typename T, typename Key>
inline constexpr bool is_indexable_v = is_detected_v<at_t, T, Key>;

/**
 * The element type 'get' produces: the explicitly given one, or the decayed
 * result of 'at'.
 */
template <typename V, typename T, typename Key>
struct element_or {
    using type = V;
};

template <typename T, typename Key>
struct element_or<deduce, T, Key> {
    using type = remove_cvref_t<detected_t<at_t, T const&, Key const&>>;
};

template <typename V, typename T, typename Key>
using element_or_t = typename element_or<V, T, Key>::type;

template <typename T>
using stream_insert_t =
    decltype(std::declval<std::ostream&>() << std::declval<T const&>());

template <typename T>
inline constexpr bool is_streamable_v = is_detected_v<stream_insert_t, T>;

template <typename Range>
using range_reference_t = decltype(*std::begin(std::declval<Range&>()));

template <typename Range>
using range_value_t = remove_cvref_t<range_reference_t<Range>>;

/**
 * What 'then' hands back: the raw result made optional, unless it already is.
 */
template <typename R>
using as_optional_t = std::conditional_t<
    is_optional_v<R>,
    remove_cvref_t<R>,
    std::optional<remove_cvref_t<R>>
>;

} /* namespace detail */
} /* namespace maybetype */

#endif /* MAYBETYPE_DETAIL_TRAITS_HPP */
