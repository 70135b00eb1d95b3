/**
 * algorithm.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Utilities over sequences of maybes.
 */

#ifndef MAYBETYPE_ALGORITHM_HPP
#define MAYBETYPE_ALGORITHM_HPP

#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>
#include "maybe.hpp"
#include "detail/traits.hpp"
#include "utils/macros.hpp"

namespace maybetype {

/**
 * Collects the payloads of the present maybes in order, dropping the empty
 * ones.
 */
template <typename Range>
[[nodiscard]] auto cat(Range&& maybes) {
    using element_t = detail::range_value_t<Range>;
    static_assert(
        detail::is_maybe_v<element_t>,
        "cat can only be applied to a range of maybes!"
    );
    using value_t = typename element_t::value_type;

    std::vector<value_t> result;
    for (auto const& m : maybes) {
        if (m.is_some()) {
            result.push_back(m.some().value());
        }
    }
    return result;
}

/**
 * Applies fn to every element and collects the payloads of the present
 * results in order. Equivalent to cat over the mapped range, without
 * materializing it.
 */
template <typename Fn, typename Range>
[[nodiscard]] auto map_maybe(Fn&& fn, Range&& values) {
    using mapped_t = detail::remove_cvref_t<
        std::invoke_result_t<Fn&, detail::range_reference_t<Range>>
    >;
    static_assert(
        detail::is_maybe_v<mapped_t>,
        "map_maybe needs a function that returns a maybe!"
    );
    using value_t = typename mapped_t::value_type;

    std::vector<value_t> result;
    for (auto&& v : values) {
        auto m = std::invoke(fn, MAYBETYPE_FWD(v));
        if (m.is_some()) {
            result.push_back(std::move(m).some().value());
        }
    }
    return result;
}

/**
 * Removes one level of nesting.
 */
template <typename T>
[[nodiscard]] maybe<T> flatten(maybe<maybe<T>> const& m) {
    if (m.is_none()) {
        return nothing;
    }
    return m.some().value();
}

template <typename T>
[[nodiscard]] maybe<T> flatten(maybe<maybe<T>>&& m) {
    if (m.is_none()) {
        return nothing;
    }
    return std::move(m).some().value();
}

} /* namespace maybetype */

#endif /* MAYBETYPE_ALGORITHM_HPP */
