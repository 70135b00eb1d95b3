/**
 * macros.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The handful of macros the maybe implementation is written with. Define
 * MAYBETYPE_ASSERT before including any library header to route invariant
 * checks elsewhere.
 */

#ifndef MAYBETYPE_UTILS_MACROS_HPP
#define MAYBETYPE_UTILS_MACROS_HPP

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * Invariant check with a message. Compiles away with NDEBUG.
 */
#ifndef MAYBETYPE_ASSERT
#define MAYBETYPE_ASSERT(msg, ...) assert(((void)msg, (__VA_ARGS__)))
#endif

/**
 * Forwarding without spelling out the template argument.
 */
#define MAYBETYPE_FWD(...) ::std::forward<decltype(__VA_ARGS__)>(__VA_ARGS__)

/**
 * Emulates a requires-clause in a template parameter list. The leading bool
 * keeps the condition dependent, so it's always checked at substitution.
 */
#define MAYBETYPE_REQUIRES(...) \
maybetype_prelude_requires(maybetype_prelude_cat(maybetype_req_, __LINE__), __VA_ARGS__)

/**
 * Read-only accessors for an owned member. An lvalue gets a const reference,
 * an rvalue moves the member out by value, so the owner can never be
 * modified through them.
 */
#define MAYBETYPE_CONST_GETTER(name, ...)                               \
[[nodiscard]]                                                           \
constexpr auto const& name() const& noexcept(noexcept(__VA_ARGS__)) {   \
    return __VA_ARGS__;                                                 \
}                                                                       \
[[nodiscard]]                                                           \
constexpr auto name() && noexcept(                                      \
    noexcept(__VA_ARGS__) && ::std::is_nothrow_move_constructible_v<    \
        ::std::decay_t<decltype(__VA_ARGS__)>>) {                       \
    return ::std::move(__VA_ARGS__);                                    \
}

// Macro details

#define maybetype_prelude_cat(x, y) maybetype_prelude_cat1(x, y)
#define maybetype_prelude_cat1(x, y) x ## y

#define maybetype_prelude_requires(id, ...) \
bool id = false,                            \
::std::enable_if_t<id || (__VA_ARGS__), ::std::nullptr_t> = nullptr

#endif /* MAYBETYPE_UTILS_MACROS_HPP */
