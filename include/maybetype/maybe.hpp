/**
 * maybe.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A generic Maybe type that's either some value, or nothing. Just like
 * std::optional but with type-constructors, a predicate-checked constructor
 * function and a set of combinators that make presence checks unnecessary.
 */

#ifndef MAYBETYPE_MAYBE_HPP
#define MAYBETYPE_MAYBE_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include "absence.hpp"
#include "errors.hpp"
#include "detail/traits.hpp"
#include "detail/type_name.hpp"
#include "utils/macros.hpp"

namespace maybetype {

/**
 * None type-constructor for maybe.
 */
class none {};

/**
 * The one absent value. Compare against it, or pass it wherever a maybe is
 * expected.
 */
inline constexpr none nothing{};

template <>
struct absence_traits<none> {
    using value_type = none;

    static constexpr bool nullable = true;

    [[nodiscard]] static constexpr bool is_absent(none) noexcept {
        return true;
    }
};

/**
 * Some type-constructor for maybe. Never holds an absent value.
 */
template <typename T>
class some {
public:
    using value_type = T;

    template <typename TFwd,
        MAYBETYPE_REQUIRES(
            !std::is_same_v<detail::remove_cvref_t<TFwd>, some>
         && std::is_constructible_v<value_type, TFwd&&>
        )>
    constexpr some(TFwd&& val)
        noexcept(std::is_nothrow_constructible_v<value_type, TFwd&&>)
        : m_Value(MAYBETYPE_FWD(val)) {
        // A nested maybe is a legitimate payload, even when it's empty
        if constexpr (!detail::is_maybe_v<value_type>) {
            MAYBETYPE_ASSERT(
                "some can not hold an absent value!",
                !absence_traits<value_type>::is_absent(m_Value)
            );
        }
    }

    MAYBETYPE_CONST_GETTER(value, m_Value)

private:
    value_type m_Value;
};

template <typename TFwd>
some(TFwd) -> some<TFwd>;

template <typename U>
struct absence_traits<maybe<U>> {
    using value_type = U;

    static constexpr bool nullable = true;

    [[nodiscard]]
    static constexpr bool is_absent(maybe<U> const& raw) noexcept {
        return raw.is_none();
    }

    template <typename TFwd>
    [[nodiscard]] static constexpr decltype(auto) payload(TFwd&& raw) {
        return MAYBETYPE_FWD(raw).some().value();
    }
};

namespace detail {

/**
 * The default predicate. Presence is already checked by the time it runs.
 */
struct always_true {
    template <typename T>
    [[nodiscard]] constexpr bool operator()(T const&) const noexcept {
        return true;
    }
};

template <typename Raw>
inline constexpr bool is_absent_literal_v =
       std::is_same_v<remove_cvref_t<Raw>, none>
    || std::is_same_v<remove_cvref_t<Raw>, std::nullopt_t>;

template <typename V, typename Raw>
struct maybe_value {
    using type = V;
};

template <typename Raw>
struct maybe_value<deduce, Raw> {
    using type = typename absence_traits<remove_cvref_t<Raw>>::value_type;
};

template <typename V, typename Raw>
using maybe_value_t = typename maybe_value<V, Raw>::type;

// Fixed hash for the absent value
inline constexpr std::size_t none_hash = 0x6e6f6e65U;

template <typename T, typename Failure, typename... Args>
[[noreturn]] void fail_unwrap(Failure&& failure, Args&&... args) {
    using failure_t = remove_cvref_t<Failure>;

    if constexpr (std::is_same_v<failure_t, std::exception_ptr>) {
        if (failure) {
            std::rethrow_exception(failure);
        }
        throw empty_unwrap(type_name<T>());
    }
    else if constexpr (std::is_base_of_v<std::exception, failure_t>) {
        throw MAYBETYPE_FWD(failure);
    }
    else {
        static_assert(
            std::is_invocable_v<Failure&&, Args&&...>,
            "The unwrap failure must be an exception or a callable!"
        );
        std::invoke(MAYBETYPE_FWD(failure), MAYBETYPE_FWD(args)...);
        // The handler was supposed to leave
        throw empty_unwrap(type_name<T>());
    }
}

} /* namespace detail */

/**
 * Constructs a maybe from a possibly-absent raw value. The result is some
 * only if the value is present and the predicate accepts the payload. The
 * predicate is never called for an absent value.
 *
 * The payload type is deduced through absence_traits, or can be given
 * explicitly as make_maybe<V>(...).
 */
template <typename V = detail::deduce, typename Raw,
    typename Pred = detail::always_true>
[[nodiscard]] auto make_maybe(Raw&& raw, Pred&& pred = Pred())
    -> maybe<detail::maybe_value_t<V, Raw>> {
    static_assert(
        !std::is_same_v<V, detail::deduce> || !detail::is_absent_literal_v<Raw>,
        "An absent literal has no payload type, write make_maybe<V>(nothing)!"
    );

    using traits = absence_traits<detail::remove_cvref_t<Raw>>;
    using value_t = detail::maybe_value_t<V, Raw>;
    using result_t = maybe<value_t>;

    if constexpr (detail::is_absent_literal_v<Raw>) {
        return result_t(nothing);
    }
    else {
        if (traits::is_absent(raw)) {
            return result_t(nothing);
        }
        decltype(auto) payload = traits::payload(MAYBETYPE_FWD(raw));
        if (!static_cast<bool>(
                std::invoke(MAYBETYPE_FWD(pred), std::as_const(payload)))) {
            return result_t(nothing);
        }
        return result_t(some<value_t>(MAYBETYPE_FWD(payload)));
    }
}

/**
 * Legacy constructor, kept for old call sites. Same as make_maybe without a
 * predicate.
 */
template <typename Raw>
[[deprecated("wrap is deprecated, use make_maybe instead")]]
[[nodiscard]] auto wrap(Raw&& raw) {
    return make_maybe(MAYBETYPE_FWD(raw));
}

/**
 * Generic maybe-type.
 */
template <typename T>
class maybe {
public:
    static_assert(
        !std::is_reference_v<T>,
        "A maybe can not hold a reference, use a pointer instead!"
    );
    static_assert(
        !std::is_same_v<std::remove_cv_t<T>, ::maybetype::none>,
        "A maybe of none is always empty!"
    );

    using value_type = T;
    using some_type = ::maybetype::some<T>;
    using none_type = ::maybetype::none;

private:
    using variant_type = std::variant<some_type, none_type>;

public:
    constexpr maybe() noexcept
        : m_Data(std::in_place_type<none_type>) {
    }

    constexpr maybe(none_type) noexcept
        : m_Data(std::in_place_type<none_type>) {
    }

    template <typename U,
        MAYBETYPE_REQUIRES(std::is_constructible_v<T, U const&>)>
    constexpr maybe(::maybetype::some<U> const& val)
        : m_Data(std::in_place_type<some_type>, val.value()) {
    }

    template <typename U,
        MAYBETYPE_REQUIRES(std::is_constructible_v<T, U&&>)>
    constexpr maybe(::maybetype::some<U>&& val)
        : m_Data(std::in_place_type<some_type>, std::move(val).value()) {
    }

    [[nodiscard]] constexpr bool is_some() const noexcept {
        return std::holds_alternative<some_type>(m_Data);
    }

    [[nodiscard]] constexpr bool is_none() const noexcept {
        return std::holds_alternative<none_type>(m_Data);
    }

    [[nodiscard]] constexpr bool is_present() const noexcept {
        return is_some();
    }

    constexpr explicit operator bool() const noexcept {
        return is_some();
    }

    MAYBETYPE_CONST_GETTER(some, std::get<some_type>(m_Data))
    MAYBETYPE_CONST_GETTER(none, std::get<none_type>(m_Data))
    MAYBETYPE_CONST_GETTER(as_variant, m_Data)

    /**
     * Calls func with the payload and returns its result as a std::optional,
     * leaving the maybe-world. Returns std::nullopt without calling func when
     * empty. A func returning void is simply called when there is a payload.
     */
    template <typename F>
    auto then(F&& func) const& {
        return then_impl(*this, MAYBETYPE_FWD(func));
    }
    template <typename F>
    auto then(F&& func) && {
        return then_impl(std::move(*this), MAYBETYPE_FWD(func));
    }

    /**
     * Calls func with the payload and wraps the result into some. The result
     * is not flattened, see flatten.
     */
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& {
        return and_then_impl(*this, MAYBETYPE_FWD(func));
    }
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) && {
        return and_then_impl(std::move(*this), MAYBETYPE_FWD(func));
    }

    /**
     * Keeps the payload only if the predicate accepts it.
     */
    template <typename Pred>
    [[nodiscard]] maybe test(Pred&& pred) const& {
        return test_impl(*this, MAYBETYPE_FWD(pred));
    }
    template <typename Pred>
    [[nodiscard]] maybe test(Pred&& pred) && {
        return test_impl(std::move(*this), MAYBETYPE_FWD(pred));
    }

    /**
     * Reads an attribute of the payload through accessor, which is anything
     * std::invoke accepts with the payload (member pointers included). An
     * accessor result that is absent means the attribute does not exist, so
     * with error_policy::raise a field holding an empty optional or a null
     * pointer throws missing_attribute too. The name is only used for
     * reporting.
     */
    template <typename Accessor>
    [[nodiscard]] auto attr(
        std::string_view name,
        Accessor&& accessor,
        error_policy err = error_policy::suppress) const {

        using field_t = decltype(::maybetype::make_maybe(
            std::invoke(std::declval<Accessor>(), std::declval<T const&>())
        ));

        if (is_none()) {
            return field_t(nothing);
        }
        auto field = ::maybetype::make_maybe(
            std::invoke(MAYBETYPE_FWD(accessor), some().value())
        );
        if (field.is_none() && err == error_policy::raise) {
            throw missing_attribute(detail::type_name<T>(), name);
        }
        return field;
    }

    /**
     * Like attr, but unwraps the attribute, or returns def if it's missing.
     */
    template <typename Accessor, typename Default>
    [[nodiscard]] auto attr_or(
        std::string_view name,
        Accessor&& accessor,
        Default&& def) const {

        using field_t = decltype(attr(name, std::declval<Accessor>()));
        using field_value_t = typename field_t::value_type;

        try {
            return attr(name, MAYBETYPE_FWD(accessor), error_policy::raise)
                .unwrap_or(MAYBETYPE_FWD(def));
        }
        catch (missing_attribute const&) {
            return static_cast<field_value_t>(MAYBETYPE_FWD(def));
        }
    }

    /**
     * Indexed or keyed access on the payload through at(key). Out-of-range
     * indices and missing keys give make_maybe<V>(def), or rethrow the
     * std::out_of_range with error_policy::raise. Other exceptions are never
     * suppressed. An empty maybe, or a payload without at(key) also gives
     * make_maybe<V>(def), regardless of err.
     *
     * Indices are passed to at() as they are. There is no counting from the
     * back, a negative index converts to a huge size_type and is out of
     * range.
     */
    template <typename V = detail::deduce, typename Key,
        typename Default = none_type>
    [[nodiscard]] auto get(
        Key const& key,
        error_policy err = error_policy::suppress,
        Default&& def = Default()) const {

        constexpr bool indexable = detail::is_indexable_v<T const&, Key const&>;
        static_assert(
            indexable || !std::is_same_v<V, detail::deduce>,
            "The payload has no at(key), give the element type as get<V>(key)!"
        );
        using element_t = detail::element_or_t<V, T, Key>;

        if constexpr (indexable) {
            if (is_some()) {
                try {
                    return ::maybetype::make_maybe<element_t>(
                        some().value().at(key)
                    );
                }
                catch (std::out_of_range const&) {
                    if (err == error_policy::raise) {
                        throw;
                    }
                }
            }
        }
        return ::maybetype::make_maybe<element_t>(MAYBETYPE_FWD(def));
    }

    /**
     * Returns this if there is a payload, some(other) otherwise. other is
     * taken as present, it must not be an absent value.
     */
    template <typename U>
    [[nodiscard]] maybe this_or(U&& other) const& {
        if (is_some()) {
            return *this;
        }
        return maybe(some_type(MAYBETYPE_FWD(other)));
    }
    template <typename U>
    [[nodiscard]] maybe this_or(U&& other) && {
        if (is_some()) {
            return std::move(*this);
        }
        return maybe(some_type(MAYBETYPE_FWD(other)));
    }

    [[nodiscard]] T const& unwrap() const& {
        if (is_none()) {
            throw empty_unwrap(detail::type_name<T>());
        }
        return some().value();
    }
    [[nodiscard]] T unwrap() && {
        if (is_none()) {
            throw empty_unwrap(detail::type_name<T>());
        }
        return std::move(*this).some().value();
    }

    /**
     * Unwraps with a custom failure. The failure is either an exception
     * object that gets thrown as-is (a std::exception_ptr is rethrown), or a
     * callable that is invoked with args and is not supposed to return.
     */
    template <typename Failure, typename... Args>
    [[nodiscard]] T const& unwrap(Failure&& failure, Args&&... args) const& {
        if (is_none()) {
            detail::fail_unwrap<T>(MAYBETYPE_FWD(failure), MAYBETYPE_FWD(args)...);
        }
        return some().value();
    }
    template <typename Failure, typename... Args>
    [[nodiscard]] T unwrap(Failure&& failure, Args&&... args) && {
        if (is_none()) {
            detail::fail_unwrap<T>(MAYBETYPE_FWD(failure), MAYBETYPE_FWD(args)...);
        }
        return std::move(*this).some().value();
    }

    template <typename U>
    [[nodiscard]] T unwrap_or(U&& other) const& {
        if (is_some()) {
            return some().value();
        }
        return static_cast<T>(MAYBETYPE_FWD(other));
    }
    template <typename U>
    [[nodiscard]] T unwrap_or(U&& other) && {
        if (is_some()) {
            return std::move(*this).some().value();
        }
        return static_cast<T>(MAYBETYPE_FWD(other));
    }

    /**
     * Calls on_some with the payload or on_none with nothing, whichever
     * applies.
     */
    template <typename OnSome, typename OnNone,
        typename R = std::common_type_t<
            std::invoke_result_t<OnSome&&, T const&>,
            std::invoke_result_t<OnNone&&>
        >>
    R match(OnSome&& on_some, OnNone&& on_none) const& {
        if (is_some()) {
            return std::invoke(MAYBETYPE_FWD(on_some), some().value());
        }
        return std::invoke(MAYBETYPE_FWD(on_none));
    }

private:
    template <typename Self, typename F>
    static auto then_impl(Self&& self, F&& func) {
        using payload_t = decltype(MAYBETYPE_FWD(self).some().value());
        using result_t = std::invoke_result_t<F&&, payload_t>;

        if constexpr (std::is_void_v<result_t>) {
            if (self.is_some()) {
                std::invoke(MAYBETYPE_FWD(func), MAYBETYPE_FWD(self).some().value());
            }
        }
        else {
            using optional_t = detail::as_optional_t<result_t>;

            if (self.is_none()) {
                return optional_t();
            }
            return optional_t(
                std::invoke(MAYBETYPE_FWD(func), MAYBETYPE_FWD(self).some().value())
            );
        }
    }

    template <typename Self, typename F>
    static auto and_then_impl(Self&& self, F&& func) {
        using payload_t = decltype(MAYBETYPE_FWD(self).some().value());
        using result_t =
            detail::remove_cvref_t<std::invoke_result_t<F&&, payload_t>>;

        static_assert(
            !std::is_void_v<result_t>,
            "and_then needs a function that returns a value, use then!"
        );
        static_assert(
            detail::is_maybe_v<result_t> || !absence_traits<result_t>::nullable,
            "The function may return an absent value, use then or make_maybe!"
        );

        using maybe_t = ::maybetype::maybe<result_t>;

        if (self.is_none()) {
            return maybe_t(nothing);
        }
        return maybe_t(::maybetype::some<result_t>(
            std::invoke(MAYBETYPE_FWD(func), MAYBETYPE_FWD(self).some().value())
        ));
    }

    template <typename Self, typename Pred>
    static maybe test_impl(Self&& self, Pred&& pred) {
        if (self.is_some()
            && static_cast<bool>(std::invoke(
                MAYBETYPE_FWD(pred), std::as_const(self.some().value())))) {
            return MAYBETYPE_FWD(self);
        }
        return maybe(nothing);
    }

    variant_type m_Data;
};

template <typename T>
maybe(some<T>) -> maybe<T>;

/**
 * Make maybes comparable. Two maybes are equal if both are empty, or both
 * have equal payloads.
 */
template <typename T, typename U>
[[nodiscard]] constexpr bool operator==(maybe<T> const& l, maybe<U> const& r) {
    if (l.is_some() && r.is_some()) {
        return l.some().value() == r.some().value();
    }
    return l.is_none() && r.is_none();
}

template <typename T, typename U>
[[nodiscard]] constexpr bool operator!=(maybe<T> const& l, maybe<U> const& r) {
    return !(l == r);
}

template <typename T>
[[nodiscard]] constexpr bool operator==(maybe<T> const& l, none) noexcept {
    return l.is_none();
}

template <typename T>
[[nodiscard]] constexpr bool operator==(none, maybe<T> const& r) noexcept {
    return r.is_none();
}

template <typename T>
[[nodiscard]] constexpr bool operator!=(maybe<T> const& l, none) noexcept {
    return l.is_some();
}

template <typename T>
[[nodiscard]] constexpr bool operator!=(none, maybe<T> const& r) noexcept {
    return r.is_some();
}

[[nodiscard]] constexpr bool operator==(none, none) noexcept {
    return true;
}

[[nodiscard]] constexpr bool operator!=(none, none) noexcept {
    return false;
}

inline std::ostream& operator<<(std::ostream& os, none) {
    return os << "nothing";
}

template <typename T, MAYBETYPE_REQUIRES(detail::is_streamable_v<T>)>
std::ostream& operator<<(std::ostream& os, maybe<T> const& m) {
    if (m.is_none()) {
        return os << m.none();
    }
    return os << "some(" << m.some().value() << ')';
}

} /* namespace maybetype */

namespace std {

template <>
struct hash<::maybetype::none> {
    [[nodiscard]] std::size_t operator()(::maybetype::none) const noexcept {
        return ::maybetype::detail::none_hash;
    }
};

template <typename T>
struct hash<::maybetype::maybe<T>> {
    [[nodiscard]]
    std::size_t operator()(::maybetype::maybe<T> const& m) const {
        if (m.is_none()) {
            return ::maybetype::detail::none_hash;
        }
        return std::hash<T>()(m.some().value());
    }
};

} /* namespace std */

#endif /* MAYBETYPE_MAYBE_HPP */
