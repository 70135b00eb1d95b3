/**
 * type_name.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Human-readable type names for diagnostics, extracted from the signature the
 * compiler reports for a function template.
 */

#ifndef MAYBETYPE_DETAIL_TYPE_NAME_HPP
#define MAYBETYPE_DETAIL_TYPE_NAME_HPP

#include <string_view>

namespace maybetype {
namespace detail {

template <typename T>
[[nodiscard]] constexpr std::string_view type_name() noexcept {
#if defined(__clang__)
    std::string_view sig = __PRETTY_FUNCTION__;
    std::string_view const prefix = "T = ";
    auto const begin = sig.find(prefix);
    if (begin == std::string_view::npos) {
        return "?";
    }
    sig.remove_prefix(begin + prefix.size());
    return sig.substr(0, sig.rfind(']'));
#elif defined(__GNUC__)
    // [with T = int; std::string_view = std::basic_string_view<char>]
    std::string_view sig = __PRETTY_FUNCTION__;
    std::string_view const prefix = "T = ";
    auto const begin = sig.find(prefix);
    if (begin == std::string_view::npos) {
        return "?";
    }
    sig.remove_prefix(begin + prefix.size());
    auto const end = sig.find(';');
    return end == std::string_view::npos
        ? sig.substr(0, sig.rfind(']'))
        : sig.substr(0, end);
#elif defined(_MSC_VER)
    std::string_view sig = __FUNCSIG__;
    std::string_view const prefix = "type_name<";
    std::string_view const suffix = ">(void)";
    auto const begin = sig.find(prefix);
    auto const end = sig.rfind(suffix);
    if (begin == std::string_view::npos || end == std::string_view::npos) {
        return "?";
    }
    return sig.substr(begin + prefix.size(), end - begin - prefix.size());
#else
    return "?";
#endif
}

} /* namespace detail */
} /* namespace maybetype */

#endif /* MAYBETYPE_DETAIL_TYPE_NAME_HPP */
