/**
 * errors.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The failures the maybe combinators report. Out-of-range and missing-key
 * failures of keyed access are the standard std::out_of_range the containers
 * throw from at(), so no type is declared for them here.
 */

#ifndef MAYBETYPE_ERRORS_HPP
#define MAYBETYPE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace maybetype {

/**
 * Selects whether a lookup that finds nothing yields an empty maybe or
 * throws.
 */
enum class error_policy {
    suppress,
    raise,
};

/**
 * Thrown when unwrapping an empty maybe without a custom failure.
 */
class empty_unwrap : public std::logic_error {
public:
    explicit empty_unwrap(std::string_view type_name)
        : std::logic_error(
            "maybe<" + std::string(type_name) + "> unwrapped into nothing") {
    }
};

/**
 * Thrown by a raising attribute lookup when the attribute does not exist.
 */
class missing_attribute : public std::logic_error {
public:
    missing_attribute(std::string_view owner, std::string_view name)
        : std::logic_error(
            "'" + std::string(owner) + "' has no attribute '"
            + std::string(name) + "'"),
          m_Name(name) {
    }

    [[nodiscard]] std::string const& name() const noexcept {
        return m_Name;
    }

private:
    std::string m_Name;
};

} /* namespace maybetype */

#endif /* MAYBETYPE_ERRORS_HPP */
