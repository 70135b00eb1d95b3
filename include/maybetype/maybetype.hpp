/**
 * maybetype.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Top-level header that includes all (other top-level) headers.
 */

#ifndef MAYBETYPE_MAYBETYPE_HPP
#define MAYBETYPE_MAYBETYPE_HPP

#include "absence.hpp"
#include "algorithm.hpp"
#include "errors.hpp"
#include "maybe.hpp"
#include "parse.hpp"

#endif /* MAYBETYPE_MAYBETYPE_HPP */
