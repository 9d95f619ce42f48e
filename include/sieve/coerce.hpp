/*
 * Sieve - runtime value validation and coercion engine
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "sieve/type.hpp"
#include "sieve/value.hpp"

/**
 * \file coerce.hpp
 * Constructor-like conversions between built-in types
 *
 * \ingroup literals
 */


namespace sieve {

/**
 * Convert a value to a built-in type
 *
 * Follows the behavior of type constructors: `integer("12") -> 12`,
 * `str(12) -> "12"`, `real("1.5") -> 1.5`, `list((1, 2)) -> [1, 2]`,
 * `boolean(x)` is truthiness. A value that already is an instance of
 * \p target is returned unchanged (except booleans converted to `integer`).
 *
 * \throws conversion_failure If the conversion is not possible
 *
 * \ingroup literals
 */
[[nodiscard]] value
coerce(value x, type target);

} // namespace sieve
