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

#include "sieve/pattern.hpp"

/**
 * \file builtins.hpp
 * Predefined patterns
 *
 * \ingroup builtins
 */


namespace sieve {

class pattern_table;

/**
 * \defgroup builtins Built-in patterns
 *
 * Patterns are created on first use and shared afterwards.
 */
namespace builtins {

/** Anything, unchanged (`any`) */
const pattern_ptr& any_pattern();

/** Only `None` (`none`) */
const pattern_ptr& none_pattern();

/** Text; bytes are decoded (`str`) */
const pattern_ptr& string_pattern();

/** Bytes; text is encoded (`bytes`) */
const pattern_ptr& bytes_pattern();

/** Integer conversion the way `int()` does it (`int`) */
const pattern_ptr& integer_pattern();

/** Real conversion the way `float()` does it (`float`) */
const pattern_ptr& float_pattern();

/** Integer or real; integral text becomes an integer (`number`) */
const pattern_ptr& number_pattern();

/** Booleans and the words `true`/`false` in any case (`bool`) */
const pattern_ptr& boolean_pattern();

/** Booleans and common spellings: `1/0`, `on/off`, `yes/no`, ... (`wide_bool`) */
const pattern_ptr& wide_boolean_pattern();

/** Display form of anything (`any_str`) */
const pattern_ptr& any_str_pattern();

/** \name Container literals
 * \{ */
const pattern_ptr& list_pattern();
const pattern_ptr& tuple_pattern();
const pattern_ptr& set_pattern();
const pattern_ptr& dict_pattern();
/** \} */

/**
 * ISO 8601 text, or seconds since the epoch, to a UTC datetime (`datetime`)
 */
const pattern_ptr& datetime_pattern();

/** Lexically normalized filesystem path; nothing is accessed (`path`) */
const pattern_ptr& path_pattern();

/** \name Text formats
 * \{ */
const pattern_ptr& email_pattern();
const pattern_ptr& ip_pattern();
const pattern_ptr& url_pattern();
/** \} */

/** Hexadecimal text to integer (`hex`) */
const pattern_ptr& hex_pattern();

/** `#rrggbb` anywhere in the text, yields `rrggbb` (`color`) */
const pattern_ptr& hex_color_pattern();

/** Integer text with `,` digit separators (`delimited_int`) */
const pattern_ptr& delimited_int_pattern();

} // namespace sieve::builtins


/**
 * Register built-in patterns
 *
 * Core patterns are keyed by origin type and alias, text formats by alias only.
 *
 * \ingroup builtins
 */
void
install_builtins(pattern_table &table, bool cover = true);

} // namespace sieve
