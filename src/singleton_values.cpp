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


#include "sieve/value.hpp"


////////////////////////////////////////////////////////////////////////////////
//
//                             Booleans
//
static sieve::object*
_initialize_boolean(sieve::object *ptr, bool val)
{
  ptr->boolean = val;
  ptr->hash = sieve::hash(sieve::value {ptr});
  return ptr;
}

static
sieve::object True_object {sieve::tag::boolean}, False_object {sieve::tag::boolean};
const sieve::value sieve::True {_initialize_boolean(&True_object, true)},
                   sieve::False {_initialize_boolean(&False_object, false)};

////////////////////////////////////////////////////////////////////////////////
//
//                              Nil
//
static sieve::object*
_initialize_nil(sieve::object *ptr)
{
  ptr->hash = sieve::hash(sieve::value {ptr});
  return ptr;
}

static
sieve::object nil_object {sieve::tag::nil};
const sieve::value sieve::nil {_initialize_nil(&nil_object)};
