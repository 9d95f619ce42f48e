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


#include "sieve/hash.hpp"
#include "sieve/utilities/execution_timer.hpp"
#include "sieve/value.hpp"


static bool
_equal(sieve::value a, sieve::value b) noexcept
{
  using namespace sieve;

  if (is(a, b))
    return true;

  // Numbers compare across boolean, integer and real
  if (isnum(a) and isnum(b))
  {
    if (isint(a) and isint(b))
      return a->integer == b->integer;
    return num_val(a) == num_val(b);
  }

  if (tag_of(a) != tag_of(b))
    return false;

  switch (tag_of(a))
  {
    case tag::nil:
      return true;

    case tag::str:
    case tag::bytes:
    case tag::path:
      return std::string_view {a->str.data, a->str.len} ==
             std::string_view {b->str.data, b->str.len};

    case tag::list:
    case tag::tuple:
      if (a->seq.len != b->seq.len)
        return false;
      for (size_t i = 0; i < a->seq.len; ++i)
      {
        if (not _equal(value {a->seq.data[i]}, value {b->seq.data[i]}))
          return false;
      }
      return true;

    case tag::set:
      if (a->seq.len != b->seq.len)
        return false;
      for (const value x : elements(a))
      {
        bool found = false;
        for (const value y : elements(b))
        {
          if (chash(x) == chash(y) and _equal(x, y))
          {
            found = true;
            break;
          }
        }
        if (not found)
          return false;
      }
      return true;

    case tag::dict: {
      if (a->seq.len != b->seq.len)
        return false;
      for (const auto &[key, val] : items(a))
      {
        value other;
        if (not dict_get(b, key, other) or not _equal(val, other))
          return false;
      }
      return true;
    }

    case tag::datetime:
      return a->micros == b->micros;

    case tag::instance:
      return a->inst.ptr == b->inst.ptr and a->inst.cls == b->inst.cls;

    case tag::boolean:
    case tag::integer:
    case tag::real:
      break;
  }
  std::terminate();
}

bool
sieve::equal(value a, value b) noexcept
{
  SIEVE_FUNCTION_BENCHMARK

  if (chash(a) != chash(b))
    return false;
  return _equal(a, b);
}
