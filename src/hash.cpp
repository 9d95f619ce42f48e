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
#include "sieve/value.hpp"

#include <cmath>
#include <limits>


static size_t
_number_hash(long double x) noexcept
{
  // Integral reals hash as integers so that 1 == 1.0 == True agree
  if (std::isfinite(x) and std::trunc(x) == x and
      x >= static_cast<long double>(std::numeric_limits<long long>::min()) and
      x <= static_cast<long double>(std::numeric_limits<long long>::max()))
    return std::hash<long long> {}(static_cast<long long>(x));
  return std::hash<long double> {}(x);
}

size_t
sieve::hash(value x) noexcept
{
  switch (tag_of(x))
  {
    case tag::nil:
      return 0x6e696c;

    case tag::boolean:
      return std::hash<long long> {}(x->boolean ? 1 : 0);

    case tag::integer:
      return std::hash<long long> {}(x->integer);

    case tag::real:
      return _number_hash(x->real);

    case tag::str:
    case tag::bytes: {
      size_t hash = std::hash<std::string_view> {}({x->str.data, x->str.len});
      if (tag_of(x) == tag::bytes)
        hash_combine(hash, 'b');
      return hash;
    }

    case tag::list:
    case tag::tuple: {
      size_t hash = static_cast<size_t>(tag_of(x));
      for (size_t i = 0; i < x->seq.len; ++i)
        hash_combine(hash, x->seq.data[i]->hash);
      return hash;
    }

    case tag::set: {
      // Order-independent
      size_t hash = static_cast<size_t>(tag::set);
      for (size_t i = 0; i < x->seq.len; ++i)
        hash += x->seq.data[i]->hash * 0x9e3779b97f4a7c15ull;
      return hash;
    }

    case tag::dict: {
      size_t hash = static_cast<size_t>(tag::dict);
      for (size_t i = 0; i < x->seq.len; ++i)
      {
        size_t item = x->seq.data[2*i]->hash;
        hash_combine(item, x->seq.data[2*i + 1]->hash);
        hash += item;
      }
      return hash;
    }

    case tag::datetime: {
      size_t hash = std::hash<long long> {}(x->micros);
      hash_combine(hash, 'd');
      return hash;
    }

    case tag::path: {
      size_t hash = std::hash<std::string_view> {}({x->str.data, x->str.len});
      hash_combine(hash, 'p');
      return hash;
    }

    case tag::instance:
      return std::hash<void*> {}(x->inst.ptr);
  }
  std::terminate();
}
