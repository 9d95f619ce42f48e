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


#include "sieve/coerce.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/logging.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <vector>


static std::string_view
_text_of(sieve::value x)
{ return std::string_view {x->str.data, x->str.len}; }

static sieve::value
_to_integer(sieve::value x)
{
  using namespace sieve;

  switch (tag_of(x))
  {
    case tag::boolean:
      return integer(x->boolean ? 1 : 0);

    case tag::integer:
      return x;

    case tag::real: {
      const long double val = std::trunc(x->real);
      if (not std::isfinite(val) or
          val < static_cast<long double>(std::numeric_limits<long long>::min()) or
          val > static_cast<long double>(std::numeric_limits<long long>::max()))
        throw conversion_failure {x, "integer"};
      return integer(static_cast<long long>(val));
    }

    case tag::str:
    case tag::bytes: {
      long long result = 0;
      if (not parse_integer(_text_of(x), result))
        throw conversion_failure {x, "integer"};
      return integer(result);
    }

    default:
      throw conversion_failure {x, "integer"};
  }
}

static sieve::value
_to_real(sieve::value x)
{
  using namespace sieve;

  if (isnum(x))
    return isreal(x) ? x : real(num_val(x));

  if (isstr(x) or isbytes(x))
  {
    long double result = 0;
    if (not parse_real(_text_of(x), result))
      throw conversion_failure {x, "real"};
    return real(result);
  }

  throw conversion_failure {x, "real"};
}

static sieve::value
_to_number(sieve::value x)
{
  using namespace sieve;

  if (isint(x) or isreal(x))
    return x;
  if (isbool(x))
    return integer(x->boolean ? 1 : 0);

  const value result = _to_real(x);
  const long double val = real_val(result);
  if (std::isfinite(val) and std::trunc(val) == val and
      val >= static_cast<long double>(std::numeric_limits<long long>::min()) and
      val <= static_cast<long double>(std::numeric_limits<long long>::max()))
    return integer(static_cast<long long>(val));
  return result;
}

static sieve::value
_to_sequence(sieve::value x, sieve::tag kind, std::string_view name)
{
  using namespace sieve;

  std::vector<value> elements;
  if (isseq(x))
  {
    if (tag_of(x) == kind)
      return x;
    for (const value elt : sieve::elements(x))
      elements.push_back(elt);
  }
  else if (isdict(x))
  {
    for (const auto &[key, _] : items(x))
      elements.push_back(key);
  }
  else if (isstr(x))
  {
    for (const char c : str_view(x))
      elements.push_back(str(std::string_view {&c, 1}));
  }
  else if (isbytes(x))
  {
    for (const char c : bytes_view(x))
      elements.push_back(integer(static_cast<unsigned char>(c)));
  }
  else
    throw conversion_failure {x, name};

  return sequence(kind, elements);
}

static sieve::value
_to_dict(sieve::value x)
{
  using namespace sieve;

  if (isdict(x))
    return x;
  if (not isseq(x))
    throw conversion_failure {x, "dict"};

  std::vector<std::pair<value, value>> entries;
  for (const value item : elements(x))
  {
    if (not isseq(item) or length(item) != 2 or tag_of(item) == tag::set)
      throw conversion_failure {x, "dict"};
    entries.emplace_back(seq_ref(item, 0), seq_ref(item, 1));
  }
  return dict(entries);
}

static sieve::value
_to_datetime(sieve::value x)
{
  using namespace sieve;

  if (isdatetime(x))
    return x;
  if (isnum(x))
  {
    // Seconds since the epoch
    const long double micros = std::round(num_val(x) * 1e6l);
    if (not std::isfinite(micros) or
        micros < static_cast<long double>(std::numeric_limits<long long>::min()) or
        micros > static_cast<long double>(std::numeric_limits<long long>::max()))
      throw conversion_failure {x, "datetime"};
    return datetime(time_point {
        std::chrono::microseconds {static_cast<long long>(micros)}});
  }
  if (isstr(x) or isbytes(x))
  {
    time_point result;
    if (not parse_datetime(_text_of(x), result))
      throw conversion_failure {x, "datetime"};
    return datetime(result);
  }
  throw conversion_failure {x, "datetime"};
}


sieve::value
sieve::coerce(value x, type target)
{
  if (target.is_any())
    return x;

  if (target == types::integer)
    return _to_integer(x);
  if (target == types::real)
    return _to_real(x);
  if (target == types::number)
    return _to_number(x);
  if (target == types::boolean)
    return boolean(truthy(x));
  if (target == types::str)
    return isstr(x) ? x : str(to_display(x));
  if (target == types::bytes)
  {
    if (isbytes(x))
      return x;
    if (isstr(x))
      return bytes(str_view(x));
    throw conversion_failure {x, "bytes"};
  }
  if (target == types::list)
    return _to_sequence(x, tag::list, "list");
  if (target == types::tuple)
    return _to_sequence(x, tag::tuple, "tuple");
  if (target == types::set)
    return _to_sequence(x, tag::set, "set");
  if (target == types::dict)
    return _to_dict(x);
  if (target == types::datetime)
    return _to_datetime(x);
  if (target == types::path)
  {
    if (ispath(x))
      return x;
    if (isstr(x) or isbytes(x))
      return path(_text_of(x));
    throw conversion_failure {x, "path"};
  }
  if (target == types::none)
  {
    if (isnil(x))
      return x;
    throw conversion_failure {x, "none"};
  }

  // User classes have no constructors known to the library
  if (isinstance(x, target))
    return x;
  debug("no conversion from {} to {}", type_of(x), target);
  throw conversion_failure {x, target.name()};
}
