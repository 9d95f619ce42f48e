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


#include "sieve/functional.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>


sieve::step_pattern::step_pattern(pattern_ptr base, function fn,
                                  std::string name, type origin)
: pattern {{.mode = match_mode::keep, .origin = origin, .alias = name}},
  m_base {std::move(base)},
  m_fn {std::move(fn)},
  m_name {std::move(name)}
{
  if (not m_base or not m_fn)
    throw std::invalid_argument {"step pattern requires a base pattern and a function"};
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::step_pattern::copy() const
{ return std::make_shared<step_pattern>(*this); }

sieve::value
sieve::step_pattern::_match(value input) const
{
  const value x = m_base->match(input);
  try
  {
    return m_fn(x);
  }
  catch (const match_failed&)
  {
    throw;
  }
  catch (const configuration_error&)
  {
    throw;
  }
  catch (...)
  {
    std::throw_with_nested(conversion_failure {x, repr()});
  }
}

void
sieve::step_pattern::_extend_key(std::string &key) const
{ key += std::format("({})->{}", m_base->key(), m_name); }


// Elements of a sequence, or characters of a text
static std::vector<sieve::value>
_elements_of(sieve::value x)
{
  using namespace sieve;

  std::vector<value> result;
  if (isstr(x))
  {
    for (const char c : str_view(x))
      result.push_back(str(std::string_view {&c, 1}));
  }
  else
  {
    for (const value elt : elements(x))
      result.push_back(elt);
  }
  return result;
}

// Same kind of container (or text) as the original
static sieve::value
_rebuild(sieve::value original, const std::vector<sieve::value> &elts)
{
  using namespace sieve;

  if (not isstr(original))
    return sequence(tag_of(original), elts);
  std::string text;
  for (const value c : elts)
    text += str_view(c);
  return str(text);
}

static size_t
_normalize_index(long long i, size_t len)
{
  const long long n = static_cast<long long>(len);
  const long long result = i < 0 ? i + n : i;
  if (result < 0 or result >= n)
    throw std::out_of_range {std::format("index {} out of range", i)};
  return static_cast<size_t>(result);
}

static std::string
_slice_repr(std::optional<long long> start, std::optional<long long> end,
            long long step)
{
  std::string text;
  if (start and end)
    text = std::format("{}:{}", *start, *end);
  else if (start)
    text = std::format("{}:", *start);
  else
    text = std::format(":{}", *end);
  if (step != 1)
    text += std::format(":{}", step);
  return text;
}


sieve::pattern_ptr
sieve::functional::index(pattern_ptr p, long long i)
{
  const std::string name = std::format("{}[{}]", p->repr(), i);
  return std::make_shared<step_pattern>(std::move(p), [i](value x) {
    const std::vector<value> elts = _elements_of(x);
    return elts[_normalize_index(i, elts.size())];
  }, name);
}

sieve::pattern_ptr
sieve::functional::slice(pattern_ptr p, std::optional<long long> start,
                         std::optional<long long> end, long long step)
{
  if (step == 0)
    throw std::invalid_argument {"slice step can not be zero"};
  if (not start and not end)
    return p;

  const std::string name = std::format("{}[{}]", p->repr(),
                                       _slice_repr(start, end, step));
  const type origin = p->origin();
  return std::make_shared<step_pattern>(std::move(p), [=](value x) {
    const std::vector<value> elts = _elements_of(x);
    const long long n = static_cast<long long>(elts.size());

    // Clamp bounds the way sequence slicing does
    const auto clamp = [&](std::optional<long long> bound, long long fallback) {
      if (not bound)
        return fallback;
      long long b = *bound < 0 ? *bound + n : *bound;
      if (step > 0)
        return std::clamp(b, 0LL, n);
      return std::clamp(b, -1LL, n - 1);
    };
    const long long first = clamp(start, step > 0 ? 0 : n - 1);
    const long long last = clamp(end, step > 0 ? n : -1);

    std::vector<value> result;
    for (long long k = first; step > 0 ? k < last : k > last; k += step)
      result.push_back(elts[static_cast<size_t>(k)]);
    return _rebuild(x, result);
  }, name, origin);
}

sieve::pattern_ptr
sieve::functional::map(pattern_ptr p, std::function<value(value)> fn,
                       std::string name)
{
  const std::string alias = std::format("{}.map({})", p->repr(), name);
  return std::make_shared<step_pattern>(std::move(p), [fn](value x) {
    std::vector<value> result;
    for (const value elt : _elements_of(x))
      result.push_back(fn(elt));
    return sequence(tag::list, result);
  }, alias, types::list);
}

sieve::pattern_ptr
sieve::functional::filter(pattern_ptr p, std::function<bool(value)> pred,
                          std::string name)
{
  const std::string alias = std::format("{}.filter({})", p->repr(), name);
  return std::make_shared<step_pattern>(std::move(p), [pred](value x) {
    std::vector<value> result;
    for (const value elt : _elements_of(x))
    {
      if (pred(elt))
        result.push_back(elt);
    }
    return sequence(tag::list, result);
  }, alias, types::list);
}

sieve::pattern_ptr
sieve::functional::sum(pattern_ptr p)
{
  const std::string alias = std::format("sum({})", p->repr());
  return std::make_shared<step_pattern>(std::move(p), [](value x) {
    long long int_total = 0;
    long double real_total = 0;
    bool is_real = false;
    for (const value elt : _elements_of(x))
    {
      if (not isnum(elt))
        throw std::invalid_argument {std::format("can not sum {}", elt)};
      if (isreal(elt))
        is_real = true;
      else
        int_total += isbool(elt) ? elt->boolean : elt->integer;
      real_total += num_val(elt);
    }
    return is_real ? real(real_total) : integer(int_total);
  }, alias, types::number);
}

sieve::pattern_ptr
sieve::functional::reduce(pattern_ptr p, std::function<value(value, value)> fn,
                          std::optional<value> initial, std::string name)
{
  const std::string alias = std::format("{}.reduce({})", p->repr(), name);
  return std::make_shared<step_pattern>(std::move(p), [fn, initial](value x) {
    const std::vector<value> elts = _elements_of(x);
    auto it = elts.begin();
    value acc = nil;
    if (initial)
      acc = *initial;
    else if (it == elts.end())
      throw std::invalid_argument {"reduce of empty sequence with no initial value"};
    else
      acc = *it++;
    for (; it != elts.end(); ++it)
      acc = fn(acc, *it);
    return acc;
  }, alias);
}

sieve::pattern_ptr
sieve::functional::join(pattern_ptr p, std::string sep)
{
  const std::string alias = std::format("{}.join({})", p->repr(), str(sep));
  return std::make_shared<step_pattern>(std::move(p), [sep](value x) {
    std::string text;
    bool first = true;
    for (const value elt : _elements_of(x))
    {
      if (not first)
        text += sep;
      text += str_view(elt);
      first = false;
    }
    return str(text);
  }, alias, types::str);
}

static sieve::pattern_ptr
_transform_case(sieve::pattern_ptr p, std::string_view method, int (*fn)(int))
{
  using namespace sieve;

  const std::string alias = std::format("{}.{}()", p->repr(), method);
  return std::make_shared<step_pattern>(std::move(p), [fn](value x) {
    std::string text {str_view(x)};
    for (char &c : text)
      c = static_cast<char>(fn(static_cast<unsigned char>(c)));
    return str(text);
  }, alias, types::str);
}

sieve::pattern_ptr
sieve::functional::upper(pattern_ptr p)
{ return _transform_case(std::move(p), "upper",
                         [](int c) { return std::toupper(c); }); }

sieve::pattern_ptr
sieve::functional::lower(pattern_ptr p)
{ return _transform_case(std::move(p), "lower",
                         [](int c) { return std::tolower(c); }); }

sieve::pattern_ptr
sieve::functional::get_item(pattern_ptr p, value key,
                            std::optional<value> fallback, type origin)
{
  const std::string alias = std::format("{}.{:d}", p->repr(), key);
  return std::make_shared<step_pattern>(std::move(p), [key, fallback](value x) {
    if (isdict(x))
    {
      value result = nil;
      if (dict_get(x, key, result))
        return result;
      if (fallback)
        return *fallback;
      throw std::out_of_range {std::format("key {} not found", key)};
    }

    try
    {
      const std::vector<value> elts = _elements_of(x);
      return elts[_normalize_index(int_val(key), elts.size())];
    }
    catch (const std::out_of_range&)
    {
      if (fallback)
        return *fallback;
      throw;
    }
  }, alias, origin);
}

sieve::pattern_ptr
sieve::functional::step(pattern_ptr p, std::function<value(value)> fn,
                        std::string name, type origin)
{
  const std::string alias = std::format("{}({})", name, p->repr());
  return std::make_shared<step_pattern>(std::move(p), std::move(fn), alias,
                                        origin);
}
