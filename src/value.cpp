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

#include <filesystem>
#include <format>


std::string_view
sieve::tag_name(tag t) noexcept
{
  switch (t)
  {
    case tag::nil: return "nil";
    case tag::boolean: return "boolean";
    case tag::integer: return "integer";
    case tag::real: return "real";
    case tag::str: return "str";
    case tag::bytes: return "bytes";
    case tag::list: return "list";
    case tag::tuple: return "tuple";
    case tag::set: return "set";
    case tag::dict: return "dict";
    case tag::datetime: return "datetime";
    case tag::path: return "path";
    case tag::instance: return "instance";
  }
  std::terminate();
}


static bool
_contains(sieve::object *const *data, size_t len, sieve::value x) noexcept
{
  for (size_t i = 0; i < len; ++i)
  {
    if (sieve::equal(sieve::value {data[i]}, x))
      return true;
  }
  return false;
}

sieve::value
sieve::sequence(tag kind, const std::vector<value> &elements)
{
  if (kind != tag::list and kind != tag::tuple and kind != tag::set)
  {
    throw std::invalid_argument {
        std::format("sequence() - not a sequence kind: {}", tag_name(kind))};
  }

  object **data =
      static_cast<object**>(allocate(sizeof(object*) * elements.size()));
  size_t len = 0;
  for (const value x : elements)
  {
    if (kind == tag::set and _contains(data, len, x))
      continue;
    data[len++] = &*x;
  }

  value ret {make<object>(kind)};
  ret->seq.data = data;
  ret->seq.len = len;
  ret->hash = hash(ret);
  return ret;
}

sieve::value
sieve::dict(const std::vector<std::pair<value, value>> &items)
{
  object **data =
      static_cast<object**>(allocate(sizeof(object*) * 2 * items.size()));
  size_t len = 0;
  for (const auto &[key, val] : items)
  {
    size_t i = 0;
    for (; i < len; ++i)
    {
      if (equal(value {data[2*i]}, key))
        break;
    }
    if (i == len)
    {
      data[2*len] = &*key;
      len += 1;
    }
    data[2*i + 1] = &*val;
  }

  value ret {make<object>(tag::dict)};
  ret->seq.data = data;
  ret->seq.len = len;
  ret->hash = hash(ret);
  return ret;
}

sieve::value
sieve::path(std::string_view text)
{
  std::string norm =
      std::filesystem::path {text}.lexically_normal().generic_string();
  if (norm.size() > 1 and norm.back() == '/')
    norm.pop_back();
  if (norm.empty())
    norm = ".";

  value ret {make<object>(tag::path)};
  ret->str.data = copy_chars(norm);
  ret->str.len = norm.length();
  ret->hash = hash(ret);
  return ret;
}


size_t
sieve::length(value x)
{
  switch (tag_of(x))
  {
    case tag::str:
    case tag::bytes:
      return x->str.len;

    case tag::list:
    case tag::tuple:
    case tag::set:
    case tag::dict:
      return x->seq.len;

    default:
      throw std::invalid_argument {
          std::format("length() - {} has no length", tag_name(tag_of(x)))};
  }
}

sieve::value
sieve::seq_ref(value x, size_t i)
{
  if (not isseq(x))
    throw std::invalid_argument {"seq_ref() - not a sequence"};
  if (i >= x->seq.len)
  {
    throw std::out_of_range {
        std::format("seq_ref() - index {} out of range [0, {})", i, x->seq.len)};
  }
  return value {x->seq.data[i]};
}

bool
sieve::dict_get(value d, value key, value &result)
{
  if (not isdict(d))
    throw std::invalid_argument {"dict_get() - not a dictionary"};

  for (size_t i = 0; i < d->seq.len; ++i)
  {
    if (equal(value {d->seq.data[2*i]}, key))
    {
      result = value {d->seq.data[2*i + 1]};
      return true;
    }
  }
  return false;
}

bool
sieve::truthy(value x) noexcept
{
  switch (tag_of(x))
  {
    case tag::nil: return false;
    case tag::boolean: return x->boolean;
    case tag::integer: return x->integer != 0;
    case tag::real: return x->real != 0;
    case tag::str:
    case tag::bytes: return x->str.len > 0;
    case tag::list:
    case tag::tuple:
    case tag::set:
    case tag::dict: return x->seq.len > 0;
    case tag::datetime:
    case tag::path:
    case tag::instance: return true;
  }
  std::terminate();
}


sieve::element_range::element_range(value x)
{
  if (not isseq(x))
    throw std::invalid_argument {"elements() - not a sequence"};
  m_begin = x->seq.data;
  m_end = x->seq.data + x->seq.len;
}

sieve::item_range::item_range(value x)
{
  if (not isdict(x))
    throw std::invalid_argument {"items() - not a dictionary"};
  m_begin = x->seq.data;
  m_end = x->seq.data + 2 * x->seq.len;
}
