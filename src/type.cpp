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


#include "sieve/type.hpp"
#include "sieve/logging.hpp"

#include <deque>
#include <format>
#include <mutex>
#include <string>


static const sieve::type_record any_record {"any", nullptr};
static const sieve::type_record none_record {"none", nullptr};
static const sieve::type_record number_record {"number", nullptr};
static const sieve::type_record integer_record {"integer", &number_record};
static const sieve::type_record boolean_record {"boolean", &integer_record};
static const sieve::type_record real_record {"real", &number_record};
static const sieve::type_record str_record {"str", nullptr};
static const sieve::type_record bytes_record {"bytes", nullptr};
static const sieve::type_record list_record {"list", nullptr};
static const sieve::type_record tuple_record {"tuple", nullptr};
static const sieve::type_record set_record {"set", nullptr};
static const sieve::type_record dict_record {"dict", nullptr};
static const sieve::type_record datetime_record {"datetime", nullptr};
static const sieve::type_record path_record {"path", nullptr};

const sieve::type sieve::types::any {&any_record};
const sieve::type sieve::types::none {&none_record};
const sieve::type sieve::types::number {&number_record};
const sieve::type sieve::types::boolean {&boolean_record};
const sieve::type sieve::types::integer {&integer_record};
const sieve::type sieve::types::real {&real_record};
const sieve::type sieve::types::str {&str_record};
const sieve::type sieve::types::bytes {&bytes_record};
const sieve::type sieve::types::list {&list_record};
const sieve::type sieve::types::tuple {&tuple_record};
const sieve::type sieve::types::set {&set_record};
const sieve::type sieve::types::dict {&dict_record};
const sieve::type sieve::types::datetime {&datetime_record};
const sieve::type sieve::types::path {&path_record};

static const sieve::type_record *const g_builtin_records[] = {
    &any_record,  &none_record,  &number_record, &integer_record,
    &boolean_record, &real_record, &str_record, &bytes_record,
    &list_record, &tuple_record, &set_record, &dict_record,
    &datetime_record, &path_record,
};


// Declared classes; records never move once created
struct declared_class {
  std::string name;
  sieve::type_record record;
};

static std::deque<declared_class> g_declared;
static std::mutex g_declared_mutex;


bool
sieve::type::is_any() const noexcept
{ return m_record == &any_record; }

bool
sieve::type::is_subtype_of(type other) const noexcept
{
  if (other.is_any())
    return true;
  for (const type_record *r = m_record; r; r = r->base)
  {
    if (r == other.m_record)
      return true;
  }
  return false;
}

sieve::type
sieve::type::declare(std::string_view name, std::optional<type> base)
{
  std::lock_guard lock {g_declared_mutex};

  for (const type_record *r : g_builtin_records)
  {
    if (r->name == name)
      throw std::invalid_argument {std::format("type {} is built-in", name)};
  }
  for (const declared_class &cls : g_declared)
  {
    if (cls.name == name)
      throw std::invalid_argument {std::format("type {} already declared", name)};
  }

  declared_class &cls = g_declared.emplace_back();
  cls.name = name;
  cls.record = {cls.name, base ? base->record() : nullptr};
  debug("declared class {}", name);
  return type {&cls.record};
}

std::optional<sieve::type>
sieve::type::lookup(std::string_view name)
{
  for (const type_record *r : g_builtin_records)
  {
    if (r->name == name)
      return type {r};
  }

  std::lock_guard lock {g_declared_mutex};
  for (const declared_class &cls : g_declared)
  {
    if (cls.name == name)
      return type {&cls.record};
  }
  return std::nullopt;
}


sieve::type
sieve::type_of(value x) noexcept
{
  switch (tag_of(x))
  {
    case tag::nil: return types::none;
    case tag::boolean: return types::boolean;
    case tag::integer: return types::integer;
    case tag::real: return types::real;
    case tag::str: return types::str;
    case tag::bytes: return types::bytes;
    case tag::list: return types::list;
    case tag::tuple: return types::tuple;
    case tag::set: return types::set;
    case tag::dict: return types::dict;
    case tag::datetime: return types::datetime;
    case tag::path: return types::path;
    case tag::instance: return type {x->inst.cls};
  }
  std::terminate();
}

sieve::value
sieve::instance(type cls, void *ptr)
{
  for (const type_record *r : g_builtin_records)
  {
    if (r == cls.record())
    {
      throw std::invalid_argument {
          std::format("instance() - {} is a built-in type", cls)};
    }
  }

  value ret {make<object>(tag::instance)};
  ret->inst.cls = cls.record();
  ret->inst.ptr = ptr;
  ret->hash = hash(ret);
  return ret;
}
