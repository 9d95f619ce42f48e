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

#include "sieve/value.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <vector>


namespace sieve {

/**
 * Runtime type description
 *
 * Records of built-in types are static; records of user classes are created
 * by type::declare() and live until the end of the process.
 *
 * \ingroup types
 */
struct type_record {
  std::string_view name;
  const type_record *base;
}; // struct sieve::type_record


/**
 * Handle to a runtime type
 *
 * Types are compared by identity. The base chain is used by isinstance()
 * to admit subclasses.
 *
 * \ingroup types
 */
class type {
  public:
  constexpr type(const type_record *record) noexcept: m_record {record} { }

  std::string_view
  name() const noexcept
  { return m_record->name; }

  std::optional<type>
  base() const noexcept
  {
    if (m_record->base)
      return type {m_record->base};
    return std::nullopt;
  }

  const type_record*
  record() const noexcept
  { return m_record; }

  /** Check if this is the `any` type */
  bool
  is_any() const noexcept;

  /**
   * Check if this type is \p other or derives from it
   *
   * Every type is a subtype of `any`.
   */
  bool
  is_subtype_of(type other) const noexcept;

  bool
  operator == (const type &other) const noexcept = default;

  /**
   * Declare a user class
   *
   * \param name Class name, must be unique among declared classes
   * \param base Optional base class
   * \throws std::invalid_argument If a class with this name already exists
   */
  static type
  declare(std::string_view name, std::optional<type> base = std::nullopt);

  /**
   * Find a type (built-in or declared) by name
   */
  static std::optional<type>
  lookup(std::string_view name);

  private:
  const type_record *m_record;
}; // class sieve::type


/**
 * Built-in types
 *
 * \ingroup types
 */
namespace types {
extern const type any;
extern const type none;
extern const type number;
extern const type boolean;
extern const type integer;
extern const type real;
extern const type str;
extern const type bytes;
extern const type list;
extern const type tuple;
extern const type set;
extern const type dict;
extern const type datetime;
extern const type path;
} // namespace sieve::types


/**
 * Runtime type of a value
 *
 * \ingroup types
 */
[[nodiscard]] type
type_of(value x) noexcept;

/**
 * Check if \p x is an instance of \p t (or of its subclass)
 *
 * \ingroup types
 */
[[nodiscard]] inline bool
isinstance(value x, type t) noexcept
{ return type_of(x).is_subtype_of(t); }

/**
 * Check if \p x is an instance of any of \p ts
 *
 * \ingroup types
 */
[[nodiscard]] inline bool
isinstance(value x, const std::vector<type> &ts) noexcept
{
  for (const type t : ts)
  {
    if (isinstance(x, t))
      return true;
  }
  return false;
}

/**
 * Create an instance of a declared class wrapping an opaque pointer
 *
 * \ingroup types
 */
[[nodiscard]] value
instance(type cls, void *ptr);

[[nodiscard]] inline void*
instance_ptr(value x)
{
  if (not isinst(x))
    throw std::invalid_argument {"instance_ptr() - not an instance"};
  return x->inst.ptr;
}

} // namespace sieve


template <>
struct std::hash<sieve::type> {
  size_t
  operator () (const sieve::type &t) const noexcept
  { return std::hash<const void*> {}(t.record()); }
};

template <>
struct std::formatter<sieve::type, char>: std::formatter<std::string_view, char> {
  template <class FmtContext>
  FmtContext::iterator
  format(sieve::type t, FmtContext &ctx) const
  { return std::formatter<std::string_view, char>::format(t.name(), ctx); }
};
