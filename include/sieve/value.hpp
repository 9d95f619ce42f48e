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

#include "sieve/memory.hpp"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


/**
 * \file value.hpp
 * Dynamic values inspected by patterns
 *
 * A value is a reference to an immutable garbage-collected object. Every
 * object carries a tag describing its runtime shape and a cached hash.
 *
 * \ingroup core
 */


namespace sieve {


/**
 * Tag enumeration for object types
 *
 * \ingroup core
 */
enum class tag {
  nil,
  boolean,
  integer,
  real,
  str,
  bytes,
  list,
  tuple,
  set,
  dict,
  datetime,
  path,
  instance,
};

std::string_view
tag_name(tag t) noexcept;

struct object;
struct type_record;

/**
 * Reference to an object
 *
 * \ingroup core
 */
class value {
  public:
  explicit value(object *ptr): m_ptr {ptr} { }

  value();

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality
   *
   * Numbers compare by numeric value across `boolean`, `integer` and `real`.
   */
  [[nodiscard]] bool
  operator == (value other) const noexcept;

  private:
  object *m_ptr;
}; // class sieve::value


/**
 * Object structure
 *
 * Sequences (`list`, `tuple`, `set`) keep their elements in `seq`; a `dict`
 * keeps `2 * seq.len` interleaved keys and values.
 *
 * \ingroup core
 */
struct object {
  object(tag tag): t {tag}, hash {0} { }

  tag t;
  size_t hash;
  union {
    bool boolean;
    long long integer;
    long double real;
    long long micros; /**< `datetime`: microseconds since the epoch, UTC */
    struct { char *data; size_t len; } str; /**< Used by `str`, `bytes`, `path` */
    struct { object **data; size_t len; } seq;
    struct { const type_record *cls; void *ptr; } inst;
  };
}; // struct sieve::object


size_t
hash(value x) noexcept;

[[nodiscard]] inline tag
tag_of(value x) noexcept
{ return x->t; }

extern const value True, False; /**< Boolean constants */
extern const value nil; /**< Nil constant */


/**
 * \name Fundamental constructors
 * \{
 */

[[nodiscard]] inline value
boolean(bool b)
{ return b ? True : False; }

[[nodiscard]] inline value
integer(long long val)
{
  value ret {make_atomic<object>(tag::integer)};
  ret->integer = val;
  ret->hash = hash(ret);
  return ret;
}

[[nodiscard]] inline value
real(long double val)
{
  value ret {make_atomic<object>(tag::real)};
  ret->real = val;
  ret->hash = hash(ret);
  return ret;
}

[[nodiscard]] inline value
str(std::string_view str)
{
  value ret {make<object>(tag::str)};
  ret->str.data = copy_chars(str);
  ret->str.len = str.length();
  ret->hash = hash(ret);
  return ret;
}

[[nodiscard]] inline value
bytes(std::string_view data)
{
  value ret {make<object>(tag::bytes)};
  ret->str.data = copy_chars(data);
  ret->str.len = data.length();
  ret->hash = hash(ret);
  return ret;
}

/**
 * Point in time with microsecond resolution (UTC, no time zone attached)
 */
using time_point = std::chrono::sys_time<std::chrono::microseconds>;

[[nodiscard]] inline value
datetime(time_point t)
{
  value ret {make_atomic<object>(tag::datetime)};
  ret->micros = t.time_since_epoch().count();
  ret->hash = hash(ret);
  return ret;
}

/**
 * Create a filesystem path
 *
 * The text is lexically normalized: repeated separators, `.` components and
 * trailing separators are dropped, `name/..` pairs are collapsed; an empty
 * path becomes `.`.
 */
[[nodiscard]] value
path(std::string_view text);

/**
 * Create a sequence of the given kind
 *
 * Elements of a `set` are deduplicated (first occurrence wins).
 *
 * \param kind One of `tag::list`, `tag::tuple`, `tag::set`
 * \param elements Elements in order
 * \throws std::invalid_argument If \p kind is not a sequence tag
 */
[[nodiscard]] value
sequence(tag kind, const std::vector<value> &elements);

/**
 * Create a dictionary
 *
 * Insertion order is preserved; a repeated key keeps its first position and
 * takes the last value.
 */
[[nodiscard]] value
dict(const std::vector<std::pair<value, value>> &items);

[[nodiscard]] inline value
list(std::initializer_list<value> elements)
{ return sequence(tag::list, std::vector<value>(elements)); }

[[nodiscard]] inline value
tuple(std::initializer_list<value> elements)
{ return sequence(tag::tuple, std::vector<value>(elements)); }

[[nodiscard]] inline value
set(std::initializer_list<value> elements)
{ return sequence(tag::set, std::vector<value>(elements)); }

[[nodiscard]] inline value
dict(std::initializer_list<std::pair<value, value>> items)
{ return dict(std::vector<std::pair<value, value>>(items)); }

/**
 * Create a sequence from a range of values
 */
template <std::ranges::input_range Range>
[[nodiscard]] value
sequence_from(tag kind, Range &&range)
{
  std::vector<value> elements;
  for (const value x : range)
    elements.push_back(x);
  return sequence(kind, elements);
}

/** \} */


/**
 * \name Type tests and accessors
 * \{
 */

[[nodiscard]] inline bool
isnil(value x) noexcept
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
isbool(value x) noexcept
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isint(value x) noexcept
{ return x->t == tag::integer; }

[[nodiscard]] inline bool
isreal(value x) noexcept
{ return x->t == tag::real; }

/**
 * Check if a value is a number (`boolean` counts as one)
 */
[[nodiscard]] inline bool
isnum(value x) noexcept
{ return x->t == tag::integer or x->t == tag::real or x->t == tag::boolean; }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isstr(value x, std::string_view s) noexcept
{ return isstr(x) and std::string_view {x->str.data, x->str.len} == s; }

[[nodiscard]] inline bool
isbytes(value x) noexcept
{ return x->t == tag::bytes; }

[[nodiscard]] inline bool
isseq(value x) noexcept
{ return x->t == tag::list or x->t == tag::tuple or x->t == tag::set; }

[[nodiscard]] inline bool
isdict(value x) noexcept
{ return x->t == tag::dict; }

[[nodiscard]] inline bool
isdatetime(value x) noexcept
{ return x->t == tag::datetime; }

[[nodiscard]] inline bool
ispath(value x) noexcept
{ return x->t == tag::path; }

[[nodiscard]] inline bool
isinst(value x) noexcept
{ return x->t == tag::instance; }

[[nodiscard]] inline bool
bool_val(value x)
{
  if (not isbool(x))
    throw std::invalid_argument {"bool_val() - not a boolean"};
  return x->boolean;
}

[[nodiscard]] inline long long
int_val(value x)
{
  if (not isint(x))
    throw std::invalid_argument {"int_val() - not an integer"};
  return x->integer;
}

[[nodiscard]] inline long double
real_val(value x)
{
  if (not isreal(x))
    throw std::invalid_argument {"real_val() - not a real"};
  return x->real;
}

/**
 * Numeric value of a `boolean`, `integer` or `real`
 *
 * \throws std::invalid_argument If the value is not a number
 */
[[nodiscard]] inline long double
num_val(value x)
{
  switch (x->t)
  {
    case tag::boolean: return x->boolean ? 1 : 0;
    case tag::integer: return x->integer;
    case tag::real: return x->real;
    default: throw std::invalid_argument {"num_val() - not a number"};
  }
}

[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline std::string_view
bytes_view(value x)
{
  if (not isbytes(x))
    throw std::invalid_argument {"bytes_view() - not bytes"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline time_point
datetime_val(value x)
{
  if (not isdatetime(x))
    throw std::invalid_argument {"datetime_val() - not a datetime"};
  return time_point {std::chrono::microseconds {x->micros}};
}

[[nodiscard]] inline std::string_view
path_view(value x)
{
  if (not ispath(x))
    throw std::invalid_argument {"path_view() - not a path"};
  return std::string_view {x->str.data, x->str.len};
}

/**
 * Number of elements of a sequence or items of a dictionary, length of a
 * string
 *
 * \throws std::invalid_argument For values without length
 */
[[nodiscard]] size_t
length(value x);

/**
 * Element of a sequence
 *
 * \throws std::invalid_argument If \p x is not a sequence
 * \throws std::out_of_range If \p i is out of bounds
 */
[[nodiscard]] value
seq_ref(value x, size_t i);

/**
 * Look up a key in a dictionary
 *
 * \return True if the key was found
 * \throws std::invalid_argument If \p d is not a dictionary
 */
bool
dict_get(value d, value key, value &result);

/**
 * False for nil, false, zero and empty text or containers
 */
[[nodiscard]] bool
truthy(value x) noexcept;

[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

[[nodiscard]] bool
equal(value a, value b) noexcept;

/** \} */


/**
 * Range over the elements of a sequence
 *
 * \ingroup core
 */
class element_range: public std::ranges::view_interface<element_range> {
  public:
  struct iterator {
    using iterator_concept = std::forward_iterator_tag;
    using difference_type = ptrdiff_t;
    using value_type = value;

    iterator() = default;
    iterator(object *const *it): m_it {it} { }

    value
    operator * () const noexcept
    { return value {*m_it}; }

    iterator&
    operator ++ () noexcept
    { ++m_it; return *this; }

    iterator
    operator ++ (int) noexcept
    { iterator old = *this; ++m_it; return old; }

    bool
    operator == (const iterator &other) const noexcept = default;

    object *const *m_it = nullptr;
  }; // struct sieve::element_range::iterator
  static_assert(std::forward_iterator<iterator>);

  element_range() = default;

  explicit element_range(value x);

  iterator
  begin() const noexcept
  { return {m_begin}; }

  iterator
  end() const noexcept
  { return {m_end}; }

  private:
  object *const *m_begin = nullptr;
  object *const *m_end = nullptr;
}; // class sieve::element_range


/**
 * Range over key-value pairs of a dictionary
 *
 * \ingroup core
 */
class item_range: public std::ranges::view_interface<item_range> {
  public:
  struct iterator {
    using iterator_concept = std::forward_iterator_tag;
    using difference_type = ptrdiff_t;
    using value_type = std::pair<value, value>;

    iterator() = default;
    iterator(object *const *it): m_it {it} { }

    value_type
    operator * () const noexcept
    { return {value {m_it[0]}, value {m_it[1]}}; }

    iterator&
    operator ++ () noexcept
    { m_it += 2; return *this; }

    iterator
    operator ++ (int) noexcept
    { iterator old = *this; m_it += 2; return old; }

    bool
    operator == (const iterator &other) const noexcept = default;

    object *const *m_it = nullptr;
  }; // struct sieve::item_range::iterator
  static_assert(std::forward_iterator<iterator>);

  item_range() = default;

  explicit item_range(value x);

  iterator
  begin() const noexcept
  { return {m_begin}; }

  iterator
  end() const noexcept
  { return {m_end}; }

  private:
  object *const *m_begin = nullptr;
  object *const *m_end = nullptr;
}; // class sieve::item_range


/**
 * Iterate over elements of a sequence
 *
 * \throws std::invalid_argument If \p x is not a sequence
 */
[[nodiscard]] inline element_range
elements(value x)
{ return element_range {x}; }

/**
 * Iterate over items of a dictionary
 *
 * \throws std::invalid_argument If \p x is not a dictionary
 */
[[nodiscard]] inline item_range
items(value x)
{ return item_range {x}; }


/**
 * \name Printing
 * \{
 */

/**
 * Color palette used by the printer
 *
 * \ingroup core
 */
struct color_palette {
  std::string_view nil_color;
  std::string_view bool_color;
  std::string_view number_color;
  std::string_view string_color;
  std::string_view container_color;
  std::string_view instance_color;
}; // struct sieve::color_palette

/**
 * Value printer
 *
 * `write` produces the representation form (strings are quoted), `display`
 * the human form (top-level strings are printed as is).
 *
 * \ingroup core
 */
class printer {
  public:
  static const color_palette default_palette;

  printer() = default;
  printer(const color_palette &palette): m_palette {palette} { }

  void
  write(std::ostream &os, value x) const;

  void
  display(std::ostream &os, value x) const;

  private:
  color_palette m_palette {};
}; // class sieve::printer

extern const printer colorized_printer;
extern const printer raw_printer;

inline void
write(std::ostream &os, value x)
{ raw_printer.write(os, x); }

inline void
display(std::ostream &os, value x)
{ raw_printer.display(os, x); }

/**
 * Representation form of a value as a string
 */
[[nodiscard]] std::string
repr(value x);

/**
 * Human form of a value as a string
 */
[[nodiscard]] std::string
to_display(value x);

/** \} */

} // namespace sieve


inline std::ostream&
operator << (std::ostream &os, const sieve::value &val)
{ sieve::write(os, val); return os; }

inline
sieve::value::value()
: m_ptr {&*sieve::nil}
{ }

inline bool
sieve::value::operator == (sieve::value other) const noexcept
{ return sieve::equal(*this, other); }
