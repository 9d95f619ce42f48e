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
#include "sieve/type.hpp"
#include "sieve/value.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * \file descriptor.hpp
 * Abstract descriptions of expected values, the input of the compiler
 *
 * \ingroup compiler
 */


namespace sieve {

struct descriptor_data;

/**
 * Container shape of a generic descriptor
 *
 * \ingroup compiler
 */
enum class container_kind {
  list,
  tuple,
  set,
  dict,
};

std::string_view
container_kind_name(container_kind kind) noexcept;


/**
 * Immutable descriptor handle
 *
 * Descriptors compare structurally (except annotated ones, which compare by
 * identity) and can be used as cache keys.
 *
 * \ingroup compiler
 */
class descriptor {
  public:
  using function = std::function<value(value)>;

  /** Ready pattern */
  descriptor(pattern_ptr pat);

  template <std::derived_from<pattern> P>
  descriptor(std::shared_ptr<P> pat)
  : descriptor {pattern_ptr {std::move(pat)}}
  { }

  /** Type (or class) */
  descriptor(type t);

  /** Literal value */
  descriptor(value x);

  /** Literal text */
  descriptor(const char *text);
  descriptor(std::string_view text);
  descriptor(const std::string &text);

  /**
   * Literal that is always matched by equality (text is never treated as a
   * regular expression or an alias)
   */
  [[nodiscard]] static descriptor
  raw(value x);

  /**
   * Compiled regular expression, matched at the beginning of the text
   */
  [[nodiscard]] static descriptor
  regex(std::string text);

  /**
   * Any of the alternatives
   */
  [[nodiscard]] static descriptor
  one_of(std::vector<descriptor> alternatives);

  [[nodiscard]] static descriptor
  list_of(descriptor element);

  [[nodiscard]] static descriptor
  tuple_of(descriptor element);

  [[nodiscard]] static descriptor
  set_of(descriptor element);

  [[nodiscard]] static descriptor
  dict_of(descriptor key, descriptor val);

  /**
   * Container without element descriptors (elements are not checked)
   */
  [[nodiscard]] static descriptor
  container(container_kind kind);

  /**
   * Conversion function
   *
   * \param fn Converter
   * \param name Name used in the representation and identity
   * \param param Accepted input type (anything if absent)
   * \param result Result type (anything if absent)
   */
  [[nodiscard]] static descriptor
  callable(function fn, std::string name, std::optional<type> param = std::nullopt,
           std::optional<type> result = std::nullopt);

  /**
   * Named reference resolved when a value is matched
   */
  [[nodiscard]] static descriptor
  forward(std::string name);

  /**
   * Base descriptor with extra validators and an alias
   */
  [[nodiscard]] static descriptor
  annotated(descriptor base, std::vector<validator> validators,
            std::optional<std::string> alias = std::nullopt);

  const descriptor_data&
  data() const noexcept
  { return *m_data; }

  size_t
  hash() const noexcept;

  std::string
  repr() const;

  bool
  operator == (const descriptor &other) const noexcept;

  private:
  explicit descriptor(std::shared_ptr<const descriptor_data> data)
  : m_data {std::move(data)}
  { }

  std::shared_ptr<const descriptor_data> m_data;
}; // class sieve::descriptor


/**
 * \name Descriptor nodes
 * \ingroup compiler
 * \{
 */
struct pattern_node {
  pattern_ptr pat;
};

struct type_node {
  type t;
};

struct literal_node {
  value x;
  bool raw;
  std::string text; /**< Representation of the literal */
};

struct regex_node {
  std::string text;
};

struct union_node {
  std::vector<descriptor> alternatives;
};

struct container_node {
  container_kind kind;
  std::vector<descriptor> args;
};

struct callable_node {
  std::shared_ptr<const descriptor::function> fn;
  std::string name;
  std::optional<type> param;
  std::optional<type> result;
};

struct forward_node {
  std::string name;
};

struct annotated_node {
  descriptor base;
  std::vector<validator> validators;
  std::optional<std::string> alias;
};
/** \} */

using descriptor_node = std::variant<
  pattern_node,
  type_node,
  literal_node,
  regex_node,
  union_node,
  container_node,
  callable_node,
  forward_node,
  annotated_node
>;

struct descriptor_data {
  descriptor_node node;
  size_t hash;
}; // struct sieve::descriptor_data

inline size_t
descriptor::hash() const noexcept
{ return m_data->hash; }

} // namespace sieve


template <>
struct std::hash<sieve::descriptor> {
  size_t
  operator () (const sieve::descriptor &desc) const noexcept
  { return desc.hash(); }
};
