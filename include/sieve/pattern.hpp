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

#include "sieve/result.hpp"
#include "sieve/type.hpp"
#include "sieve/value.hpp"

#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>


/**
 * \file pattern.hpp
 * Pattern: the unit of validation
 *
 * A pattern decides whether an input value conforms to an expected shape,
 * optionally converts it, and reports the outcome as a validate_result.
 *
 * \ingroup core
 */


namespace sieve {

/**
 * Matching strategy of a pattern, ordered by increasing amount of work
 *
 * \ingroup core
 */
enum class match_mode {
  keep,          /**< Identity, filtered by accepted types */
  regex_match,   /**< Text must match a regular expression */
  type_convert,  /**< Converter produces the origin type from any input */
  regex_convert, /**< Regular expression match fed to the converter */
  value_operate, /**< Converter normalizes an origin-typed input */
};

std::string_view
match_mode_name(match_mode mode) noexcept;

/**
 * Where a regular expression must match the input text
 *
 * \ingroup core
 */
enum class regex_anchor {
  full,   /**< The whole text */
  prefix, /**< Beginning of the text */
  suffix, /**< End of the text */
  search, /**< Anywhere */
};


class pattern;
class descriptor;

using pattern_ptr = std::shared_ptr<const pattern>;

/**
 * Converter: receives the pattern and its input, returns the converted value
 * or nothing if the input cannot be converted
 */
using converter = std::function<std::optional<value>(const pattern&, value)>;

/**
 * Validator: predicate over the converted value
 */
using validator = std::function<bool(value)>;


/**
 * Parameters of a pattern
 *
 * Which fields are required, allowed or forbidden depends on the mode:
 *
 * mode          | regex     | convert
 * ------------- | --------- | ---------
 * keep          | forbidden | forbidden
 * regex_match   | required  | forbidden
 * type_convert  | forbidden | optional (defaults to coerce())
 * regex_convert | required  | optional (defaults to reading a literal)
 * value_operate | forbidden | required
 *
 * \ingroup core
 */
struct pattern_config {
  match_mode mode = match_mode::keep;
  type origin = types::any;
  std::optional<std::string> regex = std::nullopt;
  std::optional<regex_anchor> anchor = std::nullopt;
  converter convert = nullptr;
  std::vector<validator> validators = {};
  pattern_ptr previous = nullptr;
  std::optional<std::vector<type>> accepts = std::nullopt;
  pattern_ptr addition_accepts = nullptr;
  std::optional<std::string> alias = std::nullopt;
}; // struct sieve::pattern_config


/**
 * Pattern
 *
 * Validation runs in the following order:
 * 1. the input is passed through the previous pattern (if any);
 * 2. the result is checked against accepted types; a value of another type
 *    can still be admitted by the addition pattern;
 * 3. the mode-specific match is performed (see _match());
 * 4. validators are applied to the result, first failure stops the chain.
 *
 * Patterns are immutable once shared. Mutators are only meant to be used right
 * after construction or copy().
 *
 * \ingroup core
 */
class pattern {
  public:
  /**
   * Create a pattern
   *
   * \throws std::invalid_argument If \p config is inconsistent with its mode
   *         or the regular expression is invalid
   */
  explicit pattern(pattern_config config);

  pattern(const pattern &other) = default;

  virtual ~pattern() = default;

  pattern&
  operator = (const pattern&) = delete;

  /**
   * Keep-mode pattern accepting instances of \p t
   */
  [[nodiscard]] static pattern_ptr
  of(type t);

  /**
   * Pattern accepting exactly \p x
   */
  [[nodiscard]] static pattern_ptr
  on(value x);

  /**
   * Compile a descriptor with the `allow` policy in the default context
   */
  [[nodiscard]] static pattern_ptr
  to(const descriptor &desc);

  match_mode
  mode() const noexcept
  { return m_mode; }

  type
  origin() const noexcept
  { return m_origin; }

  const std::optional<std::string>&
  regex_text() const noexcept
  { return m_regex_text; }

  regex_anchor
  anchor() const noexcept
  { return m_anchor; }

  const std::optional<std::vector<type>>&
  accepts() const noexcept
  { return m_accepts; }

  const pattern_ptr&
  addition_accepts() const noexcept
  { return m_addition; }

  const pattern_ptr&
  previous() const noexcept
  { return m_previous; }

  const std::vector<validator>&
  validators() const noexcept
  { return m_validators; }

  const std::optional<std::string>&
  alias() const noexcept
  { return m_alias; }

  /**
   * Validate an input
   *
   * Data errors are captured in the result; configuration errors propagate.
   */
  [[nodiscard]] validate_result
  validate(value input) const;

  /**
   * Validate an input, substituting \p default_value on failure
   */
  [[nodiscard]] validate_result
  validate(value input, value default_value) const;

  /**
   * Strict validation
   *
   * \throws match_failed (or a subclass) If the input is rejected
   */
  value
  match(value input) const;

  /**
   * Independent copy that can be mutated
   */
  [[nodiscard]] virtual std::shared_ptr<pattern>
  copy() const;

  /**
   * Copy that only requires a match at the beginning of the input
   */
  [[nodiscard]] pattern_ptr
  prefixed() const;

  /**
   * Copy that only requires a match at the end of the input
   */
  [[nodiscard]] pattern_ptr
  suffixed() const;

  [[nodiscard]] pattern_ptr
  with_alias(std::string alias) const;

  [[nodiscard]] pattern_ptr
  with_validators(std::vector<validator> validators) const;

  void
  set_alias(std::optional<std::string> alias);

  void
  set_previous(pattern_ptr previous);

  void
  add_validator(validator fn);

  /**
   * Recompute cached representation and identity
   */
  void
  refresh();

  const std::string&
  repr() const noexcept
  { return m_repr; }

  size_t
  hash() const noexcept
  { return m_hash; }

  /**
   * Identity of the pattern: class, mode, origin, regular expression,
   * accepted types and previous pattern (alias and validators do not count)
   */
  const std::string&
  key() const noexcept
  { return m_key; }

  bool
  operator == (const pattern &other) const noexcept
  { return m_hash == other.m_hash and m_key == other.m_key; }

  protected:
  /**
   * Mode-specific matching of an input that already passed the acceptance
   * filter
   *
   * \throws match_failed
   */
  virtual value
  _match(value input) const;

  virtual std::string
  _calc_repr() const;

  /**
   * Append class-specific identity to the key
   */
  virtual void
  _extend_key([[maybe_unused]] std::string &key) const
  { }

  /**
   * Change anchoring of this (freshly copied) pattern
   */
  virtual void
  _reanchor(regex_anchor anchor);

  /**
   * Apply the regular expression
   *
   * \return Match tuple: the whole match followed by groups (nil if a group did
   *         not participate), or nothing
   */
  std::optional<value>
  _apply_regex(std::string_view text) const;

  /**
   * Call the converter, wrapping foreign exceptions into conversion_failure
   */
  std::optional<value>
  _convert(value input) const;

  /**
   * Text naming accepted types, e.g. `integer|real`
   */
  std::string
  _accepts_repr() const;

  /** Alias if set, otherwise the computed representation */
  std::string
  _expected() const
  { return m_alias ? *m_alias : m_repr; }

  private:
  validate_result
  _validate(value input, const std::optional<value> &default_value) const;

  void
  _compile_regex();

  match_mode m_mode;
  type m_origin;
  std::optional<std::string> m_regex_text;
  regex_anchor m_anchor;
  std::optional<std::regex> m_regex;
  converter m_convert;
  std::vector<validator> m_validators;
  pattern_ptr m_previous;
  std::optional<std::vector<type>> m_accepts;
  pattern_ptr m_addition;
  std::optional<std::string> m_alias;

  std::string m_repr;
  std::string m_key;
  size_t m_hash;
}; // class sieve::pattern


/**
 * Hash functor for pattern pointers (by pattern identity)
 */
struct pattern_ptr_hash {
  size_t
  operator () (const pattern_ptr &p) const noexcept
  { return p->hash(); }
}; // struct sieve::pattern_ptr_hash

/**
 * Equality functor for pattern pointers (by pattern identity)
 */
struct pattern_ptr_equal {
  bool
  operator () (const pattern_ptr &a, const pattern_ptr &b) const noexcept
  { return *a == *b; }
}; // struct sieve::pattern_ptr_equal

} // namespace sieve


template <>
struct std::formatter<sieve::pattern, char>: std::formatter<std::string_view, char> {
  template <class FmtContext>
  FmtContext::iterator
  format(const sieve::pattern &p, FmtContext &ctx) const
  { return std::formatter<std::string_view, char>::format(p.repr(), ctx); }
};

template <>
struct std::formatter<sieve::pattern_ptr, char>: std::formatter<sieve::pattern, char> {
  template <class FmtContext>
  FmtContext::iterator
  format(const sieve::pattern_ptr &p, FmtContext &ctx) const
  { return std::formatter<sieve::pattern, char>::format(*p, ctx); }
};

inline std::ostream&
operator << (std::ostream &os, const sieve::pattern &p)
{ return os << p.repr(); }
