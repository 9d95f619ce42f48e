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
#include "sieve/stl/vector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file variants.hpp
 * Composite patterns
 *
 * \ingroup variants
 */


namespace sieve {

class context;


/**
 * Accepts values equal to a fixed literal (or to one of several literals)
 *
 * \ingroup variants
 */
class direct: public pattern {
  public:
  explicit direct(value target, std::optional<std::string> alias = std::nullopt);

  explicit direct(const std::vector<value> &targets,
                  std::optional<std::string> alias = std::nullopt);

  const stl::vector<value>&
  targets() const noexcept
  { return m_targets; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  std::string
  _calc_repr() const override;

  void
  _extend_key(std::string &key) const override;

  private:
  stl::vector<value> m_targets;
}; // class sieve::direct


/**
 * Accepts instances of fixed types
 *
 * \ingroup variants
 */
class direct_type: public pattern {
  public:
  explicit direct_type(type t, std::optional<std::string> alias = std::nullopt);

  explicit direct_type(std::vector<type> ts,
                       std::optional<std::string> alias = std::nullopt);

  std::shared_ptr<pattern>
  copy() const override;
}; // class sieve::direct_type


/**
 * Matches text against a regular expression and yields the match tuple:
 * the whole match followed by the groups
 *
 * Unlike regex_match mode, the expression only has to match at the beginning
 * of the text.
 *
 * \ingroup variants
 */
class regex_pattern: public pattern {
  public:
  explicit regex_pattern(std::string text,
                         std::optional<std::string> alias = std::nullopt);

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;
}; // class sieve::regex_pattern


/**
 * Tries alternatives left to right, the first success wins
 *
 * \ingroup variants
 */
class union_pattern: public pattern {
  public:
  /**
   * \throws std::invalid_argument If \p alternatives is empty
   */
  explicit union_pattern(std::vector<pattern_ptr> alternatives,
                         std::optional<std::string> alias = std::nullopt);

  const std::vector<pattern_ptr>&
  alternatives() const noexcept
  { return m_alternatives; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  std::string
  _calc_repr() const override;

  void
  _extend_key(std::string &key) const override;

  private:
  std::vector<pattern_ptr> m_alternatives;
}; // class sieve::union_pattern


/**
 * What happens to elements of a container that fail validation
 *
 * \ingroup variants
 */
enum class iteration_policy {
  all,        /**< Any failure fails the container */
  permissive, /**< Failing elements are dropped */
  prefix,     /**< Leading successes are kept, the rest is dropped */
  suffix,     /**< Trailing successes are kept, the rest is dropped */
};

std::string_view
iteration_policy_name(iteration_policy policy) noexcept;


/**
 * Validates every element of a list, tuple or set
 *
 * Text input is read as a literal first.
 *
 * \ingroup variants
 */
class sequence_pattern: public pattern {
  public:
  /**
   * \param kind One of `tag::list`, `tag::tuple`, `tag::set`
   * \param element Pattern applied to each element
   * \param policy Handling of failing elements
   * \throws std::invalid_argument If \p kind is not a sequence tag
   */
  sequence_pattern(tag kind, pattern_ptr element,
                   iteration_policy policy = iteration_policy::all);

  tag
  kind() const noexcept
  { return m_kind; }

  const pattern_ptr&
  element() const noexcept
  { return m_element; }

  iteration_policy
  policy() const noexcept
  { return m_policy; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  std::string
  _calc_repr() const override;

  void
  _extend_key(std::string &key) const override;

  void
  _reanchor(regex_anchor anchor) override;

  private:
  tag m_kind;
  pattern_ptr m_element;
  iteration_policy m_policy;
}; // class sieve::sequence_pattern


/**
 * Validates every key and value of a dictionary
 *
 * Text input is read as a literal first.
 *
 * \ingroup variants
 */
class mapping_pattern: public pattern {
  public:
  mapping_pattern(pattern_ptr key, pattern_ptr val,
                  iteration_policy policy = iteration_policy::all);

  const pattern_ptr&
  key_pattern() const noexcept
  { return m_key; }

  const pattern_ptr&
  value_pattern() const noexcept
  { return m_value; }

  iteration_policy
  policy() const noexcept
  { return m_policy; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  std::string
  _calc_repr() const override;

  void
  _extend_key(std::string &key) const override;

  void
  _reanchor(regex_anchor anchor) override;

  private:
  pattern_ptr m_key;
  pattern_ptr m_value;
  iteration_policy m_policy;
}; // class sieve::mapping_pattern


/**
 * Result of a switch case: a fixed value, or a pattern applied to the input
 */
using switch_case = std::variant<value, pattern_ptr>;

/**
 * Value-keyed dispatch table
 *
 * \ingroup variants
 */
class switch_pattern: public pattern {
  public:
  /**
   * \param cases Input value to result; repeated keys keep the first case
   * \param fallback Result for inputs without a case
   * \throws std::invalid_argument If \p cases is empty
   */
  explicit switch_pattern(const std::vector<std::pair<value, switch_case>> &cases,
                          std::optional<switch_case> fallback = std::nullopt);

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  std::string
  _calc_repr() const override;

  void
  _extend_key(std::string &key) const override;

  private:
  stl::vector<std::pair<value, switch_case>> m_cases;
  std::optional<switch_case> m_fallback;
}; // class sieve::switch_pattern


/**
 * Reference to a type or a registered pattern by name, resolved when a value
 * is matched
 *
 * The name is looked up among declared types first, then among aliases of
 * the context's merged pattern tables. Text equal to the name itself is
 * accepted as is. The context is not owned: once it is destroyed, names that
 * are not types no longer resolve.
 *
 * \ingroup variants
 */
class forward_ref: public pattern {
  public:
  forward_ref(std::string name, const context &ctx);

  const std::string&
  name() const noexcept
  { return m_name; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  void
  _extend_key(std::string &key) const override;

  private:
  std::string m_name;
  std::weak_ptr<const context> m_context;
}; // class sieve::forward_ref


/**
 * Succeeds exactly when the base pattern fails; yields the input unchanged
 *
 * \ingroup variants
 */
class anti_pattern: public pattern {
  public:
  explicit anti_pattern(pattern_ptr base);

  const pattern_ptr&
  base() const noexcept
  { return m_base; }

  std::shared_ptr<pattern>
  copy() const override;

  protected:
  value
  _match(value input) const override;

  void
  _extend_key(std::string &key) const override;

  private:
  pattern_ptr m_base;
}; // class sieve::anti_pattern


/**
 * Pattern that rejects everything its base pattern accepts
 *
 * \ingroup variants
 */
[[nodiscard]] inline pattern_ptr
invalidate(pattern_ptr base)
{ return std::make_shared<anti_pattern>(std::move(base)); }

} // namespace sieve
