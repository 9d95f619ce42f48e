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

#include <functional>
#include <optional>
#include <string>

/**
 * \file functional.hpp
 * Post-processing of pattern results
 *
 * Every adapter yields a new pattern that matches with the base pattern and
 * then transforms the result. A failure of the transformation is reported as
 * conversion_failure.
 *
 * \ingroup functional
 */


namespace sieve {

/**
 * Base pattern followed by a transformation
 *
 * Patterns with equal bases and equal names compare equal, so the name should
 * identify the transformation.
 *
 * \ingroup functional
 */
class step_pattern: public pattern {
  public:
  using function = std::function<value(value)>;

  step_pattern(pattern_ptr base, function fn, std::string name,
               type origin = types::any);

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
  function m_fn;
  std::string m_name;
}; // class sieve::step_pattern


namespace functional {

/**
 * Element of a sequence (or character of a text); negative indices count from
 * the end
 */
[[nodiscard]] pattern_ptr
index(pattern_ptr p, long long i);

/**
 * Slice of a sequence or text, `[start:end:step]`
 *
 * \return \p p itself if both \p start and \p end are absent
 * \throws std::invalid_argument If \p step is zero
 */
[[nodiscard]] pattern_ptr
slice(pattern_ptr p, std::optional<long long> start,
      std::optional<long long> end, long long step = 1);

/**
 * List of \p fn applied to every element
 */
[[nodiscard]] pattern_ptr
map(pattern_ptr p, std::function<value(value)> fn, std::string name);

/**
 * List of elements satisfying \p pred
 */
[[nodiscard]] pattern_ptr
filter(pattern_ptr p, std::function<bool(value)> pred, std::string name);

/**
 * Sum of numeric elements; integer unless some element is real
 */
[[nodiscard]] pattern_ptr
sum(pattern_ptr p);

/**
 * Left fold of the elements
 *
 * Without \p initial the first element starts the fold and an empty sequence
 * is a failure.
 */
[[nodiscard]] pattern_ptr
reduce(pattern_ptr p, std::function<value(value, value)> fn,
       std::optional<value> initial, std::string name);

/**
 * Text elements joined with \p sep
 */
[[nodiscard]] pattern_ptr
join(pattern_ptr p, std::string sep);

[[nodiscard]] pattern_ptr
upper(pattern_ptr p);

[[nodiscard]] pattern_ptr
lower(pattern_ptr p);

/**
 * Dictionary entry (or sequence element for integer keys)
 *
 * \param fallback Result for a missing key; without it a missing key is a
 *        failure
 */
[[nodiscard]] pattern_ptr
get_item(pattern_ptr p, value key, std::optional<value> fallback = std::nullopt,
         type origin = types::any);

/**
 * Arbitrary transformation named \p name
 */
[[nodiscard]] pattern_ptr
step(pattern_ptr p, std::function<value(value)> fn, std::string name,
     type origin = types::any);

} // namespace sieve::functional

} // namespace sieve
