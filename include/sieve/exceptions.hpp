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

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


namespace sieve {

/**
 * Base class of data errors raised while matching a value
 *
 * These are captured by pattern::validate() into an Error result and are only
 * rethrown by the strict accessors. The offending input is kept in its
 * representation form.
 *
 * \ingroup errors
 */
struct match_failed: std::runtime_error {
  match_failed(std::string_view what, value input);

  /** Representation of the rejected input */
  const std::string&
  input() const noexcept
  { return m_input; }

  private:
  std::string m_input;
}; // struct sieve::match_failed

/**
 * Runtime type of the input was rejected by the acceptance filter
 *
 * \ingroup errors
 */
struct type_mismatch: match_failed {
  type_mismatch(value input, std::string_view expected);
}; // struct sieve::type_mismatch

/**
 * Converter returned no value, a value of the wrong type, or threw
 *
 * \ingroup errors
 */
struct conversion_failure: match_failed {
  conversion_failure(value input, std::string_view expected);
  conversion_failure(std::string_view what, value input)
  : match_failed(what, input)
  { }
}; // struct sieve::conversion_failure

/**
 * Input content does not match (regular expression, literal, ...)
 *
 * \ingroup errors
 */
struct pattern_mismatch: match_failed {
  pattern_mismatch(value input, std::string_view expected);
}; // struct sieve::pattern_mismatch

/**
 * A post-conversion predicate rejected the result
 *
 * \ingroup errors
 */
struct validator_rejected: match_failed {
  validator_rejected(value input, size_t index);

  /** Position of the failed validator in the validator chain */
  size_t
  index() const noexcept
  { return m_index; }

  private:
  size_t m_index;
}; // struct sieve::validator_rejected

/**
 * None of union alternatives accepted the input
 *
 * \ingroup errors
 */
struct exhausted_alternatives: match_failed {
  exhausted_alternatives(value input, std::vector<std::string> reasons);

  /** Failure reason of each alternative, in order */
  const std::vector<std::string>&
  reasons() const noexcept
  { return m_reasons; }

  private:
  std::vector<std::string> m_reasons;
}; // struct sieve::exhausted_alternatives

/**
 * A forward reference could not be resolved
 *
 * \ingroup errors
 */
struct unresolved_reference: match_failed {
  unresolved_reference(value input, std::string_view name);
}; // struct sieve::unresolved_reference


/**
 * Base class of configuration (programmer) errors
 *
 * Configuration errors are raised immediately and never captured by
 * pattern::validate().
 *
 * \ingroup errors
 */
struct configuration_error: std::logic_error {
  using std::logic_error::logic_error;
}; // struct sieve::configuration_error

/**
 * Unknown local pattern table
 *
 * \ingroup errors
 */
struct registry_not_found: configuration_error {
  explicit registry_not_found(std::string_view name);
}; // struct sieve::registry_not_found

/**
 * Descriptor resolution is ambiguous under the `forbid` policy
 *
 * \ingroup errors
 */
struct ambiguous_descriptor: configuration_error {
  explicit ambiguous_descriptor(std::string_view what)
  : configuration_error(std::string(what))
  { }
}; // struct sieve::ambiguous_descriptor


/**
 * Wrap the exception currently being handled into a match_failed
 *
 * Used for exceptions of foreign types thrown by user callables; the thrown
 * exception is kept nested. Must be called from a handler.
 *
 * \ingroup errors
 */
[[nodiscard]] std::exception_ptr
wrap_current_exception(value input);

/**
 * Message of an exception including its nested causes
 *
 * \ingroup errors
 */
[[nodiscard]] std::string
describe(const std::exception &exn);

/**
 * Message of a captured exception including its nested causes
 *
 * \ingroup errors
 */
[[nodiscard]] std::string
describe(std::exception_ptr eptr);

} // namespace sieve
