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

#include "sieve/exceptions.hpp"
#include "sieve/value.hpp"

#include <exception>
#include <functional>
#include <string>
#include <type_traits>


namespace sieve {

class pattern;

/**
 * State of a validation result
 *
 * \ingroup core
 */
enum class result_flag {
  valid,     /**< Pattern accepted the input */
  error,     /**< Pattern rejected the input */
  defaulted, /**< Pattern rejected the input, default value substituted */
};

std::string_view
result_flag_name(result_flag flag) noexcept;


/**
 * Outcome of pattern::validate()
 *
 * Exactly one of valid(), failed() and or_default() holds. A defaulted result
 * still counts as a success.
 *
 * \ingroup core
 */
class validate_result {
  public:
  [[nodiscard]] static validate_result
  make_valid(sieve::value val) noexcept
  { return validate_result {result_flag::valid, val, nullptr, val}; }

  [[nodiscard]] static validate_result
  make_default(sieve::value val) noexcept
  { return validate_result {result_flag::defaulted, val, nullptr, val}; }

  [[nodiscard]] static validate_result
  make_error(std::exception_ptr error, sieve::value input) noexcept
  { return validate_result {result_flag::error, sieve::nil, error, input}; }

  result_flag
  flag() const noexcept
  { return m_flag; }

  /** Either valid or defaulted */
  bool
  success() const noexcept
  { return m_flag != result_flag::error; }

  bool
  valid() const noexcept
  { return m_flag == result_flag::valid; }

  bool
  failed() const noexcept
  { return m_flag == result_flag::error; }

  bool
  or_default() const noexcept
  { return m_flag == result_flag::defaulted; }

  explicit
  operator bool () const noexcept
  { return success(); }

  /**
   * Validated (or default) value
   *
   * \throws The captured exception if the result is an error
   */
  sieve::value
  value() const
  {
    if (failed())
      std::rethrow_exception(m_error);
    return m_value;
  }

  /**
   * Captured exception; null unless the result is an error
   */
  std::exception_ptr
  error() const noexcept
  { return m_error; }

  /**
   * Input that was rejected (for errors), or the result value
   */
  sieve::value
  input() const noexcept
  { return m_input; }

  /**
   * Feed the value into another pattern
   *
   * Errors are passed through unchanged.
   */
  [[nodiscard]] validate_result
  step(const pattern &next) const;

  /**
   * Apply a function to the value
   *
   * Errors are passed through unchanged; an exception thrown by \p fn becomes
   * an error result.
   */
  template <typename Fn>
    requires std::is_invocable_r_v<sieve::value, Fn, sieve::value>
  [[nodiscard]] validate_result
  step(Fn &&fn) const
  {
    if (failed())
      return *this;
    try
    {
      return make_valid(std::invoke(std::forward<Fn>(fn), m_value));
    }
    catch (const std::exception&)
    {
      return make_error(std::current_exception(), m_value);
    }
    catch (...)
    {
      return make_error(wrap_current_exception(m_value), m_value);
    }
  }

  /**
   * Representation, e.g. `validate_result(value=1)`
   */
  std::string
  repr() const;

  private:
  validate_result(result_flag flag, sieve::value val, std::exception_ptr error,
                  sieve::value input) noexcept
  : m_flag {flag}, m_value {val}, m_error {error}, m_input {input}
  { }

  result_flag m_flag;
  sieve::value m_value;
  std::exception_ptr m_error;
  sieve::value m_input;
}; // class sieve::validate_result

} // namespace sieve
