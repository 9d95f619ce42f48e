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


#include "sieve/result.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/pattern.hpp"

#include <exception>


std::string_view
sieve::result_flag_name(result_flag flag) noexcept
{
  switch (flag)
  {
    case result_flag::valid: return "valid";
    case result_flag::error: return "error";
    case result_flag::defaulted: return "defaulted";
  }
  std::terminate();
}

sieve::validate_result
sieve::validate_result::step(const pattern &next) const
{
  if (failed())
    return *this;
  return next.validate(m_value);
}

std::string
sieve::validate_result::repr() const
{
  switch (m_flag)
  {
    case result_flag::valid:
      return std::format("validate_result(value={:r})", m_value);
    case result_flag::defaulted:
      return std::format("validate_result(default={:r})", m_value);
    case result_flag::error:
      return std::format("validate_result(error={})", describe(m_error));
  }
  std::terminate();
}
