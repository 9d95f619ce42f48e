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


#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/type.hpp"

#include <format>


sieve::match_failed::match_failed(std::string_view what, value input)
: runtime_error {std::string(what)},
  m_input {repr(input)}
{ }

sieve::type_mismatch::type_mismatch(value input, std::string_view expected)
: match_failed {std::format("Parameter {} of type {} is not acceptable; "
                            "expected {}",
                            input, type_of(input), expected),
                input}
{ }

sieve::conversion_failure::conversion_failure(value input,
                                              std::string_view expected)
: match_failed {std::format("Parameter {} cannot be converted to {}", input,
                            expected),
                input}
{ }

sieve::pattern_mismatch::pattern_mismatch(value input,
                                          std::string_view expected)
: match_failed {std::format("Parameter {} is incorrect; expected {}", input,
                            expected),
                input}
{ }

sieve::validator_rejected::validator_rejected(value input, size_t index)
: match_failed {std::format("Parameter {} rejected by validator #{}", input,
                            index),
                input},
  m_index {index}
{ }

static std::string
_join_reasons(const std::vector<std::string> &reasons)
{
  std::string result;
  for (const std::string &reason : reasons)
  {
    result += "\n  - ";
    result += reason;
  }
  return result;
}

sieve::exhausted_alternatives::exhausted_alternatives(
    value input, std::vector<std::string> reasons)
: match_failed {std::format("Parameter {} matches no alternative:{}", input,
                            _join_reasons(reasons)),
                input},
  m_reasons {std::move(reasons)}
{ }

sieve::unresolved_reference::unresolved_reference(value input,
                                                  std::string_view name)
: match_failed {std::format("Cannot resolve reference '{}' to match {}", name,
                            input),
                input}
{ }

sieve::registry_not_found::registry_not_found(std::string_view name)
: configuration_error {std::format("No local pattern table named '{}'", name)}
{ }


std::string
sieve::describe(const std::exception &exn)
{
  std::string result = exn.what();
  try
  {
    std::rethrow_if_nested(exn);
  }
  catch (const std::exception &cause)
  {
    result += std::format(" (caused by: {})", describe(cause));
  }
  catch (...)
  {
    result += " (caused by: unknown exception)";
  }
  return result;
}

std::string
sieve::describe(std::exception_ptr eptr)
{
  if (not eptr)
    return "no error";
  try
  {
    std::rethrow_exception(eptr);
  }
  catch (const std::exception &exn)
  {
    return describe(exn);
  }
  catch (...)
  {
    return "unknown exception";
  }
}


std::exception_ptr
sieve::wrap_current_exception(value input)
{
  try
  {
    std::throw_with_nested(match_failed {"unknown exception", input});
  }
  catch (const match_failed&)
  {
    return std::current_exception();
  }
}
