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

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * Formatting of values with std::format
 *
 * Format specification: `w` (representation, default), `d` (display form),
 * `c` (colorized), `r` (raw, default).
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for sieve::value
 *
 * \ingroup utils
 */
template <>
struct formatter<sieve::value, char> {
  enum class style { write, display } style = style::write;
  bool colored = false;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    while (it != ctx.end() and *it != '}')
    {
      switch (*it)
      {
        case 'w': style = style::write; break;
        case 'd': style = style::display; break;
        case 'c': colored = true; break;
        case 'r': colored = false; break;
        default: throw std::format_error {"Invalid format arguments for sieve::value"};
      }
      ++it;
    }
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(sieve::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    const sieve::printer &p =
        colored ? sieve::colorized_printer : sieve::raw_printer;
    switch (style)
    {
      case style::write: p.write(buffer, x); break;
      case style::display: p.display(buffer, x); break;
    }
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct std::formatter<sieve::value>

} // namespace std
