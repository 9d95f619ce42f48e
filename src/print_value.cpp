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


#include "sieve/type.hpp"
#include "sieve/utilities/execution_timer.hpp"
#include "sieve/value.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <sstream>
#include <string>


const sieve::color_palette sieve::printer::default_palette {
    "\e[38;5;9m",  // nil
    "\e[38;5;11;1m", // boolean
    "\e[38;5;12m", // number
    "\e[38;5;10m", // string
    "\e[38;5;15m", // container
    "\e[38;5;13m"  // instance
};

const sieve::printer sieve::colorized_printer {sieve::printer::default_palette};
const sieve::printer sieve::raw_printer;


enum class mode {
  write,
  display,
};


static std::string
_format_real(long double x)
{
  if (std::isnan(x))
    return "nan";
  if (std::isinf(x))
    return x > 0 ? "inf" : "-inf";

  std::string text = std::format("{}", static_cast<double>(x));
  if (text.find_first_of(".e") == std::string::npos)
    text += ".0";
  return text;
}

static std::string
_format_datetime(sieve::time_point t)
{
  using namespace std::chrono;

  const sys_days day = floor<days>(t);
  const year_month_day ymd {day};
  const hh_mm_ss hms {t - day};
  std::string text = std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
      static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
      static_cast<unsigned>(ymd.day()), hms.hours().count(),
      hms.minutes().count(), hms.seconds().count());
  if (hms.subseconds().count() != 0)
    text += std::format(".{:06}", hms.subseconds().count());
  return text;
}

static void
_write_quoted(std::ostream &os, std::string_view str)
{
  const char quote =
      str.find('\'') != std::string_view::npos and
              str.find('"') == std::string_view::npos
          ? '"'
          : '\'';
  os.put(quote);
  for (const char c : str)
  {
    switch (c)
    {
      case '\\': os << "\\\\"; break;
      case '\n': os << "\\n"; break;
      case '\r': os << "\\r"; break;
      case '\t': os << "\\t"; break;
      default:
        if (c == quote)
          os << '\\' << c;
        else if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f)
          os << std::format("\\x{:02x}", static_cast<unsigned char>(c));
        else
          os.put(c);
    }
  }
  os.put(quote);
}

static void
_print(mode mode, std::ostream &os, sieve::value val,
       const sieve::color_palette &cp)
{
  using namespace sieve;

#define RESET_COLOR(c) (c.empty() ? "" : "\e[0m")
#define BEGC(name) cp.name##_color
#define ENDC(name) RESET_COLOR(cp.name##_color)

  switch (tag_of(val))
  {
    case tag::nil:
      os << BEGC(nil) << "None" << ENDC(nil);
      break;

    case tag::boolean:
      os << BEGC(bool) << (val->boolean ? "True" : "False") << ENDC(bool);
      break;

    case tag::integer:
      os << BEGC(number) << val->integer << ENDC(number);
      break;

    case tag::real:
      os << BEGC(number) << _format_real(val->real) << ENDC(number);
      break;

    case tag::str:
      os << BEGC(string);
      if (mode == mode::display)
        os << str_view(val);
      else
        _write_quoted(os, str_view(val));
      os << ENDC(string);
      break;

    case tag::bytes:
      os << BEGC(string) << 'b';
      _write_quoted(os, bytes_view(val));
      os << ENDC(string);
      break;

    case tag::list:
    case tag::tuple:
    case tag::set: {
      const tag t = tag_of(val);
      if (t == tag::set and length(val) == 0)
      {
        os << BEGC(container) << "set()" << ENDC(container);
        break;
      }

      const char open = t == tag::list ? '[' : t == tag::tuple ? '(' : '{';
      const char close = t == tag::list ? ']' : t == tag::tuple ? ')' : '}';
      os << BEGC(container) << open << ENDC(container);
      bool first = true;
      for (const value x : elements(val))
      {
        if (not first)
          os << ", ";
        first = false;
        // Nested strings are always quoted
        _print(mode::write, os, x, cp);
      }
      if (t == tag::tuple and length(val) == 1)
        os << ',';
      os << BEGC(container) << close << ENDC(container);
      break;
    }

    case tag::dict: {
      os << BEGC(container) << '{' << ENDC(container);
      bool first = true;
      for (const auto &[key, x] : items(val))
      {
        if (not first)
          os << ", ";
        first = false;
        _print(mode::write, os, key, cp);
        os << ": ";
        _print(mode::write, os, x, cp);
      }
      os << BEGC(container) << '}' << ENDC(container);
      break;
    }

    case tag::datetime:
      os << BEGC(number);
      if (mode == mode::display)
        os << _format_datetime(datetime_val(val));
      else
        os << "datetime('" << _format_datetime(datetime_val(val)) << "')";
      os << ENDC(number);
      break;

    case tag::path:
      os << BEGC(string);
      if (mode == mode::display)
        os << path_view(val);
      else
      {
        os << "path(";
        _write_quoted(os, path_view(val));
        os << ')';
      }
      os << ENDC(string);
      break;

    case tag::instance:
      os << BEGC(instance) << '<' << type_of(val).name() << " object at "
         << val->inst.ptr << '>' << ENDC(instance);
      break;
  }

#undef BEGC
#undef ENDC
#undef RESET_COLOR
}


void
sieve::printer::write(std::ostream &os, value x) const
{
  SIEVE_FUNCTION_BENCHMARK
  _print(mode::write, os, x, m_palette);
}

void
sieve::printer::display(std::ostream &os, value x) const
{
  SIEVE_FUNCTION_BENCHMARK
  _print(mode::display, os, x, m_palette);
}

std::string
sieve::repr(value x)
{
  std::ostringstream buffer;
  write(buffer, x);
  return std::move(buffer).str();
}

std::string
sieve::to_display(value x)
{
  std::ostringstream buffer;
  display(buffer, x);
  return std::move(buffer).str();
}
