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


#include "sieve/builtins.hpp"
#include "sieve/coerce.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/registry.hpp"
#include "sieve/variants.hpp"

#include <algorithm>
#include <array>
#include <cctype>


using namespace std::string_view_literals;

static std::string
_lower(std::string_view text)
{
  std::string result {text};
  std::ranges::transform(result, result.begin(),
      [](unsigned char c) { return std::tolower(c); });
  return result;
}

static std::string_view
_text_of(sieve::value x)
{ return std::string_view {x->str.data, x->str.len}; }

// Container literal pattern; the whole text must look like the container
static sieve::pattern_ptr
_container_literal(std::string regex, sieve::type origin, std::string alias)
{
  using namespace sieve;
  return std::make_shared<pattern>(pattern_config {
      .mode = match_mode::regex_convert,
      .origin = origin,
      .regex = std::move(regex),
      .anchor = regex_anchor::full,
      .alias = std::move(alias),
  });
}

namespace {

// Integer conversion; booleans become plain integers instead of passing as
// integer subtypes
class integer_conversion: public sieve::pattern {
  public:
  integer_conversion()
  : pattern {{.mode = sieve::match_mode::type_convert,
              .origin = sieve::types::integer,
              .alias = "int"}}
  { refresh(); }

  std::shared_ptr<sieve::pattern>
  copy() const override
  { return std::make_shared<integer_conversion>(*this); }

  protected:
  sieve::value
  _match(sieve::value input) const override
  {
    if (sieve::isbool(input))
      return sieve::integer(sieve::bool_val(input) ? 1 : 0);
    return pattern::_match(input);
  }
}; // class integer_conversion

} // anonymous namespace

static sieve::pattern_ptr
_text_format(std::string regex, std::string alias)
{
  using namespace sieve;
  return std::make_shared<pattern>(pattern_config {
      .mode = match_mode::regex_match,
      .origin = types::str,
      .regex = std::move(regex),
      .alias = std::move(alias),
  });
}


const sieve::pattern_ptr&
sieve::builtins::any_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::keep,
      .alias = "any",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::none_pattern()
{
  static const pattern_ptr p = std::make_shared<direct>(nil, "none");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::string_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::str,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        if (isbytes(x))
          return str(bytes_view(x));
        return std::nullopt;
      },
      .alias = "str",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::bytes_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::bytes,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        if (isstr(x))
          return bytes(str_view(x));
        return std::nullopt;
      },
      .alias = "bytes",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::integer_pattern()
{
  static const pattern_ptr p = std::make_shared<integer_conversion>();
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::float_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::real,
      .alias = "float",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::number_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::number,
      .alias = "number",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::boolean_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::boolean,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        if (not isstr(x) and not isbytes(x))
          return std::nullopt;
        const std::string text = _lower(_text_of(x));
        if (text == "true")
          return True;
        if (text == "false")
          return False;
        return std::nullopt;
      },
      .alias = "bool",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::wide_boolean_pattern()
{
  static constexpr std::array true_words {"1"sv, "on"sv, "t"sv, "true"sv, "y"sv, "yes"sv};
  static constexpr std::array false_words {"0"sv, "off"sv, "f"sv, "false"sv, "n"sv, "no"sv};

  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::boolean,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        if (isnum(x))
        {
          if (equal(x, integer(1)))
            return True;
          if (equal(x, integer(0)))
            return False;
          return std::nullopt;
        }
        if (not isstr(x) and not isbytes(x))
          return std::nullopt;
        const std::string text = _lower(_text_of(x));
        if (std::ranges::find(true_words, text) != true_words.end())
          return True;
        if (std::ranges::find(false_words, text) != false_words.end())
          return False;
        return std::nullopt;
      },
      .alias = "wide_bool",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::any_str_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::str,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        return str(to_display(x));
      },
      .alias = "any_str",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::list_pattern()
{
  static const pattern_ptr p = _container_literal(R"(\[.*\])", types::list, "list");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::tuple_pattern()
{
  static const pattern_ptr p = _container_literal(R"(\(.*\))", types::tuple, "tuple");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::set_pattern()
{
  static const pattern_ptr p = _container_literal(R"(\{.*\})", types::set, "set");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::dict_pattern()
{
  static const pattern_ptr p = _container_literal(R"(\{.*\})", types::dict, "dict");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::email_pattern()
{
  static const pattern_ptr p =
      _text_format(R"((?:[\w\.+-]+)@(?:[\w\.-]+)\.(?:[\w\.-]+))", "email");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::ip_pattern()
{
  static const pattern_ptr p = _text_format(
      R"((?:(?:[01]{0,1}\d{0,1}\d|2[0-4]\d|25[0-5])\.){3})"
      R"((?:[01]{0,1}\d{0,1}\d|2[0-4]\d|25[0-5]):?(?:\d+)?)",
      "ip");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::url_pattern()
{
  static const pattern_ptr p = _text_format(
      R"((?:\w+://)?[a-zA-Z0-9][-a-zA-Z0-9]{0,62}(?:\.[a-zA-Z0-9][-a-zA-Z0-9]{0,62})+)"
      R"((?::[0-9]{1,5})?[-a-zA-Z0-9()@:%_\\\+\.~#?&/=]*)",
      "url");
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::hex_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::integer,
      .convert = [](const pattern&, value x) -> std::optional<value> {
        long long result = 0;
        if (not parse_integer(str_view(x), result, 16))
          return std::nullopt;
        return integer(result);
      },
      .accepts = std::vector<type> {types::str},
      .alias = "hex",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::hex_color_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::regex_convert,
      .origin = types::str,
      .regex = "(#[0-9a-fA-F]{6})",
      .convert = [](const pattern&, value m) -> std::optional<value> {
        return str(str_view(seq_ref(m, 1)).substr(1));
      },
      .alias = "color",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::delimited_int_pattern()
{
  static const pattern_ptr p = [] {
    const pattern_ptr undelimit = std::make_shared<pattern>(pattern_config {
        .mode = match_mode::value_operate,
        .origin = types::str,
        .convert = [](const pattern&, value x) -> std::optional<value> {
          std::string text {str_view(x)};
          std::ranges::replace(text, ',', '_');
          return str(text);
        },
    });
    const std::shared_ptr<pattern> result = integer_pattern()->copy();
    result->set_previous(undelimit);
    result->set_alias("delimited_int");
    return result;
  }();
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::datetime_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::datetime,
      .alias = "datetime",
  });
  return p;
}

const sieve::pattern_ptr&
sieve::builtins::path_pattern()
{
  static const pattern_ptr p = std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = types::path,
      .alias = "path",
  });
  return p;
}


void
sieve::install_builtins(pattern_table &table, bool cover)
{
  using namespace builtins;

  table.sets({
      any_pattern(), none_pattern(), string_pattern(), bytes_pattern(),
      integer_pattern(), float_pattern(), number_pattern(), boolean_pattern(),
      list_pattern(), tuple_pattern(), set_pattern(), dict_pattern(),
      datetime_pattern(), path_pattern(),
  }, cover);

  table.merge({
      {"email", email_pattern()},
      {"ip", ip_pattern()},
      {"url", url_pattern()},
      {"hex", hex_pattern()},
      {"color", hex_color_pattern()},
      {"any_str", any_str_pattern()},
      {"delimited_int", delimited_int_pattern()},
      {"wide_bool", wide_boolean_pattern()},
  }, cover);
}
