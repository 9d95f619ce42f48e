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


#include "sieve/literal_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <format>
#include <limits>
#include <string>


sieve::parse_error::parse_error(std::string_view what, size_t offset)
: invalid_argument {std::format("{} (at offset {})", what, offset)},
  m_offset {offset}
{ }


static std::string_view
_trim(std::string_view text) noexcept
{
  while (not text.empty() and std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (not text.empty() and std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  return text;
}

// Remove single underscores between digits; false on misplaced underscores
static bool
_strip_underscores(std::string_view digits, std::string &result)
{
  for (size_t i = 0; i < digits.size(); ++i)
  {
    if (digits[i] == '_')
    {
      if (i == 0 or i + 1 == digits.size() or
          not std::isxdigit(static_cast<unsigned char>(digits[i - 1])) or
          not std::isxdigit(static_cast<unsigned char>(digits[i + 1])))
        return false;
      continue;
    }
    result.push_back(digits[i]);
  }
  return true;
}

bool
sieve::parse_integer(std::string_view text, long long &result, int base)
{
  text = _trim(text);

  std::string clean;
  if (not text.empty() and (text.front() == '+' or text.front() == '-'))
  {
    if (text.front() == '-')
      clean.push_back('-');
    text.remove_prefix(1);
  }

  if (base == 16 and text.size() > 2 and text[0] == '0' and
      (text[1] == 'x' or text[1] == 'X'))
    text.remove_prefix(2);

  if (text.empty() or text.front() == '_' or
      not _strip_underscores(text, clean))
    return false;

  const char *begin = clean.data();
  const char *end = clean.data() + clean.size();
  const auto [ptr, ec] = std::from_chars(begin, end, result, base);
  return ec == std::errc {} and ptr == end;
}

bool
sieve::parse_real(std::string_view text, long double &result)
{
  text = _trim(text);

  std::string lower {text};
  std::ranges::transform(lower, lower.begin(),
                         [](unsigned char c) { return std::tolower(c); });
  std::string_view name = lower;
  bool negative = false;
  if (not name.empty() and (name.front() == '+' or name.front() == '-'))
  {
    negative = name.front() == '-';
    name.remove_prefix(1);
  }
  if (name == "inf" or name == "infinity")
  {
    result = negative ? -std::numeric_limits<long double>::infinity()
                      : std::numeric_limits<long double>::infinity();
    return true;
  }
  if (name == "nan")
  {
    result = std::numeric_limits<long double>::quiet_NaN();
    return true;
  }

  std::string clean;
  if (text.empty() or not _strip_underscores(text, clean))
    return false;
  for (const char c : clean)
  {
    if (not std::isdigit(static_cast<unsigned char>(c)) and c != '+' and
        c != '-' and c != '.' and c != 'e' and c != 'E')
      return false;
  }

  char *end = nullptr;
  result = std::strtold(clean.c_str(), &end);
  return end == clean.c_str() + clean.size() and end != clean.c_str();
}

// Reads exactly `count` decimal digits
static bool
_take_digits(std::string_view &text, size_t count, int &result) noexcept
{
  if (text.size() < count)
    return false;
  result = 0;
  for (size_t i = 0; i < count; ++i)
  {
    if (not std::isdigit(static_cast<unsigned char>(text[i])))
      return false;
    result = result * 10 + (text[i] - '0');
  }
  text.remove_prefix(count);
  return true;
}

static bool
_take_char(std::string_view &text, char c) noexcept
{
  if (text.empty() or text.front() != c)
    return false;
  text.remove_prefix(1);
  return true;
}

bool
sieve::parse_datetime(std::string_view text, time_point &result)
{
  using namespace std::chrono;

  text = _trim(text);

  int y = 0, mon = 0, d = 0;
  if (not _take_digits(text, 4, y) or not _take_char(text, '-') or
      not _take_digits(text, 2, mon) or not _take_char(text, '-') or
      not _take_digits(text, 2, d))
    return false;
  const year_month_day ymd {year {y}, month {static_cast<unsigned>(mon)},
                            day {static_cast<unsigned>(d)}};
  if (not ymd.ok())
    return false;

  int h = 0, min = 0, sec = 0;
  long long micros = 0;
  if (not text.empty() and (text.front() == 'T' or text.front() == ' '))
  {
    text.remove_prefix(1);
    if (not _take_digits(text, 2, h) or not _take_char(text, ':') or
        not _take_digits(text, 2, min))
      return false;
    if (_take_char(text, ':'))
    {
      if (not _take_digits(text, 2, sec))
        return false;
      if (_take_char(text, '.'))
      {
        size_t ndigits = 0;
        while (ndigits < text.size() and
               std::isdigit(static_cast<unsigned char>(text[ndigits])))
          ++ndigits;
        if (ndigits == 0 or ndigits > 6)
          return false;
        int frac = 0;
        (void)_take_digits(text, ndigits, frac);
        micros = frac;
        for (size_t i = ndigits; i < 6; ++i)
          micros *= 10;
      }
    }
  }
  if (h > 23 or min > 59 or sec > 59)
    return false;

  // UTC offset; naive text is taken as UTC
  minutes offset {0};
  if (not _take_char(text, 'Z') and not text.empty() and
      (text.front() == '+' or text.front() == '-'))
  {
    const int sign = text.front() == '-' ? -1 : 1;
    text.remove_prefix(1);
    int oh = 0, om = 0;
    if (not _take_digits(text, 2, oh))
      return false;
    (void)_take_char(text, ':');
    if (not _take_digits(text, 2, om) or oh > 23 or om > 59)
      return false;
    offset = minutes {sign * (oh * 60 + om)};
  }
  if (not text.empty())
    return false;

  result = time_point {sys_days {ymd}} + hours {h} + minutes {min} +
           seconds {sec} + microseconds {micros} - offset;
  return true;
}


std::vector<sieve::literal_parser::token>
sieve::literal_parser::tokenize(std::string_view input) const
{
  std::vector<token> tokens;
  size_t pos = 0;

  while (pos < input.size())
  {
    const char c = input[pos];

    // Skip whitespace
    if (std::isspace(static_cast<unsigned char>(c)))
    {
      pos++;
      continue;
    }

    // Punctuation
    enum token::type punct = token::type::COMMA;
    bool is_punct = true;
    switch (c)
    {
      case '[': punct = token::type::LBRACKET; break;
      case ']': punct = token::type::RBRACKET; break;
      case '(': punct = token::type::LPAREN; break;
      case ')': punct = token::type::RPAREN; break;
      case '{': punct = token::type::LBRACE; break;
      case '}': punct = token::type::RBRACE; break;
      case ',': punct = token::type::COMMA; break;
      case ':': punct = token::type::COLON; break;
      default: is_punct = false;
    }
    if (is_punct)
    {
      tokens.push_back({punct, std::string(1, c), pos});
      pos++;
      continue;
    }

    // Strings and bytes
    const bool is_bytes = (c == 'b' or c == 'B') and pos + 1 < input.size() and
                         (input[pos + 1] == '\'' or input[pos + 1] == '"');
    if (c == '\'' or c == '"' or is_bytes)
    {
      const size_t start = pos;
      if (is_bytes)
        pos++;
      const char quote = input[pos++];
      std::string text;
      bool terminated = false;
      while (pos < input.size())
      {
        const char ch = input[pos++];
        if (ch == quote)
        {
          terminated = true;
          break;
        }
        if (ch != '\\')
        {
          text.push_back(ch);
          continue;
        }
        if (pos >= input.size())
          break;
        const char esc = input[pos++];
        switch (esc)
        {
          case 'n': text.push_back('\n'); break;
          case 't': text.push_back('\t'); break;
          case 'r': text.push_back('\r'); break;
          case '0': text.push_back('\0'); break;
          case '\\': case '\'': case '"': text.push_back(esc); break;
          case 'x': {
            long long code = 0;
            if (pos + 2 > input.size() or
                not parse_integer(input.substr(pos, 2), code, 16))
              throw parse_error {"Invalid \\x escape", pos - 2};
            text.push_back(static_cast<char>(code));
            pos += 2;
            break;
          }
          default:
            text.push_back('\\');
            text.push_back(esc);
        }
      }
      if (not terminated)
        throw parse_error {"Unterminated string literal", start};
      tokens.push_back(
          {is_bytes ? token::type::BYTES : token::type::STRING, text, start});
      continue;
    }

    // Numbers
    const auto is_digit = [](char ch) {
      return std::isdigit(static_cast<unsigned char>(ch));
    };
    const bool signednum = (c == '-' or c == '+') and pos + 1 < input.size() and
                           (is_digit(input[pos + 1]) or input[pos + 1] == '.');
    const bool dotnum = c == '.' and pos + 1 < input.size() and
                        is_digit(input[pos + 1]);
    if (is_digit(c) or signednum or dotnum)
    {
      const size_t start = pos;
      std::string text {c};
      pos++;
      while (pos < input.size())
      {
        const char ch = input[pos];
        const char prev = text.back();
        const bool exponent_sign =
            (ch == '+' or ch == '-') and (prev == 'e' or prev == 'E') and
            text.find_first_of("xX") == std::string::npos;
        if (std::isalnum(static_cast<unsigned char>(ch)) or ch == '_' or
            ch == '.' or exponent_sign)
        {
          text.push_back(ch);
          pos++;
        }
        else
          break;
      }
      tokens.push_back({token::type::NUMBER, text, start});
      continue;
    }

    // Names
    if (std::isalpha(static_cast<unsigned char>(c)) or c == '_')
    {
      const size_t start = pos;
      std::string text;
      while (pos < input.size() and
             (std::isalnum(static_cast<unsigned char>(input[pos])) or
              input[pos] == '_'))
        text.push_back(input[pos++]);
      tokens.push_back({token::type::NAME, text, start});
      continue;
    }

    throw parse_error {std::format("Unexpected character '{}'", c), pos};
  }

  return tokens;
}


static size_t
_end_offset(const std::vector<sieve::literal_parser::token> &tokens)
{
  if (tokens.empty())
    return 0;
  return tokens.back().offset + tokens.back().value.size();
}


sieve::value
sieve::literal_parser::parse(std::string_view input) const
{
  const std::vector<token> tokens = tokenize(input);
  if (tokens.empty())
    throw parse_error {"Empty literal", 0};

  size_t pos = 0;
  const value result = parse_tokens(tokens, pos);
  if (pos != tokens.size())
    throw parse_error {"Unexpected trailing input", tokens[pos].offset};
  return result;
}


sieve::value
sieve::literal_parser::parse_tokens(const std::vector<token> &tokens,
                                    size_t &pos, size_t depth) const
{
  if (pos >= tokens.size())
    throw parse_error {"Unexpected end of input", _end_offset(tokens)};

  const token &tok = tokens[pos++];
  switch (tok.type)
  {
    case token::type::LBRACKET:
    case token::type::LPAREN:
    case token::type::LBRACE:
      if (depth >= max_depth)
      {
        throw parse_error {
            std::format("Containers nested deeper than {}", max_depth),
            tok.offset};
      }
      if (tok.type == token::type::LBRACKET)
        return _parse_sequence(tokens, pos, token::type::RBRACKET, tag::list,
                               depth + 1);
      if (tok.type == token::type::LPAREN)
        return _parse_sequence(tokens, pos, token::type::RPAREN, tag::tuple,
                               depth + 1);
      return _parse_braces(tokens, pos, depth + 1);

    case token::type::NUMBER:
    case token::type::STRING:
    case token::type::BYTES:
    case token::type::NAME:
      return _parse_atom(tok);

    default:
      throw parse_error {std::format("Unexpected '{}'", tok.value), tok.offset};
  }
}


sieve::value
sieve::literal_parser::_parse_sequence(const std::vector<token> &tokens,
                                       size_t &pos, enum token::type close,
                                       tag kind, size_t depth) const
{
  std::vector<value> elements;
  bool comma = false;
  while (true)
  {
    if (pos >= tokens.size())
    {
      throw parse_error {"Unexpected end of input while parsing sequence",
                         _end_offset(tokens)};
    }
    if (tokens[pos].type == close)
    {
      pos++;
      break;
    }

    elements.push_back(parse_tokens(tokens, pos, depth));

    if (pos >= tokens.size())
    {
      throw parse_error {"Unexpected end of input while parsing sequence",
                         _end_offset(tokens)};
    }
    if (tokens[pos].type == token::type::COMMA)
    {
      comma = true;
      pos++;
    }
    else if (tokens[pos].type != close)
      throw parse_error {"Expected ',' or closing bracket", tokens[pos].offset};
  }

  // Parenthesized expression without a comma is not a tuple
  if (kind == tag::tuple and elements.size() == 1 and not comma)
    return elements.front();
  return sequence(kind, elements);
}


sieve::value
sieve::literal_parser::_parse_braces(const std::vector<token> &tokens,
                                     size_t &pos, size_t depth) const
{
  const auto expect_more = [&]() {
    if (pos >= tokens.size())
    {
      throw parse_error {"Unexpected end of input while parsing braces",
                         _end_offset(tokens)};
    }
  };

  expect_more();
  if (tokens[pos].type == token::type::RBRACE)
  {
    pos++;
    return dict(std::vector<std::pair<value, value>> { });
  }

  const value first = parse_tokens(tokens, pos, depth);
  expect_more();
  if (tokens[pos].type != token::type::COLON)
  {
    // A set; reuse sequence parsing for the rest
    std::vector<value> elements {first};
    if (tokens[pos].type == token::type::COMMA)
    {
      pos++;
      const value rest =
          _parse_sequence(tokens, pos, token::type::RBRACE, tag::list, depth);
      for (const value x : sieve::elements(rest))
        elements.push_back(x);
    }
    else if (tokens[pos].type == token::type::RBRACE)
      pos++;
    else
      throw parse_error {"Expected ',' or '}'", tokens[pos].offset};
    return sequence(tag::set, elements);
  }

  std::vector<std::pair<value, value>> entries;
  value key = first;
  while (true)
  {
    // At ':'
    pos++;
    entries.emplace_back(key, parse_tokens(tokens, pos, depth));
    expect_more();
    if (tokens[pos].type == token::type::RBRACE)
    {
      pos++;
      break;
    }
    if (tokens[pos].type != token::type::COMMA)
      throw parse_error {"Expected ',' or '}'", tokens[pos].offset};
    pos++;
    expect_more();
    if (tokens[pos].type == token::type::RBRACE)
    {
      pos++;
      break;
    }
    key = parse_tokens(tokens, pos, depth);
    expect_more();
    if (tokens[pos].type != token::type::COLON)
      throw parse_error {"Expected ':'", tokens[pos].offset};
  }
  return dict(entries);
}


sieve::value
sieve::literal_parser::_parse_atom(const token &tok) const
{
  switch (tok.type)
  {
    case token::type::STRING:
      return str(tok.value);

    case token::type::BYTES:
      return bytes(tok.value);

    case token::type::NAME:
      if (tok.value == "True" or tok.value == "true")
        return True;
      if (tok.value == "False" or tok.value == "false")
        return False;
      if (tok.value == "None" or tok.value == "none")
        return nil;
      throw parse_error {std::format("Unknown name: {}", tok.value), tok.offset};

    case token::type::NUMBER: {
      std::string_view text = tok.value;
      int base = 10;
      std::string_view digits = text;
      bool negative = false;
      if (not digits.empty() and (digits.front() == '-' or digits.front() == '+'))
      {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
      }
      if (digits.size() > 2 and digits[0] == '0')
      {
        switch (digits[1])
        {
          case 'x': case 'X': base = 16; break;
          case 'o': case 'O': base = 8; break;
          case 'b': case 'B': base = 2; break;
        }
      }

      if (base != 10)
      {
        long long result = 0;
        std::string clean = negative ? "-" : "";
        clean += digits.substr(2);
        if (not parse_integer(clean, result, base))
          throw parse_error {std::format("Invalid number: {}", text), tok.offset};
        return integer(result);
      }

      if (text.find_first_of(".eE") != std::string_view::npos)
      {
        long double result = 0;
        if (not parse_real(text, result))
          throw parse_error {std::format("Invalid number: {}", text), tok.offset};
        return real(result);
      }

      long long result = 0;
      if (not parse_integer(text, result))
        throw parse_error {std::format("Invalid number: {}", text), tok.offset};
      return integer(result);
    }

    default:
      throw parse_error {std::format("Unexpected '{}'", tok.value), tok.offset};
  }
}


sieve::value
sieve::read_literal(std::string_view text)
{
  static const literal_parser parser {};
  return parser.parse(text);
}
