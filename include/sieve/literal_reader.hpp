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

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file literal_reader.hpp
 * Reader of literal text
 *
 * Reads the literal notation printed by sieve::write(): numbers, quoted
 * strings and bytes, `True`/`False`/`None` (lowercase accepted), lists
 * `[...]`, tuples `(...)`, sets `{...}` and dictionaries `{k: v, ...}`.
 *
 * \ingroup literals
 */


namespace sieve {

/**
 * Malformed literal text
 *
 * \ingroup literals
 */
struct parse_error: std::invalid_argument {
  parse_error(std::string_view what, size_t offset);

  /** Position in the text where the error was detected */
  size_t
  offset() const noexcept
  { return m_offset; }

  private:
  size_t m_offset;
}; // struct sieve::parse_error


/**
 * Parser for literal text
 *
 * \ingroup literals
 */
class literal_parser {
  public:
  /**
   * Token of literal text
   */
  struct token {
    enum class type {
      LBRACKET, // [
      RBRACKET, // ]
      LPAREN,   // (
      RPAREN,   // )
      LBRACE,   // {
      RBRACE,   // }
      COMMA,    // ,
      COLON,    // :
      NUMBER,   // 12, -1.5e3, 0x1f
      STRING,   // 'abc', "abc"
      BYTES,    // b'abc'
      NAME,     // True, false, None
    };
    type type;
    std::string value;
    size_t offset;
  }; // struct sieve::literal_parser::token

  /** Containers nested deeper than this are rejected */
  static constexpr size_t max_depth = 256;

  /**
   * Parse exactly one literal spanning the whole text
   *
   * \throws parse_error
   */
  value
  parse(std::string_view input) const;

  std::vector<token>
  tokenize(std::string_view input) const;

  /**
   * Parse one literal starting at \p pos
   *
   * \param depth Number of containers enclosing the literal
   * \throws parse_error
   */
  value
  parse_tokens(const std::vector<token> &tokens, size_t &pos,
               size_t depth = 0) const;

  private:
  value
  _parse_sequence(const std::vector<token> &tokens, size_t &pos,
                  enum token::type close, tag kind, size_t depth) const;

  value
  _parse_braces(const std::vector<token> &tokens, size_t &pos,
                size_t depth) const;

  value
  _parse_atom(const token &tok) const;
}; // class sieve::literal_parser


/**
 * Read a literal
 *
 * \throws parse_error If \p text is not a single well-formed literal
 *
 * \ingroup literals
 */
[[nodiscard]] value
read_literal(std::string_view text);

/**
 * Parse an integer the way `int()` does: optional sign, decimal digits with
 * single underscores between them, surrounding whitespace ignored
 *
 * \return False if the text is not an integer or does not fit
 *
 * \ingroup literals
 */
bool
parse_integer(std::string_view text, long long &result, int base = 10);

/**
 * Parse a real number the way `float()` does (also `inf` and `nan`)
 *
 * \return False if the text is not a number
 *
 * \ingroup literals
 */
bool
parse_real(std::string_view text, long double &result);

/**
 * Parse an ISO 8601 date or date-time
 *
 * Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and
 * `HH:MM[:SS[.ffffff]]`, optionally followed by `Z` or a `+HH:MM` offset.
 * Offsets are applied, the result is in UTC.
 *
 * \return False if the text is not a valid date
 *
 * \ingroup literals
 */
bool
parse_datetime(std::string_view text, time_point &result);

} // namespace sieve
