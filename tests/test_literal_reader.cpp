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


#include "sieve/coerce.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/value.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <string>

namespace {

using namespace sieve;

class LiteralReaderTest: public testing::Test { };


TEST_F(LiteralReaderTest, Scalars)
{
  EXPECT_EQ(int_val(read_literal("12")), 12);
  EXPECT_EQ(int_val(read_literal("-3")), -3);
  EXPECT_EQ(int_val(read_literal("0x1f")), 31);
  EXPECT_EQ(int_val(read_literal("1_000")), 1000);
  EXPECT_TRUE(isreal(read_literal("1.5")));
  EXPECT_EQ(real_val(read_literal("1.5")), 1.5);
  EXPECT_EQ(str_view(read_literal("'abc'")), "abc");
  EXPECT_EQ(str_view(read_literal("\"a b\"")), "a b");
  EXPECT_EQ(bytes_view(read_literal("b'ab'")), "ab");
  EXPECT_TRUE(is(read_literal("True"), True));
  EXPECT_TRUE(is(read_literal("false"), False));
  EXPECT_TRUE(isnil(read_literal("None")));
  EXPECT_TRUE(isnil(read_literal("none")));
}

TEST_F(LiteralReaderTest, Containers)
{
  EXPECT_TRUE(equal(read_literal("[1, 2]"), list({integer(1), integer(2)})));
  EXPECT_TRUE(equal(read_literal("[1, 2,]"), list({integer(1), integer(2)})));
  EXPECT_TRUE(equal(read_literal("(1,)"), tuple({integer(1)})));
  EXPECT_EQ(tag_of(read_literal("()")), tag::tuple);
  EXPECT_EQ(tag_of(read_literal("{1, 2}")), tag::set);
  EXPECT_EQ(tag_of(read_literal("{}")), tag::dict);

  const value d = read_literal("{'a': [1, (2, 3)], 'b': None}");
  ASSERT_TRUE(isdict(d));
  value a = nil;
  ASSERT_TRUE(dict_get(d, str("a"), a));
  EXPECT_TRUE(equal(a, list({integer(1), tuple({integer(2), integer(3)})})));
}

TEST_F(LiteralReaderTest, ParenthesizedValueIsNotATuple)
{
  EXPECT_TRUE(isint(read_literal("(1)")));
}

TEST_F(LiteralReaderTest, RejectsMalformedText)
{
  EXPECT_THROW((void)read_literal(""), parse_error);
  EXPECT_THROW((void)read_literal("[1, 2"), parse_error);
  EXPECT_THROW((void)read_literal("abc"), parse_error);
  EXPECT_THROW((void)read_literal("1 2"), parse_error);
  EXPECT_THROW((void)read_literal("{'a' 1}"), parse_error);
  EXPECT_THROW((void)read_literal("'open"), parse_error);
}

TEST_F(LiteralReaderTest, NestingDepthIsLimited)
{
  const size_t limit = literal_parser::max_depth;

  const std::string deepest =
      std::string(limit, '[') + std::string(limit, ']');
  EXPECT_EQ(tag_of(read_literal(deepest)), tag::list);

  const std::string too_deep =
      std::string(limit + 1, '[') + std::string(limit + 1, ']');
  EXPECT_THROW((void)read_literal(too_deep), parse_error);

  // Unbalanced and huge: rejected without exhausting the stack
  EXPECT_THROW((void)read_literal(std::string(100000, '[')), parse_error);
  EXPECT_THROW((void)read_literal(std::string(100000, '(')), parse_error);
  EXPECT_THROW((void)read_literal("{'a': " + std::string(100000, '{')), parse_error);
}

TEST_F(LiteralReaderTest, ParseInteger)
{
  long long result = 0;
  EXPECT_TRUE(parse_integer(" 42 ", result));
  EXPECT_EQ(result, 42);
  EXPECT_TRUE(parse_integer("-1_000", result));
  EXPECT_EQ(result, -1000);
  EXPECT_TRUE(parse_integer("ff", result, 16));
  EXPECT_EQ(result, 255);
  EXPECT_TRUE(parse_integer("0xFF", result, 16));
  EXPECT_EQ(result, 255);
  EXPECT_FALSE(parse_integer("1.5", result));
  EXPECT_FALSE(parse_integer("_1", result));
  EXPECT_FALSE(parse_integer("", result));
}

TEST_F(LiteralReaderTest, ParseReal)
{
  long double result = 0;
  EXPECT_TRUE(parse_real("2.5", result));
  EXPECT_EQ(result, 2.5);
  EXPECT_TRUE(parse_real("-inf", result));
  EXPECT_TRUE(std::isinf(result));
  EXPECT_TRUE(parse_real("nan", result));
  EXPECT_TRUE(std::isnan(result));
  EXPECT_FALSE(parse_real("x", result));
}

TEST_F(LiteralReaderTest, ParseDatetime)
{
  using std::chrono::hours;
  using std::chrono::milliseconds;
  using std::chrono::minutes;
  using std::chrono::seconds;
  using std::chrono::sys_days;
  using std::chrono::year;

  const time_point leap_day = time_point {sys_days {year {2024} / 2 / 29}};

  time_point result;
  EXPECT_TRUE(parse_datetime("2024-02-29", result));
  EXPECT_EQ(result, leap_day);
  EXPECT_TRUE(parse_datetime("2024-02-29T10:30", result));
  EXPECT_EQ(result, leap_day + hours {10} + minutes {30});
  EXPECT_TRUE(parse_datetime(" 2024-02-29 10:30:15.25 ", result));
  EXPECT_EQ(result, leap_day + hours {10} + minutes {30} + seconds {15} +
                        milliseconds {250});
  EXPECT_TRUE(parse_datetime("2024-02-29T12:30:00+02:00", result));
  EXPECT_EQ(result, leap_day + hours {10} + minutes {30});
  EXPECT_TRUE(parse_datetime("2024-02-29T10:30:00Z", result));
  EXPECT_EQ(result, leap_day + hours {10} + minutes {30});

  EXPECT_FALSE(parse_datetime("2023-02-29", result));
  EXPECT_FALSE(parse_datetime("2024-13-01", result));
  EXPECT_FALSE(parse_datetime("2024-01-01T24:00", result));
  EXPECT_FALSE(parse_datetime("2024-01-01T10", result));
  EXPECT_FALSE(parse_datetime("2024-01-01T10:00:00.1234567", result));
  EXPECT_FALSE(parse_datetime("2024-01-01 junk", result));
  EXPECT_FALSE(parse_datetime("", result));
}


class CoerceTest: public testing::Test { };

TEST_F(CoerceTest, Integer)
{
  EXPECT_EQ(int_val(coerce(str("12"), types::integer)), 12);
  EXPECT_EQ(int_val(coerce(real(2.7), types::integer)), 2);
  EXPECT_EQ(int_val(coerce(True, types::integer)), 1);
  EXPECT_THROW((void)coerce(str("x"), types::integer), conversion_failure);
  EXPECT_THROW((void)coerce(list({}), types::integer), conversion_failure);
}

TEST_F(CoerceTest, RealAndNumber)
{
  EXPECT_EQ(real_val(coerce(str("1.5"), types::real)), 1.5);
  EXPECT_TRUE(isreal(coerce(integer(3), types::real)));
  EXPECT_TRUE(isint(coerce(str("2.0"), types::number)));
  EXPECT_TRUE(isreal(coerce(str("2.5"), types::number)));
  EXPECT_THROW((void)coerce(str("two"), types::number), conversion_failure);
}

TEST_F(CoerceTest, TextAndBytes)
{
  EXPECT_EQ(str_view(coerce(integer(12), types::str)), "12");
  EXPECT_EQ(str_view(coerce(list({str("a")}), types::str)), "['a']");
  EXPECT_EQ(bytes_view(coerce(str("ab"), types::bytes)), "ab");
  EXPECT_THROW((void)coerce(integer(1), types::bytes), conversion_failure);
}

TEST_F(CoerceTest, Containers)
{
  const value l = coerce(tuple({integer(1), integer(2)}), types::list);
  EXPECT_EQ(tag_of(l), tag::list);
  EXPECT_EQ(length(coerce(list({integer(1), integer(1)}), types::set)), 1u);
  EXPECT_EQ(length(coerce(str("abc"), types::list)), 3u);

  const value d = coerce(list({tuple({str("a"), integer(1)})}), types::dict);
  ASSERT_TRUE(isdict(d));
  EXPECT_THROW((void)coerce(list({integer(1)}), types::dict), conversion_failure);
}

TEST_F(CoerceTest, BooleanAndNone)
{
  EXPECT_TRUE(is(coerce(str(""), types::boolean), False));
  EXPECT_TRUE(is(coerce(integer(5), types::boolean), True));
  EXPECT_TRUE(isnil(coerce(nil, types::none)));
  EXPECT_THROW((void)coerce(integer(0), types::none), conversion_failure);
}

TEST_F(CoerceTest, DatetimeAndPath)
{
  using std::chrono::days;
  using std::chrono::milliseconds;

  const value d = coerce(str("1970-01-02"), types::datetime);
  ASSERT_TRUE(isdatetime(d));
  EXPECT_EQ(datetime_val(d).time_since_epoch(), days {1});
  EXPECT_EQ(datetime_val(coerce(real(1.5), types::datetime)).time_since_epoch(),
            milliseconds {1500});
  EXPECT_TRUE(is(coerce(d, types::datetime), d));
  EXPECT_THROW((void)coerce(str("yesterday"), types::datetime), conversion_failure);
  EXPECT_THROW((void)coerce(list({}), types::datetime), conversion_failure);

  const value p = coerce(str("etc//hosts"), types::path);
  ASSERT_TRUE(ispath(p));
  EXPECT_EQ(path_view(p), "etc/hosts");
  EXPECT_TRUE(is(coerce(p, types::path), p));
  EXPECT_THROW((void)coerce(integer(1), types::path), conversion_failure);
}

} // anonymous namespace
