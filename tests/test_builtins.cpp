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
#include "sieve/exceptions.hpp"
#include "sieve/registry.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

using namespace sieve;
using namespace sieve::builtins;

class BuiltinsTest: public testing::Test {
  protected:
  static bool
  accepts(const pattern_ptr &p, value x)
  { return p->validate(x).valid(); }
};


TEST_F(BuiltinsTest, AnyAndNone)
{
  EXPECT_TRUE(accepts(any_pattern(), nil));
  EXPECT_TRUE(accepts(any_pattern(), list({})));
  EXPECT_EQ(any_pattern()->repr(), "any");

  EXPECT_TRUE(accepts(none_pattern(), nil));
  EXPECT_FALSE(accepts(none_pattern(), integer(0)));
  EXPECT_EQ(none_pattern()->repr(), "none");
}

TEST_F(BuiltinsTest, TextAndBytes)
{
  EXPECT_TRUE(isstr(string_pattern()->validate(str("a")).value(), "a"));
  EXPECT_TRUE(isstr(string_pattern()->validate(bytes("ab")).value(), "ab"));
  EXPECT_FALSE(accepts(string_pattern(), integer(1)));

  const value b = bytes_pattern()->validate(str("ab")).value();
  ASSERT_TRUE(isbytes(b));
  EXPECT_EQ(bytes_view(b), "ab");
  EXPECT_FALSE(accepts(bytes_pattern(), integer(1)));
}

TEST_F(BuiltinsTest, Integer)
{
  const pattern_ptr &p = integer_pattern();
  EXPECT_EQ(p->repr(), "int");
  EXPECT_EQ(int_val(p->validate(str("12")).value()), 12);
  EXPECT_EQ(int_val(p->validate(str(" -4 ")).value()), -4);
  EXPECT_EQ(int_val(p->validate(integer(12)).value()), 12);
  EXPECT_EQ(int_val(p->validate(real(2.7)).value()), 2);
  EXPECT_FALSE(accepts(p, str("1.5")));
  EXPECT_FALSE(accepts(p, str("abc")));

  // Booleans become plain integers
  const value one = p->validate(True).value();
  ASSERT_TRUE(isint(one));
  EXPECT_EQ(int_val(one), 1);
  const value zero = p->validate(False).value();
  ASSERT_TRUE(isint(zero));
  EXPECT_EQ(int_val(zero), 0);

  // Copies keep the conversion
  EXPECT_TRUE(isint(p->copy()->validate(True).value()));
  EXPECT_TRUE(isint(delimited_int_pattern()->validate(str("1,000")).value()));
}

TEST_F(BuiltinsTest, FloatAndNumber)
{
  const value f = float_pattern()->validate(str("1.5")).value();
  ASSERT_TRUE(isreal(f));
  EXPECT_EQ(real_val(f), 1.5);
  EXPECT_TRUE(isreal(float_pattern()->validate(integer(2)).value()));
  EXPECT_FALSE(accepts(float_pattern(), str("x")));

  EXPECT_TRUE(isint(number_pattern()->validate(str("2")).value()));
  EXPECT_TRUE(isreal(number_pattern()->validate(str("2.5")).value()));
  EXPECT_TRUE(isint(number_pattern()->validate(integer(3)).value()));
  EXPECT_FALSE(accepts(number_pattern(), str("two")));
}

TEST_F(BuiltinsTest, Boolean)
{
  const pattern_ptr &p = boolean_pattern();
  EXPECT_TRUE(is(p->validate(str("TRUE")).value(), True));
  EXPECT_TRUE(is(p->validate(str("false")).value(), False));
  EXPECT_TRUE(is(p->validate(bytes("true")).value(), True));
  EXPECT_TRUE(is(p->validate(False).value(), False));
  EXPECT_FALSE(accepts(p, str("yes")));
  EXPECT_FALSE(accepts(p, integer(1)));
}

TEST_F(BuiltinsTest, WideBoolean)
{
  const pattern_ptr &p = wide_boolean_pattern();
  EXPECT_TRUE(is(p->validate(str("yes")).value(), True));
  EXPECT_TRUE(is(p->validate(str("OFF")).value(), False));
  EXPECT_TRUE(is(p->validate(str("y")).value(), True));
  EXPECT_TRUE(is(p->validate(integer(1)).value(), True));
  EXPECT_TRUE(is(p->validate(integer(0)).value(), False));
  EXPECT_FALSE(accepts(p, integer(2)));
  EXPECT_FALSE(accepts(p, str("maybe")));
}

TEST_F(BuiltinsTest, AnyStr)
{
  EXPECT_TRUE(isstr(any_str_pattern()->validate(integer(12)).value(), "12"));
  EXPECT_TRUE(isstr(any_str_pattern()->validate(list({integer(1)})).value(), "[1]"));
  EXPECT_TRUE(isstr(any_str_pattern()->validate(str("x")).value(), "x"));
}

TEST_F(BuiltinsTest, ContainerLiterals)
{
  const value l = list_pattern()->validate(str("[1, 2]")).value();
  EXPECT_TRUE(equal(l, list({integer(1), integer(2)})));
  EXPECT_FALSE(accepts(list_pattern(), str("(1, 2)")));
  EXPECT_FALSE(accepts(list_pattern(), str("[1, 2")));

  // Containers are kept as they are
  const value existing = list({integer(1)});
  EXPECT_TRUE(is(list_pattern()->validate(existing).value(), existing));

  const value t = tuple_pattern()->validate(str("(1, 2)")).value();
  EXPECT_EQ(tag_of(t), tag::tuple);

  const value s = set_pattern()->validate(str("{1, 2, 2}")).value();
  EXPECT_EQ(tag_of(s), tag::set);
  EXPECT_EQ(length(s), 2u);

  const value d = dict_pattern()->validate(str("{'a': 1}")).value();
  ASSERT_TRUE(isdict(d));
  value a = nil;
  ASSERT_TRUE(dict_get(d, str("a"), a));
  EXPECT_EQ(int_val(a), 1);
}

TEST_F(BuiltinsTest, TextFormats)
{
  EXPECT_TRUE(accepts(email_pattern(), str("me@example.com")));
  EXPECT_TRUE(accepts(email_pattern(), str("first.last+tag@mail.example.org")));
  EXPECT_FALSE(accepts(email_pattern(), str("not-an-email")));

  EXPECT_TRUE(accepts(ip_pattern(), str("192.168.0.1")));
  EXPECT_TRUE(accepts(ip_pattern(), str("10.0.0.1:8080")));
  EXPECT_FALSE(accepts(ip_pattern(), str("999.1.1.1")));
  EXPECT_FALSE(accepts(ip_pattern(), str("1.2.3")));

  EXPECT_TRUE(accepts(url_pattern(), str("https://example.com/path?x=1")));
  EXPECT_TRUE(accepts(url_pattern(), str("example.com")));
  EXPECT_FALSE(accepts(url_pattern(), str("example")));
}

TEST_F(BuiltinsTest, Hex)
{
  EXPECT_EQ(int_val(hex_pattern()->validate(str("ff")).value()), 255);
  EXPECT_EQ(int_val(hex_pattern()->validate(str("0x1F")).value()), 31);
  EXPECT_FALSE(accepts(hex_pattern(), str("xyz")));
  EXPECT_THROW((void)hex_pattern()->validate(integer(255)).value(), type_mismatch);
}

TEST_F(BuiltinsTest, HexColor)
{
  const value c = hex_color_pattern()->validate(str("color: #FFaa00;")).value();
  EXPECT_TRUE(isstr(c, "FFaa00"));
  EXPECT_FALSE(accepts(hex_color_pattern(), str("#fff")));
  EXPECT_FALSE(accepts(hex_color_pattern(), integer(0xffaa00)));
}

TEST_F(BuiltinsTest, DelimitedInteger)
{
  const pattern_ptr &p = delimited_int_pattern();
  EXPECT_EQ(p->repr(), "delimited_int");
  EXPECT_EQ(int_val(p->validate(str("1,000,000")).value()), 1000000);
  EXPECT_EQ(int_val(p->validate(str("42")).value()), 42);
  EXPECT_FALSE(accepts(p, integer(5)));
  EXPECT_FALSE(accepts(p, str("1,,0")));
}

TEST_F(BuiltinsTest, Datetime)
{
  const pattern_ptr &p = datetime_pattern();
  EXPECT_EQ(p->repr(), "datetime");
  const value d = p->validate(str("2024-01-01T00:00:00Z")).value();
  ASSERT_TRUE(isdatetime(d));
  EXPECT_EQ(to_display(d), "2024-01-01 00:00:00");
  EXPECT_TRUE(equal(p->validate(integer(0)).value(),
                    datetime(time_point {})));
  EXPECT_FALSE(accepts(p, str("tomorrow")));
  EXPECT_FALSE(accepts(p, nil));
}

TEST_F(BuiltinsTest, Path)
{
  const pattern_ptr &p = path_pattern();
  EXPECT_EQ(p->repr(), "path");
  const value x = p->validate(str("./no/such/dir/../file.txt")).value();
  ASSERT_TRUE(ispath(x));
  EXPECT_EQ(path_view(x), "no/such/file.txt");
  EXPECT_FALSE(accepts(p, integer(1)));
}

TEST_F(BuiltinsTest, SharedInstances)
{
  EXPECT_EQ(integer_pattern().get(), integer_pattern().get());
  EXPECT_FALSE(*delimited_int_pattern() == *integer_pattern());
}

TEST_F(BuiltinsTest, InstallRegistersCoreAndFormats)
{
  pattern_table table {"builtins"};
  install_builtins(table);

  EXPECT_EQ(table.get(types::integer), integer_pattern());
  EXPECT_EQ(table.get(std::string("int")), integer_pattern());
  EXPECT_EQ(table.get(types::str), string_pattern());
  EXPECT_EQ(table.get(types::dict), dict_pattern());
  EXPECT_EQ(table.get(std::string("email")), email_pattern());
  EXPECT_EQ(table.get(std::string("wide_bool")), wide_boolean_pattern());
  EXPECT_EQ(table.get(types::datetime), datetime_pattern());
  EXPECT_EQ(table.get(types::path), path_pattern());

  // Extra patterns do not take over their origin type
  EXPECT_EQ(table.get(types::boolean), boolean_pattern());

  const size_t size = table.size();
  install_builtins(table, false);
  EXPECT_EQ(table.size(), size);
}

TEST_F(BuiltinsTest, DefaultContextHasBuiltins)
{
  const context &ctx = context::instance();
  EXPECT_EQ(ctx.global().get(std::string("hex")), hex_pattern());
  EXPECT_EQ(ctx.global().get(types::real), float_pattern());
}

} // anonymous namespace
