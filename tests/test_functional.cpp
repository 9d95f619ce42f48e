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
#include "sieve/functional.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

namespace {

using namespace sieve;
namespace fn = sieve::functional;

class FunctionalTest: public testing::Test {
  protected:
  static const pattern_ptr&
  LIST()
  { return builtins::list_pattern(); }

  static value
  run(const pattern_ptr &p, std::string_view text)
  { return p->validate(str(text)).value(); }
};


TEST_F(FunctionalTest, Index)
{
  const pattern_ptr first = fn::index(LIST(), 0);
  EXPECT_EQ(first->repr(), "list[0]");
  EXPECT_EQ(int_val(run(first, "[1, 2]")), 1);
  EXPECT_EQ(int_val(run(fn::index(LIST(), -1), "[1, 2]")), 2);

  const validate_result out = fn::index(LIST(), 5)->validate(str("[1, 2]"));
  ASSERT_TRUE(out.failed());
  EXPECT_THROW((void)out.value(), conversion_failure);

  EXPECT_TRUE(isstr(run(fn::index(builtins::string_pattern(), 1), "abc"), "b"));
}

TEST_F(FunctionalTest, BaseFailureIsKept)
{
  const validate_result out = fn::index(LIST(), 0)->validate(str("x"));
  ASSERT_TRUE(out.failed());
  EXPECT_THROW((void)out.value(), pattern_mismatch);
}

TEST_F(FunctionalTest, Slice)
{
  const pattern_ptr tail = fn::slice(LIST(), 1, std::nullopt);
  EXPECT_EQ(tail->repr(), "list[1:]");
  EXPECT_TRUE(equal(run(tail, "[1, 2, 3]"), list({integer(2), integer(3)})));

  const pattern_ptr odd = fn::slice(LIST(), 0, 3, 2);
  EXPECT_EQ(odd->repr(), "list[0:3:2]");
  EXPECT_TRUE(equal(run(odd, "[1, 2, 3]"), list({integer(1), integer(3)})));

  const pattern_ptr reversed = fn::slice(LIST(), -1, -4, -1);
  EXPECT_TRUE(equal(run(reversed, "[1, 2, 3]"),
                    list({integer(3), integer(2), integer(1)})));

  // Out of range bounds are clamped
  EXPECT_TRUE(equal(run(fn::slice(LIST(), 1, 10), "[1, 2]"), list({integer(2)})));

  EXPECT_TRUE(isstr(run(fn::slice(builtins::string_pattern(), 0, 2), "hello"), "he"));

  // No bounds, no change
  EXPECT_EQ(fn::slice(LIST(), std::nullopt, std::nullopt), LIST());
  EXPECT_THROW((void)fn::slice(LIST(), 0, 1, 0), std::invalid_argument);
}

TEST_F(FunctionalTest, MapAndFilter)
{
  const pattern_ptr doubled = fn::map(LIST(), [](value x) {
    return integer(int_val(x) * 2);
  }, "double");
  EXPECT_EQ(doubled->repr(), "list.map(double)");
  EXPECT_TRUE(equal(run(doubled, "[1, 2]"), list({integer(2), integer(4)})));

  const pattern_ptr odd = fn::filter(LIST(), [](value x) {
    return int_val(x) % 2 != 0;
  }, "odd");
  EXPECT_EQ(odd->repr(), "list.filter(odd)");
  EXPECT_TRUE(equal(run(odd, "[1, 2, 3]"), list({integer(1), integer(3)})));
}

TEST_F(FunctionalTest, Sum)
{
  const pattern_ptr total = fn::sum(LIST());
  EXPECT_EQ(total->repr(), "sum(list)");

  const value a = run(total, "[1, 2, 3]");
  ASSERT_TRUE(isint(a));
  EXPECT_EQ(int_val(a), 6);

  const value b = run(total, "[1, 2.5]");
  ASSERT_TRUE(isreal(b));
  EXPECT_EQ(real_val(b), 3.5);

  EXPECT_TRUE(total->validate(str("['a']")).failed());
}

TEST_F(FunctionalTest, Reduce)
{
  const auto larger = [](value a, value b) {
    return int_val(a) >= int_val(b) ? a : b;
  };
  const pattern_ptr max = fn::reduce(LIST(), larger, std::nullopt, "max");
  EXPECT_EQ(max->repr(), "list.reduce(max)");
  EXPECT_EQ(int_val(run(max, "[3, 9, 4]")), 9);
  EXPECT_TRUE(max->validate(str("[]")).failed());

  const pattern_ptr max0 = fn::reduce(LIST(), larger, integer(0), "max");
  EXPECT_EQ(int_val(run(max0, "[]")), 0);
}

TEST_F(FunctionalTest, TextOperations)
{
  const pattern_ptr joined = fn::join(LIST(), "-");
  EXPECT_EQ(joined->repr(), "list.join('-')");
  EXPECT_TRUE(isstr(run(joined, "['a', 'b', 'c']"), "a-b-c"));

  const pattern_ptr up = fn::upper(builtins::string_pattern());
  EXPECT_EQ(up->repr(), "str.upper()");
  EXPECT_TRUE(isstr(run(up, "abC"), "ABC"));
  EXPECT_TRUE(isstr(run(fn::lower(builtins::string_pattern()), "AbC"), "abc"));
}

TEST_F(FunctionalTest, GetItem)
{
  const pattern_ptr a = fn::get_item(builtins::dict_pattern(), str("a"));
  EXPECT_EQ(a->repr(), "dict.a");
  EXPECT_EQ(int_val(run(a, "{'a': 1}")), 1);
  EXPECT_TRUE(a->validate(str("{'b': 1}")).failed());

  const pattern_ptr with_fallback =
      fn::get_item(builtins::dict_pattern(), str("a"), integer(0));
  EXPECT_EQ(int_val(run(with_fallback, "{'b': 1}")), 0);

  const pattern_ptr second = fn::get_item(LIST(), integer(1), integer(-1));
  EXPECT_EQ(int_val(run(second, "[5, 6]")), 6);
  EXPECT_EQ(int_val(run(second, "[5]")), -1);
}

TEST_F(FunctionalTest, Step)
{
  const pattern_ptr inc = fn::step(builtins::integer_pattern(), [](value x) {
    return integer(int_val(x) + 1);
  }, "inc", types::integer);
  EXPECT_EQ(inc->repr(), "inc(int)");
  EXPECT_EQ(inc->origin(), types::integer);
  EXPECT_EQ(int_val(run(inc, "41")), 42);

  // Steps over equal bases with equal names are the same pattern
  const pattern_ptr again = fn::step(builtins::integer_pattern(), [](value x) {
    return x;
  }, "inc", types::integer);
  EXPECT_TRUE(*inc == *again);
  EXPECT_FALSE(*inc == *fn::step(builtins::integer_pattern(), [](value x) {
    return x;
  }, "dec", types::integer));
}

TEST_F(FunctionalTest, Chaining)
{
  const pattern_ptr p = fn::upper(fn::join(fn::map(LIST(), [](value x) {
    return str(to_display(x));
  }, "str"), ""));
  EXPECT_EQ(p->repr(), "list.map(str).join('').upper()");
  EXPECT_TRUE(isstr(run(p, "['a', 1, 'b']"), "A1B"));
}

} // anonymous namespace
