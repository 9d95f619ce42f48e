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


#include "sieve/format.hpp"
#include "sieve/hash.hpp"
#include "sieve/type.hpp"
#include "sieve/value.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <string>

namespace {

using namespace sieve;

class ValueTest: public testing::Test { };


TEST_F(ValueTest, NumbersCompareAcrossTags)
{
  EXPECT_TRUE(equal(integer(1), real(1.0)));
  EXPECT_TRUE(equal(True, integer(1)));
  EXPECT_TRUE(equal(False, real(0)));
  EXPECT_FALSE(equal(integer(1), str("1")));
  EXPECT_FALSE(equal(integer(1), integer(2)));

  // Equal numbers hash alike
  EXPECT_EQ(chash(integer(1)), chash(real(1.0)));
}

TEST_F(ValueTest, SetIsDeduplicatedAndUnordered)
{
  const value s = set({integer(1), integer(2), integer(1)});
  EXPECT_EQ(length(s), 2u);

  const value a = set({integer(1), integer(2)});
  const value b = set({integer(2), integer(1)});
  EXPECT_TRUE(equal(a, b));
  EXPECT_EQ(chash(a), chash(b));

  // Order still matters for lists
  EXPECT_FALSE(equal(list({integer(1), integer(2)}), list({integer(2), integer(1)})));
}

TEST_F(ValueTest, DictKeepsFirstPositionAndLastValue)
{
  const value d = dict({
    {str("a"), integer(1)},
    {str("b"), integer(2)},
    {str("a"), integer(3)},
  });
  EXPECT_EQ(length(d), 2u);

  value result = nil;
  ASSERT_TRUE(dict_get(d, str("a"), result));
  EXPECT_EQ(int_val(result), 3);
  EXPECT_FALSE(dict_get(d, str("c"), result));
  EXPECT_EQ(repr(d), "{'a': 3, 'b': 2}");
}

TEST_F(ValueTest, ReprFollowsLiteralSyntax)
{
  EXPECT_EQ(repr(nil), "None");
  EXPECT_EQ(repr(True), "True");
  EXPECT_EQ(repr(integer(-5)), "-5");
  EXPECT_EQ(repr(real(1.0)), "1.0");
  EXPECT_EQ(repr(real(2.5)), "2.5");
  EXPECT_EQ(repr(str("abc")), "'abc'");
  EXPECT_EQ(repr(str("it's")), "\"it's\"");
  EXPECT_EQ(repr(bytes("ab")), "b'ab'");
  EXPECT_EQ(repr(list({integer(1), str("a")})), "[1, 'a']");
  EXPECT_EQ(repr(tuple({integer(1)})), "(1,)");
  EXPECT_EQ(repr(tuple({})), "()");
  EXPECT_EQ(repr(set({})), "set()");
  EXPECT_EQ(repr(dict({})), "{}");
}

TEST_F(ValueTest, DisplayFormDoesNotQuoteTopLevelText)
{
  EXPECT_EQ(to_display(str("abc")), "abc");
  EXPECT_EQ(to_display(list({str("abc")})), "['abc']");
  EXPECT_EQ(std::format("{:d}", str("x")), "x");
  EXPECT_EQ(std::format("{}", str("x")), "'x'");
}

TEST_F(ValueTest, AccessorsCheckTags)
{
  EXPECT_THROW((void)int_val(str("x")), std::invalid_argument);
  EXPECT_THROW((void)str_view(integer(1)), std::invalid_argument);
  EXPECT_THROW((void)length(integer(1)), std::invalid_argument);
  EXPECT_THROW((void)seq_ref(list({}), 0), std::out_of_range);
  EXPECT_EQ(str_view(str("abc")), "abc");
}

TEST_F(ValueTest, Truthiness)
{
  EXPECT_FALSE(truthy(nil));
  EXPECT_FALSE(truthy(integer(0)));
  EXPECT_FALSE(truthy(str("")));
  EXPECT_FALSE(truthy(list({})));
  EXPECT_TRUE(truthy(str("x")));
  EXPECT_TRUE(truthy(real(0.5)));
}


TEST_F(ValueTest, DatetimeKeepsMicroseconds)
{
  using std::chrono::microseconds;

  const value epoch = datetime(time_point {});
  EXPECT_EQ(repr(epoch), "datetime('1970-01-01 00:00:00')");
  EXPECT_EQ(to_display(datetime(time_point {microseconds {1500000}})),
            "1970-01-01 00:00:01.500000");
  EXPECT_EQ(to_display(datetime(time_point {microseconds {-1}})),
            "1969-12-31 23:59:59.999999");

  EXPECT_TRUE(equal(epoch, datetime(time_point {})));
  EXPECT_FALSE(equal(epoch, integer(0)));
  EXPECT_EQ(type_of(epoch), types::datetime);
  EXPECT_TRUE(truthy(epoch));
  EXPECT_THROW((void)datetime_val(integer(0)), std::invalid_argument);
}

TEST_F(ValueTest, PathIsNormalized)
{
  EXPECT_TRUE(equal(path("a//b/./c/"), path("a/b/c")));
  EXPECT_EQ(path_view(path("a/b/../c")), "a/c");
  EXPECT_EQ(path_view(path("/")), "/");
  EXPECT_EQ(path_view(path("")), ".");
  EXPECT_EQ(repr(path("a/b")), "path('a/b')");
  EXPECT_EQ(to_display(path("a/b")), "a/b");

  EXPECT_FALSE(equal(path("a"), str("a")));
  EXPECT_EQ(type_of(path("a")), types::path);
  EXPECT_THROW((void)path_view(str("a")), std::invalid_argument);
}


class TypeTest: public testing::Test { };

TEST_F(TypeTest, BuiltinHierarchy)
{
  EXPECT_TRUE(isinstance(True, types::integer));
  EXPECT_TRUE(isinstance(True, types::number));
  EXPECT_FALSE(isinstance(integer(1), types::boolean));
  EXPECT_TRUE(isinstance(real(1.5), types::number));
  EXPECT_FALSE(isinstance(real(1.5), types::integer));
  EXPECT_TRUE(isinstance(str("x"), types::any));
  EXPECT_TRUE(isinstance(nil, types::none));
  EXPECT_TRUE(isinstance(str("x"), std::vector<type> {types::integer, types::str}));
  EXPECT_TRUE(type_of(tuple({})) == types::tuple);
}

TEST_F(TypeTest, DeclaredClasses)
{
  const type point = type::declare("type_test_point");
  const type point3d = type::declare("type_test_point3d", point);

  int payload = 0;
  const value p = instance(point3d, &payload);
  EXPECT_TRUE(type_of(p) == point3d);
  EXPECT_TRUE(isinstance(p, point));
  EXPECT_FALSE(isinstance(instance(point, nullptr), point3d));
  EXPECT_EQ(instance_ptr(p), &payload);

  EXPECT_TRUE(type::lookup("type_test_point") == std::optional<type> {point});
  EXPECT_TRUE(type::lookup("integer") == std::optional<type> {types::integer});
  EXPECT_FALSE(type::lookup("type_test_missing").has_value());
  EXPECT_THROW(type::declare("type_test_point"), std::invalid_argument);
}

} // anonymous namespace
