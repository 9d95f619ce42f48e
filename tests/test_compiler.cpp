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
#include "sieve/compiler.hpp"
#include "sieve/descriptor.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/registry.hpp"
#include "sieve/variants.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace {

using namespace sieve;

class DescriptorTest: public testing::Test { };

class CompilerTest: public testing::Test {
  protected:
  CompilerTest()
  { install_builtins(ctx.global()); }

  pattern_ptr
  build(const descriptor &desc, extra_policy policy = extra_policy::allow)
  { return compile(desc, policy, ctx); }

  context ctx;
};


TEST_F(DescriptorTest, StructuralEquality)
{
  EXPECT_TRUE(descriptor {types::integer} == descriptor {types::integer});
  EXPECT_FALSE(descriptor {types::integer} == descriptor {types::str});
  EXPECT_TRUE(descriptor {"a"} == descriptor {str("a")});
  EXPECT_FALSE(descriptor {"a"} == descriptor::raw(str("a")));
  EXPECT_TRUE(descriptor::list_of(types::integer) == descriptor::list_of(types::integer));
  EXPECT_FALSE(descriptor::list_of(types::integer) == descriptor::set_of(types::integer));
  EXPECT_TRUE(descriptor::one_of({types::integer, "x"}) ==
              descriptor::one_of({types::integer, "x"}));
  EXPECT_EQ(descriptor::list_of(types::integer).hash(),
            descriptor::list_of(types::integer).hash());

  // Patterns compare by pattern identity
  EXPECT_TRUE(descriptor {pattern::of(types::str)} == descriptor {pattern::of(types::str)});

  // Annotations carry functions, so only the same descriptor is equal
  const descriptor a = descriptor::annotated(types::integer, {}, "a");
  EXPECT_TRUE(a == a);
  EXPECT_FALSE(a == descriptor::annotated(types::integer, {}, "a"));

  const descriptor f = descriptor::callable([](value x) { return x; }, "id");
  EXPECT_TRUE(f == f);
  EXPECT_FALSE(f == descriptor::callable([](value x) { return x; }, "id"));
}

TEST_F(DescriptorTest, Repr)
{
  EXPECT_EQ(descriptor {types::integer}.repr(), "integer");
  EXPECT_EQ(descriptor {"int"}.repr(), "'int'");
  EXPECT_EQ(descriptor::raw(str("a")).repr(), "raw('a')");
  EXPECT_EQ(descriptor::regex("a+").repr(), "regex('a+')");
  EXPECT_EQ(descriptor::one_of({types::integer, "x"}).repr(), "integer | 'x'");
  EXPECT_EQ(descriptor::dict_of(types::str, types::integer).repr(), "dict[str, integer]");
  EXPECT_EQ(descriptor::container(container_kind::tuple).repr(), "tuple");
  EXPECT_EQ(descriptor::forward("node").repr(), "'node'");
  EXPECT_EQ(descriptor::annotated(types::integer, {}, "id").repr(),
            "annotated[integer, id]");
  EXPECT_EQ(container_kind_name(container_kind::set), "set");
}

TEST_F(DescriptorTest, RejectsEmptyParts)
{
  EXPECT_THROW(descriptor {pattern_ptr {}}, std::invalid_argument);
  EXPECT_THROW((void)descriptor::callable(nullptr, "none"), std::invalid_argument);
}


TEST_F(CompilerTest, PatternsPassThrough)
{
  const pattern_ptr p = pattern::of(types::bytes);
  EXPECT_EQ(build(p), p);
  EXPECT_EQ(ctx.cache().size(), 0u);
}

TEST_F(CompilerTest, TypesUseRegistry)
{
  EXPECT_EQ(build(types::integer), builtins::integer_pattern());
  EXPECT_EQ(build(types::none), builtins::none_pattern());
  EXPECT_EQ(build(types::any), builtins::any_pattern());

  // Without the registry a type only checks instances
  const pattern_ptr plain = build(types::integer, extra_policy::ignore);
  EXPECT_EQ(plain->repr(), "integer");
  EXPECT_TRUE(plain->validate(integer(1)).valid());
  EXPECT_TRUE(plain->validate(str("1")).failed());

  const type widget = type::declare("compiler_test_widget");
  const pattern_ptr w = build(widget);
  EXPECT_EQ(w->repr(), "compiler_test_widget");
  EXPECT_TRUE(w->validate(instance(widget, nullptr)).valid());
  EXPECT_TRUE(w->validate(integer(1)).failed());
}

TEST_F(CompilerTest, TextDescriptors)
{
  EXPECT_EQ(build("int"), builtins::integer_pattern());

  const pattern_ptr word = build("hello");
  EXPECT_EQ(word->repr(), "'hello'");
  EXPECT_TRUE(word->validate(str("hello")).valid());
  EXPECT_TRUE(word->validate(str("HELLO")).failed());

  const pattern_ptr digits = build("re:\\d+");
  EXPECT_EQ(digits->repr(), "'\\d+'");
  EXPECT_TRUE(digits->validate(str("12")).valid());
  EXPECT_TRUE(digits->validate(str("a12")).failed());

  const pattern_ptr groups = build("rep:(\\d+)-(\\d+)");
  const value m = groups->validate(str("1-2 and more")).value();
  EXPECT_TRUE(isstr(seq_ref(m, 2), "2"));
}

TEST_F(CompilerTest, TextAlternatives)
{
  const pattern_ptr named = build("int|bool");
  EXPECT_EQ(int_val(named->validate(str("3")).value()), 3);
  EXPECT_TRUE(is(named->validate(str("true")).value(), True));

  const pattern_ptr words = build("a|b|");
  EXPECT_EQ(words->repr(), "'a'|'b'");
  EXPECT_TRUE(words->validate(str("b")).valid());
  EXPECT_TRUE(words->validate(str("c")).failed());

  EXPECT_EQ(build("int|int"), builtins::integer_pattern());
}

TEST_F(CompilerTest, TextWithRegexCharacters)
{
  const pattern_ptr p = build("a.b");
  EXPECT_TRUE(isstr(p->validate(str("a.b")).value(), "a.b"));
  EXPECT_TRUE(p->validate(str("axb")).valid());
  EXPECT_TRUE(p->validate(str("ab")).failed());

  // Not a valid expression: matched literally
  const pattern_ptr bracket = build("[");
  EXPECT_EQ(bracket->repr(), "'['");
  EXPECT_TRUE(bracket->validate(str("[")).valid());
}

TEST_F(CompilerTest, RawAndNone)
{
  const pattern_ptr raw = build(descriptor::raw(str("int")));
  EXPECT_EQ(raw->repr(), "'int'");
  EXPECT_TRUE(raw->validate(str("int")).valid());
  EXPECT_TRUE(raw->validate(integer(1)).failed());

  EXPECT_TRUE(build(descriptor::raw(integer(3)))->validate(integer(3)).valid());
  EXPECT_EQ(build(nil), builtins::none_pattern());
}

TEST_F(CompilerTest, ContainerLiterals)
{
  const pattern_ptr sw = build(dict({{str("yes"), True}, {str("no"), False}}));
  EXPECT_TRUE(is(sw->validate(str("no")).value(), False));
  EXPECT_TRUE(sw->validate(str("maybe")).failed());

  const pattern_ptr choice = build(list({integer(1), integer(2), nil}));
  EXPECT_TRUE(choice->validate(integer(2)).valid());
  EXPECT_TRUE(choice->validate(nil).valid());
  EXPECT_TRUE(choice->validate(integer(3)).failed());
}

TEST_F(CompilerTest, OtherLiteralsFollowPolicy)
{
  const pattern_ptr allowed = build(integer(5));
  EXPECT_TRUE(allowed->validate(integer(7)).valid());
  EXPECT_TRUE(allowed->validate(str("7")).failed());

  EXPECT_EQ(build(integer(5), extra_policy::ignore), builtins::any_pattern());
  EXPECT_THROW((void)build(integer(5), extra_policy::forbid), ambiguous_descriptor);
}

TEST_F(CompilerTest, RegexDescriptor)
{
  const pattern_ptr p = build(descriptor::regex("(\\w+)"));
  EXPECT_EQ(p->repr(), "'(\\w+)'");
  EXPECT_TRUE(isstr(seq_ref(p->validate(str("ab cd")).value(), 1), "ab"));
}

TEST_F(CompilerTest, Containers)
{
  const pattern_ptr ints = build(descriptor::list_of(types::integer));
  EXPECT_EQ(ints->repr(), "list[int]");
  EXPECT_TRUE(equal(ints->validate(str("['1', 2]")).value(),
                    list({integer(1), integer(2)})));

  // Keys are compiled without the registry: bytes are not decoded
  const pattern_ptr mapping = build(descriptor::dict_of(types::str, types::integer));
  EXPECT_EQ(mapping->repr(), "dict[str, int]");
  EXPECT_TRUE(equal(mapping->validate(dict({{str("a"), str("1")}})).value(),
                    dict({{str("a"), integer(1)}})));
  EXPECT_TRUE(mapping->validate(dict({{bytes("a"), integer(1)}})).failed());

  EXPECT_EQ(build(descriptor::container(container_kind::list))->repr(), "list[any]");
  EXPECT_EQ(build(descriptor::tuple_of(types::str))->repr(), "tuple[str]");
}

TEST_F(CompilerTest, UnionPutsLiteralsFirst)
{
  const pattern_ptr p = build(descriptor::one_of({types::integer, "1"}));
  EXPECT_TRUE(isstr(p->validate(str("1")).value(), "1"));
  EXPECT_EQ(int_val(p->validate(str("2")).value()), 2);

  EXPECT_EQ(build(descriptor::one_of({types::integer, types::integer})),
            builtins::integer_pattern());
  EXPECT_EQ(build(descriptor::one_of({})), builtins::any_pattern());

  const pattern_ptr maybe = build(descriptor::one_of({types::integer, nil}));
  EXPECT_TRUE(maybe->validate(nil).valid());
  EXPECT_EQ(int_val(maybe->validate(str("4")).value()), 4);
}

TEST_F(CompilerTest, ForwardReference)
{
  const pattern_ptr p = build(descriptor::forward("later"));
  EXPECT_TRUE(p->validate(integer(1)).failed());

  ctx.global().set(builtins::integer_pattern(), "later");
  EXPECT_EQ(int_val(p->validate(str("5")).value()), 5);
}

TEST_F(CompilerTest, CompiledPatternsOutliveTheirContext)
{
  pattern_ptr ref;
  pattern_ptr numbers;
  {
    context scoped;
    install_builtins(scoped.global());
    scoped.global().set(builtins::integer_pattern(), "later");
    ref = compile(descriptor::forward("later"), extra_policy::allow, scoped);
    numbers = compile(descriptor::list_of(types::integer), extra_policy::allow, scoped);
    EXPECT_EQ(int_val(ref->validate(str("5")).value()), 5);
  }

  EXPECT_THROW((void)ref->validate(str("5")).value(), unresolved_reference);
  EXPECT_TRUE(equal(numbers->validate(str("[1, 2]")).value(),
                    list({integer(1), integer(2)})));
}

TEST_F(CompilerTest, Callable)
{
  const pattern_ptr len = build(descriptor::callable(
      [](value x) { return integer(static_cast<long long>(length(x))); },
      "length", types::str, types::integer));
  EXPECT_EQ(len->repr(), "length");
  EXPECT_EQ(int_val(len->validate(str("abc")).value()), 3);
  EXPECT_THROW((void)len->validate(integer(3)).value(), type_mismatch);

  const pattern_ptr wrong = build(descriptor::callable(
      [](value x) { return x; }, "same", std::nullopt, types::integer));
  EXPECT_TRUE(wrong->validate(str("x")).failed());
}

TEST_F(CompilerTest, AnnotatedCopiesBase)
{
  const descriptor desc = descriptor::annotated(
      types::integer, {[](value x) { return int_val(x) > 0; }}, "positive int");
  const pattern_ptr p = build(desc);
  EXPECT_EQ(p->repr(), "positive int");
  EXPECT_EQ(int_val(p->validate(str("5")).value()), 5);
  EXPECT_THROW((void)p->validate(str("-5")).value(), validator_rejected);

  // The registered pattern is left alone
  EXPECT_TRUE(builtins::integer_pattern()->validate(str("-5")).valid());
  EXPECT_EQ(builtins::integer_pattern()->repr(), "int");
}

TEST_F(CompilerTest, ForbidRejectsConflicts)
{
  pattern_table &local = ctx.create_local("strict");
  const pattern_ptr custom = std::make_shared<direct_type>(types::integer);
  local.set(custom, "int");

  EXPECT_THROW((void)build("int", extra_policy::forbid), ambiguous_descriptor);
  EXPECT_EQ(build("int"), custom);

  const pattern_ptr literal = build("int", extra_policy::ignore);
  EXPECT_TRUE(literal->validate(str("int")).valid());
  EXPECT_TRUE(literal->validate(integer(1)).failed());

  // Same pattern in both tables is no conflict
  local.set(builtins::integer_pattern(), "int");
  EXPECT_EQ(build("int", extra_policy::forbid), builtins::integer_pattern());
}

TEST_F(CompilerTest, CacheHits)
{
  const pattern_ptr a = build(types::integer);
  const pattern_ptr b = build(types::integer);
  EXPECT_EQ(a, b);
  EXPECT_EQ(ctx.cache().hits(), 1u);
  EXPECT_EQ(ctx.cache().misses(), 1u);

  const pattern_ptr list_a = build(descriptor::list_of(types::str));
  const pattern_ptr list_b = build(descriptor::list_of(types::str));
  EXPECT_EQ(list_a, list_b);

  ctx.cache().clear();
  EXPECT_EQ(ctx.cache().size(), 0u);
  EXPECT_EQ(ctx.cache().hits(), 0u);
}

TEST_F(CompilerTest, CacheFollowsRegistryChanges)
{
  const pattern_ptr before = build("custom");
  EXPECT_EQ(before->repr(), "'custom'");

  ctx.global().set(builtins::hex_pattern(), "custom");
  EXPECT_EQ(build("custom"), builtins::hex_pattern());
}

TEST_F(CompilerTest, CacheIsScopedByLocalTable)
{
  pattern_table &a = ctx.create_local("a");
  a.set(pattern::of(types::integer));
  const pattern_ptr in_a = build(types::integer);

  pattern_table &b = ctx.create_local("b");
  b.set(std::make_shared<direct>(integer(1)));
  const pattern_ptr in_b = build(types::integer);

  EXPECT_FALSE(*in_a == *in_b);
  EXPECT_TRUE(in_b->validate(integer(1)).valid());
  EXPECT_TRUE(in_b->validate(integer(2)).failed());

  ctx.switch_local("a");
  EXPECT_EQ(build(types::integer), in_a);

  ctx.reset_local();
  EXPECT_EQ(build(types::integer), builtins::integer_pattern());
}

TEST_F(CompilerTest, Policies)
{
  EXPECT_EQ(parse_extra_policy("allow"), extra_policy::allow);
  EXPECT_EQ(parse_extra_policy("ignore"), extra_policy::ignore);
  EXPECT_EQ(parse_extra_policy("forbid"), extra_policy::forbid);
  EXPECT_EQ(parse_extra_policy("reject"), extra_policy::forbid);
  EXPECT_THROW((void)parse_extra_policy("bogus"), std::invalid_argument);
  EXPECT_EQ(extra_policy_name(extra_policy::ignore), "ignore");
}

TEST_F(CompilerTest, DefaultContext)
{
  EXPECT_EQ(pattern::to(types::integer), builtins::integer_pattern());
  EXPECT_EQ(compile("email"), builtins::email_pattern());
}

} // anonymous namespace
