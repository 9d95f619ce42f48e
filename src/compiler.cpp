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


#include "sieve/compiler.hpp"
#include "sieve/builtins.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/hash.hpp"
#include "sieve/logging.hpp"
#include "sieve/registry.hpp"
#include "sieve/utilities/execution_timer.hpp"
#include "sieve/variants.hpp"

#include <algorithm>
#include <mutex>


std::string_view
sieve::extra_policy_name(extra_policy policy) noexcept
{
  switch (policy)
  {
    case extra_policy::allow: return "allow";
    case extra_policy::ignore: return "ignore";
    case extra_policy::forbid: return "forbid";
  }
  std::terminate();
}

sieve::extra_policy
sieve::parse_extra_policy(std::string_view name)
{
  if (name == "allow")
    return extra_policy::allow;
  if (name == "ignore")
    return extra_policy::ignore;
  if (name == "forbid" or name == "reject")
    return extra_policy::forbid;
  throw std::invalid_argument {std::format("undefined extra policy '{}'", name)};
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Cache
//
size_t
sieve::compile_cache::key_hash::operator () (const key_type &key) const noexcept
{
  size_t seed = key.desc.hash();
  hash_combine(seed, static_cast<int>(key.policy));
  hash_combine(seed, key.scope);
  return seed;
}

sieve::pattern_ptr
sieve::compile_cache::find(const key_type &key, uint64_t global_version,
                           uint64_t local_version)
{
  const auto it = m_entries.find(key);
  if (it == m_entries.end())
  {
    m_misses++;
    return nullptr;
  }

  const entry &e = it->second;
  if (e.global_version != global_version or e.local_version != local_version)
  {
    debug("stale compile cache entry for {}", key.desc.repr());
    m_entries.erase(it);
    m_misses++;
    return nullptr;
  }

  m_hits++;
  return e.pat;
}

void
sieve::compile_cache::store(key_type key, entry e)
{ m_entries.insert_or_assign(std::move(key), std::move(e)); }

void
sieve::compile_cache::clear() noexcept
{
  m_entries.clear();
  m_hits = 0;
  m_misses = 0;
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Compiler
//
static sieve::pattern_ptr
_compile(const sieve::descriptor &desc, sieve::extra_policy policy,
         sieve::context &ctx);

static std::string
_quoted(std::string_view text)
{ return std::format("'{}'", text); }

/**
 * Registry override for a key
 *
 * \return The registered pattern or null
 * \throws ambiguous_descriptor Under `forbid`, if the global and the local
 *         tables hold different patterns
 */
static sieve::pattern_ptr
_registry_lookup(const sieve::table_key &key, sieve::extra_policy policy,
                 const sieve::context &ctx)
{
  using namespace sieve;

  if (policy == extra_policy::ignore)
    return nullptr;

  const pattern_table *local = ctx.local();
  const pattern_ptr in_local = local ? local->get(key) : nullptr;
  const pattern_ptr in_global = ctx.global().get(key);

  if (policy == extra_policy::forbid and in_local and in_global and
      not (*in_local == *in_global))
  {
    throw ambiguous_descriptor {std::format(
        "{} is registered both in {} ({}) and in {} ({})", table_key_repr(key),
        local->name(), in_local->repr(), ctx.global().name(), in_global->repr())};
  }

  if (in_local)
  {
    debug("registry override for {} from {}: {}", table_key_repr(key),
          local->name(), in_local->repr());
    return in_local;
  }
  return in_global;
}

// Single pattern, or a union of distinct alternatives
static sieve::pattern_ptr
_make_union(const std::vector<sieve::pattern_ptr> &alternatives)
{
  using namespace sieve;

  std::vector<pattern_ptr> distinct;
  for (const pattern_ptr &alt : alternatives)
  {
    const bool seen = std::ranges::any_of(
        distinct, [&](const pattern_ptr &p) { return *p == *alt; });
    if (not seen)
      distinct.push_back(alt);
  }

  if (distinct.empty())
    return builtins::any_pattern();
  if (distinct.size() == 1)
    return distinct.front();
  return std::make_shared<union_pattern>(std::move(distinct));
}

static sieve::pattern_ptr
_literal_alternative(sieve::value x)
{
  if (sieve::isnil(x))
    return sieve::builtins::none_pattern();
  return std::make_shared<sieve::direct>(x);
}

static bool
_looks_like_regex(std::string_view text)
{ return text.find_first_of(".^$*+?()[]{}\\") != std::string_view::npos; }

static sieve::pattern_ptr
_compile_text(sieve::value x, sieve::extra_policy policy, sieve::context &ctx)
{
  using namespace sieve;

  const std::string_view text = str_view(x);
  if (const pattern_ptr p = _registry_lookup(std::string(text), policy, ctx))
    return p;

  if (text.starts_with("re:"))
  {
    const std::string_view regex = text.substr(3);
    return std::make_shared<pattern>(pattern_config {
        .mode = match_mode::regex_match,
        .origin = types::str,
        .regex = std::string(regex),
        .alias = _quoted(regex),
    });
  }

  if (text.starts_with("rep:"))
  {
    const std::string_view regex = text.substr(4);
    return std::make_shared<regex_pattern>(std::string(regex), _quoted(regex));
  }

  if (text.find('|') != std::string_view::npos)
  {
    std::vector<pattern_ptr> alternatives;
    size_t start = 0;
    while (start <= text.size())
    {
      size_t end = text.find('|', start);
      if (end == std::string_view::npos)
        end = text.size();
      const std::string_view name = text.substr(start, end - start);
      if (not name.empty())
      {
        pattern_ptr alt = _registry_lookup(std::string(name), policy, ctx);
        alternatives.push_back(alt ? alt : std::make_shared<direct>(str(name)));
      }
      start = end + 1;
    }
    return _make_union(alternatives);
  }

  const pattern_ptr exact = std::make_shared<direct>(x);
  if (not _looks_like_regex(text))
    return exact;

  try
  {
    const pattern_ptr regex = std::make_shared<pattern>(pattern_config {
        .mode = match_mode::regex_match,
        .origin = types::str,
        .regex = std::string(text),
    });
    return std::make_shared<union_pattern>(std::vector<pattern_ptr> {exact, regex});
  }
  catch (const std::invalid_argument &exn)
  {
    debug("{} is matched literally: {}", _quoted(text), describe(exn));
    return exact;
  }
}

static sieve::pattern_ptr
_compile_literal(const sieve::literal_node &lit, sieve::extra_policy policy,
                 sieve::context &ctx)
{
  using namespace sieve;

  const value x = lit.x;
  if (isnil(x))
    return builtins::none_pattern();

  if (lit.raw)
  {
    if (isstr(x))
      return std::make_shared<direct>(x, _quoted(str_view(x)));
    return std::make_shared<direct>(x);
  }

  if (isstr(x))
    return _compile_text(x, policy, ctx);

  if (isdict(x))
  {
    std::vector<std::pair<value, switch_case>> cases;
    for (const auto &[key, result] : items(x))
      cases.emplace_back(key, switch_case {result});
    return std::make_shared<switch_pattern>(cases);
  }

  if (isseq(x))
  {
    std::vector<pattern_ptr> alternatives;
    for (const value elt : elements(x))
      alternatives.push_back(_literal_alternative(elt));
    return _make_union(alternatives);
  }

  switch (policy)
  {
    case extra_policy::allow:
      return pattern::of(type_of(x));
    case extra_policy::ignore:
      return builtins::any_pattern();
    case extra_policy::forbid:
      throw ambiguous_descriptor {
          std::format("no compilation rule for {}", lit.text)};
  }
  std::terminate();
}

static sieve::pattern_ptr
_compile_union(const std::vector<sieve::descriptor> &alternatives,
               sieve::extra_policy policy, sieve::context &ctx)
{
  using namespace sieve;

  // Literal alternatives are tried before general ones
  std::vector<descriptor> ordered = alternatives;
  std::stable_partition(ordered.begin(), ordered.end(), [](const descriptor &d) {
    return std::holds_alternative<literal_node>(d.data().node);
  });

  std::vector<pattern_ptr> patterns;
  for (const descriptor &alt : ordered)
  {
    if (const literal_node *lit = std::get_if<literal_node>(&alt.data().node))
      patterns.push_back(_literal_alternative(lit->x));
    else
      patterns.push_back(compile(alt, policy, ctx));
  }
  return _make_union(patterns);
}

static sieve::pattern_ptr
_compile_container(const sieve::container_node &n, sieve::context &ctx)
{
  using namespace sieve;

  const auto arg = [&](size_t i, extra_policy policy) {
    return i < n.args.size() ? compile(n.args[i], policy, ctx)
                             : builtins::any_pattern();
  };

  switch (n.kind)
  {
    case container_kind::dict:
      return std::make_shared<mapping_pattern>(arg(0, extra_policy::ignore),
                                               arg(1, extra_policy::allow));
    case container_kind::list:
      return std::make_shared<sequence_pattern>(tag::list, arg(0, extra_policy::allow));
    case container_kind::tuple:
      return std::make_shared<sequence_pattern>(tag::tuple, arg(0, extra_policy::allow));
    case container_kind::set:
      return std::make_shared<sequence_pattern>(tag::set, arg(0, extra_policy::allow));
  }
  std::terminate();
}

static sieve::pattern_ptr
_compile_callable(const sieve::callable_node &n)
{
  using namespace sieve;

  std::optional<std::vector<type>> accepts;
  if (n.param)
    accepts = std::vector<type> {*n.param};

  return std::make_shared<pattern>(pattern_config {
      .mode = match_mode::type_convert,
      .origin = n.result.value_or(types::any),
      .convert = [fn = n.fn](const pattern&, value x) -> std::optional<value> {
        return (*fn)(x);
      },
      .accepts = std::move(accepts),
      .alias = n.name,
  });
}

static sieve::pattern_ptr
_compile_annotated(const sieve::annotated_node &n, sieve::extra_policy policy,
                   sieve::context &ctx)
{
  using namespace sieve;

  const std::shared_ptr<pattern> result = compile(n.base, policy, ctx)->copy();
  if (n.alias)
    result->set_alias(*n.alias);
  for (const validator &fn : n.validators)
    result->add_validator(fn);
  result->refresh();
  return result;
}

static sieve::pattern_ptr
_compile(const sieve::descriptor &desc, sieve::extra_policy policy,
         sieve::context &ctx)
{
  using namespace sieve;

  const descriptor_node &node = desc.data().node;

  if (const type_node *n = std::get_if<type_node>(&node))
  {
    if (const pattern_ptr p = _registry_lookup(n->t, policy, ctx))
      return p;
    if (n->t == types::none)
      return builtins::none_pattern();
    if (n->t.is_any())
      return builtins::any_pattern();
    return std::make_shared<direct_type>(n->t, std::string(n->t.name()));
  }

  if (const literal_node *n = std::get_if<literal_node>(&node))
    return _compile_literal(*n, policy, ctx);

  if (const regex_node *n = std::get_if<regex_node>(&node))
    return std::make_shared<regex_pattern>(n->text, _quoted(n->text));

  if (const container_node *n = std::get_if<container_node>(&node))
    return _compile_container(*n, ctx);

  if (const union_node *n = std::get_if<union_node>(&node))
    return _compile_union(n->alternatives, policy, ctx);

  if (const forward_node *n = std::get_if<forward_node>(&node))
    return std::make_shared<forward_ref>(n->name, ctx);

  if (const callable_node *n = std::get_if<callable_node>(&node))
    return _compile_callable(*n);

  if (const annotated_node *n = std::get_if<annotated_node>(&node))
    return _compile_annotated(*n, policy, ctx);

  return std::get<pattern_node>(node).pat;
}


sieve::pattern_ptr
sieve::compile(const descriptor &desc, extra_policy policy, context &ctx)
{
  SIEVE_FUNCTION_BENCHMARK

  if (const pattern_node *n = std::get_if<pattern_node>(&desc.data().node))
    return n->pat;

  std::lock_guard lock {ctx.mutex()};
  const pattern_table *local = ctx.local();
  compile_cache::key_type key {desc, policy, local ? local->name() : ""};
  const uint64_t global_version = ctx.global().version();
  const uint64_t local_version = local ? local->version() : 0;

  if (const pattern_ptr hit = ctx.cache().find(key, global_version, local_version))
  {
    debug("compile cache hit: {} ({})", desc.repr(), extra_policy_name(policy));
    return hit;
  }

  debug("compile cache miss: {} ({})", desc.repr(), extra_policy_name(policy));
  const pattern_ptr result = _compile(desc, policy, ctx);
  ctx.cache().store(std::move(key), {result, global_version, local_version});
  return result;
}

sieve::pattern_ptr
sieve::compile(const descriptor &desc, extra_policy policy)
{ return compile(desc, policy, context::instance()); }

sieve::pattern_ptr
sieve::pattern::to(const descriptor &desc)
{ return compile(desc, extra_policy::allow, context::instance()); }
