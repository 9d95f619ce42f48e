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


#include "sieve/descriptor.hpp"
#include "sieve/format.hpp"
#include "sieve/hash.hpp"

#include <stdexcept>
#include <type_traits>


std::string_view
sieve::container_kind_name(container_kind kind) noexcept
{
  switch (kind)
  {
    case container_kind::list: return "list";
    case container_kind::tuple: return "tuple";
    case container_kind::set: return "set";
    case container_kind::dict: return "dict";
  }
  std::terminate();
}


// Structural hash of a node; the variant index keeps kinds apart
static size_t
_hash_node(const sieve::descriptor_node &node)
{
  using namespace sieve;

  size_t seed = node.index();
  std::visit([&seed](const auto &n) {
    using node_type = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<node_type, pattern_node>)
      hash_combine(seed, n.pat->hash());
    else if constexpr (std::is_same_v<node_type, type_node>)
      hash_combine(seed, n.t);
    else if constexpr (std::is_same_v<node_type, literal_node>)
    {
      hash_combine(seed, n.raw);
      hash_combine(seed, n.text);
    }
    else if constexpr (std::is_same_v<node_type, regex_node>)
      hash_combine(seed, n.text);
    else if constexpr (std::is_same_v<node_type, union_node>)
    {
      for (const descriptor &alt : n.alternatives)
        hash_combine(seed, alt.hash());
    }
    else if constexpr (std::is_same_v<node_type, container_node>)
    {
      hash_combine(seed, static_cast<int>(n.kind));
      for (const descriptor &arg : n.args)
        hash_combine(seed, arg.hash());
    }
    else if constexpr (std::is_same_v<node_type, callable_node>)
      hash_combine(seed, static_cast<const void*>(n.fn.get()));
    else if constexpr (std::is_same_v<node_type, forward_node>)
      hash_combine(seed, n.name);
    else
      hash_combine(seed, static_cast<const void*>(&n));
  }, node);
  return seed;
}

static sieve::descriptor_data
_make_data(sieve::descriptor_node node)
{
  const size_t hash = _hash_node(node);
  return sieve::descriptor_data {std::move(node), hash};
}


sieve::descriptor::descriptor(pattern_ptr pat)
{
  if (not pat)
    throw std::invalid_argument {"descriptor of a null pattern"};
  m_data = std::make_shared<descriptor_data>(_make_data(pattern_node {std::move(pat)}));
}

sieve::descriptor::descriptor(type t)
: m_data {std::make_shared<descriptor_data>(_make_data(type_node {t}))}
{ }

sieve::descriptor::descriptor(value x)
: m_data {std::make_shared<descriptor_data>(
      _make_data(literal_node {x, false, sieve::repr(x)}))}
{ }

sieve::descriptor::descriptor(const char *text)
: descriptor {str(text)}
{ }

sieve::descriptor::descriptor(std::string_view text)
: descriptor {str(text)}
{ }

sieve::descriptor::descriptor(const std::string &text)
: descriptor {str(text)}
{ }

sieve::descriptor
sieve::descriptor::raw(value x)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(literal_node {x, true, sieve::repr(x)}))};
}

sieve::descriptor
sieve::descriptor::regex(std::string text)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(regex_node {std::move(text)}))};
}

sieve::descriptor
sieve::descriptor::one_of(std::vector<descriptor> alternatives)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(union_node {std::move(alternatives)}))};
}

sieve::descriptor
sieve::descriptor::list_of(descriptor element)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(container_node {container_kind::list, {std::move(element)}}))};
}

sieve::descriptor
sieve::descriptor::tuple_of(descriptor element)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(container_node {container_kind::tuple, {std::move(element)}}))};
}

sieve::descriptor
sieve::descriptor::set_of(descriptor element)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(container_node {container_kind::set, {std::move(element)}}))};
}

sieve::descriptor
sieve::descriptor::dict_of(descriptor key, descriptor val)
{
  return descriptor {std::make_shared<descriptor_data>(_make_data(
      container_node {container_kind::dict, {std::move(key), std::move(val)}}))};
}

sieve::descriptor
sieve::descriptor::container(container_kind kind)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(container_node {kind, {}}))};
}

sieve::descriptor
sieve::descriptor::callable(function fn, std::string name,
                            std::optional<type> param, std::optional<type> result)
{
  if (not fn)
    throw std::invalid_argument {"descriptor of an empty function"};
  auto shared = std::make_shared<const function>(std::move(fn));
  return descriptor {std::make_shared<descriptor_data>(_make_data(
      callable_node {std::move(shared), std::move(name), param, result}))};
}

sieve::descriptor
sieve::descriptor::forward(std::string name)
{
  return descriptor {std::make_shared<descriptor_data>(
      _make_data(forward_node {std::move(name)}))};
}

sieve::descriptor
sieve::descriptor::annotated(descriptor base, std::vector<validator> validators,
                             std::optional<std::string> alias)
{
  // Hashed by the address of the node inside its final allocation
  auto data = std::make_shared<descriptor_data>(descriptor_data {
      annotated_node {std::move(base), std::move(validators), std::move(alias)}, 0});
  data->hash = _hash_node(data->node);
  return descriptor {std::move(data)};
}


static bool
_equal_nodes(const sieve::descriptor_node &a, const sieve::descriptor_node &b)
{
  using namespace sieve;

  if (a.index() != b.index())
    return false;
  return std::visit([&b](const auto &x) -> bool {
    using node_type = std::decay_t<decltype(x)>;
    const node_type &y = std::get<node_type>(b);
    if constexpr (std::is_same_v<node_type, pattern_node>)
      return *x.pat == *y.pat;
    else if constexpr (std::is_same_v<node_type, type_node>)
      return x.t == y.t;
    else if constexpr (std::is_same_v<node_type, literal_node>)
      return x.raw == y.raw and x.text == y.text;
    else if constexpr (std::is_same_v<node_type, regex_node>)
      return x.text == y.text;
    else if constexpr (std::is_same_v<node_type, union_node>)
      return x.alternatives == y.alternatives;
    else if constexpr (std::is_same_v<node_type, container_node>)
      return x.kind == y.kind and x.args == y.args;
    else if constexpr (std::is_same_v<node_type, callable_node>)
      return x.fn == y.fn and x.name == y.name;
    else if constexpr (std::is_same_v<node_type, forward_node>)
      return x.name == y.name;
    else
      return &x == &y;
  }, a);
}

bool
sieve::descriptor::operator == (const descriptor &other) const noexcept
{
  if (m_data == other.m_data)
    return true;
  if (m_data->hash != other.m_data->hash)
    return false;
  return _equal_nodes(m_data->node, other.m_data->node);
}


static std::string
_join_reprs(const std::vector<sieve::descriptor> &descs, std::string_view sep)
{
  std::string text;
  for (const sieve::descriptor &desc : descs)
  {
    if (not text.empty())
      text += sep;
    text += desc.repr();
  }
  return text;
}

std::string
sieve::descriptor::repr() const
{
  return std::visit([](const auto &n) -> std::string {
    using node_type = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<node_type, pattern_node>)
      return n.pat->repr();
    else if constexpr (std::is_same_v<node_type, type_node>)
      return std::string(n.t.name());
    else if constexpr (std::is_same_v<node_type, literal_node>)
      return n.raw ? std::format("raw({})", n.text) : n.text;
    else if constexpr (std::is_same_v<node_type, regex_node>)
      return std::format("regex('{}')", n.text);
    else if constexpr (std::is_same_v<node_type, union_node>)
      return _join_reprs(n.alternatives, " | ");
    else if constexpr (std::is_same_v<node_type, container_node>)
    {
      if (n.args.empty())
        return std::string(container_kind_name(n.kind));
      return std::format("{}[{}]", container_kind_name(n.kind),
                         _join_reprs(n.args, ", "));
    }
    else if constexpr (std::is_same_v<node_type, callable_node>)
      return n.name;
    else if constexpr (std::is_same_v<node_type, forward_node>)
      return std::format("'{}'", n.name);
    else
    {
      return std::format("annotated[{}, {}]", n.base.repr(),
                         n.alias ? *n.alias : std::string {"..."});
    }
  }, m_data->node);
}
