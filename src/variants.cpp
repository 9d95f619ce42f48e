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


#include "sieve/variants.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/hash.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/logging.hpp"
#include "sieve/registry.hpp"

#include <algorithm>
#include <exception>


////////////////////////////////////////////////////////////////////////////////
//
//                               Direct
//
static sieve::type
_common_type(const std::vector<sieve::value> &values)
{
  if (values.empty())
    return sieve::types::any;
  const sieve::type first = sieve::type_of(values.front());
  for (const sieve::value x : values)
  {
    if (sieve::type_of(x) != first)
      return sieve::types::any;
  }
  return first;
}

sieve::direct::direct(value target, std::optional<std::string> alias)
: direct {std::vector<value> {target}, std::move(alias)}
{ }

sieve::direct::direct(const std::vector<value> &targets,
                      std::optional<std::string> alias)
: pattern {{.mode = match_mode::keep,
            .origin = _common_type(targets),
            .alias = std::move(alias)}}
{
  if (targets.empty())
    throw std::invalid_argument {"direct pattern requires a target"};
  for (const value x : targets)
  {
    if (std::ranges::none_of(m_targets, [x](value y) { return equal(x, y); }))
      m_targets.push_back(x);
  }
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::direct::copy() const
{ return std::make_shared<direct>(*this); }

sieve::value
sieve::direct::_match(value input) const
{
  for (const value target : m_targets)
  {
    if (equal(input, target))
      return input;
  }
  throw pattern_mismatch {input, repr()};
}

std::string
sieve::direct::_calc_repr() const
{
  if (alias())
    return *alias();
  std::string text;
  for (const value x : m_targets)
  {
    if (not text.empty())
      text += '|';
    text += sieve::repr(x);
  }
  return text;
}

void
sieve::direct::_extend_key(std::string &key) const
{
  key += '=';
  for (const value x : m_targets)
    key += std::format("{}#{},", x, chash(x));
}


////////////////////////////////////////////////////////////////////////////////
//
//                             Direct type
//
sieve::direct_type::direct_type(type t, std::optional<std::string> alias)
: direct_type {std::vector<type> {t}, std::move(alias)}
{ }

sieve::direct_type::direct_type(std::vector<type> ts,
                                std::optional<std::string> alias)
: pattern {{.mode = match_mode::keep,
            .origin = ts.size() == 1 ? ts.front() : types::any,
            .accepts = ts,
            .alias = std::move(alias)}}
{
  if (ts.empty())
    throw std::invalid_argument {"direct type pattern requires a type"};
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::direct_type::copy() const
{ return std::make_shared<direct_type>(*this); }


////////////////////////////////////////////////////////////////////////////////
//
//                           Regex pattern
//
sieve::regex_pattern::regex_pattern(std::string text,
                                    std::optional<std::string> alias)
: pattern {{.mode = match_mode::regex_match,
            .origin = types::tuple,
            .regex = std::move(text),
            .anchor = regex_anchor::prefix,
            .alias = alias ? std::move(alias) : "regex[:group]"}}
{ refresh(); }

std::shared_ptr<sieve::pattern>
sieve::regex_pattern::copy() const
{ return std::make_shared<regex_pattern>(*this); }

sieve::value
sieve::regex_pattern::_match(value input) const
{
  if (not isstr(input))
    throw type_mismatch {input, "str"};
  if (std::optional<value> m = _apply_regex(str_view(input)))
    return *m;
  throw pattern_mismatch {input, *regex_text()};
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Union
//
static sieve::type
_union_origin(const std::vector<sieve::pattern_ptr> &alternatives)
{
  if (alternatives.empty() or not alternatives.front())
    return sieve::types::any;
  const sieve::type first = alternatives.front()->origin();
  for (const sieve::pattern_ptr &alt : alternatives)
  {
    if (not alt or alt->origin() != first)
      return sieve::types::any;
  }
  return first;
}

sieve::union_pattern::union_pattern(std::vector<pattern_ptr> alternatives,
                                    std::optional<std::string> alias)
: pattern {{.mode = match_mode::keep,
            .origin = _union_origin(alternatives),
            .alias = std::move(alias)}}
{
  if (alternatives.empty())
    throw std::invalid_argument {"union pattern requires alternatives"};

  // Repeated alternatives are dropped, first occurrence wins
  for (pattern_ptr &alt : alternatives)
  {
    if (not alt)
      throw std::invalid_argument {"union pattern alternative is null"};
    const bool seen = std::ranges::any_of(
        m_alternatives, [&](const pattern_ptr &p) { return *p == *alt; });
    if (not seen)
      m_alternatives.push_back(std::move(alt));
  }
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::union_pattern::copy() const
{ return std::make_shared<union_pattern>(*this); }

sieve::value
sieve::union_pattern::_match(value input) const
{
  std::vector<std::string> reasons;
  for (const pattern_ptr &alt : m_alternatives)
  {
    const validate_result result = alt->validate(input);
    if (result.success())
      return result.value();
    reasons.push_back(std::format("{}: {}", alt->repr(), describe(result.error())));
  }
  throw exhausted_alternatives {input, std::move(reasons)};
}

std::string
sieve::union_pattern::_calc_repr() const
{
  if (alias())
    return *alias();
  std::string text;
  for (const pattern_ptr &alt : m_alternatives)
  {
    if (not text.empty())
      text += '|';
    text += alt->repr();
  }
  return text;
}

void
sieve::union_pattern::_extend_key(std::string &key) const
{
  key += '{';
  for (const pattern_ptr &alt : m_alternatives)
    key += std::format("({})", alt->key());
  key += '}';
}


////////////////////////////////////////////////////////////////////////////////
//
//                         Sequence and mapping
//
std::string_view
sieve::iteration_policy_name(iteration_policy policy) noexcept
{
  switch (policy)
  {
    case iteration_policy::all: return "all";
    case iteration_policy::permissive: return "permissive";
    case iteration_policy::prefix: return "prefix";
    case iteration_policy::suffix: return "suffix";
  }
  std::terminate();
}

static sieve::type
_sequence_type(sieve::tag kind)
{
  switch (kind)
  {
    case sieve::tag::list: return sieve::types::list;
    case sieve::tag::tuple: return sieve::types::tuple;
    case sieve::tag::set: return sieve::types::set;
    default:
      throw std::invalid_argument {std::format(
          "sequence pattern over non-sequence {}", sieve::tag_name(kind))};
  }
}

// Read container literal text, leave other inputs unchanged
static sieve::value
_read_container(sieve::value input, std::string_view expected)
{
  if (not sieve::isstr(input))
    return input;
  try
  {
    return sieve::read_literal(sieve::str_view(input));
  }
  catch (const sieve::parse_error&)
  {
    std::throw_with_nested(sieve::type_mismatch {input, expected});
  }
}

// Rethrow an element failure as the container failure
[[noreturn]] static void
_element_failed(const sieve::validate_result &result, sieve::value input,
                const std::string &expected, size_t index)
{
  try
  {
    std::rethrow_exception(result.error());
  }
  catch (const std::exception&)
  {
    std::throw_with_nested(sieve::pattern_mismatch {
        input, std::format("{} (element #{} rejected)", expected, index)});
  }
}

/**
 * Validate items with a policy
 *
 * \param validate_item Callable returning an error result or storing the
 *        validated item into the output
 */
template <typename Item, typename ValidateItem>
static std::vector<Item>
_validate_items(const std::vector<Item> &items, sieve::iteration_policy policy,
                ValidateItem validate_item, sieve::value input,
                const std::string &expected)
{
  using namespace sieve;

  std::vector<Item> result;
  switch (policy)
  {
    case iteration_policy::all:
      for (size_t i = 0; i < items.size(); ++i)
      {
        Item out;
        const validate_result res = validate_item(items[i], out);
        if (res.failed())
          _element_failed(res, input, expected, i);
        result.push_back(out);
      }
      break;

    case iteration_policy::permissive:
      for (const Item &item : items)
      {
        Item out;
        if (validate_item(item, out).success())
          result.push_back(out);
      }
      break;

    case iteration_policy::prefix:
      for (const Item &item : items)
      {
        Item out;
        if (validate_item(item, out).failed())
          break;
        result.push_back(out);
      }
      break;

    case iteration_policy::suffix:
      for (auto it = items.rbegin(); it != items.rend(); ++it)
      {
        Item out;
        if (validate_item(*it, out).failed())
          break;
        result.push_back(out);
      }
      std::ranges::reverse(result);
      break;
  }
  return result;
}


sieve::sequence_pattern::sequence_pattern(tag kind, pattern_ptr element,
                                          iteration_policy policy)
: pattern {{.mode = match_mode::keep, .origin = _sequence_type(kind)}},
  m_kind {kind},
  m_element {std::move(element)},
  m_policy {policy}
{
  if (not m_element)
    throw std::invalid_argument {"sequence pattern requires an element pattern"};
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::sequence_pattern::copy() const
{ return std::make_shared<sequence_pattern>(*this); }

sieve::value
sieve::sequence_pattern::_match(value input) const
{
  const value x = _read_container(input, tag_name(m_kind));
  if (not isseq(x))
    throw type_mismatch {input, tag_name(m_kind)};

  std::vector<value> items;
  for (const value item : elements(x))
    items.push_back(item);
  const auto validate_item = [this](value item, value &out) {
    const validate_result res = m_element->validate(item);
    if (res.success())
      out = res.value();
    return res;
  };
  return sequence(m_kind, _validate_items(items, m_policy, validate_item, input,
                                          repr()));
}

std::string
sieve::sequence_pattern::_calc_repr() const
{
  if (alias())
    return *alias();
  return std::format("{}[{}]", tag_name(m_kind), m_element->repr());
}

void
sieve::sequence_pattern::_extend_key(std::string &key) const
{
  key += std::format("[{}:{}:({})]", tag_name(m_kind),
                     iteration_policy_name(m_policy), m_element->key());
}

void
sieve::sequence_pattern::_reanchor(regex_anchor anchor)
{
  if (anchor == regex_anchor::prefix)
    m_policy = iteration_policy::prefix;
  else if (anchor == regex_anchor::suffix)
    m_policy = iteration_policy::suffix;
}


sieve::mapping_pattern::mapping_pattern(pattern_ptr key, pattern_ptr val,
                                        iteration_policy policy)
: pattern {{.mode = match_mode::keep, .origin = types::dict}},
  m_key {std::move(key)},
  m_value {std::move(val)},
  m_policy {policy}
{
  if (not m_key or not m_value)
    throw std::invalid_argument {"mapping pattern requires key and value patterns"};
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::mapping_pattern::copy() const
{ return std::make_shared<mapping_pattern>(*this); }

sieve::value
sieve::mapping_pattern::_match(value input) const
{
  using item = std::pair<value, value>;

  const value x = _read_container(input, "dict");
  if (not isdict(x))
    throw type_mismatch {input, "dict"};

  std::vector<item> entries;
  for (const item &entry : items(x))
    entries.push_back(entry);
  const auto validate_item = [this](const item &entry, item &out) {
    const validate_result k = m_key->validate(entry.first);
    if (k.failed())
      return k;
    const validate_result v = m_value->validate(entry.second);
    if (v.success())
      out = {k.value(), v.value()};
    return v;
  };
  return dict(_validate_items(entries, m_policy, validate_item, input, repr()));
}

std::string
sieve::mapping_pattern::_calc_repr() const
{
  if (alias())
    return *alias();
  return std::format("dict[{}, {}]", m_key->repr(), m_value->repr());
}

void
sieve::mapping_pattern::_extend_key(std::string &key) const
{
  key += std::format("[{}:({}):({})]", iteration_policy_name(m_policy),
                     m_key->key(), m_value->key());
}

void
sieve::mapping_pattern::_reanchor(regex_anchor anchor)
{
  if (anchor == regex_anchor::prefix)
    m_policy = iteration_policy::prefix;
  else if (anchor == regex_anchor::suffix)
    m_policy = iteration_policy::suffix;
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Switch
//
static sieve::type
_case_origin(const sieve::switch_case &c)
{
  if (const sieve::value *x = std::get_if<sieve::value>(&c))
    return sieve::type_of(*x);
  return std::get<sieve::pattern_ptr>(c)->origin();
}

static std::string
_case_key(const sieve::switch_case &c)
{
  if (const sieve::value *x = std::get_if<sieve::value>(&c))
    return std::format("{}", *x);
  return std::format("({})", std::get<sieve::pattern_ptr>(c)->key());
}

sieve::switch_pattern::switch_pattern(
    const std::vector<std::pair<value, switch_case>> &cases,
    std::optional<switch_case> fallback)
: pattern {{.mode = match_mode::keep,
            .origin = cases.empty() ? types::any : _case_origin(cases.front().second)}},
  m_fallback {std::move(fallback)}
{
  if (cases.empty())
    throw std::invalid_argument {"switch pattern requires cases"};
  for (const std::pair<value, switch_case> &c : cases)
  {
    if (const pattern_ptr *p = std::get_if<pattern_ptr>(&c.second); p and not *p)
      throw std::invalid_argument {"switch case pattern is null"};
    const bool seen = std::ranges::any_of(
        m_cases, [&c](const auto &other) { return equal(other.first, c.first); });
    if (not seen)
      m_cases.push_back(c);
  }
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::switch_pattern::copy() const
{ return std::make_shared<switch_pattern>(*this); }

static sieve::value
_apply_case(const sieve::switch_case &c, sieve::value input)
{
  if (const sieve::value *x = std::get_if<sieve::value>(&c))
    return *x;
  return std::get<sieve::pattern_ptr>(c)->match(input);
}

sieve::value
sieve::switch_pattern::_match(value input) const
{
  for (const auto &[key, result] : m_cases)
  {
    if (equal(input, key))
      return _apply_case(result, input);
  }
  if (m_fallback)
    return _apply_case(*m_fallback, input);
  throw pattern_mismatch {input, repr()};
}

std::string
sieve::switch_pattern::_calc_repr() const
{
  if (alias())
    return *alias();
  std::string text;
  for (const auto &[key, _] : m_cases)
  {
    if (not text.empty())
      text += '|';
    text += to_display(key);
  }
  return text;
}

void
sieve::switch_pattern::_extend_key(std::string &key) const
{
  key += '{';
  for (const auto &[k, result] : m_cases)
    key += std::format("{}:{},", k, _case_key(result));
  if (m_fallback)
    key += std::format("...:{}", _case_key(*m_fallback));
  key += '}';
}


////////////////////////////////////////////////////////////////////////////////
//
//                          Forward reference
//
sieve::forward_ref::forward_ref(std::string name, const context &ctx)
: pattern {{.mode = match_mode::keep, .alias = name}},
  m_name {std::move(name)},
  m_context {ctx.handle()}
{ refresh(); }

std::shared_ptr<sieve::pattern>
sieve::forward_ref::copy() const
{ return std::make_shared<forward_ref>(*this); }

sieve::value
sieve::forward_ref::_match(value input) const
{
  if (isstr(input, m_name))
    return input;

  if (const std::optional<type> t = type::lookup(m_name))
  {
    if (not isinstance(input, *t))
      throw type_mismatch {input, m_name};
    return input;
  }

  const std::shared_ptr<const context> ctx = m_context.lock();
  if (not ctx)
  {
    debug("reference '{}' outlived its registry context", m_name);
    throw unresolved_reference {input, m_name};
  }
  if (const pattern_ptr target = ctx->lookup(m_name))
  {
    debug("resolved reference '{}' to {}", m_name, target->repr());
    return target->match(input);
  }

  throw unresolved_reference {input, m_name};
}

void
sieve::forward_ref::_extend_key(std::string &key) const
{ key += std::format("&{}", m_name); }


////////////////////////////////////////////////////////////////////////////////
//
//                                Anti
//
sieve::anti_pattern::anti_pattern(pattern_ptr base)
: pattern {{.mode = match_mode::keep,
            .origin = base ? base->origin() : types::any,
            .alias = base ? std::format("!{}", base->repr()) : "!"}},
  m_base {std::move(base)}
{
  if (not m_base)
    throw std::invalid_argument {"anti pattern requires a base pattern"};
  refresh();
}

std::shared_ptr<sieve::pattern>
sieve::anti_pattern::copy() const
{ return std::make_shared<anti_pattern>(*this); }

sieve::value
sieve::anti_pattern::_match(value input) const
{
  if (m_base->validate(input).failed())
    return input;
  throw pattern_mismatch {input, repr()};
}

void
sieve::anti_pattern::_extend_key(std::string &key) const
{ key += std::format("!({})", m_base->key()); }
