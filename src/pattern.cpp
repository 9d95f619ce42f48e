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


#include "sieve/pattern.hpp"
#include "sieve/coerce.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/logging.hpp"
#include "sieve/utilities/execution_timer.hpp"
#include "sieve/variants.hpp"

#include <typeinfo>


std::string_view
sieve::match_mode_name(match_mode mode) noexcept
{
  switch (mode)
  {
    case match_mode::keep: return "keep";
    case match_mode::regex_match: return "regex_match";
    case match_mode::type_convert: return "type_convert";
    case match_mode::regex_convert: return "regex_convert";
    case match_mode::value_operate: return "value_operate";
  }
  std::terminate();
}


namespace {

using sieve::regex_anchor;

enum class field_rule {
  forbidden,
  optional,
  required,
};

struct mode_rules {
  field_rule regex;
  field_rule convert;
  regex_anchor default_anchor;
};

// Indexed by sieve::match_mode
constexpr mode_rules g_mode_rules[] = {
  /* keep          */ {field_rule::forbidden, field_rule::forbidden, regex_anchor::full},
  /* regex_match   */ {field_rule::required, field_rule::forbidden, regex_anchor::full},
  /* type_convert  */ {field_rule::forbidden, field_rule::optional, regex_anchor::full},
  /* regex_convert */ {field_rule::required, field_rule::optional, regex_anchor::search},
  /* value_operate */ {field_rule::forbidden, field_rule::required, regex_anchor::full},
};

void
_check_field(sieve::match_mode mode, std::string_view field, field_rule rule,
             bool present)
{
  if (rule == field_rule::forbidden and present)
  {
    throw std::invalid_argument {
        std::format("{} is not allowed in {} mode", field,
                    sieve::match_mode_name(mode))};
  }
  if (rule == field_rule::required and not present)
  {
    throw std::invalid_argument {
        std::format("{} is required in {} mode", field,
                    sieve::match_mode_name(mode))};
  }
}

} // anonymous namespace


static sieve::converter
_default_converter(sieve::match_mode mode)
{
  using namespace sieve;

  if (mode == match_mode::type_convert)
  {
    return [](const pattern &self, value input) -> std::optional<value> {
      return coerce(input, self.origin());
    };
  }

  // regex_convert: read the matched text as a literal
  return [](const pattern &self, value match) -> std::optional<value> {
    const value result = read_literal(str_view(seq_ref(match, 0)));
    if (isinstance(result, self.origin()))
      return result;
    return coerce(result, self.origin());
  };
}


sieve::pattern::pattern(pattern_config config)
: m_mode {config.mode},
  m_origin {config.origin},
  m_regex_text {std::move(config.regex)},
  m_anchor {regex_anchor::full},
  m_convert {std::move(config.convert)},
  m_validators {std::move(config.validators)},
  m_previous {std::move(config.previous)},
  m_accepts {std::move(config.accepts)},
  m_addition {std::move(config.addition_accepts)},
  m_alias {std::move(config.alias)},
  m_hash {0}
{
  const mode_rules &rules = g_mode_rules[static_cast<int>(m_mode)];
  _check_field(m_mode, "regex", rules.regex, m_regex_text.has_value());
  _check_field(m_mode, "anchor", rules.regex, config.anchor.has_value());
  _check_field(m_mode, "converter", rules.convert, bool(m_convert));

  if (m_regex_text)
  {
    const std::string &text = *m_regex_text;
    if (text.starts_with('^') or text.ends_with('$'))
    {
      throw std::invalid_argument {std::format(
          "regular expression '{}' must not be anchored with ^ or $", text)};
    }
    m_anchor = config.anchor.value_or(rules.default_anchor);
    _compile_regex();
  }

  if (rules.convert == field_rule::optional and not m_convert)
    m_convert = _default_converter(m_mode);

  refresh();
}


void
sieve::pattern::_compile_regex()
{
  const std::string &text = *m_regex_text;
  try
  {
    if (m_anchor == regex_anchor::suffix)
      m_regex.emplace(std::format("(?:{})$", text), std::regex::ECMAScript);
    else
      m_regex.emplace(text, std::regex::ECMAScript);
  }
  catch (const std::regex_error&)
  {
    std::throw_with_nested(std::invalid_argument {
        std::format("invalid regular expression '{}'", text)});
  }
}


sieve::pattern_ptr
sieve::pattern::of(type t)
{
  return std::make_shared<pattern>(pattern_config {
      .mode = match_mode::keep,
      .origin = t,
      .accepts = std::vector<type> {t},
      .alias = std::string(t.name()),
  });
}

sieve::pattern_ptr
sieve::pattern::on(value x)
{ return std::make_shared<direct>(x); }


sieve::validate_result
sieve::pattern::validate(value input) const
{ return _validate(input, std::nullopt); }

sieve::validate_result
sieve::pattern::validate(value input, value default_value) const
{ return _validate(input, default_value); }

sieve::validate_result
sieve::pattern::_validate(value input,
                          const std::optional<value> &default_value) const
{
  try
  {
    return validate_result::make_valid(match(input));
  }
  catch (const configuration_error&)
  {
    throw;
  }
  catch (const std::exception&)
  {
    if (default_value)
      return validate_result::make_default(*default_value);
    return validate_result::make_error(std::current_exception(), input);
  }
  catch (...)
  {
    if (default_value)
      return validate_result::make_default(*default_value);
    return validate_result::make_error(wrap_current_exception(input), input);
  }
}


sieve::value
sieve::pattern::match(value input) const
{
  SIEVE_FUNCTION_BENCHMARK

  value x = m_previous ? m_previous->match(input) : input;

  if (m_accepts or m_addition)
  {
    if (not (m_accepts and isinstance(x, *m_accepts)))
    {
      std::optional<value> admitted;
      if (m_addition)
      {
        const validate_result res = m_addition->validate(x);
        if (res.success())
          admitted = res.value();
      }
      if (not admitted)
        throw type_mismatch {x, _accepts_repr()};
      x = *admitted;
    }
  }

  const value result = _match(x);

  for (size_t i = 0; i < m_validators.size(); ++i)
  {
    bool passed = false;
    try
    {
      passed = m_validators[i](result);
    }
    catch (const configuration_error&)
    {
      throw;
    }
    catch (...)
    {
      std::throw_with_nested(validator_rejected {result, i});
    }
    if (not passed)
      throw validator_rejected {result, i};
  }

  return result;
}


sieve::value
sieve::pattern::_match(value input) const
{
  switch (m_mode)
  {
    case match_mode::keep:
      return input;

    case match_mode::regex_match: {
      if (not isstr(input))
        throw type_mismatch {input, "str"};
      const std::optional<value> m = _apply_regex(str_view(input));
      if (not m)
        throw pattern_mismatch {input, _expected()};
      return seq_ref(*m, 0);
    }

    case match_mode::type_convert: {
      if (not m_origin.is_any() and isinstance(input, m_origin))
        return input;
      const std::optional<value> result = _convert(input);
      if (not result or not isinstance(*result, m_origin))
        throw conversion_failure {input, _expected()};
      return *result;
    }

    case match_mode::regex_convert: {
      if (not m_origin.is_any() and m_origin != types::str and
          isinstance(input, m_origin))
        return input;
      if (not isstr(input))
        throw type_mismatch {input, "str"};
      const std::optional<value> m = _apply_regex(str_view(input));
      if (not m)
        throw pattern_mismatch {input, _expected()};
      const std::optional<value> result = _convert(*m);
      if (not result or not isinstance(*result, m_origin))
        throw conversion_failure {input, _expected()};
      return *result;
    }

    case match_mode::value_operate: {
      if (not isinstance(input, m_origin))
        throw type_mismatch {input, m_origin.name()};
      const std::optional<value> result = _convert(input);
      if (not result or not isinstance(*result, m_origin))
        throw conversion_failure {input, _expected()};
      return *result;
    }
  }
  std::terminate();
}


std::optional<sieve::value>
sieve::pattern::_apply_regex(std::string_view text) const
{
  std::match_results<std::string_view::const_iterator> m;
  bool found = false;
  switch (m_anchor)
  {
    case regex_anchor::full:
      found = std::regex_match(text.begin(), text.end(), m, *m_regex);
      break;

    case regex_anchor::prefix:
      found = std::regex_search(text.begin(), text.end(), m, *m_regex,
                                std::regex_constants::match_continuous);
      break;

    case regex_anchor::suffix:
    case regex_anchor::search:
      found = std::regex_search(text.begin(), text.end(), m, *m_regex);
      break;
  }
  if (not found)
    return std::nullopt;

  std::vector<value> groups;
  for (size_t i = 0; i < m.size(); ++i)
    groups.push_back(m[i].matched ? str(m[i].str()) : nil);
  return sequence(tag::tuple, groups);
}


std::optional<sieve::value>
sieve::pattern::_convert(value input) const
{
  try
  {
    return m_convert(*this, input);
  }
  catch (const match_failed&)
  {
    throw;
  }
  catch (const configuration_error&)
  {
    throw;
  }
  catch (...)
  {
    std::throw_with_nested(conversion_failure {input, _expected()});
  }
}


std::string
sieve::pattern::_accepts_repr() const
{
  std::string text;
  if (m_accepts)
  {
    for (const type t : *m_accepts)
    {
      if (not text.empty())
        text += '|';
      text += t.name();
    }
  }
  if (m_addition)
  {
    if (not text.empty())
      text += '|';
    text += m_addition->repr();
  }
  return text;
}


std::string
sieve::pattern::_calc_repr() const
{
  if (m_mode == match_mode::keep)
  {
    if (m_alias)
      return *m_alias;
    return m_accepts or m_addition ? _accepts_repr() : "any";
  }

  std::string text;
  if (m_alias)
    text = *m_alias;
  else if (m_mode == match_mode::regex_match)
    text = *m_regex_text;
  else if (m_mode == match_mode::regex_convert or not (m_accepts or m_addition))
    text = m_origin.name();
  else
    text = std::format("{} -> {}", _accepts_repr(), m_origin);

  if (m_previous)
    return std::format("{} -> {}", m_previous->repr(), text);
  return text;
}


void
sieve::pattern::refresh()
{
  m_repr = _calc_repr();

  std::string key = std::format("{}:{}:{}", typeid(*this).name(),
                                match_mode_name(m_mode), m_origin);
  if (m_regex_text)
    key += std::format("/{}/{}", *m_regex_text, static_cast<int>(m_anchor));
  if (m_accepts)
  {
    key += '<';
    for (const type t : *m_accepts)
      key += std::format("{},", t);
    key += '>';
  }
  if (m_addition)
    key += std::format("+({})", m_addition->key());
  if (m_previous)
    key += std::format("^({})", m_previous->key());
  _extend_key(key);

  m_key = std::move(key);
  m_hash = std::hash<std::string> {}(m_key);
}


std::shared_ptr<sieve::pattern>
sieve::pattern::copy() const
{ return std::make_shared<pattern>(*this); }

void
sieve::pattern::_reanchor(regex_anchor anchor)
{
  if (not m_regex_text)
    return;
  m_anchor = anchor;
  _compile_regex();
}

sieve::pattern_ptr
sieve::pattern::prefixed() const
{
  const std::shared_ptr<pattern> result = copy();
  result->_reanchor(regex_anchor::prefix);
  result->refresh();
  return result;
}

sieve::pattern_ptr
sieve::pattern::suffixed() const
{
  const std::shared_ptr<pattern> result = copy();
  result->_reanchor(regex_anchor::suffix);
  result->refresh();
  return result;
}

sieve::pattern_ptr
sieve::pattern::with_alias(std::string alias) const
{
  const std::shared_ptr<pattern> result = copy();
  result->set_alias(std::move(alias));
  return result;
}

sieve::pattern_ptr
sieve::pattern::with_validators(std::vector<validator> validators) const
{
  const std::shared_ptr<pattern> result = copy();
  for (validator &fn : validators)
    result->add_validator(std::move(fn));
  return result;
}

void
sieve::pattern::set_alias(std::optional<std::string> alias)
{
  m_alias = std::move(alias);
  refresh();
}

void
sieve::pattern::set_previous(pattern_ptr previous)
{
  if (previous.get() == this)
    throw std::invalid_argument {"pattern can not be its own predecessor"};
  m_previous = std::move(previous);
  refresh();
}

void
sieve::pattern::add_validator(validator fn)
{
  if (not fn)
    throw std::invalid_argument {"empty validator"};
  m_validators.push_back(std::move(fn));
}
