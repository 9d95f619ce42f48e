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


#include "sieve/registry.hpp"
#include "sieve/builtins.hpp"
#include "sieve/compiler.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/logging.hpp"

#include <atomic>
#include <format>


static std::atomic<uint64_t> g_version_counter {0};

static uint64_t
_next_version() noexcept
{ return ++g_version_counter; }


std::string
sieve::table_key_repr(const table_key &key)
{
  if (const type *t = std::get_if<type>(&key))
    return std::format("<{}>", *t);
  return std::format("'{}'", std::get<std::string>(key));
}


////////////////////////////////////////////////////////////////////////////////
//
//                            Pattern table
//
sieve::pattern_table::pattern_table(std::string name)
: m_name {std::move(name)},
  m_version {_next_version()},
  m_guard {nullptr}
{ }

sieve::pattern_table::pattern_table(const pattern_table &other)
: m_name {other.m_name},
  m_entries {other.entries()},
  m_version {other.m_version},
  m_guard {nullptr}
{ }

std::unique_lock<std::recursive_mutex>
sieve::pattern_table::_lock() const
{
  if (m_guard)
    return std::unique_lock {*m_guard};
  return { };
}

void
sieve::pattern_table::_touch() noexcept
{ m_version = _next_version(); }

void
sieve::pattern_table::_insert(const table_key &key, const pattern_ptr &pat,
                              bool cover)
{
  auto it = m_entries.find(key);
  if (it == m_entries.end())
    m_entries.emplace(key, pat);
  else if (cover)
    it->second = pat;
  else
  {
    debug("{}: keep existing {} for {}", m_name, it->second->repr(),
          table_key_repr(key));
    return;
  }
  debug("{}: {} -> {}", m_name, table_key_repr(key), pat->repr());
}

void
sieve::pattern_table::set(pattern_ptr pat, std::optional<std::string> alias,
                          bool cover)
{
  if (not pat)
    throw std::invalid_argument {"pattern_table::set() - null pattern"};

  const auto lock = _lock();
  if (alias)
    _insert(*alias, pat, cover);
  else
  {
    _insert(pat->origin(), pat, cover);
    if (pat->alias())
      _insert(*pat->alias(), pat, cover);
  }
  _touch();
}

void
sieve::pattern_table::sets(const std::vector<pattern_ptr> &patterns, bool cover)
{
  const auto lock = _lock();
  for (const pattern_ptr &pat : patterns)
    set(pat, std::nullopt, cover);
}

void
sieve::pattern_table::merge(
    const std::vector<std::pair<std::string, pattern_ptr>> &patterns, bool cover)
{
  const auto lock = _lock();
  for (const auto &[alias, pat] : patterns)
    set(pat, alias, cover);
}

void
sieve::pattern_table::remove(type origin, std::optional<std::string> alias)
{
  const auto lock = _lock();
  m_entries.erase(origin);
  if (alias)
    m_entries.erase(*alias);
  _touch();
}

sieve::pattern_ptr
sieve::pattern_table::get(const table_key &key) const
{
  const auto lock = _lock();
  const auto it = m_entries.find(key);
  return it == m_entries.end() ? nullptr : it->second;
}

bool
sieve::pattern_table::contains(const table_key &key) const
{
  const auto lock = _lock();
  return m_entries.contains(key);
}

size_t
sieve::pattern_table::size() const
{
  const auto lock = _lock();
  return m_entries.size();
}

sieve::pattern_table::entries_type
sieve::pattern_table::entries() const
{
  const auto lock = _lock();
  return m_entries;
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Context
//
sieve::context::context()
: m_global {std::string(global_name)},
  m_current {nullptr},
  m_cache {std::make_unique<compile_cache>()},
  m_self {this, [](const context*) { }}
{ m_global.m_guard = &m_mutex; }

sieve::context::~context()
{ m_self.reset(); }

sieve::context&
sieve::context::instance()
{
  static context &ctx = []() -> context& {
    static context instance;
    install_builtins(instance.global());
    return instance;
  }();
  return ctx;
}

static void
_check_local_name(std::string_view name)
{
  if (name.starts_with('$'))
  {
    throw std::invalid_argument {
        std::format("local table name '{}' is reserved", name)};
  }
}

sieve::pattern_table&
sieve::context::create_local(
    const std::string &name,
    const std::vector<std::pair<table_key, pattern_ptr>> &initial,
    bool set_current)
{
  _check_local_name(name);

  std::lock_guard lock {m_mutex};
  auto table = std::make_unique<pattern_table>(name);
  table->m_guard = &m_mutex;
  for (const auto &[key, pat] : initial)
    table->_insert(key, pat, true);

  pattern_table &result = *table;
  auto it = m_locals.find(name);
  if (it != m_locals.end())
  {
    if (m_current == it->second.get())
      m_current = nullptr;
    it->second = std::move(table);
  }
  else
    m_locals.emplace(name, std::move(table));

  if (set_current)
    m_current = &result;
  debug("created local table {}{}", name, set_current ? " (current)" : "");
  return result;
}

void
sieve::context::switch_local(std::string_view name)
{
  _check_local_name(name);

  std::lock_guard lock {m_mutex};
  const auto it = m_locals.find(name);
  if (it == m_locals.end())
    throw registry_not_found {name};
  m_current = it->second.get();
  debug("switched to local table {}", name);
}

void
sieve::context::reset_local()
{
  std::lock_guard lock {m_mutex};
  m_current = nullptr;
  debug("reset local table");
}

void
sieve::context::drop_local(std::string_view name)
{
  std::lock_guard lock {m_mutex};
  const auto it = m_locals.find(name);
  if (it == m_locals.end())
    throw registry_not_found {name};
  if (m_current == it->second.get())
    m_current = nullptr;
  m_locals.erase(it);
  debug("dropped local table {}", name);
}

sieve::pattern_table*
sieve::context::local()
{
  std::lock_guard lock {m_mutex};
  return m_current;
}

const sieve::pattern_table*
sieve::context::local() const
{
  std::lock_guard lock {m_mutex};
  return m_current;
}

std::optional<std::string>
sieve::context::current_local_name() const
{
  std::lock_guard lock {m_mutex};
  if (m_current)
    return m_current->name();
  return std::nullopt;
}

sieve::pattern_table
sieve::context::all() const
{
  std::lock_guard lock {m_mutex};
  pattern_table result {"$temp"};
  result.m_entries = m_global.m_entries;
  if (m_current)
  {
    for (const auto &[key, pat] : m_current->m_entries)
      result.m_entries.insert_or_assign(key, pat);
  }
  return result;
}

sieve::pattern_ptr
sieve::context::lookup(const table_key &key) const
{
  std::lock_guard lock {m_mutex};
  if (m_current)
  {
    if (pattern_ptr pat = m_current->get(key))
      return pat;
  }
  return m_global.get(key);
}
