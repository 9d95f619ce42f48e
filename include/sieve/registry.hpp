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


#pragma once

#include "sieve/pattern.hpp"
#include "sieve/type.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file registry.hpp
 * Named pattern tables with global and local scoping
 *
 * \ingroup registry
 */


namespace sieve {

/**
 * Key of a pattern table: a type or an alias
 *
 * \ingroup registry
 */
using table_key = std::variant<type, std::string>;

struct table_key_hash {
  size_t
  operator () (const table_key &key) const noexcept
  {
    if (const type *t = std::get_if<type>(&key))
      return std::hash<type> {}(*t);
    return std::hash<std::string> {}(std::get<std::string>(key));
  }
}; // struct sieve::table_key_hash

std::string
table_key_repr(const table_key &key);


/**
 * Named mapping from types and aliases to patterns
 *
 * Mutations that would overwrite an existing entry while `cover` is false
 * are skipped silently.
 *
 * \ingroup registry
 */
class pattern_table {
  public:
  using entries_type = std::unordered_map<table_key, pattern_ptr, table_key_hash>;

  explicit pattern_table(std::string name);

  pattern_table(const pattern_table &other);

  pattern_table&
  operator = (const pattern_table&) = delete;

  const std::string&
  name() const noexcept
  { return m_name; }

  /**
   * Insert a pattern
   *
   * With \p alias the pattern is keyed by that alias only. Otherwise it is
   * keyed by its origin type and by its own alias (if any).
   */
  void
  set(pattern_ptr pat, std::optional<std::string> alias = std::nullopt,
      bool cover = true);

  /**
   * Insert several patterns keyed by their origin types and aliases
   */
  void
  sets(const std::vector<pattern_ptr> &patterns, bool cover = true);

  /**
   * Insert patterns keyed by the given aliases
   */
  void
  merge(const std::vector<std::pair<std::string, pattern_ptr>> &patterns,
        bool cover = true);

  /**
   * Delete the entry keyed by \p origin and, if given, by \p alias
   */
  void
  remove(type origin, std::optional<std::string> alias = std::nullopt);

  /**
   * Find a pattern
   *
   * \return The pattern or null
   */
  [[nodiscard]] pattern_ptr
  get(const table_key &key) const;

  [[nodiscard]] bool
  contains(const table_key &key) const;

  size_t
  size() const;

  /**
   * Version stamp, changed by every mutation
   *
   * Stamps are unique across all tables of the process.
   */
  uint64_t
  version() const noexcept
  { return m_version; }

  /**
   * Snapshot of all entries
   */
  entries_type
  entries() const;

  private:
  void
  _insert(const table_key &key, const pattern_ptr &pat, bool cover);

  void
  _touch() noexcept;

  std::unique_lock<std::recursive_mutex>
  _lock() const;

  std::string m_name;
  entries_type m_entries;
  uint64_t m_version;
  std::recursive_mutex *m_guard;

  friend class context;
}; // class sieve::pattern_table


class compile_cache;

/**
 * Registry context: the global pattern table, named local tables, the
 * currently active local table, and the descriptor compiler cache
 *
 * All operations are serialized with a recursive mutex owned by the context.
 *
 * \ingroup registry
 */
class context {
  public:
  static constexpr std::string_view global_name = "$global";

  /**
   * Create a context with an empty global table
   */
  context();

  ~context();

  context(const context&) = delete;
  context& operator = (const context&) = delete;

  /**
   * Default process-wide context with built-in patterns installed
   */
  static context&
  instance();

  pattern_table&
  global() noexcept
  { return m_global; }

  const pattern_table&
  global() const noexcept
  { return m_global; }

  /**
   * Create (or replace) a named local table
   *
   * \param name Table name, must not start with `$`
   * \param initial Initial entries
   * \param set_current Make the new table the active one
   * \throws std::invalid_argument If the name is reserved
   */
  pattern_table&
  create_local(const std::string &name,
               const std::vector<std::pair<table_key, pattern_ptr>> &initial = {},
               bool set_current = true);

  /**
   * Activate a local table
   *
   * \throws std::invalid_argument If the name is reserved
   * \throws registry_not_found If there is no such table
   */
  void
  switch_local(std::string_view name);

  /**
   * Deactivate the current local table
   */
  void
  reset_local();

  /**
   * Destroy a local table; deactivates it if it is the current one
   *
   * \throws registry_not_found If there is no such table
   */
  void
  drop_local(std::string_view name);

  /**
   * Currently active local table or null
   */
  pattern_table*
  local();

  const pattern_table*
  local() const;

  /**
   * Name of the currently active local table
   */
  std::optional<std::string>
  current_local_name() const;

  /**
   * Merged copy of the global and the active local table (local wins)
   */
  pattern_table
  all() const;

  /**
   * Find a pattern in the active local table, then in the global one
   */
  [[nodiscard]] pattern_ptr
  lookup(const table_key &key) const;

  std::recursive_mutex&
  mutex() const noexcept
  { return m_mutex; }

  /**
   * Non-owning handle that expires when the context is destroyed
   *
   * Held by patterns that resolve names through the context when matching.
   */
  std::weak_ptr<const context>
  handle() const noexcept
  { return m_self; }

  compile_cache&
  cache() noexcept
  { return *m_cache; }

  private:
  mutable std::recursive_mutex m_mutex;
  pattern_table m_global;
  std::map<std::string, std::unique_ptr<pattern_table>, std::less<>> m_locals;
  pattern_table *m_current;
  std::unique_ptr<compile_cache> m_cache;
  std::shared_ptr<const context> m_self;
}; // class sieve::context

} // namespace sieve
