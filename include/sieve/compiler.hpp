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

#include "sieve/descriptor.hpp"
#include "sieve/pattern.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

/**
 * \file compiler.hpp
 * Descriptor compiler
 *
 * \ingroup compiler
 */


namespace sieve {

class context;

/**
 * How the compiler treats registry overrides and descriptors it has no rule
 * for
 *
 * \ingroup compiler
 */
enum class extra_policy {
  allow,  /**< Use registry overrides; unknown values match by their type */
  ignore, /**< Skip registry overrides; unknown values match anything */
  forbid, /**< Fail on conflicting overrides and on unknown values */
};

std::string_view
extra_policy_name(extra_policy policy) noexcept;

/**
 * Parse a policy name
 *
 * \throws std::invalid_argument For unknown names
 */
extra_policy
parse_extra_policy(std::string_view name);


/**
 * Memo table of compiled descriptors
 *
 * Entries are keyed by descriptor, policy and the name of the active local
 * table, and remember the table versions they were compiled under. An entry
 * compiled under other versions is stale and is never returned.
 *
 * Not synchronized; the owning context serializes access.
 *
 * \ingroup compiler
 */
class compile_cache {
  public:
  struct key_type {
    descriptor desc;
    extra_policy policy;
    std::string scope;

    bool
    operator == (const key_type &other) const noexcept = default;
  }; // struct sieve::compile_cache::key_type

  struct key_hash {
    size_t
    operator () (const key_type &key) const noexcept;
  }; // struct sieve::compile_cache::key_hash

  struct entry {
    pattern_ptr pat;
    uint64_t global_version;
    uint64_t local_version;
  }; // struct sieve::compile_cache::entry

  /**
   * Find a fresh entry
   *
   * \return The cached pattern or null
   */
  pattern_ptr
  find(const key_type &key, uint64_t global_version, uint64_t local_version);

  void
  store(key_type key, entry e);

  void
  clear() noexcept;

  size_t
  size() const noexcept
  { return m_entries.size(); }

  size_t
  hits() const noexcept
  { return m_hits; }

  size_t
  misses() const noexcept
  { return m_misses; }

  private:
  std::unordered_map<key_type, entry, key_hash> m_entries;
  size_t m_hits = 0;
  size_t m_misses = 0;
}; // class sieve::compile_cache


/**
 * Compile a descriptor into a pattern
 *
 * Rules, first match wins:
 * 1. a pattern is returned as is;
 * 2. a type or an alias registered in the active tables yields the registered
 *    pattern (unless the policy is `ignore`);
 * 3. a regular expression yields a regex_pattern;
 * 4. text yields a direct pattern; text that is also a valid regular
 *    expression yields a union of the direct pattern and the expression;
 *    `re:` and `rep:` prefixes select a regular expression, `a|b` a union;
 * 5. `dict[K, V]` yields a mapping_pattern;
 * 6. `list[T]`, `tuple[T]`, `set[T]` yield a sequence_pattern;
 * 7. a type yields a direct_type pattern (`none` yields NONE);
 * 8. a dictionary value yields a switch_pattern;
 * 9. alternatives (or a sequence value) yield a union_pattern;
 * 10. a forward reference yields a forward_ref;
 * 11. a callable yields a type-converting pattern;
 * 12. any other value yields a pattern over its runtime type.
 *
 * Results are cached in the context.
 *
 * \throws ambiguous_descriptor Under the `forbid` policy, if both the global
 *         and the active local table hold an override, or no rule applies
 *
 * \ingroup compiler
 */
[[nodiscard]] pattern_ptr
compile(const descriptor &desc, extra_policy policy, context &ctx);

/**
 * Compile in the default context
 *
 * \ingroup compiler
 */
[[nodiscard]] pattern_ptr
compile(const descriptor &desc, extra_policy policy = extra_policy::allow);

} // namespace sieve
