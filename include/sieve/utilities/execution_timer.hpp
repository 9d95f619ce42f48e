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

#include <chrono>
#include <optional>
#include <string>
#include <string_view>


namespace sieve {

/**
 * Scoped timer accumulating per-name execution statistics
 *
 * Statistics are reported with report_global_stats() (see `--stats` of
 * sieve-check).
 */
class execution_timer {
  public:
  /**
   * Construct a new timer
   *
   * \param name Name of the operation being timed
   * \param auto_start Whether to start timing immediately
   */
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  static void
  report_global_stats();

  void
  start();

  void
  stop();

  void
  reset();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class sieve::execution_timer

/**
 * Check if function benchmarking is enabled (`--flag benchmark`)
 */
bool
benchmarking_enabled() noexcept;

} // namespace sieve


#ifdef SIEVE_ENABLE_BENCHMARKS
# define SIEVE_FUNCTION_BENCHMARK                                              \
  std::optional<sieve::execution_timer> _sieve_function_timer;                 \
  if (sieve::benchmarking_enabled())                                           \
    _sieve_function_timer.emplace(__func__);
#else
# define SIEVE_FUNCTION_BENCHMARK
#endif
