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


#include "sieve/utilities/execution_timer.hpp"
#include "sieve/logging.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>


namespace sieve {

static
std::unordered_map<std::string, std::chrono::nanoseconds> g_total_duration;
static
std::unordered_map<std::string, std::chrono::nanoseconds> g_max_duration;
static
std::mutex g_stats_mutex;

bool
benchmarking_enabled() noexcept
{ return global_flags.contains("benchmark"); }

execution_timer::execution_timer(std::string_view name, bool auto_start)
: m_name {name},
  m_running {false},
  m_total_duration {std::chrono::nanoseconds::zero()}
{
  if (auto_start)
    start();
}

execution_timer::~execution_timer()
{
  if (m_running)
    stop();
}

void
execution_timer::start()
{
  if (not m_running)
  {
    m_start_time = std::chrono::steady_clock::now();
    m_running = true;
  }
}

void
execution_timer::stop()
{
  if (m_running)
  {
    const auto duration = std::chrono::steady_clock::now() - m_start_time;
    m_total_duration += duration;
    m_running = false;

    std::lock_guard lock {g_stats_mutex};
    g_total_duration[m_name] += duration;
    auto it = g_max_duration.find(m_name);
    if (it == g_max_duration.end() or duration > it->second)
      g_max_duration[m_name] = duration;
  }
}

void
execution_timer::reset()
{
  m_running = false;
  m_total_duration = std::chrono::nanoseconds::zero();
}

static std::string
_format_duration(std::chrono::nanoseconds duration)
{
  const double ms = std::chrono::duration<double, std::milli>(duration).count();
  if (ms < 1.0)
    return std::format("{:.3f} μs", ms * 1000.0);
  else if (ms < 1000.0)
    return std::format("{:.3f} ms", ms);
  else
    return std::format("{:.3f} s", ms / 1000.0);
}

void
execution_timer::report() const
{
  info("\e[1m{}\e[0m completed in {}", m_name,
       _format_duration(m_total_duration));
}

void
execution_timer::report_global_stats()
{
  std::lock_guard lock {g_stats_mutex};
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;

  for (const auto &[name, duration] : g_total_duration)
  {
    const auto it = g_max_duration.find(name);
    const std::chrono::nanoseconds max =
        it == g_max_duration.end() ? std::chrono::nanoseconds::zero()
                                   : it->second;

    entries.emplace(duration,
                    std::format("\e[1m{:20}\e[0m - total: {}, max: {}", name,
                                _format_duration(duration),
                                _format_duration(max)));
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}

} // namespace sieve
