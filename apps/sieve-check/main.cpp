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
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/logging.hpp"
#include "sieve/registry.hpp"
#include "sieve/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


/**
 * Register `name=descriptor` definitions in a new local table
 */
static void
define_locals(sieve::context &ctx, const std::vector<std::string> &definitions)
{
  using namespace sieve;

  if (definitions.empty())
    return;

  // Definitions are compiled before the table becomes active, so they can not
  // refer to each other
  std::vector<std::pair<std::string, pattern_ptr>> patterns;
  for (const std::string &definition : definitions)
  {
    const size_t eq = definition.find('=');
    if (eq == std::string::npos or eq == 0)
    {
      throw std::invalid_argument {
          std::format("invalid local definition '{}', expected name=descriptor",
                      definition)};
    }
    const std::string name = definition.substr(0, eq);
    const pattern_ptr pat = compile(definition.substr(eq + 1), extra_policy::allow, ctx);
    debug("local {} = {}", name, pat->repr());
    patterns.emplace_back(name, pat);
  }

  pattern_table &table = ctx.create_local("cli");
  table.merge(patterns);
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace sieve;

  std::string verbosity {loglevel_name(loglevel::warning)};
  std::vector<std::string> flags;
  std::string descriptor_text {"any"};
  std::optional<std::string> default_text;
  std::string policy_name {extra_policy_name(extra_policy::allow)};
  std::vector<std::string> locals;
  std::vector<std::string> tokens;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help,h", "produce help message")
    ("pattern,p", po::value<std::string>(&descriptor_text), "descriptor of the expected value")
    ("default,d", po::value<std::string>(), "literal substituted for rejected tokens")
    ("extra,e", po::value<std::string>(&policy_name), "extra policy: allow, ignore or forbid")
    ("local,l", po::value<std::vector<std::string>>(&locals), "local pattern name=descriptor")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity")
    ("flag,f", po::value<std::vector<std::string>>(&flags), "flags")
    ("stats", "print compiler cache and timing statistics")
    ("token", po::value<std::vector<std::string>>(&tokens), "tokens to validate");

  po::positional_options_description posdesc;
  posdesc.add("token", -1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [token...]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  if (varmap.contains("default"))
    default_text = varmap["default"].as<std::string>();

  context &ctx = context::instance();
  pattern_ptr pat;
  std::optional<value> default_value;
  try
  {
    // Set global log-level
    loglevel = parse_loglevel(verbosity);

    // Set global flags
    for (const std::string &flag : flags)
      global_flags.emplace(flag);

    // Statistics are reported at info level
    if (varmap.contains("stats"))
    {
      global_flags.emplace("benchmark");
      if (not (loglevel >= loglevel::info))
        loglevel = loglevel::info;
    }

    define_locals(ctx, locals);
    pat = compile(descriptor_text, parse_extra_policy(policy_name), ctx);
    if (default_text)
      default_value = read_literal(*default_text);
  }
  catch (const std::exception &exn)
  {
    error("{}", describe(exn));
    return EXIT_FAILURE;
  }

  info("pattern: {}", pat->repr());

  bool all_passed = true;
  for (const std::string &token : tokens)
  {
    const value input = str(token);
    const validate_result result =
        default_value ? pat->validate(input, *default_value) : pat->validate(input);
    all_passed = all_passed and result.success();
    std::cout << std::format("{} => {}", input, result.repr()) << std::endl;
  }

  if (varmap.contains("stats"))
  {
    info("compile cache: {} entries, {} hits, {} misses", ctx.cache().size(),
         ctx.cache().hits(), ctx.cache().misses());
    execution_timer::report_global_stats();
  }

  return all_passed ? EXIT_SUCCESS : EXIT_FAILURE;
}
