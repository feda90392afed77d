/*
 * Matchbox - Structural pattern matching over garbage-collected values
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


#include "matchbox/options.hpp"

#include <boost/program_options.hpp>

#include <string>


mbx::settings
mbx::parse_settings(int argc, const char *const argv[])
{
  namespace po = boost::program_options;

  std::string verbosity {loglevel_name(settings {}.verbosity)};

  po::options_description desc {"Matchbox options"};
  desc.add_options()
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"),
     "log level: silent, error, warning, info or debug");

  po::variables_map varmap;
  // First stored value wins: command line overrides environment
  po::store(po::command_line_parser(argc, argv)
                .options(desc)
                .allow_unregistered()
                .run(),
            varmap);
  po::store(po::parse_environment(desc,
                                  [](const std::string &name) -> std::string {
                                    if (name == "MATCHBOX_VERBOSITY")
                                      return "verbosity";
                                    return "";
                                  }),
            varmap);
  po::notify(varmap);

  return settings {parse_loglevel(verbosity)};
}


void
mbx::apply(const settings &config)
{
  current_loglevel = config.verbosity;
  debug("log level set to {}", loglevel_name(config.verbosity));
}


mbx::settings
mbx::configure(int argc, const char *const argv[])
{
  const settings config = parse_settings(argc, argv);
  apply(config);
  return config;
}
