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


#pragma once

#include "matchbox/logging.hpp"


namespace mbx {

/**
 * Runtime settings of the library
 *
 * \ingroup config
 */
struct settings {
  loglevel verbosity = loglevel::info;
}; // struct mbx::settings


/**
 * Read settings from command line and environment
 *
 * Recognized options:
 * - `--verbosity=<level>` (or `-v` alone for `debug`) on the command line;
 * - `MATCHBOX_VERBOSITY=<level>` in the environment.
 *
 * The command line takes precedence over the environment. Unrecognized
 * command line arguments are ignored so that the options can be mixed with
 * those of a host program.
 *
 * \throws std::runtime_error On an invalid log level name
 * \throws boost::program_options::error On a malformed option
 *
 * \ingroup config
 */
[[nodiscard]] settings
parse_settings(int argc, const char *const argv[]);

/**
 * Make \p config the active settings
 *
 * \ingroup config
 */
void
apply(const settings &config);

/**
 * Parse settings and apply them
 *
 * \return The applied settings
 *
 * \ingroup config
 */
settings
configure(int argc, const char *const argv[]);

} // namespace mbx
