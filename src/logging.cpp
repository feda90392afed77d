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


#include "matchbox/logging.hpp"

#include <iostream>
#include <sstream>


mbx::loglevel mbx::current_loglevel = mbx::loglevel::info;

size_t mbx::logging_indent = 0;


void
mbx::detail::emit(std::string_view label, const std::string &message)
{
  std::ostringstream prefix;
  prefix << "matchbox ";
  if (not label.empty())
    prefix << label << ' ';
  for (size_t i = 1; i < logging_indent; ++i)
    prefix << "\e[2m¦\e[0m ";
  if (logging_indent > 0)
    prefix << "| ";

  std::istringstream input {message};
  std::string line;
  std::ostringstream output;
  while (std::getline(input, line))
    output << prefix.str() << line << '\n';
  std::cerr << output.str();
}
