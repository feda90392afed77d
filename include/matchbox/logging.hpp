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

#include "matchbox/format.hpp" // IWYU pragma: export

#include <cstddef>
#include <exception>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>


namespace mbx {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


/**
 * Messages above this level are not printed
 */
extern loglevel current_loglevel;

extern size_t logging_indent;


namespace detail {

/**
 * Write a message to stderr under the given label
 *
 * Every line of the message is prefixed with the current indentation.
 */
void
emit(std::string_view label, const std::string &message);

} // namespace mbx::detail


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt,
      [[maybe_unused]] Args &&...args)
{
#ifndef MATCHBOX_RELEASE_BUILD
  if (current_loglevel >= loglevel::debug)
    detail::emit("\e[7;1mdebug\e[0m",
                 std::format(fmt, std::forward<Args>(args)...));
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (current_loglevel >= loglevel::info)
    detail::emit("", std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (current_loglevel >= loglevel::warning)
    detail::emit("\e[38;5;3;1mwarning\e[0m",
                 std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (current_loglevel >= loglevel::error)
    detail::emit("\e[38;5;1;1merror\e[0m",
                 std::format(fmt, std::forward<Args>(args)...));
}


struct indent {
  indent(ptrdiff_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  ptrdiff_t m_inc;
}; // struct mbx::indent

} // namespace mbx
