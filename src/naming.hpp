// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <string_view>

#include <arfidl/token.hpp>

// Naming convention checks
namespace arfidl::naming {

namespace detail {
constexpr bool is_lower(char c) noexcept { return c >= 'a' && c <= 'z'; }
constexpr bool is_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
constexpr bool is_alnum(char c) noexcept
{
  return is_lower(c) || is_upper(c) || is_digit(c);
}

// first char class, then groups of [class]+ separated by single '_'
template <typename Pred>
constexpr bool is_snake_like(std::string_view s, Pred pred) noexcept
{
  if (s.empty() || is_digit(s.front()) || !pred(s.front()))
    return false;
  bool underscore = false;
  for (auto c : s.substr(1)) {
    if (c == '_') {
      if (underscore)
        return false;
      underscore = true;
    } else if (pred(c) || is_digit(c)) {
      underscore = false;
    } else {
      return false;
    }
  }
  return !underscore;
}
} // namespace detail

// ^[a-z][a-z0-9]*(_[a-z0-9]+)*$
constexpr bool is_snake_case(std::string_view s) noexcept
{
  return detail::is_snake_like(s, detail::is_lower);
}

// ^[A-Z][A-Z0-9]*(_[A-Z0-9]+)*$
constexpr bool is_screaming_snake_case(std::string_view s) noexcept
{
  return detail::is_snake_like(s, detail::is_upper);
}

// ^[A-Z][a-zA-Z0-9]*$
constexpr bool is_camel_case(std::string_view s) noexcept
{
  if (s.empty() || !detail::is_upper(s.front()))
    return false;
  for (auto c : s) {
    if (!detail::is_alnum(c))
      return false;
  }
  return true;
}

// Method names accept both lowerCamel and UpperCamel
constexpr bool is_method_name(std::string_view s) noexcept
{
  if (s.empty() || detail::is_digit(s.front()))
    return false;
  for (auto c : s) {
    if (!detail::is_alnum(c))
      return false;
  }
  return true;
}

inline bool is_reserved(std::string_view s) noexcept
{
  return find_keyword(s).has_value();
}

} // namespace arfidl::naming
