// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "logging.hpp"

namespace arfidl::impl {

std::optional<LogLevel> parse_log_level(std::string_view str) noexcept
{
  if (str == "trace")
    return LogLevel::trace;
  if (str == "debug")
    return LogLevel::debug;
  if (str == "info")
    return LogLevel::info;
  if (str == "warn" || str == "warning")
    return LogLevel::warn;
  if (str == "error")
    return LogLevel::error;
  if (str == "critical")
    return LogLevel::critical;
  if (str == "off")
    return LogLevel::off;
  return std::nullopt;
}

std::shared_ptr<SimpleLogger>& get_logger()
{
  static std::shared_ptr<SimpleLogger> logger =
      std::make_shared<SimpleLogger>("arfidl", LogLevel::warn);
  return logger;
}

} // namespace arfidl::impl
