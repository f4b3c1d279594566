// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

// Internal logging header - do not expose in public API

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace arfidl::impl {

enum class LogLevel {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

// "trace", "debug", ... "off"
std::optional<LogLevel> parse_log_level(std::string_view str) noexcept;

// Simple logger that mimics spdlog's interface
class SimpleLogger
{
  std::string name_;
  LogLevel level_;
  std::mutex mutex_;

  const char* level_name(LogLevel lvl) const
  {
    switch (lvl) {
    case LogLevel::trace:
      return "trace";
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warn:
      return "warn";
    case LogLevel::error:
      return "error";
    case LogLevel::critical:
      return "critical";
    default:
      return "unknown";
    }
  }

  std::string format_time() const
  {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm tm;
    localtime_r(&time_t_val, &tm);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
             tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    return buf;
  }

  template <typename... Args>
  void log_impl(LogLevel lvl, fmt::format_string<Args...> fmt, Args&&... args)
  {
    if (lvl < level_)
      return;

    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [2025-12-09 15:30:45.123] [arfidl] [level] message
    std::clog << "[" << format_time() << "] "
              << "[" << name_ << "] "
              << "[" << level_name(lvl) << "] "
              << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
  }

public:
  SimpleLogger(const std::string& name, LogLevel level = LogLevel::info)
      : name_(name)
      , level_(level)
  {
  }

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }

  bool should_log(LogLevel lvl) const { return lvl >= level_; }

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::trace, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::error, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(fmt::format_string<Args...> fmt, Args&&... args)
  {
    log_impl(LogLevel::critical, fmt, std::forward<Args>(args)...);
  }
};

// Process-wide logger, level warn until configured
std::shared_ptr<SimpleLogger>& get_logger();

} // namespace arfidl::impl

#define ARFIDL_LOG_TRACE(...) arfidl::impl::get_logger()->trace(__VA_ARGS__)
#define ARFIDL_LOG_DEBUG(...) arfidl::impl::get_logger()->debug(__VA_ARGS__)
#define ARFIDL_LOG_INFO(...) arfidl::impl::get_logger()->info(__VA_ARGS__)
#define ARFIDL_LOG_WARN(...) arfidl::impl::get_logger()->warn(__VA_ARGS__)
#define ARFIDL_LOG_ERROR(...) arfidl::impl::get_logger()->error(__VA_ARGS__)
#define ARFIDL_LOG_CRITICAL(...)                                               \
  arfidl::impl::get_logger()->critical(__VA_ARGS__)
