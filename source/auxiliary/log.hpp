#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/color.h>
#include <fmt/format.h>

namespace aux
{
enum class LogLevel : uint8_t
{
  Debug,
  Info,
  Warn,
  Error,
  Off
};

inline std::atomic<LogLevel>& log_threshold()
{
  static std::atomic<LogLevel> threshold {LogLevel::Info};
  return threshold;
}

inline void set_log_level(LogLevel level)
{
  log_threshold().store(level, std::memory_order_relaxed);
}

inline bool is_log_enabled(LogLevel level)
{
  return level >= log_threshold().load(std::memory_order_relaxed);
}

/// Writes "[level][scope] message" lines to stderr.
class Logger
{
  std::string_view m_scope;

public:
  constexpr explicit Logger(std::string_view scope)
      : m_scope {scope}
  {
  }

  template<typename... Args>
  void debug(fmt::format_string<Args...> format, Args&&... args) const
  {
    write(LogLevel::Debug, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(fmt::format_string<Args...> format, Args&&... args) const
  {
    write(LogLevel::Info, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(fmt::format_string<Args...> format, Args&&... args) const
  {
    write(LogLevel::Warn, format, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(fmt::format_string<Args...> format, Args&&... args) const
  {
    write(LogLevel::Error, format, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void write(LogLevel level,
             fmt::format_string<Args...> format,
             Args&&... args) const
  {
    if (!is_log_enabled(level)) {
      return;
    }

    fmt::print(stderr, style(level), "[{}][{}] ", label(level), m_scope);
    fmt::print(stderr, "{}\n", fmt::format(format, std::forward<Args>(args)...));
  }

  static fmt::text_style style(LogLevel level)
  {
    switch (level) {
      case LogLevel::Debug:
        return fg(fmt::color::gray);
      case LogLevel::Info:
        return fg(fmt::color::aqua);
      case LogLevel::Warn:
        return fg(fmt::color::orange) | fmt::emphasis::bold;
      default:
        return fg(fmt::color::red) | fmt::emphasis::bold;
    }
  }

  static std::string_view label(LogLevel level)
  {
    switch (level) {
      case LogLevel::Debug:
        return "debug";
      case LogLevel::Info:
        return "info";
      case LogLevel::Warn:
        return "warn";
      default:
        return "error";
    }
  }
};
}  // namespace aux
