#pragma once

#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace franchise_core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Off = 3 };

// Process-wide threshold. Messages below it are dropped before formatting.
void set_log_level(LogLevel level);
LogLevel log_level();

const char *log_level_tag(LogLevel level);

template <typename... Args>
void log_at(LogLevel level, fmt::format_string<Args...> format, Args &&...args) {
  if (level < log_level() || level == LogLevel::Off)
    return;
  fmt::print(stderr, "[{}] {}\n", log_level_tag(level),
             fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args &&...args) {
  log_at(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args &&...args) {
  log_at(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> format, Args &&...args) {
  log_at(LogLevel::Warn, format, std::forward<Args>(args)...);
}

} // namespace franchise_core
