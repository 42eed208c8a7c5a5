#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {
LogLevel g_level = LogLevel::Warn;
} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

const char *log_level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "Debug";
  case LogLevel::Info:
    return "Info";
  case LogLevel::Warn:
    return "Warn";
  case LogLevel::Off:
    return "Off";
  }
  return "?";
}

} // namespace franchise_core
