#pragma once
#include "types.hpp"
#include <string>

namespace tsdb {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

bool parse_log_level(const std::string &s, LogLevel &out);

// Настраивает уровень, формат (text|json) и поток (stdout|stderr).
// Неизвестные значения оставляют текущие настройки.
void init_logging(const LoggingConfig &cfg);

void log_write(LogLevel lv, const char *tag, const std::string &msg);

inline void log_dbg(const char *tag, const std::string &msg) {
  log_write(LogLevel::debug, tag, msg);
}
inline void log_info(const char *tag, const std::string &msg) {
  log_write(LogLevel::info, tag, msg);
}
inline void log_warn(const char *tag, const std::string &msg) {
  log_write(LogLevel::warn, tag, msg);
}
inline void log_err(const char *tag, const std::string &msg) {
  log_write(LogLevel::error, tag, msg);
}

} // namespace tsdb
