#include "tsdb/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>

namespace tsdb {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
std::atomic<bool> g_json{false};
std::atomic<bool> g_stderr{true};

const char *level_name(LogLevel lv) {
  switch (lv) {
  case LogLevel::debug:
    return "DBG";
  case LogLevel::info:
    return "INFO";
  case LogLevel::warn:
    return "WARN";
  case LogLevel::error:
    return "ERR";
  }
  return "INFO";
}

std::string now_text() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

} // namespace

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "debug")
    out = LogLevel::debug;
  else if (s == "info")
    out = LogLevel::info;
  else if (s == "warn" || s == "warning")
    out = LogLevel::warn;
  else if (s == "error")
    out = LogLevel::error;
  else
    return false;
  return true;
}

void init_logging(const LoggingConfig &cfg) {
  LogLevel lv;
  if (parse_log_level(cfg.level, lv))
    g_level = static_cast<int>(lv);
  if (cfg.format == "json")
    g_json = true;
  else if (cfg.format == "text")
    g_json = false;
  if (cfg.output == "stdout")
    g_stderr = false;
  else if (cfg.output == "stderr")
    g_stderr = true;
}

void log_write(LogLevel lv, const char *tag, const std::string &msg) {
  if (static_cast<int>(lv) < g_level.load(std::memory_order_relaxed))
    return;

  std::FILE *out = g_stderr ? stderr : stdout;
  if (g_json) {
    nlohmann::json j{{"time", now_text()},
                     {"level", level_name(lv)},
                     {"component", tag},
                     {"msg", msg}};
    // replace: в сообщениях бывают не-UTF8 байты из тела запроса
    std::fprintf(out, "%s\n",
                 j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                     .c_str());
  } else {
    std::fprintf(out, "%s [%s][%s] %s\n", now_text().c_str(), level_name(lv),
                 tag, msg.c_str());
  }
  std::fflush(out);
}

} // namespace tsdb
