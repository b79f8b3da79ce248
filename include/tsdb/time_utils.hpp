#pragma once
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace tsdb {

inline Timestamp from_unix_nanos(std::int64_t ns) {
  return Timestamp(std::chrono::nanoseconds(ns));
}

inline std::int64_t to_unix_nanos(Timestamp ts) {
  return ts.time_since_epoch().count();
}

// RFC 3339 с наносекундами в UTC, хвостовые нули дробной части обрезаются:
// 2015-06-11T20:46:02Z, 2015-06-11T20:46:02.5Z, ...
inline std::string format_rfc3339_nano(Timestamp ts) {
  std::int64_t ns = to_unix_nanos(ts);
  std::int64_t secs = ns / 1'000'000'000LL;
  std::int64_t frac = ns % 1'000'000'000LL;
  if (frac < 0) { // до эпохи, округляем вниз
    frac += 1'000'000'000LL;
    secs -= 1;
  }

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                        tm.tm_hour, tm.tm_min, tm.tm_sec);
  std::string out(buf, static_cast<std::size_t>(n));

  if (frac != 0) {
    char fbuf[16];
    std::snprintf(fbuf, sizeof(fbuf), "%09lld", static_cast<long long>(frac));
    std::string digits(fbuf);
    while (!digits.empty() && digits.back() == '0')
      digits.pop_back();
    out += '.';
    out += digits;
  }
  out += 'Z';
  return out;
}

// Суффикс файла бэкапа при ротации: YYYYMMDD-HHMMSS (локальное время).
inline std::string format_backup_suffix(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
  return buf;
}

} // namespace tsdb
