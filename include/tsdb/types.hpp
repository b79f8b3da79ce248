#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace tsdb {

using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::nanoseconds>;
using Tags = std::unordered_map<std::string, std::string>;
using Fields = std::unordered_map<std::string, double>;

// Одна точка временного ряда. Создаётся парсером, дальше передаётся только по
// const-ссылке.
struct Point {
  std::string measurement;
  Tags tags;
  Fields fields; // минимум одно поле
  Timestamp timestamp;
};

inline bool operator==(const Point &a, const Point &b) {
  return a.measurement == b.measurement && a.tags == b.tags &&
         a.fields == b.fields && a.timestamp == b.timestamp;
}

inline bool operator!=(const Point &a, const Point &b) { return !(a == b); }

struct ServerConfig {
  std::string host = "0.0.0.0";
  unsigned short port = 8080;
  std::size_t http_threads = 4;
  std::chrono::seconds read_timeout{30};
  std::chrono::seconds write_timeout{30};
  std::chrono::seconds idle_timeout{120};
  std::chrono::seconds shutdown_timeout{30};
  std::size_t max_body_bytes = 10 * 1024 * 1024;
};

struct StorageConfig {
  std::string data_file = "data.tsv";
  std::int64_t max_file_size = 1073741824; // 1 GiB, 0, без ротации
  std::string backup_dir = "backups";
  bool compression = false;
};

struct LoggingConfig {
  std::string level = "info";    // debug|info|warn|error
  std::string format = "text";   // text|json
  std::string output = "stdout"; // stdout|stderr
};

struct Config {
  ServerConfig server;
  StorageConfig storage;
  LoggingConfig logging;
};

} // namespace tsdb
