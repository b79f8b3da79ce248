#include "tsdb/config.hpp"
#include "tsdb/errors.hpp"
#include "tsdb/log.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <vector>

using json = nlohmann::json;

namespace tsdb {

namespace {

const char *env(const char *key) {
  const char *v = std::getenv(key);
  return (v && *v) ? v : nullptr;
}

bool parse_int(const char *s, long long &out) {
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0')
    return false;
  out = v;
  return true;
}

bool parse_bool(const std::string &s, bool &out) {
  if (s == "1" || s == "t" || s == "T" || s == "true" || s == "TRUE" ||
      s == "True") {
    out = true;
    return true;
  }
  if (s == "0" || s == "f" || s == "F" || s == "false" || s == "FALSE" ||
      s == "False") {
    out = false;
    return true;
  }
  return false;
}

void env_string(const char *key, std::string &dst) {
  if (auto v = env(key))
    dst = v;
}

void env_seconds(const char *key, std::chrono::seconds &dst) {
  long long v = 0;
  if (auto s = env(key); s && parse_int(s, v))
    dst = std::chrono::seconds(v);
}

} // namespace

void apply_json(Config &c, const json &j) {
  auto get = [&](const json &obj, const char *key, auto def) {
    return obj.contains(key) ? obj[key].get<std::decay_t<decltype(def)>>()
                             : def;
  };
  auto seconds = [&](const json &obj, const char *key, std::chrono::seconds def) {
    return std::chrono::seconds(get(obj, key, static_cast<long long>(def.count())));
  };

  const json empty = json::object();
  const json &srv = j.contains("server") ? j["server"] : empty;
  const json &st = j.contains("storage") ? j["storage"] : empty;
  const json &lg = j.contains("logging") ? j["logging"] : empty;

  c.server.host = get(srv, "host", c.server.host);
  const long long port = get(srv, "port", static_cast<long long>(c.server.port));
  if (port < 0 || port > 65535) {
    auto e = validation_error("server.port must be in 0..65535");
    e.with_context("port", port);
    throw e;
  }
  c.server.port = static_cast<unsigned short>(port);
  c.server.http_threads = get(srv, "http_threads", c.server.http_threads);
  c.server.read_timeout = seconds(srv, "read_timeout", c.server.read_timeout);
  c.server.write_timeout = seconds(srv, "write_timeout", c.server.write_timeout);
  c.server.idle_timeout = seconds(srv, "idle_timeout", c.server.idle_timeout);
  c.server.shutdown_timeout =
      seconds(srv, "shutdown_timeout", c.server.shutdown_timeout);
  c.server.max_body_bytes = get(srv, "max_body_bytes", c.server.max_body_bytes);

  c.storage.data_file = get(st, "data_file", c.storage.data_file);
  c.storage.max_file_size = get(st, "max_file_size", c.storage.max_file_size);
  c.storage.backup_dir = get(st, "backup_dir", c.storage.backup_dir);
  c.storage.compression = get(st, "compression", c.storage.compression);

  c.logging.level = get(lg, "level", c.logging.level);
  c.logging.format = get(lg, "format", c.logging.format);
  c.logging.output = get(lg, "output", c.logging.output);
}

void apply_env(Config &c) {
  long long v = 0;

  env_string("HOST", c.server.host);
  if (auto s = env("PORT"); s && parse_int(s, v) && v >= 0 && v <= 65535)
    c.server.port = static_cast<unsigned short>(v);
  if (auto s = env("HTTP_THREADS"); s && parse_int(s, v) && v > 0)
    c.server.http_threads = static_cast<std::size_t>(v);
  env_seconds("READ_TIMEOUT", c.server.read_timeout);
  env_seconds("WRITE_TIMEOUT", c.server.write_timeout);
  env_seconds("IDLE_TIMEOUT", c.server.idle_timeout);
  env_seconds("SHUTDOWN_TIMEOUT", c.server.shutdown_timeout);

  env_string("DATA_FILE", c.storage.data_file);
  if (auto s = env("MAX_FILE_SIZE"); s && parse_int(s, v))
    c.storage.max_file_size = v;
  env_string("BACKUP_DIR", c.storage.backup_dir);
  if (auto s = env("COMPRESSION")) {
    bool b = false;
    if (parse_bool(s, b))
      c.storage.compression = b;
  }

  env_string("LOG_LEVEL", c.logging.level);
  env_string("LOG_FORMAT", c.logging.format);
  env_string("LOG_OUTPUT", c.logging.output);
}

Config load_config(const std::string &path) {
  Config c;
  std::ifstream f(path);
  if (f) {
    try {
      json j;
      f >> j;
      apply_json(c, j);
    } catch (const json::exception &e) {
      auto err = AppError::wrap(e, ErrorType::validation,
                                "failed to read config file");
      err.with_context("path", path);
      throw err;
    } catch (AppError &e) {
      e.with_context("path", path);
      throw;
    }
  }
  apply_env(c);
  return c;
}

void validate_config(const Config &c) {
  std::vector<std::string> problems;
  if (c.server.http_threads == 0)
    problems.emplace_back("server.http_threads must be > 0");
  if (c.server.read_timeout.count() <= 0)
    problems.emplace_back("server.read_timeout must be > 0");
  if (c.server.write_timeout.count() <= 0)
    problems.emplace_back("server.write_timeout must be > 0");
  if (c.server.idle_timeout.count() <= 0)
    problems.emplace_back("server.idle_timeout must be > 0");
  if (c.server.shutdown_timeout.count() <= 0)
    problems.emplace_back("server.shutdown_timeout must be > 0");
  if (c.server.max_body_bytes == 0)
    problems.emplace_back("server.max_body_bytes must be > 0");
  if (c.storage.data_file.empty())
    problems.emplace_back("storage.data_file must not be empty");
  if (c.storage.max_file_size > 0 && c.storage.backup_dir.empty())
    problems.emplace_back("storage.backup_dir is required when rotation is on");
  LogLevel lv;
  if (!parse_log_level(c.logging.level, lv))
    problems.emplace_back("logging.level '" + c.logging.level + "' is unknown");
  if (c.logging.format != "text" && c.logging.format != "json")
    problems.emplace_back("logging.format '" + c.logging.format + "' is unknown");
  if (c.logging.output != "stdout" && c.logging.output != "stderr")
    problems.emplace_back("logging.output '" + c.logging.output + "' is unknown");

  if (problems.empty())
    return;

  std::string msg = "invalid configuration: ";
  for (std::size_t i = 0; i < problems.size(); ++i) {
    if (i > 0)
      msg += "; ";
    msg += problems[i];
  }
  auto err = validation_error(msg);
  err.with_context("problems", problems);
  throw err;
}

std::string to_string(const Config &c) {
  std::ostringstream ss;
  ss << "server: " << c.server.host << ":" << c.server.port
     << " threads=" << c.server.http_threads
     << " read_timeout=" << c.server.read_timeout.count() << "s"
     << " write_timeout=" << c.server.write_timeout.count() << "s"
     << " idle_timeout=" << c.server.idle_timeout.count() << "s"
     << " shutdown_timeout=" << c.server.shutdown_timeout.count() << "s"
     << " max_body_bytes=" << c.server.max_body_bytes << "; storage: "
     << c.storage.data_file << " max_file_size=" << c.storage.max_file_size
     << " backup_dir=" << c.storage.backup_dir
     << " compression=" << (c.storage.compression ? "true" : "false")
     << "; logging: " << c.logging.level << "/" << c.logging.format << "/"
     << c.logging.output;
  return ss.str();
}

} // namespace tsdb
