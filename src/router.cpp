#include "tsdb/router.hpp"
#include "tsdb/line_protocol.hpp"
#include "tsdb/log.hpp"
#include <boost/stacktrace.hpp>
#include <chrono>
#include <sstream>

namespace tsdb {

namespace {

std::string stack_text(const boost::stacktrace::stacktrace &st) {
  std::ostringstream ss;
  ss << st;
  return ss.str();
}

HttpResponse make_json_response(unsigned version, int status,
                                const nlohmann::json &body) {
  HttpResponse res{static_cast<http::status>(status), version};
  res.set(http::field::server, "tsdb");
  res.set(http::field::content_type, "application/json");
  res.body() = body.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

HttpResponse method_not_allowed(const HttpRequest &req, const char *allow) {
  auto res = make_error_response(req.version(), 405, "method_not_allowed",
                                 "Method not allowed");
  res.set(http::field::allow, allow);
  return res;
}

// метка path для метрик: только известные маршруты, чтобы не плодить серии
std::string path_label(const std::string &path) {
  if (path == "/write" || path == "/health" || path == "/metrics")
    return path;
  return "other";
}

} // namespace

HttpResponse make_error_response(unsigned version, int status,
                                 const std::string &type,
                                 const std::string &message,
                                 const nlohmann::json &context) {
  return make_json_response(version, status,
                            nlohmann::json{{"error", type},
                                           {"type", type},
                                           {"code", status},
                                           {"message", message},
                                           {"context", context}});
}

Router::Router(PointWriter *writer, MetricsRegistry &metrics, InfoProvider info)
    : writer_(writer), metrics_(metrics), info_(std::move(info)) {}

HttpResponse Router::handle(const HttpRequest &req) {
  const auto started = std::chrono::steady_clock::now();

  std::string path(req.target());
  if (auto q = path.find('?'); q != std::string::npos)
    path.resize(q);

  HttpResponse res;
  try {
    res = dispatch(req, path);
  } catch (const AppError &e) {
    if (e.type() == ErrorType::internal) {
      log_err("HTTP", std::string("internal error: ") + e.what() +
                          "\nstack trace:\n" + stack_text(e.stack()));
    }
    const auto body = e.to_json();
    res = make_json_response(req.version(), http_status_for(e.type()), body);
  } catch (const std::exception &e) {
    log_err("HTTP", std::string("unhandled exception: ") + e.what() +
                        "\nstack trace:\n" +
                        stack_text(boost::stacktrace::stacktrace()));
    res = make_error_response(req.version(), 500, "internal",
                              "Internal Server Error");
  } catch (...) {
    // исключение не из std: отвечаем 500 и не роняем event loop
    log_err("HTTP", "unhandled non-standard exception\nstack trace:\n" +
                        stack_text(boost::stacktrace::stacktrace()));
    res = make_error_response(req.version(), 500, "internal",
                              "Internal Server Error");
  }

  res.keep_alive(req.keep_alive());

  const std::string method(req.method_string());
  const std::string label = path_label(path);
  metrics_.inc_counter(metric::kHttpRequests,
                       {{"method", method},
                        {"path", label},
                        {"status", std::to_string(res.result_int())}});
  metrics_.observe(metric::kHttpDuration,
                   std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - started)
                       .count(),
                   {{"method", method}, {"path", label}});
  return res;
}

HttpResponse Router::dispatch(const HttpRequest &req, const std::string &path) {
  if (path == "/write")
    return handle_write(req);
  if (path == "/health")
    return handle_health(req);
  if (path == "/metrics")
    return handle_metrics(req);
  throw not_found_error("route not found: " + path);
}

HttpResponse Router::handle_write(const HttpRequest &req) {
  if (req.method() != http::verb::post)
    return method_not_allowed(req, "POST");

  const auto started = std::chrono::steady_clock::now();

  if (req.body().empty()) {
    metrics_.inc_counter(metric::kWriteErrors, {{"reason", "parse"}});
    throw validation_error("empty request body");
  }

  std::vector<Point> points;
  try {
    points = parse_line_protocol(req.body());
  } catch (const AppError &e) {
    log_warn("WRITE", std::string("failed to parse line protocol: ") + e.what());
    metrics_.inc_counter(metric::kWriteErrors, {{"reason", "parse"}});
    throw;
  }

  if (!writer_) {
    metrics_.inc_counter(metric::kWriteErrors, {{"reason", "storage"}});
    throw storage_error("storage is not available");
  }

  // первая ошибка записи прерывает остаток запроса
  std::size_t written = 0;
  for (const auto &p : points) {
    try {
      writer_->write_point(p);
    } catch (const AppError &e) {
      log_err("WRITE", std::string("failed to write point: ") + e.what());
      metrics_.inc_counter(metric::kWriteErrors, {{"reason", "storage"}});
      AppError err = e;
      err.with_context("points_written", written);
      err.with_context("points_total", points.size());
      throw err;
    }
    ++written;
  }

  metrics_.inc_counter(metric::kIngestionBatches);
  metrics_.inc_counter(metric::kIngestionPoints, {},
                       static_cast<double>(written));
  metrics_.observe(metric::kIngestionLatency,
                   std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - started)
                       .count());
  log_dbg("WRITE", "wrote " + std::to_string(written) + " points");

  return make_json_response(req.version(), 200,
                            nlohmann::json{{"status", "ok"},
                                           {"points", written}});
}

HttpResponse Router::handle_health(const HttpRequest &req) {
  if (req.method() != http::verb::get && req.method() != http::verb::head)
    return method_not_allowed(req, "GET");

  nlohmann::json body{{"status", "healthy"}, {"service", "tsdb"}};
  if (info_)
    body["server"] = info_();
  return make_json_response(req.version(), 200, body);
}

HttpResponse Router::handle_metrics(const HttpRequest &req) {
  if (req.method() != http::verb::get)
    return method_not_allowed(req, "GET");

  HttpResponse res{http::status::ok, req.version()};
  res.set(http::field::server, "tsdb");
  res.set(http::field::content_type, "text/plain; version=0.0.4");
  res.body() = metrics_.render_prometheus();
  res.prepare_payload();
  return res;
}

} // namespace tsdb
