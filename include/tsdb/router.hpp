#pragma once
#include "errors.hpp"
#include "metrics.hpp"
#include "storage.hpp"
#include <boost/beast/http.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace tsdb {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// JSON-ответ {error, type, code, message, context} с произвольным статусом.
HttpResponse make_error_response(unsigned version, int status,
                                 const std::string &type,
                                 const std::string &message,
                                 const nlohmann::json &context =
                                     nlohmann::json::object());

// Маршруты сервиса:
//   POST /write    line protocol → хранилище
//   GET  /health   liveness
//   GET  /metrics  Prometheus
// handle() это граница ошибок: наружу ничего не бросает, любое исключение
// превращается в JSON-ответ с кодом по типу ошибки.
class Router {
public:
  using InfoProvider = std::function<nlohmann::json()>;

  // writer может быть nullptr: тогда /write отвечает 503.
  Router(PointWriter *writer, MetricsRegistry &metrics,
         InfoProvider info = nullptr);

  HttpResponse handle(const HttpRequest &req);

private:
  HttpResponse dispatch(const HttpRequest &req, const std::string &path);
  HttpResponse handle_write(const HttpRequest &req);
  HttpResponse handle_health(const HttpRequest &req);
  HttpResponse handle_metrics(const HttpRequest &req);

  PointWriter *writer_;
  MetricsRegistry &metrics_;
  InfoProvider info_;
};

} // namespace tsdb
