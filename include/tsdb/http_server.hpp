// include/tsdb/http_server.hpp
#pragma once
#include "router.hpp"
#include "types.hpp"
#include <boost/asio.hpp>
#include <boost/thread/mutex.hpp>
#include <atomic>
#include <memory>
#include <vector>

namespace tsdb {

// Учёт запросов "в работе": increment при начале обработки запроса,
// decrement после отправки ответа.
class ConnectionTracker {
public:
  virtual ~ConnectionTracker() = default;
  virtual void increment_connection() = 0;
  virtual void decrement_connection() = 0;
};

class HttpServer {
public:
  // Сокет открывается и биндится здесь; ошибка: AppError(network).
  HttpServer(boost::asio::io_context &ioc, const ServerConfig &cfg,
             Router &router, ConnectionTracker &tracker);

  // Начинает принимать соединения. После stop(): no-op.
  void run();

  // Перестаёт принимать новые соединения и закрывает простаивающие.
  // Запросы в обработке дорабатывают.
  void stop();

  // Закрывает listening-сокет синхронно. Только когда event loop не крутится.
  void close();

  unsigned short port() const noexcept { return port_; }

private:
  struct Session;
  void do_accept();

  boost::asio::io_context &ioc_;
  const ServerConfig cfg_;
  Router &router_;
  ConnectionTracker &tracker_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;

  boost::mutex m_;
  bool running_ = false;
  bool stopped_ = false;
  std::vector<std::weak_ptr<Session>> sessions_;
};

} // namespace tsdb
