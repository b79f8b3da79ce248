#pragma once
#include "http_server.hpp"
#include "metrics.hpp"
#include "router.hpp"
#include "shutdown_context.hpp"
#include "storage.hpp"
#include "types.hpp"
#include <boost/asio.hpp>
#include <boost/thread/mutex.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>

namespace tsdb {

enum class ServerStatus { stopped, starting, running, shutting_down };

const char *to_string(ServerStatus s) noexcept;

// Числовое значение для tsdb_server_status: starting=1, running=2,
// shutting_down=3, stopped=4. 0 означает, что сервер ещё не создан.
int status_code(ServerStatus s) noexcept;

// Владеет HTTP-листенером, хранилищем и event loop'ом.
//
//   starting --start()--> running --shutdown()/close()--> shutting_down --> stopped
//
// shutdown() и close() идемпотентны и безопасны при одновременном вызове из
// нескольких потоков: работу выполняет первый, остальные дожидаются его и
// возвращаются. Статус в итоге всегда stopped.
class Server : public ConnectionTracker {
public:
  // cfg == nullptr: AppError(validation). metrics == nullptr, свой реестр.
  explicit Server(std::shared_ptr<const Config> cfg,
                  std::shared_ptr<MetricsRegistry> metrics = nullptr);

  // Хранилище передаётся снаружи и может быть nullptr (тогда /write, 503).
  Server(std::shared_ptr<const Config> cfg,
         std::shared_ptr<MetricsRegistry> metrics,
         std::shared_ptr<Storage> storage);

  ~Server() override;

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  // Блокирует до остановки event loop. Вызывать один раз; если сервер уже
  // не в starting, сразу возвращает управление.
  void start();

  // Graceful: перестать принимать соединения, дождаться текущих запросов
  // или истечения/отмены ctx, закрыть хранилище. При истечении ctx
  // бросает AppError(timeout), но очистка всё равно выполняется.
  // ctx == nullptr: AppError(validation), статус не меняется.
  void shutdown(const std::shared_ptr<ShutdownContext> &ctx);

  // Без ожидания запросов. Можно вызывать сколько угодно раз.
  void close();

  void increment_connection() override;
  void decrement_connection() override;
  std::int64_t active_connections() const noexcept;

  void set_health(bool healthy);
  bool healthy() const noexcept { return healthy_.load(); }

  ServerStatus status() const noexcept { return status_.load(); }
  std::chrono::system_clock::time_point start_time() const noexcept {
    return start_time_;
  }
  double uptime_seconds() const;
  unsigned short bound_port() const noexcept { return http_.port(); }

  const Config &config() const noexcept { return *cfg_; }
  MetricsRegistry &metrics() noexcept { return *metrics_; }

  nlohmann::json info() const;

private:
  Server(std::shared_ptr<const Config> cfg,
         std::shared_ptr<MetricsRegistry> metrics,
         std::shared_ptr<Storage> storage, bool open_storage);

  bool advance_status(ServerStatus next);
  void publish_status();
  bool wait_for_drain(const ShutdownContext &ctx);
  void stop_event_loop();
  void release_storage();
  void schedule_uptime_tick();

  const std::shared_ptr<const Config> cfg_;
  const std::shared_ptr<MetricsRegistry> metrics_;
  std::shared_ptr<Storage> storage_;

  std::atomic<ServerStatus> status_{ServerStatus::starting};
  std::atomic<std::int64_t> conn_count_{0};
  std::atomic<bool> healthy_{true};
  const std::chrono::system_clock::time_point start_time_;
  const std::chrono::steady_clock::time_point start_steady_;

  boost::mutex shutdown_m_;
  bool shutdown_done_ = false;

  Router router_;

  // порядок важен: io_context разрушается раньше роутера и счётчиков,
  // на которые ссылаются сессии
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  boost::asio::steady_timer uptime_timer_;
  HttpServer http_;
};

} // namespace tsdb
