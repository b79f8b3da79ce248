#include "tsdb/server.hpp"
#include "tsdb/errors.hpp"
#include "tsdb/log.hpp"
#include "tsdb/time_utils.hpp"
#include <algorithm>
#include <boost/thread.hpp>
#include <thread>
#include <vector>

namespace net = boost::asio;

namespace tsdb {

namespace {

const auto kDrainPollStep = std::chrono::milliseconds(10);
const auto kUptimeInterval = std::chrono::seconds(10);

std::shared_ptr<const Config> require_config(std::shared_ptr<const Config> cfg) {
  if (!cfg)
    throw validation_error("config cannot be nil");
  return cfg;
}

std::shared_ptr<MetricsRegistry>
ensure_registry(std::shared_ptr<MetricsRegistry> metrics) {
  if (metrics)
    return metrics;
  auto r = std::make_shared<MetricsRegistry>();
  register_default_metrics(*r);
  return r;
}

int rank(ServerStatus s) { return status_code(s); }

} // namespace

const char *to_string(ServerStatus s) noexcept {
  switch (s) {
  case ServerStatus::stopped:
    return "stopped";
  case ServerStatus::starting:
    return "starting";
  case ServerStatus::running:
    return "running";
  case ServerStatus::shutting_down:
    return "shutting_down";
  }
  return "stopped";
}

int status_code(ServerStatus s) noexcept {
  switch (s) {
  case ServerStatus::starting:
    return 1;
  case ServerStatus::running:
    return 2;
  case ServerStatus::shutting_down:
    return 3;
  case ServerStatus::stopped:
    return 4;
  }
  return 0;
}

Server::Server(std::shared_ptr<const Config> cfg,
               std::shared_ptr<MetricsRegistry> metrics)
    : Server(std::move(cfg), std::move(metrics), nullptr, true) {}

Server::Server(std::shared_ptr<const Config> cfg,
               std::shared_ptr<MetricsRegistry> metrics,
               std::shared_ptr<Storage> storage)
    : Server(std::move(cfg), std::move(metrics), std::move(storage), false) {}

Server::Server(std::shared_ptr<const Config> cfg,
               std::shared_ptr<MetricsRegistry> metrics,
               std::shared_ptr<Storage> storage, bool open_storage)
    : cfg_(require_config(std::move(cfg))),
      metrics_(ensure_registry(std::move(metrics))),
      storage_(open_storage
                   ? std::make_shared<Storage>(cfg_->storage, *metrics_)
                   : std::move(storage)),
      start_time_(std::chrono::system_clock::now()),
      start_steady_(std::chrono::steady_clock::now()),
      router_(storage_.get(), *metrics_, [this] { return info(); }),
      work_guard_(net::make_work_guard(ioc_)), uptime_timer_(ioc_),
      http_(ioc_, cfg_->server, router_, *this) {
  const auto &s = cfg_->server;
  metrics_->set_gauge(metric::kConfigPort, http_.port());
  metrics_->set_gauge(metric::kConfigReadTimeout,
                      static_cast<double>(s.read_timeout.count()));
  metrics_->set_gauge(metric::kConfigWriteTimeout,
                      static_cast<double>(s.write_timeout.count()));
  metrics_->set_gauge(metric::kConfigIdleTimeout,
                      static_cast<double>(s.idle_timeout.count()));
  metrics_->set_gauge(
      metric::kServerStartTime,
      static_cast<double>(std::chrono::system_clock::to_time_t(start_time_)));
  metrics_->set_gauge(metric::kStorageConnection,
                      storage_ && storage_->is_open() ? 1 : 0);
  metrics_->set_gauge(metric::kServerConnections, 0);
  metrics_->set_gauge(metric::kServerHealth, 1);
  metrics_->set_gauge(metric::kServerUptime, 0);
  publish_status();
}

Server::~Server() {
  close();
  ioc_.stop();
}

bool Server::advance_status(ServerStatus next) {
  auto cur = status_.load();
  while (rank(cur) < rank(next)) {
    if (status_.compare_exchange_weak(cur, next)) {
      publish_status();
      return true;
    }
  }
  return false;
}

void Server::publish_status() {
  metrics_->set_gauge(metric::kServerStatus, status_code(status_.load()));
}

void Server::start() {
  auto expected = ServerStatus::starting;
  if (!status_.compare_exchange_strong(expected, ServerStatus::running)) {
    log_warn("SERVER", std::string("start ignored, server is ") +
                           to_string(expected));
    return;
  }
  publish_status();

  log_info("SERVER", "starting tsdb on " + cfg_->server.host + ":" +
                         std::to_string(http_.port()));
  log_info("SERVER", "metrics available at http://localhost:" +
                         std::to_string(http_.port()) + "/metrics");

  http_.run();
  metrics_->set_gauge(metric::kServerUptime, uptime_seconds());
  schedule_uptime_tick();

  const std::size_t n_threads =
      std::max<std::size_t>(1, cfg_->server.http_threads);
  std::vector<std::unique_ptr<boost::thread>> threads;
  threads.reserve(n_threads - 1);
  for (std::size_t i = 0; i + 1 < n_threads; ++i) {
    threads.emplace_back(std::make_unique<boost::thread>([this] {
      try {
        ioc_.run();
      } catch (const std::exception &e) {
        log_err("SERVER", std::string("event loop thread failed: ") + e.what());
      }
    }));
  }

  // вызывающий поток тоже крутит io_context
  try {
    ioc_.run();
  } catch (const std::exception &e) {
    log_err("SERVER", std::string("event loop failed: ") + e.what());
  }

  for (auto &t : threads)
    t->join();

  // все потоки вышли, можно трогать акцептор напрямую
  http_.close();
  log_info("SERVER", "listener stopped");
}

void Server::schedule_uptime_tick() {
  uptime_timer_.expires_after(kUptimeInterval);
  uptime_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || status_.load() == ServerStatus::stopped)
      return;
    metrics_->set_gauge(metric::kServerUptime, uptime_seconds());
    schedule_uptime_tick();
  });
}

void Server::shutdown(const std::shared_ptr<ShutdownContext> &ctx) {
  if (!ctx)
    throw validation_error("shutdown context cannot be nil");

  boost::unique_lock<boost::mutex> lk(shutdown_m_);
  if (shutdown_done_)
    return;

  log_info("SERVER", "shutting down server gracefully...");
  const auto started = std::chrono::steady_clock::now();

  advance_status(ServerStatus::shutting_down);
  http_.stop();

  const bool drained = wait_for_drain(*ctx);
  const auto remaining = active_connections();
  if (!drained) {
    log_err("SERVER", "shutdown deadline reached with " +
                          std::to_string(remaining) +
                          " requests in flight, forcing stop");
    metrics_->inc_counter(metric::kServerErrors,
                          {{"type", "shutdown_timeout"},
                           {"component", "http_server"}});
  }

  stop_event_loop();
  release_storage();
  advance_status(ServerStatus::stopped);
  shutdown_done_ = true;

  metrics_->observe(metric::kServerShutdownDuration,
                    std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - started)
                        .count());

  if (!drained) {
    auto e = timeout_error(ctx->cancelled()
                               ? "shutdown cancelled before requests drained"
                               : "shutdown deadline exceeded before requests drained");
    e.with_context("active_connections", remaining);
    throw e;
  }
  log_info("SERVER", "server shutdown complete");
}

void Server::close() {
  boost::unique_lock<boost::mutex> lk(shutdown_m_);
  if (shutdown_done_)
    return;

  advance_status(ServerStatus::shutting_down);
  http_.stop();
  stop_event_loop();
  release_storage();
  advance_status(ServerStatus::stopped);
  shutdown_done_ = true;
}

bool Server::wait_for_drain(const ShutdownContext &ctx) {
  while (active_connections() > 0) {
    if (ctx.done())
      return false;
    auto step = std::chrono::steady_clock::duration(kDrainPollStep);
    if (const auto &dl = ctx.deadline()) {
      step = std::min(step, std::max(std::chrono::steady_clock::duration::zero(),
                                     *dl - std::chrono::steady_clock::now()));
    }
    std::this_thread::sleep_for(step);
  }
  return true;
}

void Server::stop_event_loop() {
  work_guard_.reset();
  ioc_.stop();
}

void Server::release_storage() {
  if (!storage_)
    return;
  try {
    storage_->close();
  } catch (const std::exception &e) {
    log_err("SERVER", std::string("storage close error: ") + e.what());
    metrics_->inc_counter(metric::kServerErrors,
                          {{"type", "close_error"}, {"component", "storage"}});
  }
}

void Server::increment_connection() {
  const auto n = conn_count_.fetch_add(1) + 1;
  metrics_->set_gauge(metric::kServerConnections, static_cast<double>(n));
}

void Server::decrement_connection() {
  // не уходим ниже нуля, даже если decrement вызвали лишний раз
  auto cur = conn_count_.load();
  while (cur > 0 && !conn_count_.compare_exchange_weak(cur, cur - 1)) {
  }
  metrics_->set_gauge(metric::kServerConnections,
                      static_cast<double>(conn_count_.load()));
}

std::int64_t Server::active_connections() const noexcept {
  return conn_count_.load();
}

void Server::set_health(bool healthy) {
  healthy_ = healthy;
  metrics_->set_gauge(metric::kServerHealth, healthy ? 1 : 0);
}

double Server::uptime_seconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start_steady_)
      .count();
}

nlohmann::json Server::info() const {
  return nlohmann::json{
      {"status", to_string(status())},
      {"status_code", status_code(status())},
      {"uptime_seconds", uptime_seconds()},
      {"start_time", format_rfc3339_nano(Timestamp(
                         std::chrono::duration_cast<std::chrono::nanoseconds>(
                             start_time_.time_since_epoch())))},
      {"port", http_.port()},
      {"active_connections", active_connections()},
      {"storage_connected", storage_ != nullptr && storage_->is_open()},
      {"healthy", healthy()},
  };
}

} // namespace tsdb
