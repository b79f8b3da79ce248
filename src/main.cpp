#include "tsdb/config.hpp"
#include "tsdb/errors.hpp"
#include "tsdb/log.hpp"
#include "tsdb/server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

static void report(const char *what, const std::exception &e) {
  if (auto *app = dynamic_cast<const tsdb::AppError *>(&e)) {
    tsdb::log_err("MAIN", std::string(what) + ": " + app->what() + " (type: " +
                              tsdb::to_string(app->type()) + ")");
  } else {
    tsdb::log_err("MAIN", std::string(what) + ": " + e.what());
  }
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path = "server.json";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      cfg_path = argv[++i];
    } else if (a == "--help" || a == "-h") {
      std::cout << "usage: " << argv[0] << " [--config server.json]\n";
      return 0;
    }
  }

  std::shared_ptr<tsdb::Config> cfg;
  try {
    cfg = std::make_shared<tsdb::Config>(tsdb::load_config(cfg_path));
    tsdb::validate_config(*cfg);
  } catch (const std::exception &e) {
    report("failed to load configuration", e);
    return 1;
  }

  tsdb::init_logging(cfg->logging);
  tsdb::log_info("MAIN", "starting tsdb...");
  tsdb::log_info("MAIN", "configuration: " + tsdb::to_string(*cfg));

  std::unique_ptr<tsdb::Server> server;
  try {
    server = std::make_unique<tsdb::Server>(cfg);
  } catch (const std::exception &e) {
    report("failed to create server", e);
    return 1;
  }

  // Ждём сигнал или выход листенера (ошибка event loop)
  boost::asio::io_context sig_ioc;
  boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code &ec, int sig) {
    if (!ec)
      tsdb::log_info("MAIN", "received signal " + std::to_string(sig) +
                                 ", shutting down gracefully...");
  });

  boost::thread serve([&] {
    try {
      server->start();
    } catch (const std::exception &e) {
      report("server error", e);
    }
    // листенер вышел сам, будим основной поток
    boost::asio::post(sig_ioc, [&signals] {
      boost::system::error_code ec;
      signals.cancel(ec);
    });
  });

  sig_ioc.run();

  int rc = 0;
  try {
    server->shutdown(
        tsdb::ShutdownContext::with_timeout(cfg->server.shutdown_timeout));
  } catch (const std::exception &e) {
    report("error during shutdown", e);
    rc = 1;
  }

  serve.join();
  server.reset();
  tsdb::log_info("MAIN", "tsdb shutdown complete");
  return rc;
}
