#include "test_helpers.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/thread.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <tsdb/errors.hpp>
#include <tsdb/server.hpp>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using tsdb::ErrorType;
using tsdb::Server;
using tsdb::ServerStatus;
using tsdb::ShutdownContext;
using tsdb::test::read_lines;
using tsdb::test::TempDir;

namespace {

std::shared_ptr<tsdb::Config> make_config(const TempDir &dir) {
  auto c = std::make_shared<tsdb::Config>();
  c->server.host = "127.0.0.1";
  c->server.port = 0; // любой свободный
  c->server.http_threads = 2;
  c->storage.data_file = dir.file("data.tsv");
  c->storage.backup_dir = dir.file("backups");
  c->storage.max_file_size = 0;
  return c;
}

bool wait_for_status(const Server &s, ServerStatus want) {
  for (int i = 0; i < 500; ++i) {
    if (s.status() == want)
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

// Простой синхронный клиент на одном соединении.
class Client {
public:
  explicit Client(unsigned short port) : stream_(ioc_) {
    stream_.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  }

  tsdb::HttpResponse request(tsdb::http::verb method, const std::string &target,
                             const std::string &body = {},
                             bool keep_alive = true) {
    tsdb::HttpRequest req{method, target, 11};
    req.set(tsdb::http::field::host, "127.0.0.1");
    req.keep_alive(keep_alive);
    req.body() = body;
    req.prepare_payload();
    tsdb::http::write(stream_, req);

    tsdb::HttpResponse res;
    tsdb::http::read(stream_, buffer_, res);
    return res;
  }

private:
  net::io_context ioc_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
};

// Сервер, крутящийся в отдельном потоке.
struct RunningServer {
  explicit RunningServer(std::shared_ptr<tsdb::Config> cfg)
      : server(std::make_unique<Server>(std::move(cfg))),
        thread([this] { server->start(); }) {}

  ~RunningServer() {
    if (thread.joinable()) {
      server->close();
      thread.join();
    }
  }

  void shutdown(std::chrono::seconds timeout = std::chrono::seconds(5)) {
    server->shutdown(ShutdownContext::with_timeout(timeout));
    thread.join();
  }

  std::unique_ptr<Server> server;
  boost::thread thread;
};

} // namespace

TEST(Server, NullConfigRejected) {
  try {
    Server s(nullptr);
    FAIL() << "expected validation error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::validation);
    EXPECT_EQ(e.message(), "config cannot be nil");
  }
}

TEST(Server, InitialState) {
  TempDir dir;
  Server s(make_config(dir));
  EXPECT_EQ(s.status(), ServerStatus::starting);
  EXPECT_TRUE(s.healthy());
  EXPECT_EQ(s.active_connections(), 0);
  EXPECT_NE(s.bound_port(), 0);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerStatus), 1);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kStorageConnection), 1);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kConfigPort), s.bound_port());

  // uptime виден в /metrics до первого тика таймера
  const auto text = s.metrics().render_prometheus();
  EXPECT_NE(text.find("\ntsdb_server_uptime_seconds 0\n"), std::string::npos)
      << text;

  const auto info = s.info();
  EXPECT_EQ(info["status"], "starting");
  EXPECT_EQ(info["storage_connected"], true);
}

TEST(Server, StatusNames) {
  EXPECT_STREQ(tsdb::to_string(ServerStatus::shutting_down), "shutting_down");
  EXPECT_EQ(tsdb::status_code(ServerStatus::starting), 1);
  EXPECT_EQ(tsdb::status_code(ServerStatus::running), 2);
  EXPECT_EQ(tsdb::status_code(ServerStatus::shutting_down), 3);
  EXPECT_EQ(tsdb::status_code(ServerStatus::stopped), 4);
}

TEST(Server, ConnectionCounterNeverNegative) {
  TempDir dir;
  Server s(make_config(dir));
  s.decrement_connection();
  EXPECT_EQ(s.active_connections(), 0);
  s.increment_connection();
  s.increment_connection();
  EXPECT_EQ(s.active_connections(), 2);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerConnections), 2);
  s.decrement_connection();
  s.decrement_connection();
  s.decrement_connection();
  EXPECT_EQ(s.active_connections(), 0);
}

TEST(Server, SetHealth) {
  TempDir dir;
  Server s(make_config(dir));
  s.set_health(false);
  EXPECT_FALSE(s.healthy());
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerHealth), 0);
  s.set_health(true);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerHealth), 1);
}

TEST(Server, NullShutdownContextRejected) {
  TempDir dir;
  Server s(make_config(dir));
  try {
    s.shutdown(nullptr);
    FAIL() << "expected validation error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::validation);
  }
  EXPECT_EQ(s.status(), ServerStatus::starting);
}

TEST(Server, ShutdownWithoutStart) {
  TempDir dir;
  Server s(make_config(dir));
  s.shutdown(ShutdownContext::with_timeout(std::chrono::seconds(1)));
  EXPECT_EQ(s.status(), ServerStatus::stopped);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerStatus), 4);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kStorageConnection), 0);
  EXPECT_EQ(s.metrics().histogram_count(tsdb::metric::kServerShutdownDuration),
            1u);

  // повторный вызов ничего не делает
  s.shutdown(ShutdownContext::background());
  EXPECT_EQ(s.metrics().histogram_count(tsdb::metric::kServerShutdownDuration),
            1u);

  // start после остановки не запускает event loop
  s.start();
  EXPECT_EQ(s.status(), ServerStatus::stopped);
}

TEST(Server, ConcurrentShutdownCalls) {
  TempDir dir;
  Server s(make_config(dir));

  std::atomic<int> failures{0};
  boost::thread_group group;
  for (int i = 0; i < 5; ++i) {
    group.create_thread([&] {
      try {
        s.shutdown(ShutdownContext::with_timeout(std::chrono::seconds(2)));
      } catch (const std::exception &) {
        ++failures;
      }
    });
  }
  group.join_all();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(s.status(), ServerStatus::stopped);
  EXPECT_EQ(s.metrics().histogram_count(tsdb::metric::kServerShutdownDuration),
            1u);
}

TEST(Server, CloseIsRepeatable) {
  TempDir dir;
  Server s(make_config(dir));
  s.close();
  s.close();
  EXPECT_EQ(s.status(), ServerStatus::stopped);
  EXPECT_NO_THROW(
      s.shutdown(ShutdownContext::with_timeout(std::chrono::seconds(1))));
}

TEST(Server, WorksWithoutStorage) {
  TempDir dir;
  Server s(make_config(dir), nullptr, nullptr);
  EXPECT_EQ(s.info()["storage_connected"], false);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kStorageConnection), 0);
  s.close();
  EXPECT_EQ(s.status(), ServerStatus::stopped);
}

TEST(Server, ShutdownDeadlineWithRequestsInFlight) {
  TempDir dir;
  Server s(make_config(dir));
  s.increment_connection(); // запрос, который никогда не завершится

  const auto started = std::chrono::steady_clock::now();
  try {
    s.shutdown(ShutdownContext::with_timeout(std::chrono::milliseconds(100)));
    FAIL() << "expected timeout error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::timeout);
    EXPECT_EQ(e.context()["active_connections"], 1);
  }
  EXPECT_GE(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds(100));

  // очистка выполнена несмотря на таймаут
  EXPECT_EQ(s.status(), ServerStatus::stopped);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kStorageConnection), 0);
  EXPECT_DOUBLE_EQ(s.metrics().value(tsdb::metric::kServerErrors,
                                     {{"type", "shutdown_timeout"},
                                      {"component", "http_server"}}),
                   1);
}

TEST(Server, CancelledShutdownContext) {
  TempDir dir;
  Server s(make_config(dir));
  s.increment_connection();
  auto ctx = ShutdownContext::background();
  ctx->cancel();
  try {
    s.shutdown(ctx);
    FAIL() << "expected timeout error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::timeout);
    EXPECT_NE(std::string(e.what()).find("cancelled"), std::string::npos);
  }
  EXPECT_EQ(s.status(), ServerStatus::stopped);
}

TEST(Server, ShutdownWaitsForDrain) {
  TempDir dir;
  Server s(make_config(dir));
  s.increment_connection();

  boost::thread finisher([&s] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    s.decrement_connection();
  });

  EXPECT_NO_THROW(
      s.shutdown(ShutdownContext::with_timeout(std::chrono::seconds(5))));
  finisher.join();
  EXPECT_EQ(s.status(), ServerStatus::stopped);
  EXPECT_EQ(s.active_connections(), 0);
}

TEST(Server, HttpWriteRoundTrip) {
  TempDir dir;
  auto cfg = make_config(dir);
  RunningServer rs(cfg);
  ASSERT_TRUE(wait_for_status(*rs.server, ServerStatus::running));

  {
    Client client(rs.server->bound_port());

    auto ok = client.request(
        tsdb::http::verb::post, "/write",
        "cpu,host=server01,region=us-west value=0.64 1434055562000000000\n");
    EXPECT_EQ(ok.result_int(), 200);
    EXPECT_EQ(nlohmann::json::parse(ok.body())["points"], 1);

    // то же соединение (keep-alive)
    auto bad = client.request(tsdb::http::verb::post, "/write",
                              "cpu,host=server01 value=abc 1434055562000000000");
    EXPECT_EQ(bad.result_int(), 400);
    EXPECT_NE(bad.body().find("invalid field value 'abc'"), std::string::npos)
        << bad.body();

    auto health = client.request(tsdb::http::verb::get, "/health", {}, false);
    EXPECT_EQ(health.result_int(), 200);
    EXPECT_EQ(nlohmann::json::parse(health.body())["server"]["status"],
              "running");
  }

  rs.shutdown();
  EXPECT_EQ(rs.server->status(), ServerStatus::stopped);
  EXPECT_EQ(rs.server->active_connections(), 0);

  const auto lines = read_lines(cfg->storage.data_file);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].rfind("cpu\t", 0), 0u);
}

TEST(Server, OversizedBodyRejected) {
  TempDir dir;
  auto cfg = make_config(dir);
  cfg->server.max_body_bytes = 16;
  RunningServer rs(cfg);
  ASSERT_TRUE(wait_for_status(*rs.server, ServerStatus::running));

  {
    Client client(rs.server->bound_port());
    auto res = client.request(tsdb::http::verb::post, "/write",
                              std::string(64, 'x'), false);
    EXPECT_EQ(res.result_int(), 413);
  }

  rs.shutdown();
  EXPECT_TRUE(read_lines(cfg->storage.data_file).empty());
}

TEST(Server, IdleConnectionDoesNotBlockShutdown) {
  TempDir dir;
  RunningServer rs(make_config(dir));
  ASSERT_TRUE(wait_for_status(*rs.server, ServerStatus::running));

  Client client(rs.server->bound_port());
  auto res = client.request(tsdb::http::verb::get, "/health");
  EXPECT_EQ(res.result_int(), 200);

  // соединение остаётся открытым на стороне клиента
  EXPECT_NO_THROW(rs.shutdown(std::chrono::seconds(2)));
  EXPECT_EQ(rs.server->status(), ServerStatus::stopped);
}

// Запрос, тело которого ещё не дочитано, дорабатывает до ответа.
TEST(Server, ShutdownWaitsForPartiallyReceivedRequest) {
  TempDir dir;
  auto cfg = make_config(dir);
  RunningServer rs(cfg);
  ASSERT_TRUE(wait_for_status(*rs.server, ServerStatus::running));

  const std::string body = "cpu,host=a value=1 1434055562000000000\n";
  const std::string head = "POST /write HTTP/1.1\r\n"
                           "Host: 127.0.0.1\r\n"
                           "Content-Length: " +
                           std::to_string(body.size()) + "\r\n\r\n";
  const std::size_t half = body.size() / 2;

  net::io_context ioc;
  tcp::socket sock(ioc);
  sock.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"),
                             rs.server->bound_port()));
  net::write(sock, net::buffer(head + body.substr(0, half)));

  // заголовок разобран: запрос уже учтён
  for (int i = 0; i < 500 && rs.server->active_connections() == 0; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  ASSERT_EQ(rs.server->active_connections(), 1);

  std::atomic<bool> shutdown_failed{false};
  boost::thread stopper([&] {
    try {
      rs.shutdown(std::chrono::seconds(5));
    } catch (const std::exception &) {
      shutdown_failed = true;
    }
  });
  ASSERT_TRUE(wait_for_status(*rs.server, ServerStatus::shutting_down));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(rs.server->status(), ServerStatus::shutting_down);

  net::write(sock, net::buffer(body.substr(half)));
  beast::flat_buffer buffer;
  tsdb::HttpResponse res;
  tsdb::http::read(sock, buffer, res);
  EXPECT_EQ(res.result_int(), 200);
  EXPECT_FALSE(res.keep_alive());

  stopper.join();
  EXPECT_FALSE(shutdown_failed.load());
  EXPECT_EQ(rs.server->status(), ServerStatus::stopped);

  const auto lines = read_lines(cfg->storage.data_file);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].rfind("cpu\thost=a\tvalue\t1\t", 0), 0u);
}
