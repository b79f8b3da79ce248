// src/http_server.cpp
#include "tsdb/http_server.hpp"
#include "tsdb/errors.hpp"
#include "tsdb/log.hpp"
#include <algorithm>
#include <boost/beast.hpp>
#include <boost/thread/lock_guard.hpp>
#include <optional>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace tsdb {

namespace {

// RAII: запрос считается "в работе" от разбора заголовка до отправки ответа
class InFlight {
public:
  explicit InFlight(ConnectionTracker &t) : t_(t) { t_.increment_connection(); }
  ~InFlight() { t_.decrement_connection(); }
  InFlight(const InFlight &) = delete;
  InFlight &operator=(const InFlight &) = delete;

private:
  ConnectionTracker &t_;
};

} // namespace

struct HttpServer::Session
    : public std::enable_shared_from_this<HttpServer::Session> {
  beast::tcp_stream stream;
  Router &router;
  ConnectionTracker &tracker;
  const ServerConfig cfg;

  beast::flat_buffer buffer;
  std::optional<http::request_parser<http::string_body>> parser;
  HttpResponse res;

  // меняются только на strand
  bool busy = false;
  bool closing = false;
  bool first_request = true;
  std::unique_ptr<InFlight> in_flight;

  // сокет уже привязан к своему strand (см. do_accept), все обработчики
  // и таймеры tcp_stream идут через него
  Session(tcp::socket s, Router &r, ConnectionTracker &t,
          const ServerConfig &c)
      : stream(std::move(s)), router(r), tracker(t), cfg(c) {}

  void run() {
    auto self = shared_from_this();
    net::dispatch(stream.get_executor(), [self] { self->read_request(); });
  }

  void read_request() {
    if (closing) {
      close_socket();
      return;
    }
    parser.emplace();
    parser->body_limit(cfg.max_body_bytes);
    // первый запрос ждём read_timeout, следующие на keep-alive ждём idle_timeout
    stream.expires_after(first_request ? cfg.read_timeout : cfg.idle_timeout);

    auto self = shared_from_this();
    http::async_read_header(stream, buffer, *parser,
                            [self](beast::error_code ec, std::size_t) {
                              self->on_header(ec);
                            });
  }

  // Заголовок разобран: с этого момента соединение занято и stop() ждёт
  // ответа, даже если тело ещё не дочитано.
  void on_header(beast::error_code ec) {
    if (ec && ec != http::error::body_limit) {
      // конец потока, таймаут или отмена при остановке
      if (ec != http::error::end_of_stream && ec != beast::error::timeout &&
          ec != net::error::operation_aborted) {
        log_dbg("HTTP", "read error: " + ec.message());
      }
      close_socket();
      return;
    }

    busy = true;
    in_flight = std::make_unique<InFlight>(tracker);
    first_request = false;
    if (ec) {
      reject_too_large();
      return;
    }

    stream.expires_after(cfg.read_timeout);
    auto self = shared_from_this();
    http::async_read(stream, buffer, *parser,
                     [self](beast::error_code body_ec, std::size_t) {
                       self->on_read(body_ec);
                     });
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::body_limit) {
      reject_too_large();
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted)
        log_dbg("HTTP", "body read error: " + ec.message());
      in_flight.reset();
      busy = false;
      close_socket();
      return;
    }

    HttpRequest req = parser->release();
    HttpResponse r = router.handle(req);
    const bool keep = r.keep_alive() && !closing;
    write_response(std::move(r), keep);
  }

  void reject_too_large() {
    write_response(
        make_error_response(11, 413, "validation", "request body too large"),
        false);
  }

  void write_response(HttpResponse r, bool keep) {
    res = std::move(r);
    res.keep_alive(keep);
    stream.expires_after(cfg.write_timeout);

    auto self = shared_from_this();
    http::async_write(stream, res,
                      [self, keep](beast::error_code ec, std::size_t) {
                        self->in_flight.reset();
                        self->busy = false;
                        if (ec || !keep || self->closing) {
                          self->close_socket();
                          return;
                        }
                        self->read_request();
                      });
  }

  void close_socket() {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.close();
  }

  // Вызывается при остановке сервера: простаивающее соединение закрываем
  // сразу, занятое закрывается после отправки ответа.
  void close_if_idle() {
    auto self = shared_from_this();
    net::dispatch(stream.get_executor(), [self] {
      self->closing = true;
      if (!self->busy)
        self->stream.close();
    });
  }
};

HttpServer::HttpServer(net::io_context &ioc, const ServerConfig &cfg,
                       Router &router, ConnectionTracker &tracker)
    : ioc_(ioc), cfg_(cfg), router_(router), tracker_(tracker),
      strand_(net::make_strand(ioc)), acceptor_(strand_) {
  beast::error_code ec;
  const auto addr = net::ip::make_address(cfg_.host, ec);
  if (ec)
    throw network_error("invalid listen address '" + cfg_.host + "'",
                        ec.message());

  tcp::endpoint ep{addr, cfg_.port};
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    auto e = network_error("failed to listen on " + cfg_.host + ":" +
                               std::to_string(cfg_.port),
                           ec.message());
    e.with_context("port", cfg_.port);
    throw e;
  }
  port_ = acceptor_.local_endpoint().port();
}

void HttpServer::run() {
  {
    boost::lock_guard<boost::mutex> lk(m_);
    if (stopped_ || running_)
      return;
    running_ = true;
  }
  net::dispatch(strand_, [this] { do_accept(); });
}

void HttpServer::stop() {
  std::vector<std::shared_ptr<Session>> live;
  bool was_running = false;
  {
    boost::lock_guard<boost::mutex> lk(m_);
    if (stopped_)
      return;
    stopped_ = true;
    was_running = running_;
    for (auto &w : sessions_) {
      if (auto s = w.lock())
        live.push_back(std::move(s));
    }
    sessions_.clear();
  }

  if (was_running) {
    net::dispatch(strand_, [this] { close(); });
  } else {
    close();
  }
  for (auto &s : live)
    s->close_if_idle();
}

void HttpServer::close() {
  beast::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::do_accept() {
  // новое соединение сразу получает собственный strand
  acceptor_.async_accept(
      net::make_strand(ioc_),
      net::bind_executor(strand_, [this](beast::error_code ec,
                                         tcp::socket socket) {
        if (!ec) {
          auto s = std::make_shared<Session>(std::move(socket), router_,
                                             tracker_, cfg_);
          {
            boost::lock_guard<boost::mutex> lk(m_);
            if (stopped_)
              return; // сокет закроется вместе с сессией
            sessions_.erase(
                std::remove_if(sessions_.begin(), sessions_.end(),
                               [](const std::weak_ptr<Session> &w) {
                                 return w.expired();
                               }),
                sessions_.end());
            sessions_.push_back(s);
          }
          s->run();
        } else if (ec != net::error::operation_aborted) {
          log_warn("HTTP", "accept error: " + ec.message());
        }

        boost::lock_guard<boost::mutex> lk(m_);
        if (!stopped_ && acceptor_.is_open())
          do_accept();
      }));
}

} // namespace tsdb
