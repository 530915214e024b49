#include "server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace gate::runtime {

namespace beast      = boost::beast;
namespace beast_http = boost::beast::http;
namespace net        = boost::asio;
using tcp            = boost::asio::ip::tcp;

namespace {

class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket&& socket, const ServerOptions& options, std::shared_ptr<http::HttpHandler> handler,
          net::thread_pool& workers)
      : stream_(std::move(socket)), options_(options), handler_(std::move(handler)), workers_(workers) {}

  void Start() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
  }

private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(options_.max_body_bytes);
    stream_.expires_after(options_.read_timeout);

    beast_http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == beast_http::error::end_of_stream) {
      return DoClose();
    }
    if (ec == beast_http::error::body_limit) {
      http::Request req;
      req.version(11);
      auto res = http::HttpHandler::ErrorResponse(req, beast_http::status::payload_too_large, "request body too large");
      res.keep_alive(false);
      return Send(std::move(res));
    }
    if (ec) {
      if (ec != beast::error::timeout) {
        GATE_LOG_WARN("http read failed", {observability::StringField("error", ec.message())});
      }
      return;
    }

    // no deadline while the worker runs
    stream_.expires_never();

    auto req = std::make_shared<http::Request>(parser_->release());
    net::post(workers_, [self = shared_from_this(), req] {
      auto res = self->handler_->Handle(*req);
      net::post(self->stream_.get_executor(), [self, res = std::move(res)]() mutable { self->Send(std::move(res)); });
    });
  }

  void Send(http::Response res) {
    auto shared = std::make_shared<http::Response>(std::move(res));
    stream_.expires_after(options_.read_timeout);
    beast_http::async_write(stream_, *shared, [self = shared_from_this(), shared](beast::error_code ec, std::size_t) {
      self->OnWrite(shared->need_eof(), ec);
    });
  }

  void OnWrite(bool close, beast::error_code ec) {
    if (ec) {
      GATE_LOG_WARN("http write failed", {observability::StringField("error", ec.message())});
      return;
    }
    if (close) {
      return DoClose();
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  const ServerOptions& options_;
  std::shared_ptr<http::HttpHandler> handler_;
  net::thread_pool& workers_;
};

} // namespace

class Server::Listener : public std::enable_shared_from_this<Server::Listener> {
public:
  Listener(net::io_context& ioc, tcp::endpoint endpoint, const ServerOptions& options,
           std::shared_ptr<http::HttpHandler> handler, net::thread_pool& workers)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)), options_(options), handler_(std::move(handler)), workers_(workers) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw std::runtime_error("open acceptor: " + ec.message());

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("set reuse_address: " + ec.message());

    acceptor_.bind(endpoint, ec);
    if (ec) throw std::runtime_error("bind " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) + ": " + ec.message());

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("listen: " + ec.message());
  }

  unsigned short Port() const { return acceptor_.local_endpoint().port(); }

  void Start() { DoAccept(); }

  void Close() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
      beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

private:
  void DoAccept() {
    acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
  }

  void OnAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    if (ec) {
      GATE_LOG_WARN("accept failed", {observability::StringField("error", ec.message())});
    } else {
      std::make_shared<Session>(std::move(socket), options_, handler_, workers_)->Start();
    }
    DoAccept();
  }

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  const ServerOptions& options_;
  std::shared_ptr<http::HttpHandler> handler_;
  net::thread_pool& workers_;
};

std::pair<std::string, unsigned short> SplitHostPort(const std::string& bind_address) {
  auto colon = bind_address.rfind(':');
  if (colon == std::string::npos) {
    throw std::invalid_argument("bind address must be host:port: " + bind_address);
  }

  std::string host = bind_address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  int port = 0;
  try {
    size_t used = 0;
    port        = std::stoi(bind_address.substr(colon + 1), &used);
    if (used != bind_address.size() - colon - 1) throw std::invalid_argument("trailing characters");
  } catch (const std::exception&) {
    throw std::invalid_argument("bad port in bind address: " + bind_address);
  }
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("port out of range: " + bind_address);
  }
  return {host.empty() ? "0.0.0.0" : host, static_cast<unsigned short>(port)};
}

Server::Server(ServerOptions options, std::shared_ptr<http::HttpHandler> handler)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      ioc_(static_cast<int>(options_.io_threads == 0 ? 1 : options_.io_threads)),
      workers_(options_.worker_threads == 0 ? 1 : options_.worker_threads) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (running_.exchange(true)) {
    return;
  }

  const auto [host, port] = SplitHostPort(options_.bind_address);
  tcp::endpoint endpoint(net::ip::make_address(host), port);

  listener_ = std::make_shared<Listener>(ioc_, endpoint, options_, handler_, workers_);
  port_     = listener_->Port();
  listener_->Start();

  const unsigned n = options_.io_threads == 0 ? 1 : options_.io_threads;
  threads_.reserve(n);
  for (unsigned i = 0; i < n; ++i) {
    threads_.emplace_back([this] {
      for (;;) {
        try {
          ioc_.run();
          return;
        } catch (const std::exception& e) {
          GATE_LOG_ERROR("io thread exception", {observability::StringField("error", e.what())});
        }
      }
    });
  }

  GATE_LOG_INFO("submission gate listening", {observability::StringField("address", host),
                                              observability::IntField("port", port_),
                                              observability::IntField("io_threads", n),
                                              observability::IntField("worker_threads", options_.worker_threads)});
}

void Server::Wait() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void Server::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (listener_) listener_->Close();
  workers_.join();
  ioc_.stop();
  Wait();
  threads_.clear();
  listener_.reset();
}

} // namespace gate::runtime
