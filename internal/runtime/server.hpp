#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/http/http_handler.hpp"

namespace gate::runtime {

struct ServerOptions {
  std::string               bind_address = "0.0.0.0:8080";
  unsigned                  io_threads     = 4;
  unsigned                  worker_threads = 8;
  std::uint64_t             max_body_bytes = 64ull * 1024 * 1024;
  std::chrono::milliseconds read_timeout{30000};
};

/*
  HTTP/1.1 server on Boost.Beast.

  I/O threads only accept, read and write. Each parsed request is handed
  to the worker pool, so a slow database or cache never blocks the
  acceptor; the response is posted back to the connection's strand.
*/
class Server {
public:
  Server(ServerOptions options, std::shared_ptr<http::HttpHandler> handler);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds and starts the threads; throws if the address cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Actual port after Start(); differs from the configured one for port 0.
  unsigned short Port() const { return port_; }

private:
  class Listener;

  ServerOptions options_;
  std::shared_ptr<http::HttpHandler> handler_;

  boost::asio::io_context ioc_;
  boost::asio::thread_pool workers_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  unsigned short port_ = 0;
};

// "host:port" or "[v6]:port"
std::pair<std::string, unsigned short> SplitHostPort(const std::string& bind_address);

} // namespace gate::runtime
