#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

namespace beatstore::http { class Router; }
namespace beatstore::media { class AudioLibrary; }

namespace beatstore::runtime {

inline constexpr std::size_t kMaxRequestHeadBytes = 16 * 1024;
inline constexpr std::size_t kMaxRequestBodyBytes = 1024 * 1024;

/*
  HTTP/1.1 front end.

  One thread accepts; each connection is handed to a fixed-size worker pool
  that reads one request, runs it through the router, writes the response
  (streaming file bodies chunk by chunk) and closes the connection.

  Each connection carries its own io_context so a worker can bound the
  request read by read_timeout; a peer that stalls gets 408 and its worker
  moves on.
*/
class Server {
public:
  Server(std::string bind_address, std::uint16_t port, std::size_t worker_threads,
         std::chrono::milliseconds read_timeout, std::shared_ptr<http::Router> router,
         std::shared_ptr<media::AudioLibrary> audio);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Bound port; differs from the configured one when that was 0.
  std::uint16_t Port() const;

private:
  struct Connection;

  void Accept();
  void Serve(Connection& connection) const;

  std::string               bind_address_;
  std::uint16_t             port_;
  std::chrono::milliseconds read_timeout_;

  std::shared_ptr<http::Router>       router_;
  std::shared_ptr<media::AudioLibrary> audio_;

  boost::asio::io_context        io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool       workers_;
  std::thread                    accept_thread_;
  std::atomic<bool>              running_{false};
};

} // namespace beatstore::runtime
