#include "server.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include "internal/http/http_message.hpp"
#include "internal/http/router.hpp"
#include "internal/media/audio_library.hpp"
#include "internal/observability/logging.hpp"

namespace beatstore::runtime {

using beatstore::observability::IntField;
using beatstore::observability::StringField;
using boost::asio::ip::tcp;

namespace {

using Deadline = std::chrono::steady_clock::time_point;

bool WriteAll(tcp::socket& socket, const char* data, std::size_t size) {
  boost::system::error_code ec;
  boost::asio::write(socket, boost::asio::buffer(data, size), ec);
  return !ec;
}

bool WriteResponseHead(tcp::socket& socket, const http::HttpResponse& response) {
  const auto head = http::SerializeHead(response);
  return WriteAll(socket, head.data(), head.size());
}

void WriteError(tcp::socket& socket, int status, const std::string& message) {
  auto response = http::ErrorResponse(status, message);
  response.SetHeader("Access-Control-Allow-Origin", "*");
  if (WriteResponseHead(socket, response)) {
    WriteAll(socket, response.body.data(), response.body.size());
  }
}

} // namespace

struct Server::Connection {
  boost::asio::io_context io;
  tcp::socket             socket{io};

  // Runs the pending read until it completes or the deadline passes; a late
  // read is cancelled and completes with operation_aborted.
  void RunUntil(Deadline deadline) {
    io.restart();
    io.run_until(deadline);
    if (!io.stopped()) {
      boost::system::error_code ignored;
      socket.cancel(ignored);
      io.run();
    }
  }
};

Server::Server(std::string bind_address, std::uint16_t port, std::size_t worker_threads,
               std::chrono::milliseconds read_timeout, std::shared_ptr<http::Router> router,
               std::shared_ptr<media::AudioLibrary> audio)
    : bind_address_(std::move(bind_address)),
      port_(port),
      read_timeout_(read_timeout),
      router_(std::move(router)),
      audio_(std::move(audio)),
      acceptor_(io_),
      workers_(worker_threads == 0 ? 1 : worker_threads) {
  if (!router_ || !audio_) {
    throw std::invalid_argument("server requires a router and an audio library");
  }
  if (read_timeout_.count() <= 0) {
    throw std::invalid_argument("server read timeout must be positive");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  const auto     address = boost::asio::ip::make_address(bind_address_);
  tcp::endpoint endpoint(address, port_);

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();

  running_ = true;
  Accept();
  accept_thread_ = std::thread([this] { io_.run(); });

  BEATSTORE_LOG_INFO("HTTP server listening", {StringField("bind_address", bind_address_), IntField("port", Port())});
}

void Server::Wait() {
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  workers_.join();
}

void Server::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  boost::asio::post(io_, [this] {
    boost::system::error_code ec;
    acceptor_.close(ec);
  });
  Wait();
}

std::uint16_t Server::Port() const {
  boost::system::error_code ec;
  const auto                endpoint = acceptor_.local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

void Server::Accept() {
  auto connection = std::make_shared<Connection>();
  acceptor_.async_accept(connection->socket, [this, connection](const boost::system::error_code& ec) {
    if (!acceptor_.is_open()) {
      return;
    }
    if (ec) {
      BEATSTORE_LOG_WARN("accept failed", {StringField("error", ec.message())});
    } else {
      boost::asio::post(workers_, [this, connection] {
        Serve(*connection);
        boost::system::error_code ignored;
        connection->socket.shutdown(tcp::socket::shutdown_both, ignored);
        connection->socket.close(ignored);
      });
    }
    Accept();
  });
}

void Server::Serve(Connection& connection) const {
  auto&                     socket   = connection.socket;
  const Deadline            deadline = std::chrono::steady_clock::now() + read_timeout_;
  boost::asio::streambuf    buffer(kMaxRequestHeadBytes);
  boost::system::error_code ec;

  std::size_t head_size = 0;
  boost::asio::async_read_until(socket, buffer, "\r\n\r\n",
                                [&ec, &head_size](const boost::system::error_code& result, std::size_t size) {
                                  ec        = result;
                                  head_size = size;
                                });
  connection.RunUntil(deadline);
  if (ec) {
    if (ec == boost::asio::error::not_found) {
      WriteError(socket, 400, "request head too large");
    } else if (ec == boost::asio::error::operation_aborted) {
      BEATSTORE_LOG_INFO("request head timed out", {IntField("timeout_ms", read_timeout_.count())});
      WriteError(socket, 408, "Request timeout");
    }
    return;
  }

  http::HttpRequest request;
  std::size_t       body_size = 0;
  try {
    const auto* data = boost::asio::buffer_cast<const char*>(buffer.data());
    request          = http::ParseRequestHead(std::string(data, head_size));
    body_size        = http::ContentLength(request);
  } catch (const std::exception& e) {
    WriteError(socket, 400, e.what());
    return;
  }
  buffer.consume(head_size);

  if (body_size > kMaxRequestBodyBytes) {
    WriteError(socket, 413, "request body too large");
    return;
  }

  // read_until may have pulled part of the body along with the head.
  const auto* pending = boost::asio::buffer_cast<const char*>(buffer.data());
  request.body.assign(pending, std::min(buffer.size(), body_size));
  if (request.body.size() < body_size) {
    std::string rest(body_size - request.body.size(), '\0');
    boost::asio::async_read(socket, boost::asio::buffer(rest),
                            [&ec](const boost::system::error_code& result, std::size_t) { ec = result; });
    connection.RunUntil(deadline);
    if (ec == boost::asio::error::operation_aborted) {
      BEATSTORE_LOG_INFO("request body timed out", {StringField("path", request.path)});
      WriteError(socket, 408, "Request timeout");
      return;
    }
    if (ec) {
      BEATSTORE_LOG_WARN("request body truncated", {StringField("path", request.path), StringField("error", ec.message())});
      return;
    }
    request.body += rest;
  }

  const auto response = router_->Handle(request);
  if (!WriteResponseHead(socket, response)) {
    return;
  }

  if (!response.file) {
    WriteAll(socket, response.body.data(), response.body.size());
    return;
  }

  try {
    const auto sent = audio_->Stream(*response.file, [&socket](const char* data, std::size_t size) {
      return WriteAll(socket, data, size);
    });
    if (sent < response.file->size) {
      BEATSTORE_LOG_INFO("stream ended early", {StringField("path", request.path),
                                                IntField("sent_bytes", static_cast<std::int64_t>(sent))});
    }
  } catch (const std::exception& e) {
    // The head is already out; all that is left is to drop the connection.
    BEATSTORE_LOG_ERROR("stream failed", {StringField("path", request.path), StringField("error", e.what())});
  }
}

} // namespace beatstore::runtime
