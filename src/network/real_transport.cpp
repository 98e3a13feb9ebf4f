// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/real_transport.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cerrno>

#include <poll.h>

namespace bitwire {
namespace network {

const char* StreamStatusToString(StreamStatus status) {
  switch (status) {
  case StreamStatus::Ok:
    return "ok";
  case StreamStatus::Closed:
    return "closed";
  case StreamStatus::Timeout:
    return "timeout";
  case StreamStatus::Interrupted:
    return "interrupted";
  case StreamStatus::Error:
    return "error";
  }
  return "unknown";
}

namespace {

constexpr std::chrono::milliseconds POLL_SLICE{protocol::STREAM_POLL_INTERVAL_MS};

bool IsWouldBlock(const asio::error_code& ec) {
  return ec == asio::error::would_block || ec == asio::error::try_again;
}

bool IsDisconnect(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::error::connection_reset || ec == asio::error::broken_pipe ||
         ec == asio::error::connection_aborted || ec == asio::error::shut_down;
}

// Poll one descriptor for at most one slice; 1 ready, 0 timeout, -1 error
int PollOnce(int fd, short events, ByteStream::Deadline deadline) {
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - ByteStream::Clock::now());
  auto slice = std::clamp(remaining, std::chrono::milliseconds(0), POLL_SLICE);
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = events;
  int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
  if (rc < 0 && errno == EINTR) {
    return 0;
  }
  return rc > 0 ? 1 : rc;
}

}  // namespace

// ============================================================================
// TcpStream
// ============================================================================

TcpStream::TcpStream() : socket_(io_context_) {}

TcpStream::~TcpStream() {
  close();
}

std::unique_ptr<TcpStream> TcpStream::connect(const std::string& host, uint16_t port,
                                              std::chrono::milliseconds timeout, std::string* error) {
  auto stream = std::make_unique<TcpStream>();

  asio::error_code ec;
  asio::ip::tcp::resolver resolver(stream->io_context_);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    if (error) {
      *error = "resolve failed: " + ec.message();
    }
    return nullptr;
  }

  // Blocking connect with timeout: run the async connect for at most `timeout`
  asio::error_code connect_ec = asio::error::would_block;
  asio::async_connect(stream->socket_, endpoints,
                      [&connect_ec](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
                        connect_ec = result;
                      });
  stream->io_context_.run_for(timeout);

  if (connect_ec == asio::error::would_block) {
    // Still pending: cancel and let the handler complete before returning
    asio::error_code ignored;
    stream->socket_.close(ignored);
    stream->io_context_.restart();
    stream->io_context_.run();
    if (error) {
      *error = "connect timed out";
    }
    return nullptr;
  }
  if (connect_ec) {
    if (error) {
      *error = connect_ec.message();
    }
    return nullptr;
  }

  stream->on_connected();
  return stream;
}

void TcpStream::on_connected() {
  asio::error_code ec;
  socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  socket_.set_option(asio::socket_base::keep_alive(true), ec);
  socket_.non_blocking(true, ec);
  if (ec) {
    LOG_NET_WARN("failed to set non-blocking mode: {}", ec.message());
  }

  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    auto addr = endpoint.address();
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
      addr = asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6());
    }
    remote_addr_ = addr.to_string();
    remote_port_ = endpoint.port();
  }
}

StreamStatus TcpStream::wait_ready(short events, Deadline deadline) {
  while (true) {
    if (interrupted_.load(std::memory_order_acquire)) {
      return StreamStatus::Interrupted;
    }
    if (Clock::now() >= deadline) {
      return StreamStatus::Timeout;
    }
    int rc = PollOnce(socket_.native_handle(), events, deadline);
    if (rc < 0) {
      return StreamStatus::Error;
    }
    if (rc > 0) {
      // Readable, writable, or an error/hangup the next socket call will report
      return StreamStatus::Ok;
    }
  }
}

StreamStatus TcpStream::read_exact(uint8_t* buf, size_t n, Deadline deadline) {
  size_t got = 0;
  while (got < n) {
    StreamStatus status = wait_ready(POLLIN, deadline);
    if (status != StreamStatus::Ok) {
      return status;
    }

    asio::error_code ec;
    size_t k = socket_.read_some(asio::buffer(buf + got, n - got), ec);
    if (ec) {
      if (IsWouldBlock(ec)) {
        continue;
      }
      if (interrupted_.load(std::memory_order_acquire)) {
        return StreamStatus::Interrupted;
      }
      if (IsDisconnect(ec)) {
        return StreamStatus::Closed;
      }
      LOG_NET_DEBUG("read from {}:{} failed: {}", remote_addr_, remote_port_, ec.message());
      return StreamStatus::Error;
    }
    got += k;
  }
  return StreamStatus::Ok;
}

StreamStatus TcpStream::write_all(const uint8_t* data, size_t n) {
  const Deadline deadline = Clock::now() + WRITE_TIMEOUT;
  size_t sent = 0;
  while (sent < n) {
    StreamStatus status = wait_ready(POLLOUT, deadline);
    if (status != StreamStatus::Ok) {
      return status;
    }

    asio::error_code ec;
    size_t k = socket_.write_some(asio::buffer(data + sent, n - sent), ec);
    if (ec) {
      if (IsWouldBlock(ec)) {
        continue;
      }
      if (interrupted_.load(std::memory_order_acquire)) {
        return StreamStatus::Interrupted;
      }
      if (IsDisconnect(ec)) {
        return StreamStatus::Closed;
      }
      LOG_NET_DEBUG("write to {}:{} failed: {}", remote_addr_, remote_port_, ec.message());
      return StreamStatus::Error;
    }
    sent += k;
  }
  return StreamStatus::Ok;
}

void TcpStream::interrupt() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  interrupted_.store(true, std::memory_order_release);
  if (!closed_ && socket_.is_open()) {
    // Wakes a blocked poll() immediately instead of after the next slice
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  }
}

void TcpStream::close() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  interrupted_.store(true, std::memory_order_release);
  if (socket_.is_open()) {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
}

// ============================================================================
// TcpListener
// ============================================================================

TcpListener::TcpListener() : acceptor_(io_context_) {}

TcpListener::~TcpListener() {
  close();
}

bool TcpListener::listen(uint16_t port, std::string* error) {
  using tcp = asio::ip::tcp;
  asio::error_code ec;

  // Prefer dual-stack IPv6, fall back to IPv4-only
  acceptor_.open(tcp::v6(), ec);
  if (!ec) {
    acceptor_.set_option(asio::ip::v6_only(false), ec);
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(tcp::endpoint(tcp::v6(), port), ec);
  }
  if (ec) {
    asio::error_code ignored;
    acceptor_.close(ignored);
    ec.clear();
    acceptor_.open(tcp::v4(), ec);
    if (!ec) {
      acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
      acceptor_.bind(tcp::endpoint(tcp::v4(), port), ec);
    }
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (!ec) {
    acceptor_.non_blocking(true, ec);
  }
  if (ec) {
    if (error) {
      *error = ec.message();
    }
    asio::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }

  local_port_ = acceptor_.local_endpoint(ec).port();
  listening_ = true;
  return true;
}

StreamStatus TcpListener::accept(std::unique_ptr<TcpStream>& out, ByteStream::Deadline deadline) {
  while (true) {
    if (interrupted_.load(std::memory_order_acquire) || !listening_) {
      return StreamStatus::Interrupted;
    }
    if (ByteStream::Clock::now() >= deadline) {
      return StreamStatus::Timeout;
    }

    int rc = PollOnce(acceptor_.native_handle(), POLLIN, deadline);
    if (rc < 0) {
      return StreamStatus::Error;
    }
    if (rc == 0) {
      continue;
    }

    auto stream = std::make_unique<TcpStream>();
    asio::error_code ec;
    acceptor_.accept(stream->socket_, ec);
    if (ec) {
      if (IsWouldBlock(ec) || ec == asio::error::connection_aborted) {
        continue;
      }
      if (interrupted_.load(std::memory_order_acquire)) {
        return StreamStatus::Interrupted;
      }
      LOG_NET_WARN("accept failed: {}", ec.message());
      return StreamStatus::Error;
    }

    stream->on_connected();
    out = std::move(stream);
    return StreamStatus::Ok;
  }
}

void TcpListener::interrupt() {
  interrupted_.store(true, std::memory_order_release);
}

void TcpListener::close() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  interrupted_.store(true, std::memory_order_release);
  listening_ = false;
  if (acceptor_.is_open()) {
    asio::error_code ignored;
    acceptor_.close(ignored);
  }
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::~RealTransport() {
  if (listener_) {
    listener_->close();
  }
}

ByteStreamPtr RealTransport::connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) {
  std::string error;
  auto stream = TcpStream::connect(address, port, timeout, &error);
  if (!stream) {
    LOG_NET_DEBUG("connect to {}:{} failed: {}", address, port, error);
    return nullptr;
  }
  return stream;
}

bool RealTransport::listen(uint16_t port) {
  auto listener = std::make_unique<TcpListener>();
  std::string error;
  if (!listener->listen(port, &error)) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, error);
    return false;
  }
  listener_ = std::move(listener);
  LOG_NET_INFO("listening on port {}", listener_->local_port());
  return true;
}

StreamStatus RealTransport::accept(ByteStreamPtr& out, ByteStream::Deadline deadline) {
  if (!listener_) {
    return StreamStatus::Interrupted;
  }
  std::unique_ptr<TcpStream> stream;
  StreamStatus status = listener_->accept(stream, deadline);
  if (status == StreamStatus::Ok) {
    out = std::move(stream);
  }
  return status;
}

void RealTransport::stop_listening() {
  if (listener_) {
    listener_->interrupt();
  }
}

uint16_t RealTransport::listening_port() const {
  return listener_ ? listener_->local_port() : 0;
}

}  // namespace network
}  // namespace bitwire
