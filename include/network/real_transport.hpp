// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <asio.hpp>

namespace bitwire {
namespace network {

// TcpStream - blocking TCP socket behind the ByteStream interface
//
// The socket runs in non-blocking mode; every read or write waits for
// readiness in slices of STREAM_POLL_INTERVAL_MS so the interrupt flag and
// the deadline are observed while blocked. Synchronous socket operations may
// run concurrently with interrupt() (asio documents synchronous send, receive
// and shutdown as thread safe with respect to each other).
class TcpStream : public ByteStream {
public:
  TcpStream();
  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  // Resolve host (name or literal) and connect within timeout; nullptr on failure
  static std::unique_ptr<TcpStream> connect(const std::string& host, uint16_t port,
                                            std::chrono::milliseconds timeout, std::string* error = nullptr);

  StreamStatus read_exact(uint8_t* buf, size_t n, Deadline deadline) override;
  StreamStatus write_all(const uint8_t* data, size_t n) override;
  void interrupt() override;
  void close() override;
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }

  // Upper bound on a single write_all() against a peer that stops reading
  static constexpr std::chrono::seconds WRITE_TIMEOUT{60};

private:
  friend class TcpListener;

  // Socket options and endpoint cache once connected/accepted
  void on_connected();

  // Wait until the socket is readable/writable, the deadline passes, or interrupt
  StreamStatus wait_ready(short events, Deadline deadline);

  asio::io_context io_context_;
  asio::ip::tcp::socket socket_;

  std::mutex state_mutex_;  // interrupt() vs close()
  std::atomic<bool> interrupted_{false};
  bool closed_{false};

  std::string remote_addr_;
  uint16_t remote_port_{0};
};

// TcpListener - accepting socket with interruptible accept
class TcpListener {
public:
  TcpListener();
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Dual-stack where available, IPv4 otherwise. Port 0 picks an ephemeral port.
  bool listen(uint16_t port, std::string* error = nullptr);

  StreamStatus accept(std::unique_ptr<TcpStream>& out, ByteStream::Deadline deadline);

  void interrupt();
  void close();

  uint16_t local_port() const { return local_port_; }
  bool is_listening() const { return listening_; }

private:
  asio::io_context io_context_;
  asio::ip::tcp::acceptor acceptor_;
  std::mutex state_mutex_;
  std::atomic<bool> interrupted_{false};
  std::atomic<bool> listening_{false};
  uint16_t local_port_{0};
};

// RealTransport - TCP implementation of Transport
class RealTransport : public Transport {
public:
  RealTransport() = default;
  ~RealTransport() override;

  ByteStreamPtr connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) override;
  bool listen(uint16_t port) override;
  StreamStatus accept(ByteStreamPtr& out, ByteStream::Deadline deadline) override;
  void stop_listening() override;
  uint16_t listening_port() const override;

private:
  std::unique_ptr<TcpListener> listener_;
};

}  // namespace network
}  // namespace bitwire
