// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

/*
 Transport abstraction

 ByteStream is the only thing the wire codec and peer sessions see of a
 connection: read exactly N bytes before a deadline, write all bytes, and
 be interruptible from another thread. TCP sockets, in-memory pipes used
 by tests, or a TLS wrapper all plug in behind it.

 Transport produces ByteStreams: outbound via connect(), inbound via
 listen() + accept(). NetworkManager only talks to this interface.
*/

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace bitwire {
namespace network {

enum class StreamStatus {
  Ok,
  Closed,       // Orderly EOF or connection reset by peer
  Timeout,      // Deadline passed before the operation completed
  Interrupted,  // interrupt() was called
  Error,        // Any other I/O failure
};

const char* StreamStatusToString(StreamStatus status);

class ByteStream {
public:
  using Clock = std::chrono::steady_clock;
  using Deadline = Clock::time_point;

  virtual ~ByteStream() = default;

  // Blocks until exactly n bytes are read, the deadline passes, or the stream
  // is interrupted. On anything but Ok the stream position is unspecified.
  virtual StreamStatus read_exact(uint8_t* buf, size_t n, Deadline deadline) = 0;

  // Blocks until all n bytes are handed to the OS
  virtual StreamStatus write_all(const uint8_t* data, size_t n) = 0;

  // Thread-safe. Every current and future blocking call returns Interrupted
  // within STREAM_POLL_INTERVAL_MS.
  virtual void interrupt() = 0;

  // Release the underlying connection. Not to be called concurrently with read/write.
  virtual void close() = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
};

using ByteStreamPtr = std::unique_ptr<ByteStream>;

class Transport {
public:
  virtual ~Transport() = default;

  // Resolve and connect; nullptr on failure (reason logged by the implementation)
  virtual ByteStreamPtr connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) = 0;

  // Bind and listen. False if the port cannot be bound.
  virtual bool listen(uint16_t port) = 0;

  // Wait for one inbound connection. Timeout if none arrived before the deadline,
  // Interrupted after stop_listening().
  virtual StreamStatus accept(ByteStreamPtr& out, ByteStream::Deadline deadline) = 0;

  virtual void stop_listening() = 0;

  // Bound port (0 if not listening)
  virtual uint16_t listening_port() const = 0;
};

}  // namespace network
}  // namespace bitwire
