// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "infra/memory_stream.hpp"

#include <algorithm>

namespace bitwire {
namespace test {

using network::ByteStream;
using network::StreamStatus;

MemoryStream::MemoryStream(std::shared_ptr<PipeBuffer> in, std::shared_ptr<PipeBuffer> out,
                           std::string remote_address, uint16_t remote_port)
    : in_(std::move(in)), out_(std::move(out)), remote_address_(std::move(remote_address)),
      remote_port_(remote_port) {}

MemoryStream::~MemoryStream() {
  close();
}

StreamStatus MemoryStream::read_exact(uint8_t* buf, size_t n, Deadline deadline) {
  std::unique_lock<std::mutex> lock(in_->mutex);
  for (;;) {
    if (interrupted_.load()) {
      return StreamStatus::Interrupted;
    }
    if (in_->data.size() >= n) {
      std::copy_n(in_->data.begin(), n, buf);
      in_->data.erase(in_->data.begin(), in_->data.begin() + static_cast<std::ptrdiff_t>(n));
      return StreamStatus::Ok;
    }
    if (in_->closed) {
      return StreamStatus::Closed;
    }
    auto now = ByteStream::Clock::now();
    if (now >= deadline) {
      return StreamStatus::Timeout;
    }
    auto slice = now + std::chrono::milliseconds(protocol::STREAM_POLL_INTERVAL_MS);
    in_->cv.wait_until(lock, std::min(deadline, slice));
  }
}

StreamStatus MemoryStream::write_all(const uint8_t* data, size_t n) {
  std::unique_lock<std::mutex> lock(out_->mutex);
  for (;;) {
    if (interrupted_.load()) {
      return StreamStatus::Interrupted;
    }
    if (out_->closed) {
      return StreamStatus::Closed;
    }
    if (!out_->stalled) {
      break;
    }
    out_->cv.wait_for(lock, std::chrono::milliseconds(protocol::STREAM_POLL_INTERVAL_MS));
  }
  out_->data.insert(out_->data.end(), data, data + n);
  out_->cv.notify_all();
  return StreamStatus::Ok;
}

void MemoryStream::interrupt() {
  interrupted_.store(true);
  for (const auto& pipe : {in_, out_}) {
    std::lock_guard<std::mutex> lock(pipe->mutex);
    pipe->cv.notify_all();
  }
}

void MemoryStream::close() {
  if (closed_.exchange(true)) {
    return;
  }
  for (const auto& pipe : {in_, out_}) {
    std::lock_guard<std::mutex> lock(pipe->mutex);
    pipe->closed = true;
    pipe->cv.notify_all();
  }
}

size_t MemoryStream::pending() const {
  std::lock_guard<std::mutex> lock(in_->mutex);
  return in_->data.size();
}

void MemoryStream::stall_incoming(bool stalled) {
  std::lock_guard<std::mutex> lock(in_->mutex);
  in_->stalled = stalled;
  in_->cv.notify_all();
}

std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>>
MakeStreamPair(const std::string& remote_address, uint16_t remote_port, const std::string& local_address,
               uint16_t local_port) {
  auto a_to_b = std::make_shared<PipeBuffer>();
  auto b_to_a = std::make_shared<PipeBuffer>();
  auto ours = std::make_unique<MemoryStream>(b_to_a, a_to_b, remote_address, remote_port);
  auto theirs = std::make_unique<MemoryStream>(a_to_b, b_to_a, local_address, local_port);
  return {std::move(ours), std::move(theirs)};
}

// === ScriptedPeer ===

ScriptedPeer::ScriptedPeer(std::unique_ptr<MemoryStream> stream, uint32_t magic)
    : stream_(std::move(stream)), magic_(magic) {}

bool ScriptedPeer::send(const message::Message& msg) {
  return send_frame(msg.command(), msg.serialize());
}

bool ScriptedPeer::send_raw(const std::vector<uint8_t>& bytes) {
  return stream_->write_all(bytes.data(), bytes.size()) == StreamStatus::Ok;
}

bool ScriptedPeer::send_frame(const std::string& command, const std::vector<uint8_t>& payload) {
  return network::write_frame(*stream_, magic_, command, payload) == StreamStatus::Ok;
}

network::FrameStatus ScriptedPeer::read(network::Frame& out, std::chrono::milliseconds timeout) {
  return network::read_frame(*stream_, magic_, ByteStream::Clock::now() + timeout, out);
}

bool ScriptedPeer::expect(const std::string& command, network::Frame& out, std::chrono::milliseconds timeout) {
  auto deadline = ByteStream::Clock::now() + timeout;
  while (ByteStream::Clock::now() < deadline) {
    network::Frame frame;
    if (network::read_frame(*stream_, magic_, deadline, frame) != network::FrameStatus::Ok) {
      return false;
    }
    if (frame.command == command) {
      out = std::move(frame);
      return true;
    }
  }
  return false;
}

bool ScriptedPeer::expect(const std::string& command, std::chrono::milliseconds timeout) {
  network::Frame frame;
  return expect(command, frame, timeout);
}

message::VersionMessage ScriptedPeer::MakeVersion(int32_t version, uint64_t services, uint64_t nonce) {
  message::VersionMessage msg;
  msg.version = version;
  msg.services = services;
  msg.timestamp = 1700000000;
  msg.addr_recv = protocol::NetworkAddress::from_string("10.0.0.1", 40000);
  msg.addr_from = protocol::NetworkAddress{};
  msg.nonce = nonce;
  msg.user_agent = "/Satoshi:25.0.0/";
  msg.start_height = 800000;
  msg.relay = true;
  return msg;
}

bool ScriptedPeer::wait_closed(std::chrono::milliseconds timeout) {
  // A closed peer leaves unread frames followed by EOF; drain until Closed
  auto deadline = ByteStream::Clock::now() + timeout;
  uint8_t byte;
  for (;;) {
    StreamStatus status = stream_->read_exact(&byte, 1, deadline);
    if (status == StreamStatus::Closed) {
      return true;
    }
    if (status != StreamStatus::Ok) {
      return false;
    }
  }
}

// === MockTransport ===

network::ByteStreamPtr MockTransport::connect(const std::string& address, uint16_t port,
                                              std::chrono::milliseconds /*timeout*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  dial_log_.push_back(address + ":" + std::to_string(port));
  if (std::find(refused_.begin(), refused_.end(), address) != refused_.end()) {
    return nullptr;
  }
  auto [ours, theirs] = MakeStreamPair(address, port);
  dialed_.push_back(std::move(theirs));
  cv_.notify_all();
  return std::move(ours);
}

bool MockTransport::listen(uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!listen_ok_) {
    return false;
  }
  listening_ = true;
  port_ = port == 0 ? 18444 : port;
  return true;
}

network::StreamStatus MockTransport::accept(network::ByteStreamPtr& out, network::ByteStream::Deadline deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_until(lock, deadline, [this]() { return !listening_ || !inbound_.empty(); });
  if (!listening_) {
    return StreamStatus::Interrupted;
  }
  if (inbound_.empty()) {
    return StreamStatus::Timeout;
  }
  out = std::move(inbound_.front());
  inbound_.pop_front();
  return StreamStatus::Ok;
}

void MockTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(mutex_);
  listening_ = false;
  cv_.notify_all();
}

uint16_t MockTransport::listening_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listening_ ? port_ : 0;
}

void MockTransport::refuse(const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  refused_.push_back(address);
}

std::unique_ptr<MemoryStream> MockTransport::inject_inbound(const std::string& address, uint16_t port) {
  auto [ours, theirs] = MakeStreamPair(address, port);
  std::lock_guard<std::mutex> lock(mutex_);
  inbound_.push_back(std::move(ours));
  cv_.notify_all();
  return std::move(theirs);
}

std::unique_ptr<MemoryStream> MockTransport::take_dialed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this]() { return !dialed_.empty(); })) {
    return nullptr;
  }
  auto stream = std::move(dialed_.front());
  dialed_.pop_front();
  return stream;
}

std::vector<std::string> MockTransport::dial_log() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dial_log_;
}

}  // namespace test
}  // namespace bitwire
