// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/wire_codec.hpp"

#include "network/message.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <array>
#include <span>

namespace bitwire {
namespace network {

const char* FrameStatusToString(FrameStatus status) {
  switch (status) {
  case FrameStatus::Ok:
    return "ok";
  case FrameStatus::InvalidMagic:
    return "invalid-magic";
  case FrameStatus::ChecksumMismatch:
    return "checksum-mismatch";
  case FrameStatus::OversizedPayload:
    return "oversized-payload";
  case FrameStatus::Truncated:
    return "truncated";
  case FrameStatus::Timeout:
    return "timeout";
  case FrameStatus::Interrupted:
    return "interrupted";
  case FrameStatus::IoError:
    return "io-error";
  }
  return "unknown";
}

namespace {

// Payload buffers grow by at most this much ahead of the bytes received
constexpr size_t PAYLOAD_READ_CHUNK = 64 * 1024;

FrameStatus FromStreamStatus(StreamStatus status) {
  switch (status) {
  case StreamStatus::Ok:
    return FrameStatus::Ok;
  case StreamStatus::Closed:
    return FrameStatus::Truncated;
  case StreamStatus::Timeout:
    return FrameStatus::Timeout;
  case StreamStatus::Interrupted:
    return FrameStatus::Interrupted;
  case StreamStatus::Error:
    return FrameStatus::IoError;
  }
  return FrameStatus::IoError;
}

}  // namespace

std::vector<uint8_t> encode_frame(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload) {
  auto header = message::create_header(magic, command, payload);
  auto frame = message::serialize_header(header);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

FrameStatus read_frame(ByteStream& stream, uint32_t magic, ByteStream::Deadline deadline, Frame& out) {
  std::array<uint8_t, protocol::MESSAGE_HEADER_SIZE> header_bytes{};
  FrameStatus status = FromStreamStatus(stream.read_exact(header_bytes.data(), header_bytes.size(), deadline));
  if (status != FrameStatus::Ok) {
    return status;
  }

  protocol::MessageHeader header;
  if (!message::deserialize_header(header_bytes.data(), header_bytes.size(), header)) {
    return FrameStatus::IoError;
  }
  if (header.magic != magic) {
    return FrameStatus::InvalidMagic;
  }
  if (header.length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    return FrameStatus::OversizedPayload;
  }

  // The declared length is untrusted until the bytes arrive
  std::vector<uint8_t> payload;
  while (payload.size() < header.length) {
    const size_t offset = payload.size();
    const size_t chunk = std::min<size_t>(header.length - offset, PAYLOAD_READ_CHUNK);
    payload.resize(offset + chunk);
    status = FromStreamStatus(stream.read_exact(payload.data() + offset, chunk, deadline));
    if (status != FrameStatus::Ok) {
      return status;
    }
  }

  if (Checksum(std::span<const uint8_t>(payload.data(), payload.size())) != header.checksum) {
    return FrameStatus::ChecksumMismatch;
  }

  out.command = header.get_command();
  out.payload = std::move(payload);
  return FrameStatus::Ok;
}

StreamStatus write_frame(ByteStream& stream, uint32_t magic, const std::string& command,
                         const std::vector<uint8_t>& payload) {
  auto frame = encode_frame(magic, command, payload);
  return stream.write_all(frame.data(), frame.size());
}

}  // namespace network
}  // namespace bitwire
