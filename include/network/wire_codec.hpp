// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bitwire {
namespace network {

enum class FrameStatus {
  Ok,
  InvalidMagic,
  ChecksumMismatch,
  OversizedPayload,  // Declared length above MAX_PROTOCOL_MESSAGE_LENGTH
  Truncated,         // Stream ended or reset mid-frame
  Timeout,
  Interrupted,
  IoError,
};

const char* FrameStatusToString(FrameStatus status);

// One decoded frame: command name (NUL padding stripped) and raw payload
struct Frame {
  std::string command;
  std::vector<uint8_t> payload;
};

// 24-byte header followed by payload; checksum is the first four bytes of
// the double SHA-256 of the payload (5d f6 e0 e2 for an empty payload)
std::vector<uint8_t> encode_frame(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload);

// Read one frame. Never reads more than 24 + length bytes, so an unknown
// command leaves the stream positioned at the next frame.
FrameStatus read_frame(ByteStream& stream, uint32_t magic, ByteStream::Deadline deadline, Frame& out);

// Encode and write with a single write_all()
StreamStatus write_frame(ByteStream& stream, uint32_t magic, const std::string& command,
                         const std::vector<uint8_t>& payload);

}  // namespace network
}  // namespace bitwire
