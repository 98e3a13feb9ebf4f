// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "network/protocol.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bitwire {
namespace message {

// VarInt - CompactSize encoding
// < 0xfd: 1 byte; <= 0xffff: 0xfd + u16; <= 0xffffffff: 0xfe + u32; else 0xff + u64
class VarInt {
public:
  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  // Get encoded size in bytes
  size_t encoded_size() const;

  // Encode to buffer (must hold encoded_size() bytes)
  size_t encode(uint8_t* buffer) const;

  // Decode from buffer, returns bytes consumed (0 on truncated or non-canonical input)
  size_t decode(const uint8_t* buffer, size_t available);
};

// Serialization buffer for building wire-format messages
class MessageSerializer {
public:
  MessageSerializer();

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int32(int32_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);

  void write_varint(uint64_t value);
  void write_string(const std::string& str);
  void write_bytes(const uint8_t* data, size_t len);
  void write_bytes(const std::vector<uint8_t>& data);
  void write_hash(const uint256& hash);

  void write_network_address(const protocol::NetworkAddress& addr);
  void write_timestamped_address(const protocol::TimestampedAddress& addr);
  void write_inventory(const protocol::InventoryVector& inv);
  void write_block_header(const CBlockHeader& header);

  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

  void reserve(size_t n) { buffer_.reserve(n); }
  void clear() { buffer_.clear(); }

private:
  std::vector<uint8_t> buffer_;
};

// Deserialization buffer for parsing wire-format messages
// Reads past the end set an error flag and return zero values instead of throwing.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t* data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t>& data);

  // Read primitives
  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32();
  int64_t read_int64();
  bool read_bool();

  // Rejects non-canonical encodings and values above protocol::MAX_SIZE
  uint64_t read_varint();
  std::string read_string(size_t max_length = protocol::MAX_SIZE);
  std::vector<uint8_t> read_bytes(size_t count);
  std::vector<uint8_t> read_remaining();
  uint256 read_hash();

  protocol::NetworkAddress read_network_address();
  protocol::TimestampedAddress read_timestamped_address();
  protocol::InventoryVector read_inventory();
  CBlockHeader read_block_header();

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

  // Success means no read error and every byte consumed
  bool complete() const { return !error_ && position_ == size_; }

  void set_error() { error_ = true; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t position_;
  bool error_;

  bool check_available(size_t bytes);
};

// Base class for all message payloads
class Message {
public:
  virtual ~Message() = default;

  // Get command name for this message type
  virtual std::string command() const = 0;

  // Serialize message payload
  virtual std::vector<uint8_t> serialize() const = 0;

  // Deserialize message payload (returns true on success)
  virtual bool deserialize(const uint8_t* data, size_t size) = 0;

  // Payload length without serializing
  virtual size_t serialized_size() const = 0;
};

// Payload-less messages share one implementation
class EmptyMessage : public Message {
public:
  std::vector<uint8_t> serialize() const override { return {}; }
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return 0; }
};

// VERSION message - First message sent to establish connection
class VersionMessage : public Message {
public:
  int32_t version;
  uint64_t services;
  int64_t timestamp;
  protocol::NetworkAddress addr_recv;
  protocol::NetworkAddress addr_from;
  uint64_t nonce;
  std::string user_agent;
  int32_t start_height;
  bool relay;  // BIP 37; optional on the wire, absent means true

  VersionMessage();

  std::string command() const override { return protocol::commands::VERSION; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// VERACK message - Acknowledge version
class VerackMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::VERACK; }
};

// PING message - Keep-alive check
class PingMessage : public Message {
public:
  uint64_t nonce;

  PingMessage() : nonce(0) {}
  explicit PingMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PING; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return 8; }
};

// PONG message - Response to ping
class PongMessage : public Message {
public:
  uint64_t nonce;

  PongMessage() : nonce(0) {}
  explicit PongMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PONG; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return 8; }
};

// ADDR message - Share peer addresses
class AddrMessage : public Message {
public:
  std::vector<protocol::TimestampedAddress> addresses;

  AddrMessage() = default;

  std::string command() const override { return protocol::commands::ADDR; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// GETADDR message - Request peer addresses
class GetAddrMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::GETADDR; }
};

// Shared body of INV, GETDATA and NOTFOUND
class InventoryMessage : public Message {
public:
  std::vector<protocol::InventoryVector> inventory;

  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// INV message - Announce known transactions/blocks
class InvMessage : public InventoryMessage {
public:
  std::string command() const override { return protocol::commands::INV; }
};

// GETDATA message - Request transactions/blocks
class GetDataMessage : public InventoryMessage {
public:
  std::string command() const override { return protocol::commands::GETDATA; }
};

// NOTFOUND message - Reply to GETDATA for unknown items
class NotFoundMessage : public InventoryMessage {
public:
  std::string command() const override { return protocol::commands::NOTFOUND; }
};

// Shared body of GETHEADERS and GETBLOCKS
class LocatorMessage : public Message {
public:
  uint32_t version;
  std::vector<uint256> block_locator_hashes;
  uint256 hash_stop;

  LocatorMessage();

  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// GETHEADERS message - Request headers
class GetHeadersMessage : public LocatorMessage {
public:
  std::string command() const override { return protocol::commands::GETHEADERS; }
};

// GETBLOCKS message - Request an INV of blocks
class GetBlocksMessage : public LocatorMessage {
public:
  std::string command() const override { return protocol::commands::GETBLOCKS; }
};

// HEADERS message - Block headers, each followed by a zero transaction count
class HeadersMessage : public Message {
public:
  std::vector<::CBlockHeader> headers;

  HeadersMessage() = default;

  std::string command() const override { return protocol::commands::HEADERS; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// TX message - Raw transaction, not parsed
class TxMessage : public Message {
public:
  std::vector<uint8_t> raw_tx;

  TxMessage() = default;
  explicit TxMessage(std::vector<uint8_t> raw) : raw_tx(std::move(raw)) {}

  // Double SHA-256 of the raw bytes
  uint256 txid() const;

  std::string command() const override { return protocol::commands::TX; }
  std::vector<uint8_t> serialize() const override { return raw_tx; }
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return raw_tx.size(); }
};

// BLOCK message - Header, transaction count, opaque transactions
class BlockMessage : public Message {
public:
  ::CBlockHeader header;
  uint64_t tx_count;
  std::vector<uint8_t> transactions;

  BlockMessage() : tx_count(0) {}

  uint256 hash() const { return header.GetHash(); }

  std::string command() const override { return protocol::commands::BLOCK; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// FEEFILTER message - BIP 133 minimum fee rate (satoshis per 1000 bytes)
class FeeFilterMessage : public Message {
public:
  int64_t feerate;

  FeeFilterMessage() : feerate(0) {}
  explicit FeeFilterMessage(int64_t rate) : feerate(rate) {}

  std::string command() const override { return protocol::commands::FEEFILTER; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return 8; }
};

// SENDHEADERS message - BIP 130, announce blocks with HEADERS instead of INV
class SendHeadersMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::SENDHEADERS; }
};

// MEMPOOL message - BIP 35, request an INV of the mempool
class MempoolMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::MEMPOOL; }
};

// SENDCMPCT message - BIP 152 compact block negotiation
class SendCmpctMessage : public Message {
public:
  bool announce;
  uint64_t version;

  SendCmpctMessage() : announce(false), version(1) {}

  std::string command() const override { return protocol::commands::SENDCMPCT; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override { return 9; }
};

// REJECT message - BIP 61
class RejectMessage : public Message {
public:
  enum Code : uint8_t {
    REJECT_MALFORMED = 0x01,
    REJECT_INVALID = 0x10,
    REJECT_OBSOLETE = 0x11,
    REJECT_DUPLICATE = 0x12,
    REJECT_NONSTANDARD = 0x40,
    REJECT_DUST = 0x41,
    REJECT_INSUFFICIENTFEE = 0x42,
    REJECT_CHECKPOINT = 0x43,
  };

  std::string message;  // Command being rejected
  uint8_t ccode;
  std::string reason;
  std::vector<uint8_t> data;  // 32-byte hash for tx/block rejects

  RejectMessage() : ccode(0) {}

  std::string command() const override { return protocol::commands::REJECT; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t* data, size_t size) override;
  size_t serialized_size() const override;
};

// Create message header with checksum
protocol::MessageHeader create_header(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload);

// Serialize header to bytes
std::vector<uint8_t> serialize_header(const protocol::MessageHeader& header);

// Deserialize header from bytes
bool deserialize_header(const uint8_t* data, size_t size, protocol::MessageHeader& header);

// Factory function to create message from command name (nullptr if unrecognized)
std::unique_ptr<Message> create_message(const std::string& command);

}  // namespace message
}  // namespace bitwire
