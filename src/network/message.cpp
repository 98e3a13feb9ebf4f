// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/message.hpp"

#include "util/hash.hpp"

#include <cstring>
#include <span>

namespace bitwire {
namespace message {

namespace {

constexpr size_t NETWORK_ADDRESS_SIZE = 26;
constexpr size_t TIMESTAMPED_ADDRESS_SIZE = 30;
constexpr size_t INVENTORY_VECTOR_SIZE = 36;
constexpr size_t HASH_SIZE = 32;

size_t VarStringSize(const std::string& s) {
  return VarInt(s.size()).encoded_size() + s.size();
}

}  // namespace

// ============================================================================
// VarInt
// ============================================================================

size_t VarInt::encoded_size() const {
  if (value < 0xfd) {
    return 1;
  } else if (value <= 0xffff) {
    return 3;
  } else if (value <= 0xffffffff) {
    return 5;
  }
  return 9;
}

size_t VarInt::encode(uint8_t* buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  size_t width;
  if (value <= 0xffff) {
    buffer[0] = 0xfd;
    width = 2;
  } else if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    width = 4;
  } else {
    buffer[0] = 0xff;
    width = 8;
  }
  for (size_t i = 0; i < width; ++i) {
    buffer[1 + i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return 1 + width;
}

size_t VarInt::decode(const uint8_t* buffer, size_t available) {
  if (available < 1) {
    return 0;
  }
  const uint8_t first = buffer[0];
  if (first < 0xfd) {
    value = first;
    return 1;
  }

  const size_t width = first == 0xfd ? 2 : (first == 0xfe ? 4 : 8);
  if (available < 1 + width) {
    return 0;
  }
  uint64_t v = 0;
  for (size_t i = 0; i < width; ++i) {
    v |= static_cast<uint64_t>(buffer[1 + i]) << (8 * i);
  }

  // Non-canonical: a shorter encoding was available
  const uint64_t min_value = width == 2 ? 0xfd : (width == 4 ? 0x10000 : 0x100000000ULL);
  if (v < min_value) {
    return 0;
  }
  value = v;
  return 1 + width;
}

// ============================================================================
// MessageSerializer
// ============================================================================

MessageSerializer::MessageSerializer() = default;

void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_bool(bool value) {
  write_uint8(value ? 1 : 0);
}

void MessageSerializer::write_varint(uint64_t value) {
  uint8_t buf[9];
  size_t n = VarInt(value).encode(buf);
  buffer_.insert(buffer_.end(), buf, buf + n);
}

void MessageSerializer::write_string(const std::string& str) {
  write_varint(str.size());
  buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void MessageSerializer::write_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t>& data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_hash(const uint256& hash) {
  write_bytes(hash.data(), hash.size());
}

void MessageSerializer::write_network_address(const protocol::NetworkAddress& addr) {
  write_uint64(addr.services);
  write_bytes(addr.ip.data(), addr.ip.size());
  // Port is big-endian on the wire
  buffer_.push_back(static_cast<uint8_t>(addr.port >> 8));
  buffer_.push_back(static_cast<uint8_t>(addr.port & 0xff));
}

void MessageSerializer::write_timestamped_address(const protocol::TimestampedAddress& addr) {
  write_uint32(addr.timestamp);
  write_network_address(addr.address);
}

void MessageSerializer::write_inventory(const protocol::InventoryVector& inv) {
  write_uint32(static_cast<uint32_t>(inv.type));
  write_hash(inv.hash);
}

void MessageSerializer::write_block_header(const CBlockHeader& header) {
  auto bytes = header.Serialize();
  write_bytes(bytes.data(), bytes.size());
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || bytes > size_ - position_) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1)) {
    return 0;
  }
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2)) {
    return 0;
  }
  uint16_t value = static_cast<uint16_t>(data_[position_]) | (static_cast<uint16_t>(data_[position_ + 1]) << 8);
  position_ += 2;
  return value;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4)) {
    return 0;
  }
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 4;
  return value;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8)) {
    return 0;
  }
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 8;
  return value;
}

int32_t MessageDeserializer::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool MessageDeserializer::read_bool() {
  return read_uint8() != 0;
}

uint64_t MessageDeserializer::read_varint() {
  if (error_) {
    return 0;
  }
  VarInt vi;
  size_t consumed = vi.decode(data_ + position_, size_ - position_);
  if (consumed == 0 || vi.value > protocol::MAX_SIZE) {
    error_ = true;
    return 0;
  }
  position_ += consumed;
  return vi.value;
}

std::string MessageDeserializer::read_string(size_t max_length) {
  uint64_t len = read_varint();
  if (error_) {
    return {};
  }
  if (len > max_length || !check_available(static_cast<size_t>(len))) {
    error_ = true;
    return {};
  }
  std::string s(reinterpret_cast<const char*>(data_ + position_), static_cast<size_t>(len));
  position_ += static_cast<size_t>(len);
  return s;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count)) {
    return {};
  }
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

std::vector<uint8_t> MessageDeserializer::read_remaining() {
  if (error_) {
    return {};
  }
  return read_bytes(size_ - position_);
}

uint256 MessageDeserializer::read_hash() {
  uint256 hash;
  if (!check_available(HASH_SIZE)) {
    return hash;
  }
  std::memcpy(hash.data(), data_ + position_, HASH_SIZE);
  position_ += HASH_SIZE;
  return hash;
}

protocol::NetworkAddress MessageDeserializer::read_network_address() {
  protocol::NetworkAddress addr;
  if (!check_available(NETWORK_ADDRESS_SIZE)) {
    return addr;
  }
  addr.services = read_uint64();
  std::memcpy(addr.ip.data(), data_ + position_, addr.ip.size());
  position_ += addr.ip.size();
  addr.port = static_cast<uint16_t>((static_cast<uint16_t>(data_[position_]) << 8) | data_[position_ + 1]);
  position_ += 2;
  return addr;
}

protocol::TimestampedAddress MessageDeserializer::read_timestamped_address() {
  protocol::TimestampedAddress ts_addr;
  ts_addr.timestamp = read_uint32();
  ts_addr.address = read_network_address();
  return ts_addr;
}

protocol::InventoryVector MessageDeserializer::read_inventory() {
  protocol::InventoryVector inv;
  inv.type = static_cast<protocol::InventoryType>(read_uint32());
  inv.hash = read_hash();
  return inv;
}

CBlockHeader MessageDeserializer::read_block_header() {
  CBlockHeader header;
  if (!check_available(CBlockHeader::HEADER_SIZE)) {
    return header;
  }
  header.Deserialize(std::span<const uint8_t>(data_ + position_, CBlockHeader::HEADER_SIZE));
  position_ += CBlockHeader::HEADER_SIZE;
  return header;
}

// ============================================================================
// Messages
// ============================================================================

bool EmptyMessage::deserialize(const uint8_t* /*data*/, size_t size) {
  return size == 0;
}

VersionMessage::VersionMessage()
    : version(protocol::PROTOCOL_VERSION),
      services(protocol::NODE_NONE),
      timestamp(0),
      nonce(0),
      user_agent(protocol::GetUserAgent()),
      start_height(0),
      relay(true) {}

std::vector<uint8_t> VersionMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_int32(version);
  s.write_uint64(services);
  s.write_int64(timestamp);
  s.write_network_address(addr_recv);
  s.write_network_address(addr_from);
  s.write_uint64(nonce);
  s.write_string(user_agent);
  s.write_int32(start_height);
  s.write_bool(relay);
  return s.release();
}

bool VersionMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  version = d.read_int32();
  services = d.read_uint64();
  timestamp = d.read_int64();
  addr_recv = d.read_network_address();
  addr_from = d.read_network_address();
  nonce = d.read_uint64();
  user_agent = d.read_string(protocol::MAX_SUBVERSION_LENGTH);
  start_height = d.read_int32();
  relay = d.bytes_remaining() > 0 ? d.read_bool() : true;
  return d.complete();
}

size_t VersionMessage::serialized_size() const {
  return 4 + 8 + 8 + NETWORK_ADDRESS_SIZE * 2 + 8 + VarStringSize(user_agent) + 4 + 1;
}

std::vector<uint8_t> PingMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PingMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return d.complete();
}

std::vector<uint8_t> PongMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PongMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return d.complete();
}

std::vector<uint8_t> AddrMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_varint(addresses.size());
  for (const auto& addr : addresses) {
    s.write_timestamped_address(addr);
  }
  return s.release();
}

bool AddrMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  uint64_t count = d.read_varint();
  if (d.has_error() || count > protocol::MAX_ADDR_SIZE) {
    return false;
  }
  addresses.clear();
  addresses.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    addresses.push_back(d.read_timestamped_address());
  }
  return d.complete();
}

size_t AddrMessage::serialized_size() const {
  return VarInt(addresses.size()).encoded_size() + addresses.size() * TIMESTAMPED_ADDRESS_SIZE;
}

std::vector<uint8_t> InventoryMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_varint(inventory.size());
  for (const auto& inv : inventory) {
    s.write_inventory(inv);
  }
  return s.release();
}

bool InventoryMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  uint64_t count = d.read_varint();
  if (d.has_error() || count > protocol::MAX_INV_SIZE) {
    return false;
  }
  // Cheap reject before allocating for a count the payload cannot hold
  if (count * INVENTORY_VECTOR_SIZE != d.bytes_remaining()) {
    return false;
  }
  inventory.clear();
  inventory.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    inventory.push_back(d.read_inventory());
  }
  return d.complete();
}

size_t InventoryMessage::serialized_size() const {
  return VarInt(inventory.size()).encoded_size() + inventory.size() * INVENTORY_VECTOR_SIZE;
}

LocatorMessage::LocatorMessage() : version(static_cast<uint32_t>(protocol::PROTOCOL_VERSION)) {}

std::vector<uint8_t> LocatorMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_uint32(version);
  s.write_varint(block_locator_hashes.size());
  for (const auto& hash : block_locator_hashes) {
    s.write_hash(hash);
  }
  s.write_hash(hash_stop);
  return s.release();
}

bool LocatorMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  version = d.read_uint32();
  uint64_t count = d.read_varint();
  if (d.has_error() || count > protocol::MAX_LOCATOR_SZ) {
    return false;
  }
  block_locator_hashes.clear();
  block_locator_hashes.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    block_locator_hashes.push_back(d.read_hash());
  }
  hash_stop = d.read_hash();
  return d.complete();
}

size_t LocatorMessage::serialized_size() const {
  return 4 + VarInt(block_locator_hashes.size()).encoded_size() + (block_locator_hashes.size() + 1) * HASH_SIZE;
}

std::vector<uint8_t> HeadersMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_varint(headers.size());
  for (const auto& header : headers) {
    s.write_block_header(header);
    s.write_varint(0);  // Transaction count, always zero in headers
  }
  return s.release();
}

bool HeadersMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  uint64_t count = d.read_varint();
  if (d.has_error() || count > protocol::MAX_HEADERS_SIZE) {
    return false;
  }
  headers.clear();
  headers.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    headers.push_back(d.read_block_header());
    d.read_varint();  // Ignored, as Bitcoin Core does
  }
  return d.complete();
}

size_t HeadersMessage::serialized_size() const {
  return VarInt(headers.size()).encoded_size() + headers.size() * (CBlockHeader::HEADER_SIZE + 1);
}

uint256 TxMessage::txid() const {
  return Hash(raw_tx);
}

bool TxMessage::deserialize(const uint8_t* data, size_t size) {
  if (size == 0) {
    return false;
  }
  raw_tx.assign(data, data + size);
  return true;
}

std::vector<uint8_t> BlockMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_block_header(header);
  s.write_varint(tx_count);
  s.write_bytes(transactions);
  return s.release();
}

bool BlockMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  header = d.read_block_header();
  tx_count = d.read_varint();
  transactions = d.read_remaining();
  return d.complete();
}

size_t BlockMessage::serialized_size() const {
  return CBlockHeader::HEADER_SIZE + VarInt(tx_count).encoded_size() + transactions.size();
}

std::vector<uint8_t> FeeFilterMessage::serialize() const {
  MessageSerializer s;
  s.write_int64(feerate);
  return s.release();
}

bool FeeFilterMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  feerate = d.read_int64();
  return d.complete() && feerate >= 0;
}

std::vector<uint8_t> SendCmpctMessage::serialize() const {
  MessageSerializer s;
  s.write_bool(announce);
  s.write_uint64(version);
  return s.release();
}

bool SendCmpctMessage::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  announce = d.read_bool();
  version = d.read_uint64();
  return d.complete();
}

std::vector<uint8_t> RejectMessage::serialize() const {
  MessageSerializer s;
  s.reserve(serialized_size());
  s.write_string(message);
  s.write_uint8(ccode);
  s.write_string(reason);
  s.write_bytes(data);
  return s.release();
}

bool RejectMessage::deserialize(const uint8_t* payload, size_t size) {
  MessageDeserializer d(payload, size);
  message = d.read_string(protocol::COMMAND_SIZE);
  ccode = d.read_uint8();
  reason = d.read_string(protocol::MAX_REJECT_MESSAGE_LENGTH);
  data = d.read_remaining();
  return d.complete();
}

size_t RejectMessage::serialized_size() const {
  return VarStringSize(message) + 1 + VarStringSize(reason) + data.size();
}

// ============================================================================
// Header helpers and factory
// ============================================================================

protocol::MessageHeader create_header(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload) {
  protocol::MessageHeader header(magic, command, static_cast<uint32_t>(payload.size()));
  header.checksum = Checksum(std::span<const uint8_t>(payload.data(), payload.size()));
  return header;
}

std::vector<uint8_t> serialize_header(const protocol::MessageHeader& header) {
  MessageSerializer s;
  s.reserve(protocol::MESSAGE_HEADER_SIZE);
  s.write_uint32(header.magic);
  s.write_bytes(reinterpret_cast<const uint8_t*>(header.command.data()), protocol::COMMAND_SIZE);
  s.write_uint32(header.length);
  s.write_bytes(header.checksum.data(), protocol::CHECKSUM_SIZE);
  return s.release();
}

bool deserialize_header(const uint8_t* data, size_t size, protocol::MessageHeader& header) {
  if (size != protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }
  MessageDeserializer d(data, size);
  header.magic = d.read_uint32();
  std::memcpy(header.command.data(), data + 4, protocol::COMMAND_SIZE);
  d.read_bytes(protocol::COMMAND_SIZE);
  header.length = d.read_uint32();
  std::memcpy(header.checksum.data(), data + 20, protocol::CHECKSUM_SIZE);
  d.read_bytes(protocol::CHECKSUM_SIZE);
  return d.complete();
}

std::unique_ptr<Message> create_message(const std::string& command) {
  if (command == protocol::commands::VERSION) {
    return std::make_unique<VersionMessage>();
  } else if (command == protocol::commands::VERACK) {
    return std::make_unique<VerackMessage>();
  } else if (command == protocol::commands::PING) {
    return std::make_unique<PingMessage>();
  } else if (command == protocol::commands::PONG) {
    return std::make_unique<PongMessage>();
  } else if (command == protocol::commands::ADDR) {
    return std::make_unique<AddrMessage>();
  } else if (command == protocol::commands::GETADDR) {
    return std::make_unique<GetAddrMessage>();
  } else if (command == protocol::commands::INV) {
    return std::make_unique<InvMessage>();
  } else if (command == protocol::commands::GETDATA) {
    return std::make_unique<GetDataMessage>();
  } else if (command == protocol::commands::NOTFOUND) {
    return std::make_unique<NotFoundMessage>();
  } else if (command == protocol::commands::GETHEADERS) {
    return std::make_unique<GetHeadersMessage>();
  } else if (command == protocol::commands::GETBLOCKS) {
    return std::make_unique<GetBlocksMessage>();
  } else if (command == protocol::commands::HEADERS) {
    return std::make_unique<HeadersMessage>();
  } else if (command == protocol::commands::TX) {
    return std::make_unique<TxMessage>();
  } else if (command == protocol::commands::BLOCK) {
    return std::make_unique<BlockMessage>();
  } else if (command == protocol::commands::FEEFILTER) {
    return std::make_unique<FeeFilterMessage>();
  } else if (command == protocol::commands::SENDHEADERS) {
    return std::make_unique<SendHeadersMessage>();
  } else if (command == protocol::commands::MEMPOOL) {
    return std::make_unique<MempoolMessage>();
  } else if (command == protocol::commands::SENDCMPCT) {
    return std::make_unique<SendCmpctMessage>();
  } else if (command == protocol::commands::REJECT) {
    return std::make_unique<RejectMessage>();
  }
  return nullptr;
}

}  // namespace message
}  // namespace bitwire
