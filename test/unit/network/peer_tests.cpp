// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "infra/memory_stream.hpp"
#include "network/message_dispatcher.hpp"
#include "network/peer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace bitwire;
using namespace bitwire::network;
using namespace std::chrono_literals;
using bitwire::test::MakeStreamPair;
using bitwire::test::ScriptedPeer;

namespace {

constexpr uint32_t kMagic = protocol::magic::REGTEST;

PeerConfig TestConfig() {
  PeerConfig config;
  config.network_magic = kMagic;
  config.protocol_version = 70015;
  config.local_services = protocol::NODE_NETWORK;
  config.start_height = 0;
  config.user_agent = "/bitwire-test:0.1.0/";
  config.handshake_timeout = 2s;
  config.inactivity_timeout = 10s;
  return config;
}

bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// Runs one session on its own thread, as NetworkManager does
class Session {
public:
  Session(PeerDirection direction, PeerConfig config = TestConfig()) {
    auto [ours, theirs] = MakeStreamPair("10.0.0.2", 8333);
    remote_ = std::make_unique<ScriptedPeer>(std::move(theirs), config.network_magic);
    peer_ = direction == PeerDirection::OUTBOUND ? Peer::create_outbound(std::move(ours), config)
                                                 : Peer::create_inbound(std::move(ours), config);
    peer_->set_id(1);
  }

  ~Session() {
    peer_->disconnect(DisconnectReason::Shutdown);
    join();
  }

  void start() {
    thread_ = std::thread([this] { result_ = peer_->run(); });
  }

  DisconnectReason join() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return result_;
  }

  // Remote side of a normal handshake
  void complete_handshake(int32_t remote_version = 70015) {
    if (peer_->direction() == PeerDirection::OUTBOUND) {
      REQUIRE(remote_->expect(protocol::commands::VERSION));
      REQUIRE(remote_->send(ScriptedPeer::MakeVersion(remote_version)));
      REQUIRE(remote_->expect(protocol::commands::VERACK));
      REQUIRE(remote_->send(message::VerackMessage()));
    } else {
      REQUIRE(remote_->send(ScriptedPeer::MakeVersion(remote_version)));
      REQUIRE(remote_->expect(protocol::commands::VERSION));
      REQUIRE(remote_->expect(protocol::commands::VERACK));
      REQUIRE(remote_->send(message::VerackMessage()));
    }
    REQUIRE(WaitFor([this] { return peer_->is_ready(); }));
  }

  PeerPtr& peer() { return peer_; }
  ScriptedPeer& remote() { return *remote_; }

private:
  std::unique_ptr<ScriptedPeer> remote_;
  PeerPtr peer_;
  std::thread thread_;
  DisconnectReason result_{DisconnectReason::None};
};

}  // namespace

TEST_CASE("Outbound handshake negotiates the lower version", "[peer][handshake]") {
  Session s(PeerDirection::OUTBOUND);
  s.start();

  Frame frame;
  REQUIRE(s.remote().expect(protocol::commands::VERSION, frame));
  message::VersionMessage ours;
  REQUIRE(ours.deserialize(frame.payload.data(), frame.payload.size()));
  CHECK(ours.version == 70015);
  CHECK(ours.services == protocol::NODE_NETWORK);
  CHECK(ours.user_agent == "/bitwire-test:0.1.0/");
  CHECK(ours.nonce == s.peer()->get_local_nonce());
  CHECK(ours.nonce != 0);
  REQUIRE(ours.addr_recv.to_string().has_value());
  CHECK(*ours.addr_recv.to_string() == "10.0.0.2");

  CHECK(s.peer()->state() == PeerConnectionState::HANDSHAKING);
  CHECK_FALSE(s.peer()->negotiated_version().has_value());

  REQUIRE(s.remote().send(ScriptedPeer::MakeVersion(70013, protocol::NODE_NETWORK | protocol::NODE_WITNESS, 0x99)));
  REQUIRE(s.remote().expect(protocol::commands::VERACK));
  REQUIRE(s.remote().send(message::VerackMessage()));

  REQUIRE(WaitFor([&] { return s.peer()->is_ready(); }));
  CHECK(s.peer()->negotiated_version() == 70013);
  CHECK(s.peer()->version() == 70013);
  CHECK(s.peer()->peer_services() == (protocol::NODE_NETWORK | protocol::NODE_WITNESS));
  CHECK(s.peer()->peer_nonce() == 0x99);
  CHECK(s.peer()->start_height() == 800000);
  CHECK(s.peer()->user_agent() == "/Satoshi:25.0.0/");

  s.peer()->disconnect();
  CHECK(s.join() == DisconnectReason::LocalRequest);
  CHECK(s.peer()->is_closed());
  CHECK(s.remote().wait_closed());
}

TEST_CASE("Inbound handshake waits for the remote version", "[peer][handshake]") {
  Session s(PeerDirection::INBOUND);
  s.start();

  // Nothing is sent before the remote speaks
  Frame frame;
  CHECK(s.remote().read(frame, 100ms) == FrameStatus::Timeout);

  REQUIRE(s.remote().send(ScriptedPeer::MakeVersion(70016)));
  REQUIRE(s.remote().read(frame) == FrameStatus::Ok);
  CHECK(frame.command == protocol::commands::VERSION);
  REQUIRE(s.remote().read(frame) == FrameStatus::Ok);
  CHECK(frame.command == protocol::commands::VERACK);
  REQUIRE(s.remote().send(message::VerackMessage()));

  REQUIRE(WaitFor([&] { return s.peer()->is_ready(); }));
  CHECK(s.peer()->negotiated_version() == 70015);
  CHECK(s.peer()->is_inbound());
}

TEST_CASE("Handshake violations", "[peer][handshake]") {
  SECTION("ping before the handshake completes") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    REQUIRE(s.remote().expect(protocol::commands::VERSION));
    REQUIRE(s.remote().send(message::PingMessage(5)));
    CHECK(s.join() == DisconnectReason::InvalidHandshake);
    CHECK(s.peer()->disconnect_reason() == DisconnectReason::InvalidHandshake);
    CHECK(s.remote().wait_closed());
  }

  SECTION("verack before version") {
    Session s(PeerDirection::INBOUND);
    s.start();
    REQUIRE(s.remote().send(message::VerackMessage()));
    CHECK(s.join() == DisconnectReason::InvalidHandshake);
  }

  SECTION("duplicate version") {
    Session s(PeerDirection::INBOUND);
    s.start();
    REQUIRE(s.remote().send(ScriptedPeer::MakeVersion()));
    REQUIRE(s.remote().send(ScriptedPeer::MakeVersion()));
    CHECK(s.join() == DisconnectReason::InvalidHandshake);
  }

  SECTION("malformed version") {
    Session s(PeerDirection::INBOUND);
    s.start();
    REQUIRE(s.remote().send_frame(protocol::commands::VERSION, {0x7f, 0x11, 0x01}));
    CHECK(s.join() == DisconnectReason::MalformedMessage);
  }

  SECTION("verack with a payload") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    REQUIRE(s.remote().expect(protocol::commands::VERSION));
    REQUIRE(s.remote().send(ScriptedPeer::MakeVersion()));
    REQUIRE(s.remote().send_frame(protocol::commands::VERACK, {0x00}));
    CHECK(s.join() == DisconnectReason::MalformedMessage);
  }

  SECTION("wrong network magic") {
    Session s(PeerDirection::INBOUND);
    s.start();
    auto bytes = encode_frame(protocol::magic::MAINNET, protocol::commands::VERSION,
                              ScriptedPeer::MakeVersion().serialize());
    REQUIRE(s.remote().send_raw(bytes));
    CHECK(s.join() == DisconnectReason::InvalidMagic);
  }

  SECTION("remote hangs up") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    REQUIRE(s.remote().expect(protocol::commands::VERSION));
    s.remote().stream().close();
    CHECK(s.join() == DisconnectReason::StreamClosed);
  }
}

TEST_CASE("Unknown commands during the handshake are skipped", "[peer][handshake]") {
  Session s(PeerDirection::INBOUND);
  s.start();
  REQUIRE(s.remote().send_frame("notarealcmd", std::vector<uint8_t>(10, 0xab)));
  s.complete_handshake();
  CHECK(s.peer()->is_ready());
}

TEST_CASE("Handshake timeout", "[peer][handshake]") {
  PeerConfig config = TestConfig();
  config.handshake_timeout = 150ms;
  Session s(PeerDirection::OUTBOUND, config);

  auto start = std::chrono::steady_clock::now();
  s.start();
  REQUIRE(s.remote().expect(protocol::commands::VERSION));
  CHECK(s.join() == DisconnectReason::HandshakeTimeout);
  CHECK(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("Inactivity timeout in the READY state", "[peer]") {
  PeerConfig config = TestConfig();
  config.inactivity_timeout = 200ms;
  Session s(PeerDirection::OUTBOUND, config);
  s.start();
  s.complete_handshake();

  // Any frame resets the deadline
  std::this_thread::sleep_for(120ms);
  REQUIRE(s.remote().send(message::SendHeadersMessage()));
  std::this_thread::sleep_for(120ms);
  CHECK(s.peer()->is_ready());

  CHECK(s.join() == DisconnectReason::InactivityTimeout);
}

TEST_CASE("READY session answers ping and records announcements", "[peer]") {
  Session s(PeerDirection::OUTBOUND);
  s.start();
  s.complete_handshake();

  REQUIRE(s.remote().send(message::PingMessage(0xabcdef)));
  Frame frame;
  REQUIRE(s.remote().expect(protocol::commands::PONG, frame));
  message::PongMessage pong;
  REQUIRE(pong.deserialize(frame.payload.data(), frame.payload.size()));
  CHECK(pong.nonce == 0xabcdef);

  REQUIRE(s.remote().send(message::FeeFilterMessage(1000)));
  REQUIRE(s.remote().send(message::SendHeadersMessage()));
  message::SendCmpctMessage cmpct;
  cmpct.announce = true;
  cmpct.version = 2;
  REQUIRE(s.remote().send(cmpct));

  // Frames are handled in order, so the second pong means the rest were seen
  REQUIRE(s.remote().send(message::PingMessage(7)));
  REQUIRE(s.remote().expect(protocol::commands::PONG, frame));
  CHECK(s.peer()->fee_filter() == 1000);
  CHECK(s.peer()->prefers_headers());
  CHECK(s.peer()->is_ready());
  CHECK(s.peer()->stats().messages_received.load() >= 7);
  CHECK(s.peer()->stats().last_recv.load() > 0);
}

TEST_CASE("READY session violations", "[peer]") {
  SECTION("version after the handshake") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    s.complete_handshake();
    REQUIRE(s.remote().send(ScriptedPeer::MakeVersion()));
    CHECK(s.join() == DisconnectReason::ProtocolViolation);
  }

  SECTION("verack after the handshake") {
    Session s(PeerDirection::INBOUND);
    s.start();
    s.complete_handshake();
    REQUIRE(s.remote().send(message::VerackMessage()));
    CHECK(s.join() == DisconnectReason::ProtocolViolation);
  }

  SECTION("malformed ping") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    s.complete_handshake();
    REQUIRE(s.remote().send_frame(protocol::commands::PING, {1, 2, 3}));
    CHECK(s.join() == DisconnectReason::MalformedMessage);
  }

  SECTION("checksum mismatch") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    s.complete_handshake();
    auto bytes = encode_frame(kMagic, protocol::commands::PING, message::PingMessage(1).serialize());
    bytes[30] ^= 0xff;
    REQUIRE(s.remote().send_raw(bytes));
    CHECK(s.join() == DisconnectReason::ChecksumMismatch);
  }

  SECTION("oversized declared length") {
    Session s(PeerDirection::OUTBOUND);
    s.start();
    s.complete_handshake();
    auto header = message::create_header(kMagic, protocol::commands::BLOCK, {});
    header.length = static_cast<uint32_t>(protocol::MAX_PROTOCOL_MESSAGE_LENGTH + 1);
    REQUIRE(s.remote().send_raw(message::serialize_header(header)));
    CHECK(s.join() == DisconnectReason::OversizedMessage);
  }
}

TEST_CASE("Unknown and unmodelled commands are ignored after the handshake", "[peer]") {
  Session s(PeerDirection::OUTBOUND);
  s.start();
  s.complete_handshake();

  REQUIRE(s.remote().send_frame("notarealcmd", std::vector<uint8_t>(10, 0x00)));
  REQUIRE(s.remote().send_frame(protocol::commands::CMPCTBLOCK, std::vector<uint8_t>(90, 0x00)));
  REQUIRE(s.remote().send(message::PingMessage(7)));
  CHECK(s.remote().expect(protocol::commands::PONG));
  CHECK(s.peer()->is_ready());
}

TEST_CASE("Data messages go to the dispatcher", "[peer][dispatcher]") {
  MessageDispatcher dispatcher;
  std::atomic<int> inv_count{0};
  std::atomic<bool> saw_null_peer{false};
  dispatcher.RegisterHandler(protocol::commands::INV, [&](PeerPtr peer, message::Message* msg) {
    if (!peer) {
      saw_null_peer = true;
    }
    inv_count += static_cast<int>(static_cast<message::InvMessage*>(msg)->inventory.size());
    return true;
  });
  dispatcher.RegisterHandler(protocol::commands::TX, [](PeerPtr, message::Message*) { return false; });

  Session s(PeerDirection::OUTBOUND);
  s.peer()->set_dispatcher(&dispatcher);
  s.start();
  s.complete_handshake();

  message::InvMessage inv;
  inv.inventory.emplace_back(protocol::InventoryType::MSG_TX, uint256::ONE);
  inv.inventory.emplace_back(protocol::InventoryType::MSG_TX, uint256(uint8_t{2}));
  REQUIRE(s.remote().send(inv));
  REQUIRE(WaitFor([&] { return inv_count.load() == 2; }));
  CHECK_FALSE(saw_null_peer.load());

  // A message without a handler is dropped
  REQUIRE(s.remote().send(message::GetAddrMessage()));

  // A handler that refuses the message ends the session
  REQUIRE(s.remote().send(message::TxMessage(std::vector<uint8_t>{0x01, 0x02})));
  CHECK(s.join() == DisconnectReason::ProtocolViolation);
}

TEST_CASE("Keepalive ping round trip", "[peer][ping]") {
  Session s(PeerDirection::OUTBOUND);
  s.start();

  // Not before READY
  CHECK_FALSE(s.peer()->send_ping());
  s.complete_handshake();

  REQUIRE(s.peer()->send_ping());
  CHECK(s.peer()->ping_outstanding());
  CHECK_FALSE(s.peer()->send_ping());

  Frame frame;
  REQUIRE(s.remote().expect(protocol::commands::PING, frame));
  message::PingMessage ping;
  REQUIRE(ping.deserialize(frame.payload.data(), frame.payload.size()));

  // A pong with the wrong nonce leaves the ping outstanding
  REQUIRE(s.remote().send(message::PongMessage(ping.nonce + 1)));
  REQUIRE(s.remote().send(message::PongMessage(ping.nonce)));
  REQUIRE(WaitFor([&] { return !s.peer()->ping_outstanding(); }));
  CHECK(s.peer()->stats().ping_time_ms.load() >= 0ms);
}

TEST_CASE("Disconnect and close notifications", "[peer]") {
  std::atomic<int> ready_calls{0};
  std::atomic<int> closed_calls{0};
  std::atomic<DisconnectReason> closed_reason{DisconnectReason::None};

  Session s(PeerDirection::OUTBOUND);
  s.peer()->set_ready_handler([&](PeerPtr) { ++ready_calls; });
  s.peer()->set_closed_handler([&](PeerPtr, DisconnectReason reason) {
    ++closed_calls;
    closed_reason = reason;
  });
  s.start();
  s.complete_handshake();
  CHECK(ready_calls.load() == 1);

  SECTION("the first requested reason wins") {
    s.peer()->disconnect(DisconnectReason::PingTimeout);
    s.peer()->disconnect(DisconnectReason::Shutdown);
    CHECK(s.join() == DisconnectReason::PingTimeout);
  }

  SECTION("disconnect unblocks a session waiting for data") {
    auto start = std::chrono::steady_clock::now();
    s.peer()->disconnect(DisconnectReason::Shutdown);
    CHECK(s.join() == DisconnectReason::Shutdown);
    CHECK(std::chrono::steady_clock::now() - start < 2s);
  }

  CHECK(closed_calls.load() == 1);
  CHECK(closed_reason.load() == s.peer()->disconnect_reason());
  CHECK_FALSE(s.peer()->send_message(message::PingMessage(1)));

  // Further disconnects after CLOSED change nothing
  s.peer()->disconnect(DisconnectReason::IoError);
  CHECK(closed_calls.load() == 1);
}

TEST_CASE("Sending to a peer that stopped reading never blocks", "[peer][sendqueue]") {
  auto config = TestConfig();
  config.send_queue_limit = 4096;
  Session s(PeerDirection::INBOUND, config);
  s.start();
  s.complete_handshake();

  s.remote().stream().stall_incoming(true);

  // Each send returns immediately while the writer is stuck on the first frame
  const std::vector<uint8_t> raw(1000, 0xab);
  auto start = std::chrono::steady_clock::now();
  CHECK(s.peer()->send_message(message::TxMessage(raw)));
  CHECK(s.peer()->send_message(message::TxMessage(raw)));
  CHECK(s.peer()->send_message(message::TxMessage(raw)));
  CHECK(std::chrono::steady_clock::now() - start < 500ms);
  CHECK(s.peer()->send_queue_bytes() > 0);

  SECTION("a queue above the limit disconnects the peer") {
    bool refused = false;
    for (int i = 0; i < 5 && !refused; ++i) {
      refused = !s.peer()->send_message(message::TxMessage(raw));
    }
    CHECK(refused);
    CHECK(s.join() == DisconnectReason::SendQueueOverflow);
  }

  SECTION("queued frames are delivered once the peer reads again") {
    s.remote().stream().stall_incoming(false);
    for (int i = 0; i < 3; ++i) {
      Frame frame;
      REQUIRE(s.remote().expect(protocol::commands::TX, frame));
      CHECK(frame.payload == raw);
    }
    CHECK(WaitFor([&] { return s.peer()->send_queue_bytes() == 0; }));
    CHECK(s.peer()->is_ready());
  }
}

TEST_CASE("Disconnect requested before run", "[peer]") {
  Session s(PeerDirection::OUTBOUND);
  s.peer()->disconnect(DisconnectReason::ConnectionLimit);
  s.start();
  CHECK(s.join() == DisconnectReason::ConnectionLimit);
}

TEST_CASE("Peer factories reject a null stream", "[peer]") {
  CHECK(Peer::create_outbound(nullptr, TestConfig()) == nullptr);
  CHECK(Peer::create_inbound(nullptr, TestConfig()) == nullptr);
}

TEST_CASE("Reason and state names", "[peer]") {
  CHECK(std::string(DisconnectReasonToString(DisconnectReason::HandshakeTimeout)) == "handshake timeout");
  CHECK(std::string(DisconnectReasonToString(DisconnectReason::ProtocolViolation)) == "protocol violation");
  CHECK(std::string(DisconnectReasonToString(DisconnectReason::SendQueueOverflow)) == "send queue overflow");
  CHECK(std::string(PeerConnectionStateToString(PeerConnectionState::READY)) == "ready");
}
