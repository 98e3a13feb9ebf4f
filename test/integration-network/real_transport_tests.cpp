// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

// TCP transport over the loopback interface

#include <catch2/catch_test_macros.hpp>

#include "chain/chainparams.hpp"
#include "chain/memory_block_store.hpp"
#include "chain/memory_mempool.hpp"
#include "infra/test_node.hpp"
#include "network/network_manager.hpp"
#include "network/real_transport.hpp"
#include "util/hash.hpp"

#include <chrono>
#include <cstring>
#include <thread>

using namespace bitwire;
using namespace bitwire::network;
using bitwire::test::WaitFor;

namespace {

ByteStream::Deadline In(std::chrono::milliseconds ms) {
  return ByteStream::Clock::now() + ms;
}

// Listener plus one connected client/server pair
struct LoopbackPair {
  LoopbackPair() {
    REQUIRE(transport.listen(0));
    REQUIRE(transport.listening_port() != 0);
    client = transport.connect("127.0.0.1", transport.listening_port(), std::chrono::seconds(2));
    REQUIRE(client);
    REQUIRE(transport.accept(server, In(std::chrono::seconds(2))) == StreamStatus::Ok);
    REQUIRE(server);
  }

  RealTransport transport;
  ByteStreamPtr client;
  ByteStreamPtr server;
};

}  // namespace

TEST_CASE("RealTransport moves bytes over loopback", "[network][transport][tcp]") {
  LoopbackPair pair;
  CHECK(pair.client->remote_port() == pair.transport.listening_port());
  CHECK(pair.client->remote_address() == "127.0.0.1");

  const uint8_t hello[] = {'h', 'e', 'l', 'l', 'o'};
  REQUIRE(pair.client->write_all(hello, sizeof(hello)) == StreamStatus::Ok);

  uint8_t got[5] = {};
  REQUIRE(pair.server->read_exact(got, sizeof(got), In(std::chrono::seconds(2))) == StreamStatus::Ok);
  CHECK(std::memcmp(got, hello, sizeof(hello)) == 0);

  SECTION("read times out when nothing arrives") {
    uint8_t byte;
    auto started = ByteStream::Clock::now();
    CHECK(pair.server->read_exact(&byte, 1, In(std::chrono::milliseconds(150))) == StreamStatus::Timeout);
    CHECK(ByteStream::Clock::now() - started >= std::chrono::milliseconds(150));
  }

  SECTION("closing one end is seen as Closed") {
    pair.client->close();
    uint8_t byte;
    CHECK(pair.server->read_exact(&byte, 1, In(std::chrono::seconds(2))) == StreamStatus::Closed);
  }

  SECTION("interrupt wakes a blocked reader") {
    StreamStatus status = StreamStatus::Ok;
    std::thread reader([&]() {
      uint8_t byte;
      status = pair.server->read_exact(&byte, 1, In(std::chrono::seconds(30)));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto started = ByteStream::Clock::now();
    pair.server->interrupt();
    reader.join();
    CHECK(status == StreamStatus::Interrupted);
    CHECK(ByteStream::Clock::now() - started < std::chrono::seconds(1));

    // Interruption is sticky
    uint8_t byte;
    CHECK(pair.server->read_exact(&byte, 1, In(std::chrono::seconds(1))) == StreamStatus::Interrupted);
  }
}

TEST_CASE("RealTransport accept honours deadline and stop_listening", "[network][transport][tcp]") {
  RealTransport transport;
  ByteStreamPtr out;

  SECTION("accept without a listener") {
    CHECK(transport.accept(out, In(std::chrono::milliseconds(10))) == StreamStatus::Interrupted);
  }

  SECTION("accept times out") {
    REQUIRE(transport.listen(0));
    CHECK(transport.accept(out, In(std::chrono::milliseconds(100))) == StreamStatus::Timeout);
    CHECK_FALSE(out);
  }

  SECTION("stop_listening unblocks accept") {
    REQUIRE(transport.listen(0));
    StreamStatus status = StreamStatus::Ok;
    std::thread acceptor([&]() { status = transport.accept(out, In(std::chrono::seconds(30))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport.stop_listening();
    acceptor.join();
    CHECK(status == StreamStatus::Interrupted);
  }
}

TEST_CASE("RealTransport connect failures", "[network][transport][tcp]") {
  RealTransport transport;

  SECTION("nothing listening") {
    // Bind and release to learn a port that is very likely unused
    uint16_t port = 0;
    {
      TcpListener scratch;
      REQUIRE(scratch.listen(0));
      port = scratch.local_port();
    }
    CHECK_FALSE(transport.connect("127.0.0.1", port, std::chrono::seconds(2)));
  }

  SECTION("unresolvable host") {
    CHECK_FALSE(transport.connect("no-such-host.invalid", 8333, std::chrono::seconds(2)));
  }
}

TEST_CASE("Two NetworkManagers handshake over TCP", "[network][transport][tcp][integration]") {
  auto params = chain::ChainParams::CreateRegTest();

  auto config = test::RegtestNetConfig();
  config.listen_port = 0;

  chain::MemoryMempool mempool_a;
  chain::MemoryBlockStore store_a(params->GenesisBlock());
  auto config_a = config;
  config_a.test_nonce = 0xaaaa;
  NetworkManager a(mempool_a, store_a, config_a);

  chain::MemoryMempool mempool_b;
  chain::MemoryBlockStore store_b(params->GenesisBlock());
  auto config_b = config;
  config_b.test_nonce = 0xbbbb;
  config_b.listen_enabled = false;
  NetworkManager b(mempool_b, store_b, config_b);

  REQUIRE(a.start());
  REQUIRE(b.start());
  REQUIRE(a.listening_port() != 0);

  REQUIRE(b.connect_to("127.0.0.1", a.listening_port()) == ConnectionResult::Success);
  REQUIRE(WaitFor([&]() {
    return a.peer_manager().get_ready_peers().size() == 1 && b.peer_manager().get_ready_peers().size() == 1;
  }));

  auto a_side = a.peer_manager().get_ready_peers().front();
  auto b_side = b.peer_manager().get_ready_peers().front();
  CHECK(a_side->is_inbound());
  CHECK_FALSE(b_side->is_inbound());
  CHECK(a_side->peer_nonce() == 0xbbbb);
  CHECK(b_side->peer_nonce() == 0xaaaa);
  CHECK(b_side->user_agent() == "/bitwire-test:0.1.0/");

  SECTION("a transaction crosses the connection") {
    const std::vector<uint8_t> raw{0x01, 0x00, 0x00, 0x00, 0x00};
    REQUIRE(mempool_a.submit_transaction(raw) == chain::MempoolAcceptResult::ACCEPTED);
    a.relay_transaction(Hash(raw));
    // b requests it with GETDATA and stores the reply
    CHECK(WaitFor([&]() { return mempool_b.contains(Hash(raw)); }));
  }

  SECTION("stopping one side closes the other") {
    a.stop();
    CHECK(WaitFor([&]() { return b.active_peer_count() == 0; }));
    CHECK(b_side->disconnect_reason() == DisconnectReason::StreamClosed);
  }

  b.stop();
  a.stop();
}
