// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "application.hpp"
#include "chain/chainparams.hpp"
#include "config.hpp"

#include <chrono>
#include <thread>

using namespace bitwire;
using namespace bitwire::app;

namespace {

NodeConfig RegtestNodeConfig() {
  NodeConfig config;
  config.chain_type = chain::ChainType::REGTEST;
  config.port = 0;
  config.log_level = "off";
  return config;
}

}  // namespace

TEST_CASE("Application wires chain and network for regtest", "[app]") {
  Application app(RegtestNodeConfig());
  CHECK(Application::instance() == &app);

  REQUIRE(app.initialize());
  CHECK(app.chain_params().GetChainType() == chain::ChainType::REGTEST);
  CHECK(app.block_store().chain_tip().hash == app.chain_params().GenesisHash());
  CHECK(app.block_store().chain_tip().height == 0);
  CHECK(app.mempool().size() == 0);
  CHECK_FALSE(app.network_manager().is_running());

  REQUIRE(app.start());
  CHECK(app.is_running());
  CHECK(app.network_manager().is_running());
  CHECK(app.network_manager().listening_port() != 0);
  CHECK_FALSE(app.start());

  app.stop();
  CHECK_FALSE(app.is_running());
  CHECK_FALSE(app.network_manager().is_running());
}

TEST_CASE("Application start requires initialize", "[app]") {
  Application app(RegtestNodeConfig());
  CHECK_FALSE(app.start());
  CHECK_FALSE(app.is_running());
}

TEST_CASE("request_shutdown ends wait_for_shutdown", "[app]") {
  auto config = RegtestNodeConfig();
  config.listen = false;
  Application app(config);
  REQUIRE(app.initialize());
  REQUIRE(app.start());

  std::thread requester([&app]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    app.request_shutdown();
  });
  app.wait_for_shutdown();
  requester.join();

  CHECK_FALSE(app.is_running());
  CHECK_FALSE(app.network_manager().is_running());
}
