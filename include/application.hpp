// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "chain/memory_block_store.hpp"
#include "chain/memory_mempool.hpp"
#include "config.hpp"
#include "network/network_manager.hpp"

#include <atomic>
#include <csignal>
#include <memory>

namespace bitwire {
namespace app {

/**
 * Application - wires the daemon together
 *
 * Owns chain parameters, the in-memory mempool and block store, and the
 * NetworkManager. Signal handlers only set an atomic flag; the main thread
 * polls it in wait_for_shutdown() and performs the actual shutdown.
 */
class Application {
public:
  explicit Application(const NodeConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  bool initialize();
  bool start();
  void stop();

  // Block until SIGINT/SIGTERM or request_shutdown(), then shut down
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  network::NetworkManager& network_manager() { return *network_manager_; }
  chain::MemoryMempool& mempool() { return *mempool_; }
  chain::MemoryBlockStore& block_store() { return *block_store_; }
  const chain::ChainParams& chain_params() const { return *chain_params_; }

  static Application* instance();

private:
  NodeConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<chain::MemoryMempool> mempool_;
  std::unique_ptr<chain::MemoryBlockStore> block_store_;
  std::unique_ptr<network::NetworkManager> network_manager_;

  // Static instance for signal handling
  static Application* instance_;

  bool init_datadir();
  bool init_chain();
  bool init_network();

  void shutdown();

  void setup_signal_handlers();
  static void signal_handler(int signal);
};

}  // namespace app
}  // namespace bitwire
