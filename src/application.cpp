// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "application.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <thread>

#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace bitwire {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const NodeConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  LOG_INFO("Initializing bitwire {}...", GetFullVersion());

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }
  if (!init_chain()) {
    LOG_ERROR("Failed to initialize chain parameters");
    return false;
  }
  if (!init_network()) {
    LOG_ERROR("Failed to initialize network manager");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!network_manager_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  setup_signal_handlers();

  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }

  running_ = true;

  LOG_APP_INFO("bitwire started on {} (magic {:#010x})", chain_params_->GetChainTypeString(),
               chain_params_->GetNetworkMagic());
  if (config_.listen) {
    LOG_APP_INFO("Listening on port: {}", network_manager_->listening_port());
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down bitwire...");

  if (network_manager_) {
    LOG_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  LOG_INFO("Shutdown complete ({} transactions in mempool, chain height {})", mempool_->size(),
           block_store_->chain_tip().height);
}

bool Application::init_datadir() {
  // Only needed for a relative log file
  if (config_.datadir.empty()) {
    return true;
  }
  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  LOG_DEBUG("Data directory: {}", config_.datadir.string());
  return true;
}

bool Application::init_chain() {
  chain_params_ = chain::ChainParams::Create(config_.chain_type);
  if (!chain_params_) {
    LOG_ERROR("Unsupported chain type");
    return false;
  }
  LOG_INFO("Using {} (genesis {})", chain_params_->GetChainTypeString(), chain_params_->GenesisHash().GetHex());

  mempool_ = std::make_unique<chain::MemoryMempool>();
  block_store_ = std::make_unique<chain::MemoryBlockStore>(chain_params_->GenesisBlock());
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network manager...");
  network_manager_ =
      std::make_unique<network::NetworkManager>(*mempool_, *block_store_, config_.ToNetworkConfig(*chain_params_));
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE to prevent crashes on broken network connections
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace bitwire
