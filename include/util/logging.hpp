// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace bitwire {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the node.
 *
 * Thread-safety: All methods are thread-safe. Initialization and
 * shutdown are serialized by a mutex; logger access is protected by
 * the same mutex so sessions on different threads can log freely.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Multiple calls are safe; only the first call after startup (or after
  // Shutdown()) performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component ("network", "chain", "app").
  // Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (network, chain, app, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace bitwire

// Convenience macros for logging
#define LOG_TRACE(...) bitwire::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) bitwire::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) bitwire::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) bitwire::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) bitwire::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) bitwire::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) bitwire::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) bitwire::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) bitwire::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) bitwire::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...) bitwire::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...) bitwire::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...) bitwire::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...) bitwire::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...) bitwire::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) bitwire::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) bitwire::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) bitwire::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite for messages triggered by untrusted input
// (peer framing errors, malformed payloads, unknown commands).
//
// Rate limits (token bucket): 200 messages per hour per callsite.
//
// Use for:
// - Peer protocol errors (malformed messages, bad magic, bad checksum)
// - Connection failures (can be spammed)
// Do not use for:
// - Startup/shutdown messages
// - Fatal errors

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_ERROR_RL(...)                                                                                              \
  do {                                                                                                                 \
    if (bitwire::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      bitwire::util::LogManager::GetLogger()->error(__VA_ARGS__);                                                      \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_ERROR_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (bitwire::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      bitwire::util::LogManager::GetLogger("network")->error(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (bitwire::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      bitwire::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                       \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (bitwire::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      bitwire::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_CHAIN_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (bitwire::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      bitwire::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__);                                                \
    }                                                                                                                  \
  } while (0)
