// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace bitwire {
namespace network {

void MessageDispatcher::RegisterHandler(const std::string& command, MessageHandler handler) {
  if (!handler) {
    LOG_NET_WARN("MessageDispatcher: ignoring empty handler for '{}'", command);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[command] = std::move(handler);
}

void MessageDispatcher::UnregisterHandler(const std::string& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(command);
}

MessageDispatcher::Result MessageDispatcher::Dispatch(PeerPtr peer, const std::string& command,
                                                      ::bitwire::message::Message* msg) {
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      return Result::NO_HANDLER;
    }
    handler = it->second;
  }
  return handler(std::move(peer), msg) ? Result::HANDLED : Result::REJECTED;
}

bool MessageDispatcher::HasHandler(const std::string& command) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(command) > 0;
}

std::vector<std::string> MessageDispatcher::GetRegisteredCommands() const {
  std::vector<std::string> commands;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commands.reserve(handlers_.size());
    for (const auto& [command, handler] : handlers_) {
      commands.push_back(command);
    }
  }
  std::sort(commands.begin(), commands.end());
  return commands;
}

}  // namespace network
}  // namespace bitwire
