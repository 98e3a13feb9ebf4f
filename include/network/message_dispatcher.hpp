#ifndef BITWIRE_NETWORK_MESSAGE_DISPATCHER_HPP
#define BITWIRE_NETWORK_MESSAGE_DISPATCHER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bitwire {

// Forward declaration
namespace message {
class Message;
}  // namespace message

namespace network {

// Forward declarations
class Peer;
using PeerPtr = std::shared_ptr<Peer>;

/**
 * MessageDispatcher - routes post-handshake data messages to handlers
 *
 * Handlers are registered per command by NetworkManager and forward to the
 * mempool and block store collaborators. Dispatch runs on the receiving
 * peer's session thread, so one peer's messages are handled in arrival order
 * while different peers dispatch concurrently. Handlers must therefore be
 * thread-safe with respect to each other.
 *
 * Ownership Model:
 * - Handlers receive raw Message* pointer (borrowed, not owned)
 * - Message lifetime guaranteed only during handler execution
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler("tx",
 *     [this](PeerPtr p, message::Message* m) {
 *       return handle_tx(p, static_cast<message::TxMessage&>(*m));
 *     });
 *   dispatcher.Dispatch(peer, "tx", msg);
 */
class MessageDispatcher {
public:
  // Handler signature: takes peer + message, returns false on a protocol violation
  // WARNING: Message* is borrowed - do not store for async use
  using MessageHandler = std::function<bool(PeerPtr, ::bitwire::message::Message*)>;

  // Result of a dispatch attempt
  enum class Result {
    HANDLED,     // Handler ran and returned true
    NO_HANDLER,  // Nothing registered for the command
    REJECTED,    // Handler returned false
  };

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  // Non-copyable
  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  // Register handler for a message command (e.g., "tx", "inv"). Thread-safe.
  // Empty handlers are ignored; a second registration replaces the first.
  void RegisterHandler(const std::string& command, MessageHandler handler);

  void UnregisterHandler(const std::string& command);

  // The handler runs outside the registry lock
  Result Dispatch(PeerPtr peer, const std::string& command, ::bitwire::message::Message* msg);

  bool HasHandler(const std::string& command) const;

  // Sorted list of registered commands (for diagnostics)
  std::vector<std::string> GetRegisteredCommands() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, MessageHandler> handlers_;
};

}  // namespace network
}  // namespace bitwire

#endif  // BITWIRE_NETWORK_MESSAGE_DISPATCHER_HPP
