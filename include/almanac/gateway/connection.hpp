#pragma once

#include "almanac/agent/session_registry.hpp"
#include "almanac/gateway/protocol.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace almanac::gateway {

enum class ConnectionPhase { Connecting, Open, Processing, Closing, Closed, Errored };

[[nodiscard]] std::string_view phase_name(ConnectionPhase phase);

/// Per-connection protocol state machine. Transport agnostic: the server feeds it decoded text
/// frames and it answers through `send`. Calls for one connection must come from one thread.
class ConnectionHandler {
public:
  /// Returns false when the peer can no longer be written to.
  using SendFn = std::function<bool(const std::string &text)>;

  ConnectionHandler(std::string connection_id, std::shared_ptr<agent::SessionRegistry> sessions,
                    SendFn send);

  [[nodiscard]] const std::string &id() const { return connection_id_; }
  [[nodiscard]] const std::string &default_session_id() const { return default_session_id_; }
  [[nodiscard]] ConnectionPhase phase() const { return phase_.load(); }
  [[nodiscard]] std::size_t messages_handled() const { return messages_handled_.load(); }

  void on_open();
  void on_text(const std::string &payload);
  void on_close();
  void on_error(const std::string &reason);

private:
  void handle_message(const ClientEnvelope &envelope);
  void handle_clear_history(const ClientEnvelope &envelope);
  void send(const ServerEnvelope &envelope);
  [[nodiscard]] bool transition(ConnectionPhase from, ConnectionPhase to);
  [[nodiscard]] static bool is_terminal(ConnectionPhase phase);

  std::string connection_id_;
  std::string default_session_id_;
  std::shared_ptr<agent::SessionRegistry> sessions_;
  SendFn send_;
  std::atomic<ConnectionPhase> phase_{ConnectionPhase::Connecting};
  std::atomic<std::size_t> messages_handled_{0};
};

} // namespace almanac::gateway
