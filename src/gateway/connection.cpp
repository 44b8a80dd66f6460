#include "almanac/gateway/connection.hpp"

#include "almanac/common/random.hpp"
#include "almanac/observability/global.hpp"

#include <exception>
#include <optional>

namespace almanac::gateway {

std::string_view phase_name(const ConnectionPhase phase) {
  switch (phase) {
  case ConnectionPhase::Connecting:
    return "connecting";
  case ConnectionPhase::Open:
    return "open";
  case ConnectionPhase::Processing:
    return "processing";
  case ConnectionPhase::Closing:
    return "closing";
  case ConnectionPhase::Closed:
    return "closed";
  case ConnectionPhase::Errored:
    return "errored";
  }
  return "closed";
}

ConnectionHandler::ConnectionHandler(std::string connection_id,
                                     std::shared_ptr<agent::SessionRegistry> sessions,
                                     SendFn send)
    : connection_id_(std::move(connection_id)),
      default_session_id_("conn-" + common::random_hex(6)), sessions_(std::move(sessions)),
      send_(std::move(send)) {}

bool ConnectionHandler::is_terminal(const ConnectionPhase phase) {
  return phase == ConnectionPhase::Closed || phase == ConnectionPhase::Errored;
}

bool ConnectionHandler::transition(ConnectionPhase from, const ConnectionPhase to) {
  return phase_.compare_exchange_strong(from, to);
}

void ConnectionHandler::send(const ServerEnvelope &envelope) {
  if (!send_ || !send_(envelope.to_json())) {
    observability::record_error("gateway", "connection " + connection_id_ + ": dropped " +
                                               envelope.type + " envelope");
  }
}

void ConnectionHandler::on_open() {
  if (!transition(ConnectionPhase::Connecting, ConnectionPhase::Open)) {
    return;
  }
  observability::record_connection_opened(connection_id_);
  send(connection_envelope());
}

void ConnectionHandler::on_text(const std::string &payload) {
  if (phase() != ConnectionPhase::Open) {
    return;
  }

  auto parsed = parse_client_envelope(payload);
  if (!parsed.ok()) {
    observability::record_error("gateway", "connection " + connection_id_ + ": " + parsed.error());
    send(error_envelope(parsed.error()));
    return;
  }

  switch (parsed.value().type) {
  case EnvelopeType::Ping:
    send(pong_envelope());
    return;
  case EnvelopeType::ClearHistory:
    handle_clear_history(parsed.value());
    return;
  case EnvelopeType::Message:
    handle_message(parsed.value());
    return;
  }
}

void ConnectionHandler::handle_clear_history(const ClientEnvelope &envelope) {
  const std::string session_id = envelope.session_id.value_or(default_session_id_);
  if (sessions_) {
    (void)sessions_->clear(session_id);
  }
  send(history_cleared_envelope(session_id));
}

void ConnectionHandler::handle_message(const ClientEnvelope &envelope) {
  if (!transition(ConnectionPhase::Open, ConnectionPhase::Processing)) {
    return;
  }
  ++messages_handled_;
  const std::string session_id = envelope.session_id.value_or(default_session_id_);
  send(processing_envelope());

  std::optional<ServerEnvelope> outcome;
  try {
    if (!sessions_) {
      outcome = error_envelope(std::string(failure_message(common::ErrorKind::Generic)));
    } else {
      auto session = sessions_->get_or_create(session_id);
      auto reply = session->process(envelope.content);
      if (reply.ok()) {
        outcome = response_envelope(reply.value(), session_id);
      } else {
        outcome = error_envelope(std::string(failure_message(reply.kind())));
      }
    }
  } catch (const std::exception &e) {
    observability::record_error("gateway", "connection " + connection_id_ + ": session " +
                                               session_id + " threw: " + e.what());
    outcome = error_envelope(std::string(failure_message(common::ErrorKind::Generic)));
  }

  // A close that arrived meanwhile wins; the result is dropped.
  if (transition(ConnectionPhase::Processing, ConnectionPhase::Open)) {
    send(*outcome);
  }
}

void ConnectionHandler::on_close() {
  auto current = phase();
  while (!is_terminal(current) && current != ConnectionPhase::Closing) {
    if (phase_.compare_exchange_weak(current, ConnectionPhase::Closing)) {
      phase_.store(ConnectionPhase::Closed);
      observability::record_connection_closed(connection_id_, "closed");
      return;
    }
  }
}

void ConnectionHandler::on_error(const std::string &reason) {
  auto current = phase();
  while (!is_terminal(current)) {
    if (phase_.compare_exchange_weak(current, ConnectionPhase::Errored)) {
      observability::record_error("gateway", "connection " + connection_id_ + ": " + reason);
      observability::record_connection_closed(connection_id_, "errored");
      return;
    }
  }
}

} // namespace almanac::gateway
