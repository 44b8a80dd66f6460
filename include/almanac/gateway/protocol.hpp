#pragma once

#include "almanac/agent/session.hpp"
#include "almanac/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::gateway {

enum class EnvelopeType { Message, ClearHistory, Ping };

struct ClientEnvelope {
  EnvelopeType type = EnvelopeType::Message;
  std::string content;
  std::optional<std::string> session_id;
};

/// Fails with ErrorKind::Protocol; the message is safe to show to the client.
[[nodiscard]] common::Result<ClientEnvelope> parse_client_envelope(const std::string &json);

struct ServerEnvelope {
  std::string type;
  std::optional<std::string> status;
  std::optional<std::string> message;
  std::optional<std::string> content;
  std::optional<std::string> session_id;
  /// Rendered as `{id,name,arguments,status,result,is_error}` objects.
  std::optional<std::vector<agent::ToolCallRecord>> tool_calls;
  /// Rendered as `{content,source}` objects.
  std::optional<std::vector<std::string>> thoughts;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] ServerEnvelope connection_envelope();
[[nodiscard]] ServerEnvelope processing_envelope();
[[nodiscard]] ServerEnvelope response_envelope(const agent::Reply &reply,
                                               const std::string &session_id);
[[nodiscard]] ServerEnvelope history_cleared_envelope(const std::string &session_id);
[[nodiscard]] ServerEnvelope error_envelope(const std::string &message);
[[nodiscard]] ServerEnvelope pong_envelope();

/// Client-facing text for a failed process() call. Details stay in the log.
[[nodiscard]] std::string_view failure_message(common::ErrorKind kind);

} // namespace almanac::gateway
