#include "almanac/gateway/protocol.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"

#include <sstream>

namespace almanac::gateway {

namespace {

void append_field(std::ostringstream &out, const char *key, const std::string &value) {
  out << ",\"" << key << "\":\"" << common::json_escape(value) << "\"";
}

void append_tool_calls(std::ostringstream &out,
                       const std::vector<agent::ToolCallRecord> &tool_calls) {
  out << ",\"tool_calls\":[";
  for (std::size_t i = 0; i < tool_calls.size(); ++i) {
    const auto &call = tool_calls[i];
    out << (i == 0 ? "" : ",") << "{\"id\":\"" << common::json_escape(call.id) << "\""
        << ",\"name\":\"" << common::json_escape(call.name) << "\""
        << ",\"arguments\":\"" << common::json_escape(call.arguments) << "\""
        << ",\"status\":\"" << call.status() << "\""
        << ",\"result\":\"" << common::json_escape(call.result) << "\""
        << ",\"is_error\":" << (call.is_error ? "true" : "false") << "}";
  }
  out << "]";
}

void append_thoughts(std::ostringstream &out, const std::vector<std::string> &thoughts) {
  out << ",\"thoughts\":[";
  for (std::size_t i = 0; i < thoughts.size(); ++i) {
    out << (i == 0 ? "" : ",") << "{\"content\":\"" << common::json_escape(thoughts[i])
        << "\",\"source\":\"assistant\"}";
  }
  out << "]";
}

common::Result<ClientEnvelope> protocol_error(const std::string &message) {
  return common::Result<ClientEnvelope>::failure(common::ErrorKind::Protocol, message);
}

bool is_null_or_absent(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() || it->second == "null";
}

} // namespace

common::Result<ClientEnvelope> parse_client_envelope(const std::string &json) {
  if (!common::json_is_object(json)) {
    return protocol_error("Invalid JSON format");
  }
  const auto fields = common::json_parse_flat(json);
  const auto strings = common::json_parse_flat_strings(json);

  ClientEnvelope envelope;
  if (const auto sid = strings.find("session_id"); sid != strings.end()) {
    if (!common::trim(sid->second).empty()) {
      envelope.session_id = common::trim(sid->second);
    }
  } else if (!is_null_or_absent(fields, "session_id")) {
    return protocol_error("session_id must be a string");
  }

  std::string type = "message";
  if (const auto it = strings.find("type"); it != strings.end()) {
    if (!common::trim(it->second).empty()) {
      type = common::trim(it->second);
    }
  } else if (!is_null_or_absent(fields, "type")) {
    return protocol_error("Unknown message type: " + fields.at("type"));
  }

  if (type == "message") {
    envelope.type = EnvelopeType::Message;
    const auto content = strings.find("content");
    if (content == strings.end() || common::trim(content->second).empty()) {
      return protocol_error("Message content is required");
    }
    envelope.content = content->second;
  } else if (type == "clear_history") {
    envelope.type = EnvelopeType::ClearHistory;
  } else if (type == "ping") {
    envelope.type = EnvelopeType::Ping;
  } else {
    return protocol_error("Unknown message type: " + type);
  }
  return common::Result<ClientEnvelope>::success(std::move(envelope));
}

std::string ServerEnvelope::to_json() const {
  std::ostringstream out;
  out << "{\"type\":\"" << common::json_escape(type) << "\"";
  if (status.has_value()) {
    append_field(out, "status", *status);
  }
  if (message.has_value()) {
    append_field(out, "message", *message);
  }
  if (content.has_value()) {
    append_field(out, "content", *content);
  }
  if (session_id.has_value()) {
    append_field(out, "session_id", *session_id);
  }
  if (tool_calls.has_value()) {
    append_tool_calls(out, *tool_calls);
  }
  if (thoughts.has_value()) {
    append_thoughts(out, *thoughts);
  }
  out << "}";
  return out.str();
}

ServerEnvelope connection_envelope() {
  return {.type = "connection",
          .status = "connected",
          .message = "Connected to almanac agent service"};
}

ServerEnvelope processing_envelope() {
  return {.type = "status", .status = "processing", .message = "Processing your message..."};
}

ServerEnvelope response_envelope(const agent::Reply &reply, const std::string &session_id) {
  return {.type = "response",
          .content = reply.content,
          .session_id = session_id,
          .tool_calls = reply.tool_calls,
          .thoughts = reply.thoughts};
}

ServerEnvelope history_cleared_envelope(const std::string &session_id) {
  return {.type = "status",
          .status = "success",
          .message = "History cleared for session " + session_id,
          .session_id = session_id};
}

ServerEnvelope error_envelope(const std::string &message) {
  return {.type = "error", .message = message};
}

ServerEnvelope pong_envelope() { return {.type = "pong"}; }

std::string_view failure_message(const common::ErrorKind kind) {
  switch (kind) {
  case common::ErrorKind::ToolLoopExceeded:
    return "Too many tool invocations; please try again";
  case common::ErrorKind::NoAssistantReply:
    return "The assistant did not produce a reply";
  default:
    return "An internal error occurred while processing your message";
  }
}

} // namespace almanac::gateway
