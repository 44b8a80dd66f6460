#include "almanac/providers/compatible.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"

#include <charconv>
#include <set>
#include <sstream>

namespace almanac::providers {

namespace {

void parse_sse_bytes(const std::string_view chunk, std::string &line_buffer, std::string &event_data,
                     const std::function<void(const std::string &)> &on_event_data) {
  line_buffer.append(chunk);
  std::size_t line_end = std::string::npos;
  while ((line_end = line_buffer.find('\n')) != std::string::npos) {
    std::string line = line_buffer.substr(0, line_end);
    line_buffer.erase(0, line_end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      if (!event_data.empty()) {
        on_event_data(event_data);
        event_data.clear();
      }
      continue;
    }

    if (!common::starts_with(line, "data:")) {
      continue;
    }

    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!event_data.empty()) {
      event_data.push_back('\n');
    }
    event_data += payload;
  }
}

void write_message(std::ostringstream &body, const ChatMessage &message) {
  body << "{\"role\":\"" << common::json_escape(message.role) << "\"";
  if (message.role == "assistant" && !message.tool_calls.empty()) {
    if (message.content.empty()) {
      body << ",\"content\":null";
    } else {
      body << ",\"content\":\"" << common::json_escape(message.content) << "\"";
    }
    body << ",\"tool_calls\":[";
    for (std::size_t i = 0; i < message.tool_calls.size(); ++i) {
      const auto &call = message.tool_calls[i];
      if (i > 0) {
        body << ',';
      }
      body << "{\"id\":\"" << common::json_escape(call.id) << "\",\"type\":\"function\","
           << "\"function\":{\"name\":\"" << common::json_escape(call.name)
           << "\",\"arguments\":\""
           << common::json_escape(call.arguments.empty() ? "{}" : call.arguments) << "\"}}";
    }
    body << "]";
  } else {
    body << ",\"content\":\"" << common::json_escape(message.content) << "\"";
  }
  if (message.role == "tool") {
    body << ",\"tool_call_id\":\"" << common::json_escape(message.tool_call_id) << "\"";
  }
  body << "}";
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const std::uint64_t timeout_ms,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms),
      extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const CompletionRequest &request, const bool stream) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  bool first = true;
  if (request.system_prompt.has_value()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(*request.system_prompt)
         << "\"}";
    first = false;
  }
  for (const auto &message : request.messages) {
    if (!first) {
      body << ',';
    }
    write_message(body, message);
    first = false;
  }
  body << "],";
  if (!request.tools.empty()) {
    body << "\"tools\":[";
    for (std::size_t i = 0; i < request.tools.size(); ++i) {
      if (i > 0) {
        body << ',';
      }
      const auto &tool = request.tools[i];
      body << "{";
      body << "\"type\":\"function\",";
      body << "\"function\":{";
      body << "\"name\":\"" << common::json_escape(tool.name) << "\",";
      body << "\"description\":\"" << common::json_escape(tool.description) << "\",";
      body << "\"parameters\":" << tool.parameters_json;
      body << "}";
      body << "}";
    }
    body << "],";
    body << "\"tool_choice\":\"auto\",";
  }
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":" << (stream ? "true" : "false");
  body << "}";
  return body.str();
}

common::Status CompatibleProvider::validate_response_status(const HttpResponse &response) const {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
        .to_status();
  }

  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message}
        .to_status();
  }

  if (response.status == 401 || response.status == 403) {
    return ProviderError{.code = ProviderErrorCode::AuthError,
                         .status = response.status,
                         .message = response.body}
        .to_status();
  }

  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body}
        .to_status();
  }

  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    auto it = response.headers.find("retry-after");
    if (it != response.headers.end()) {
      std::uint64_t seconds = 0;
      const auto &text = it->second;
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
      if (ec == std::errc() && ptr != text.data()) {
        error.retry_after = seconds;
      }
    }
    return error.to_status();
  }

  if (response.status < 200 || response.status >= 300) {
    return ProviderError{.code = ProviderErrorCode::ApiError,
                         .status = response.status,
                         .message = response.body}
        .to_status();
  }

  return common::Status::success();
}

bool CompatibleProvider::is_sse_response(const HttpResponse &response) {
  const auto it = response.headers.find("content-type");
  if (it != response.headers.end() &&
      common::to_lower(it->second).find("text/event-stream") != std::string::npos) {
    return true;
  }
  return response.body.find("data:") != std::string::npos;
}

common::Status CompatibleProvider::stream_completion(const CompletionRequest &request,
                                                     const CompletionChunkCallback &on_chunk) {
  if (api_key_.empty()) {
    return ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}
        .to_status();
  }

  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Accept", "text/event-stream"},
      {"Authorization", "Bearer " + api_key_},
  };
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  // Deltas after the first one usually omit the role.
  std::set<std::size_t> announced;
  auto emit = [&](CompletionChunk chunk) {
    if (chunk.role.empty() && !announced.contains(chunk.entry)) {
      chunk.role = "assistant";
    }
    announced.insert(chunk.entry);
    if (on_chunk) {
      on_chunk(chunk);
    }
  };

  std::string line_buffer;
  std::string event_data;
  std::size_t events_seen = 0;
  std::optional<common::Status> stream_error;
  const auto stream_handler = [&](const std::string_view bytes) {
    parse_sse_bytes(bytes, line_buffer, event_data, [&](const std::string &event) {
      if (stream_error.has_value() || common::trim(event) == "[DONE]") {
        return;
      }
      ++events_seen;
      auto chunks = parse_completion_event(event);
      if (!chunks.ok()) {
        stream_error = ProviderError{.code = ProviderErrorCode::InvalidResponse,
                                     .message = chunks.error()}
                           .to_status();
        return;
      }
      for (auto &chunk : chunks.value()) {
        emit(std::move(chunk));
      }
    });
  };

  const std::string body = build_body(request, true);
  const auto response = http_client_->post_json_stream(base_url_ + "/chat/completions", headers,
                                                       body, timeout_ms_, stream_handler);
  stream_handler("\n\n");

  auto status = validate_response_status(response);
  if (!status.ok()) {
    return status;
  }
  if (stream_error.has_value()) {
    return *stream_error;
  }
  if (is_sse_response(response)) {
    if (events_seen == 0) {
      return ProviderError{.code = ProviderErrorCode::InvalidResponse,
                           .message = "no events in SSE stream"}
          .to_status();
    }
    return common::Status::success();
  }

  // Server ignored "stream": the whole completion is one JSON body.
  auto chunks = parse_completion_event(response.body);
  if (!chunks.ok()) {
    return ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = chunks.error()}
        .to_status();
  }
  for (auto &chunk : chunks.value()) {
    emit(std::move(chunk));
  }
  return common::Status::success();
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace almanac::providers
