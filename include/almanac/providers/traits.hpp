#pragma once

#include "almanac/common/result.hpp"
#include "almanac/tools/tool.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace almanac::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] common::Status to_status() const {
    return common::Status::error(common::ErrorKind::Provider, to_string());
  }
};

struct ToolCallRequest {
  std::string id;
  std::string name;
  std::string arguments; // JSON object text
};

/// One message of the wire conversation (system, user, assistant or tool).
struct ChatMessage {
  std::string role;
  std::string content;
  std::vector<ToolCallRequest> tool_calls; // assistant only
  std::string tool_call_id;                // tool only
};

struct CompletionRequest {
  std::string model;
  std::optional<std::string> system_prompt;
  std::vector<ChatMessage> messages;
  std::vector<tools::ToolSpec> tools;
  double temperature = 0.7;
};

struct ToolCallFragment {
  std::size_t index = 0;
  std::string id;
  std::string name;
  std::string arguments;
};

/// Incremental piece of a completion. `entry` identifies the candidate message the piece
/// belongs to; a message may be spread over any number of chunks. `reasoning` carries
/// `reasoning_content`/`reasoning` text. `streamed` marks pieces decoded from a `delta`.
struct CompletionChunk {
  std::size_t entry = 0;
  std::string role;
  std::string content;
  std::string reasoning;
  std::optional<ToolCallFragment> tool_call;
  bool streamed = false;
};

using CompletionChunkCallback = std::function<void(const CompletionChunk &)>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using StreamChunkCallback = std::function<void(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk) override;
};

/// Model-completion capability. Implementations are shared between sessions and must be
/// callable concurrently.
class Provider {
public:
  virtual ~Provider() = default;

  /// Delivers the completion through `on_chunk`, in order, before returning.
  [[nodiscard]] virtual common::Status stream_completion(const CompletionRequest &request,
                                                         const CompletionChunkCallback &on_chunk) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

/// Decodes one OpenAI-style streaming event (`{"choices":[{"index":..,"delta":{..}}]}`) or a
/// non-streamed body (`"message"` instead of `"delta"`) into chunks.
[[nodiscard]] common::Result<std::vector<CompletionChunk>>
parse_completion_event(const std::string &event_json);

} // namespace almanac::providers
