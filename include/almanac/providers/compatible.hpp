#pragma once

#include "almanac/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace almanac::providers {

/// OpenAI-compatible `/chat/completions` endpoint (OpenRouter, OpenAI, local servers), streamed
/// over server-sent events.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     std::uint64_t timeout_ms = 120'000,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Status stream_completion(const CompletionRequest &request,
                                                 const CompletionChunkCallback &on_chunk) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] static std::string build_body(const CompletionRequest &request, bool stream);

private:
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;
  [[nodiscard]] static bool is_sse_response(const HttpResponse &response);

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  std::uint64_t timeout_ms_;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace almanac::providers
