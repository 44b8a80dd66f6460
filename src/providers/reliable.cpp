#include "almanac/providers/reliable.hpp"

#include "almanac/observability/global.hpp"

#include <chrono>
#include <thread>

namespace almanac::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> primary,
                                   std::vector<std::shared_ptr<Provider>> fallbacks,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms)
    : primary_(std::move(primary)), fallbacks_(std::move(fallbacks)), max_retries_(max_retries),
      backoff_ms_(backoff_ms) {}

common::Status ReliableProvider::execute_with_provider(const std::shared_ptr<Provider> &provider,
                                                       const CompletionRequest &request,
                                                       const CompletionChunkCallback &on_chunk,
                                                       bool &delivered) const {
  common::Status last = common::Status::error(common::ErrorKind::Provider, "no attempt made");
  const CompletionChunkCallback forward = [&](const CompletionChunk &chunk) {
    delivered = true;
    if (on_chunk) {
      on_chunk(chunk);
    }
  };

  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    last = provider->stream_completion(request, forward);
    if (last.ok() || delivered) {
      return last;
    }

    observability::record_error("provider", provider->name() + " attempt " +
                                                std::to_string(attempt + 1) + ": " + last.error());
    if (attempt < max_retries_) {
      const std::uint64_t delay = backoff_ms_ * (1ULL << attempt);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
  }
  return last;
}

common::Status ReliableProvider::stream_completion(const CompletionRequest &request,
                                                   const CompletionChunkCallback &on_chunk) {
  if (!primary_) {
    return common::Status::error(common::ErrorKind::Provider, "no provider configured");
  }

  bool delivered = false;
  auto status = execute_with_provider(primary_, request, on_chunk, delivered);
  if (status.ok() || delivered) {
    return status;
  }

  for (const auto &fallback : fallbacks_) {
    if (!fallback) {
      continue;
    }
    status = execute_with_provider(fallback, request, on_chunk, delivered);
    if (status.ok() || delivered) {
      return status;
    }
  }
  return status;
}

std::string ReliableProvider::name() const { return "reliable"; }

} // namespace almanac::providers
