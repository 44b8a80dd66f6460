#pragma once

#include "almanac/providers/traits.hpp"

#include <memory>
#include <vector>

namespace almanac::providers {

/// Retries with exponential backoff, then moves on to fallbacks. An attempt that already
/// delivered chunks is not retried.
class ReliableProvider final : public Provider {
public:
  ReliableProvider(std::shared_ptr<Provider> primary, std::vector<std::shared_ptr<Provider>> fallbacks,
                   std::uint32_t max_retries, std::uint64_t backoff_ms);

  [[nodiscard]] common::Status stream_completion(const CompletionRequest &request,
                                                 const CompletionChunkCallback &on_chunk) override;
  [[nodiscard]] std::string name() const override;

private:
  [[nodiscard]] common::Status execute_with_provider(const std::shared_ptr<Provider> &provider,
                                                     const CompletionRequest &request,
                                                     const CompletionChunkCallback &on_chunk,
                                                     bool &delivered) const;

  std::shared_ptr<Provider> primary_;
  std::vector<std::shared_ptr<Provider>> fallbacks_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

} // namespace almanac::providers
