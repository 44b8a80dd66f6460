#pragma once

#include "almanac/common/result.hpp"
#include "almanac/config/schema.hpp"
#include "almanac/providers/traits.hpp"

#include <memory>

namespace almanac::providers {

/// Compatible endpoint from `[provider]`, wrapped in retries.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::ProviderConfig &config,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace almanac::providers
