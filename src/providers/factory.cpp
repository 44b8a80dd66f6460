#include "almanac/providers/factory.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/providers/compatible.hpp"
#include "almanac/providers/reliable.hpp"

#include <unordered_map>

namespace almanac::providers {

common::Result<std::shared_ptr<Provider>> create_provider(const config::ProviderConfig &config,
                                                          std::shared_ptr<HttpClient> http_client) {
  const std::string api_key = common::trim(config.api_key.value_or(""));
  if (api_key.empty()) {
    return common::Result<std::shared_ptr<Provider>>::failure(
        common::ErrorKind::Provider,
        "no API key configured; set ALMANAC_API_KEY or OPENROUTER_API_KEY");
  }

  std::unordered_map<std::string, std::string> extra_headers;
  if (config.base_url.find("openrouter.ai") != std::string::npos) {
    extra_headers = {{"X-Title", "Almanac"}};
  }

  auto compatible = std::make_shared<CompatibleProvider>(
      "compatible", config.base_url, api_key, std::move(http_client), config.timeout_ms,
      std::move(extra_headers));
  std::shared_ptr<Provider> reliable = std::make_shared<ReliableProvider>(
      compatible, std::vector<std::shared_ptr<Provider>>{}, config.max_retries, config.backoff_ms);
  return common::Result<std::shared_ptr<Provider>>::success(std::move(reliable));
}

} // namespace almanac::providers
