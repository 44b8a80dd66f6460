#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace almanac::config {

struct ProviderConfig {
  std::optional<std::string> api_key;
  std::string base_url = "https://openrouter.ai/api/v1";
  std::string model = "moonshotai/kimi-k2.5";
  double temperature = 0.7;
  std::uint64_t timeout_ms = 120'000;
  std::uint32_t max_retries = 2;
  std::uint64_t backoff_ms = 500;
};

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8765;
  std::size_t max_clients = 256;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
};

struct AgentConfig {
  std::uint32_t max_tool_iterations = 10;
  std::string system_prompt_file;
};

struct ScheduleConfig {
  std::string file;
};

struct NotifierConfig {
  bool enabled = true;
  std::uint32_t interval_secs = 30;
  std::string sink = "log";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ProviderConfig provider;
  GatewayConfig gateway;
  AgentConfig agent;
  ScheduleConfig schedule;
  NotifierConfig notifier;
  ObservabilityConfig observability;
};

} // namespace almanac::config
